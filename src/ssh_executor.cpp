// ============================================================================
// ssh_executor.cpp - implementation for ssh_executor.hpp
// ============================================================================

#include "ssh_executor.hpp"
#include "subprocess.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace espfleet {

// ssh reserves this exit status for its own errors.
static constexpr int kSshTransportFailure = 255;

static std::string first_line(const std::string& s) {
    auto nl = s.find('\n');
    return nl == std::string::npos ? s : s.substr(0, nl);
}

SshExecutor::SshExecutor(Config cfg) : cfg_(std::move(cfg)) {}

SshExecutor::~SshExecutor() {
    disconnect();
}

std::string SshExecutor::control_path() const {
    return (cfg_.runtime_dir / "cm-%C").string();
}

std::vector<std::string> SshExecutor::master_argv(const HostSpec& host) const {
    return {
        cfg_.ssh_binary, "-M", "-S", control_path(), "-f", "-N",
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=" + std::to_string(cfg_.connect_timeout_s),
        "-o", "ServerAliveInterval=" + std::to_string(cfg_.server_alive_s),
        "-o", "ControlPersist=" + std::to_string(cfg_.control_persist_s) + "s",
        "--", host.str(),
    };
}

std::vector<std::string> SshExecutor::command_argv(const HostSpec& host, const std::string& command) const {
    return {
        cfg_.ssh_binary, "-S", control_path(),
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=" + std::to_string(cfg_.connect_timeout_s),
        "--", host.str(), command,
    };
}

std::vector<std::string> SshExecutor::exit_argv(const HostSpec& host) const {
    return {cfg_.ssh_binary, "-S", control_path(), "-O", "exit", "--", host.str()};
}

Status SshExecutor::connect(const std::string& host) {
    if (!host_.empty()) {
        if (host_ == host) return Status::success();
        disconnect();
    }

    HostSpec spec = parse_host(host, cfg_.default_user);
    ProcessOptions opts;
    opts.capture = false;  // master daemonizes with -f
    opts.timeout_ms = (cfg_.connect_timeout_s + 5) * 1000;

    ProcessOutput po;
    Status st = run_process(master_argv(spec), opts, po);
    if (!st.ok()) {
        if (st.reason == "timeout") {
            return Status::error(ErrorKind::Connection, "timeout", "ssh to " + spec.str() + ": " + st.detail);
        }
        return st;
    }
    if (po.exit_code != 0) {
        return Status::error(ErrorKind::Connection, "connect_failed",
                             "ssh to " + spec.str() + " exited " + std::to_string(po.exit_code) +
                             "; check the host is up and `ssh " + spec.str() + "` works without a password");
    }

    host_ = host;
    spec_ = spec;
    spdlog::debug("ssh: master session open to {}", spec_.str());
    return Status::success();
}

void SshExecutor::disconnect() {
    if (host_.empty()) return;

    ProcessOptions opts;
    opts.timeout_ms = 5000;
    ProcessOutput po;
    Status st = run_process(exit_argv(spec_), opts, po);
    if (!st.ok() || po.exit_code != 0) {
        spdlog::warn("ssh: closing master session to {} failed: {}", spec_.str(),
                     st.ok() ? first_line(po.err) : st.detail);
    } else {
        spdlog::debug("ssh: master session to {} closed", spec_.str());
    }
    host_.clear();
    spec_ = HostSpec{};
}

Status SshExecutor::run(const std::string& host, const std::string& command, remote::CommandResult& out) {
    out = remote::CommandResult{};
    HostSpec spec = parse_host(host, cfg_.default_user);
    if (host_ != host) {
        spdlog::debug("ssh: no session for {}, running '{}' on a one-shot connection", spec.str(), command);
    }

    ProcessOptions opts;
    opts.timeout_ms = cfg_.command_timeout_ms;
    ProcessOutput po;
    Status st = run_process(command_argv(spec, command), opts, po);
    if (!st.ok()) {
        if (st.reason == "timeout") {
            return Status::error(ErrorKind::Connection, "timeout",
                                 "'" + command + "' on " + spec.str() + ": " + st.detail);
        }
        return st;
    }

    out.out = std::move(po.out);
    out.err = std::move(po.err);
    out.exit_code = po.exit_code;

    if (out.exit_code == kSshTransportFailure) {
        return Status::error(ErrorKind::Connection, "connect_failed",
                             spec.str() + ": " + first_line(out.err));
    }
    return Status::success();
}

} // namespace espfleet
