// ============================================================================
// tunnel_manager.cpp - implementation for tunnel_manager.hpp
// ============================================================================

#include "tunnel_manager.hpp"
#include "espfleet/device.hpp"
#include "subprocess.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

namespace espfleet {

bool probe_port(int port, int timeout_ms) {
    if (port < 1 || port > 65535) return false;

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool open = false;
    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof addr);
    if (rc == 0) {
        open = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{fd, POLLOUT, 0};
        int pr;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);
        if (pr > 0) {
            int err = 0;
            socklen_t len = sizeof err;
            open = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
        }
    }
    ::close(fd);
    return open;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static std::string basename_of(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool is_forward_for(const std::vector<std::string>& argv, int local_port, const std::string& program) {
    if (argv.empty()) return false;
    if (basename_of(argv[0]) != basename_of(program)) return false;

    const std::string spec = std::to_string(local_port) + ":";
    for (size_t i = 1; i < argv.size(); ++i) {
        if (argv[i] == "-L") {
            if (i + 1 < argv.size() && starts_with(argv[i + 1], spec)) return true;
        } else if (starts_with(argv[i], "-L") && starts_with(argv[i].substr(2), spec)) {
            return true;
        }
    }
    return false;
}

TunnelManager::TunnelManager(ProcessControl& procs, const Config& cfg)
    : procs_(procs),
      ssh_binary_(cfg.ssh_binary),
      default_user_(cfg.default_user),
      server_alive_s_(cfg.server_alive_s),
      timeouts_(cfg.tunnel) {}

bool TunnelManager::is_open(int local_port) const {
    return probe_port(local_port, timeouts_.probe_timeout_ms);
}

TunnelState TunnelManager::state(int local_port) const {
    return is_open(local_port) ? TunnelState::Open : TunnelState::Closed;
}

std::optional<int> TunnelManager::find_process(int local_port) const {
    for (const auto& p : procs_.snapshot()) {
        if (is_forward_for(p.argv, local_port, ssh_binary_)) return p.pid;
    }
    return std::nullopt;
}

std::vector<std::string> TunnelManager::forward_argv(const std::string& host, int local_port, int remote_port) const {
    return {
        ssh_binary_, "-f", "-N",
        "-L", std::to_string(local_port) + ":127.0.0.1:" + std::to_string(remote_port),
        "-o", "ExitOnForwardFailure=yes",
        "-o", "ServerAliveInterval=" + std::to_string(server_alive_s_),
        "-o", "BatchMode=yes",
        "--", parse_host(host, default_user_).str(),
    };
}

Status TunnelManager::create(const std::string& host, int local_port, int remote_port) {
    if (auto stale = find_process(local_port)) {
        spdlog::info("tunnel: replacing forwarder pid {} on port {}", *stale, local_port);
        procs_.signal(*stale, SIGTERM);
        std::this_thread::sleep_for(std::chrono::milliseconds(timeouts_.kill_grace_ms));
    }

    const auto argv = forward_argv(host, local_port, remote_port);
    int exit_code = -1;
    Status st = procs_.launch(argv, exit_code);
    if (!st.ok()) {
        return Status::error(ErrorKind::Process, st.reason, "launching `" + join_argv(argv) + "`: " + st.detail);
    }

    const std::string where = "local " + std::to_string(local_port) + " -> " + host + ":" +
                              std::to_string(remote_port);
    if (exit_code != 0) {
        return Status::error(ErrorKind::Connection, "tunnel_failed",
                             where + ": ssh exited " + std::to_string(exit_code) +
                             "; check `ssh " + host + "` works, the local port is free and ser2net is set up "
                             "(espfleet setup " + host + ")");
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(timeouts_.confirm_delay_ms));
    if (!is_open(local_port)) {
        return Status::error(ErrorKind::Process, "tunnel_unconfirmed",
                             where + ": ssh started but port " + std::to_string(local_port) +
                             " is not accepting connections; run `espfleet status` to re-check");
    }

    spdlog::info("tunnel: {} open", where);
    return Status::success();
}

bool TunnelManager::kill(int local_port) {
    auto pid = find_process(local_port);
    if (!pid) return false;
    bool sent = procs_.signal(*pid, SIGTERM);
    if (sent) spdlog::info("tunnel: sent SIGTERM to pid {} (port {})", *pid, local_port);
    return sent;
}

} // namespace espfleet
