// ============================================================================
// registry_git.cpp - implementation for registry_git.hpp
// ============================================================================

#include "registry_git.hpp"
#include "espfleet/device_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace espfleet {

static std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

RegistryGit::RegistryGit(const Config& cfg)
    : dir_(cfg.registry_dir), git_binary_(cfg.git_binary), timeout_ms_(cfg.command_timeout_ms) {}

Status RegistryGit::git(const std::vector<std::string>& args, ProcessOutput& out) const {
    std::vector<std::string> argv{git_binary_, "-C", dir_.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcessOptions opts;
    opts.timeout_ms = timeout_ms_;
    return run_process(argv, opts, out);
}

// Like git(), but a non-zero exit is an error carrying git's stderr.
Status RegistryGit::git_ok(const std::vector<std::string>& args, ProcessOutput& out) const {
    Status st = git(args, out);
    if (!st.ok()) return st;
    if (out.exit_code != 0) {
        std::string msg = trim(out.err.empty() ? out.out : out.err);
        return Status::error(ErrorKind::Process, "git_failed", "git " + args.front() + ": " + msg);
    }
    return Status::success();
}

bool RegistryGit::is_repo() const {
    std::error_code ec;
    return fs::exists(dir_ / ".git", ec);
}

Status RegistryGit::init(const std::string& remote_url) {
    ProcessOutput out;
    std::error_code ec;

    if (!remote_url.empty()) {
        if (fs::exists(dir_, ec) && !fs::is_empty(dir_, ec)) {
            return Status::error(ErrorKind::Usage, "registry_not_empty",
                                 dir_.string() + " already has files; move them away before cloning");
        }
        ProcessOptions opts;
        opts.timeout_ms = timeout_ms_;
        Status st = run_process({git_binary_, "clone", remote_url, dir_.string()}, opts, out);
        if (!st.ok()) return st;
        if (out.exit_code != 0) {
            return Status::error(ErrorKind::Connection, "clone_failed", "git clone " + remote_url + ": " + trim(out.err));
        }
        spdlog::info("git: cloned {} into {}", remote_url, dir_.string());
        return Status::success();
    }

    fs::create_directories(dir_, ec);
    if (ec) return Status::error(ErrorKind::Io, "mkdir_failed", dir_.string() + ": " + ec.message());

    Status st = git_ok({"init"}, out);
    if (!st.ok()) return st;

    DeviceStore store(dir_ / "devices.json");
    if (!fs::exists(store.path(), ec)) {
        st = store.save(nlohmann::json{{"device", nlohmann::json::object()}});
        if (!st.ok()) return st;
    }
    for (const char* sub : {"hosts", "udev"}) {
        fs::create_directories(dir_ / sub, ec);
        if (ec) return Status::error(ErrorKind::Io, "mkdir_failed", (dir_ / sub).string() + ": " + ec.message());
    }

    st = git_ok({"add", "devices.json"}, out);
    if (!st.ok()) return st;
    st = git_ok({"commit", "-m", "Initial registry"}, out);
    if (!st.ok()) {
        st.detail += " (set git user.name and user.email, then run `espfleet sync`)";
        return st;
    }
    spdlog::info("git: initialized registry at {}", dir_.string());
    return Status::success();
}

Status RegistryGit::sync(const std::string& message, std::string& summary) {
    summary.clear();
    if (!is_repo()) {
        return Status::error(ErrorKind::Usage, "registry_not_initialized",
                             dir_.string() + " is not a git repository; run `espfleet init`");
    }

    ProcessOutput out;
    Status st = git_ok({"add", "-A"}, out);
    if (!st.ok()) return st;

    st = git_ok({"status", "--porcelain"}, out);
    if (!st.ok()) return st;
    if (!trim(out.out).empty()) {
        st = git_ok({"commit", "-m", message}, out);
        if (!st.ok()) return st;
    }

    st = git_ok({"remote"}, out);
    if (!st.ok()) return st;
    if (trim(out.out).empty()) {
        summary = "Committed locally (no remote configured)";
        return Status::success();
    }

    st = git_ok({"pull"}, out);
    if (!st.ok()) {
        st.kind = ErrorKind::Connection;
        st.reason = "sync_failed";
        return st;
    }
    st = git_ok({"push"}, out);
    if (!st.ok()) {
        st.kind = ErrorKind::Connection;
        st.reason = "sync_failed";
        return st;
    }
    summary = "Synced with remote";
    return Status::success();
}

GitStatus RegistryGit::status() const {
    GitStatus gs;
    if (!is_repo()) return gs;
    gs.initialized = true;

    ProcessOutput out;
    if (git({"status", "--porcelain"}, out).ok() && out.exit_code == 0) {
        gs.dirty = !trim(out.out).empty();
    }
    if (git({"rev-parse", "--abbrev-ref", "HEAD"}, out).ok() && out.exit_code == 0) {
        gs.branch = trim(out.out);
        if (gs.branch == "HEAD") gs.branch = "detached";
    }
    if (git({"remote", "get-url", "origin"}, out).ok() && out.exit_code == 0) {
        gs.has_remote = true;
        gs.remote_url = trim(out.out);
    }
    return gs;
}

} // namespace espfleet
