// ============================================================================
// process_control.cpp - implementation for process_control.hpp
// ============================================================================

#include "process_control.hpp"
#include "subprocess.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <signal.h>

namespace fs = std::filesystem;

namespace espfleet {

std::vector<std::string> split_cmdline(const std::string& blob) {
    std::vector<std::string> args;
    std::string cur;
    for (char c : blob) {
        if (c == '\0') {
            args.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) args.push_back(cur);
    return args;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::vector<ProcessInfo> LinuxProcessControl::snapshot() const {
    std::vector<ProcessInfo> out;
    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!all_digits(name)) continue;

        std::ifstream in(it->path() / "cmdline", std::ios::binary);
        if (!in) continue;  // exited meanwhile, or not ours to read
        std::string blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (blob.empty()) continue;  // kernel thread or zombie

        out.push_back({std::stoi(name), split_cmdline(blob)});
    }
    if (ec) spdlog::warn("proc: listing /proc failed: {}", ec.message());

    std::sort(out.begin(), out.end(), [](const ProcessInfo& a, const ProcessInfo& b) { return a.pid < b.pid; });
    return out;
}

bool LinuxProcessControl::signal(int pid, int sig) {
    if (::kill(pid, sig) == 0) return true;
    spdlog::warn("proc: kill({}, {}) failed: {}", pid, sig, std::strerror(errno));
    return false;
}

Status LinuxProcessControl::launch(const std::vector<std::string>& argv, int& exit_code) {
    ProcessOptions opts;
    opts.capture = false;
    opts.timeout_ms = launch_timeout_ms_;

    ProcessOutput po;
    Status st = run_process(argv, opts, po);
    exit_code = po.exit_code;
    return st;
}

} // namespace espfleet
