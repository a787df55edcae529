#pragma once
// Shared fakes and fixtures for the doctest suite.

#include "espfleet/config.hpp"
#include "espfleet/remote/executor.hpp"
#include "process_control.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace espfleet_test {

// mkdtemp() directory removed on scope exit.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "espfleet-test-XXXXXX").string();
        char* p = ::mkdtemp(&tmpl[0]);
        if (p) path_ = p;
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    espfleet::Config config() const {
        espfleet::Config cfg = espfleet::Config::rooted_at(path_);
        cfg.tunnel.confirm_delay_ms = 10;
        cfg.tunnel.kill_grace_ms = 0;
        cfg.tunnel.probe_timeout_ms = 200;
        return cfg;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& p, const std::string& text) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Scripted executor: the first rule whose needle occurs in the command answers it.
class FakeExecutor : public espfleet::remote::RemoteExecutor {
public:
    struct Rule {
        std::string needle;
        espfleet::remote::CommandResult result;
        int remaining;  ///< -1: unlimited
    };

    void on(const std::string& needle, std::string out, int exit_code = 0, std::string err = {}, int times = -1) {
        espfleet::remote::CommandResult r;
        r.out = std::move(out);
        r.err = std::move(err);
        r.exit_code = exit_code;
        rules.push_back({needle, r, times});
    }

    espfleet::Status connect(const std::string& host) override {
        ++connects;
        if (!connect_status.ok()) return connect_status;
        host_ = host;
        return espfleet::Status::success();
    }
    void disconnect() override {
        ++disconnects;
        host_.clear();
    }
    std::string connected_host() const override { return host_; }

    espfleet::Status run(const std::string& host, const std::string& command,
                         espfleet::remote::CommandResult& out) override {
        commands.push_back(command);
        hosts.push_back(host);
        if (!run_status.ok()) return run_status;
        for (auto& rule : rules) {
            if (rule.remaining == 0) continue;
            if (command.find(rule.needle) == std::string::npos) continue;
            if (rule.remaining > 0) --rule.remaining;
            out = rule.result;
            return espfleet::Status::success();
        }
        out = espfleet::remote::CommandResult{};
        out.exit_code = 127;
        out.err = "sh: command not scripted";
        return espfleet::Status::success();
    }

    size_t count(const std::string& needle) const {
        size_t n = 0;
        for (const auto& c : commands) {
            if (c.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    std::vector<Rule>        rules;
    std::vector<std::string> commands;
    std::vector<std::string> hosts;
    espfleet::Status         connect_status;
    espfleet::Status         run_status;
    int                      connects = 0;
    int                      disconnects = 0;

private:
    std::string host_;
};

// Loopback listener (ephemeral port unless one is given); closed on scope exit.
class Listener {
public:
    explicit Listener(int port = 0) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof addr) != 0 || ::listen(fd_, 4) != 0) {
            ::close(fd_);
            fd_ = -1;
            return;
        }
        socklen_t len = sizeof addr;
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~Listener() { close(); }
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void close() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }
    int port() const { return port_; }
    int fd() const { return fd_; }

private:
    int fd_{-1};
    int port_{0};
};

// A port that was free a moment ago.
inline int unused_port() {
    Listener l;
    int port = l.port();
    l.close();
    return port;
}

// Process table + launcher double. launch() records argv and, when
// listen_port is set, starts a Listener there to mimic a working forward.
class FakeProcessControl : public espfleet::ProcessControl {
public:
    std::vector<espfleet::ProcessInfo> snapshot() const override { return table; }

    bool signal(int pid, int sig) override {
        signals.emplace_back(pid, sig);
        for (auto it = table.begin(); it != table.end(); ++it) {
            if (it->pid == pid) {
                table.erase(it);
                return true;
            }
        }
        return false;
    }

    espfleet::Status launch(const std::vector<std::string>& argv, int& exit_code) override {
        launches.push_back(argv);
        if (!launch_status.ok()) return launch_status;
        exit_code = launch_exit_code;
        if (launch_exit_code == 0 && listen_port > 0) listener = std::make_unique<Listener>(listen_port);
        return espfleet::Status::success();
    }

    std::vector<espfleet::ProcessInfo>       table;
    std::vector<std::pair<int, int>>         signals;
    std::vector<std::vector<std::string>>    launches;
    espfleet::Status                         launch_status;
    int                                      launch_exit_code = 0;
    int                                      listen_port = 0;
    std::unique_ptr<Listener>                listener;
};

} // namespace espfleet_test
