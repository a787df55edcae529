// ============================================================================
// rfc2217.cpp - implementation for rfc2217.hpp
// ============================================================================

#include "rfc2217.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

namespace espfleet {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kChunk = 512;
constexpr uint8_t kCtrlC = 0x03;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

Status errno_status(const char* reason, const std::string& what) {
    return Status::error(ErrorKind::Connection, reason, what + ": " + std::strerror(errno));
}

// Restores the saved termios on scope exit.
class RawTerminal {
public:
    explicit RawTerminal(int fd) : fd_(fd) {
        if (tcgetattr(fd_, &saved_) != 0) return;
        termios raw = saved_;
        cfmakeraw(&raw);
        raw.c_cc[VMIN]  = 0;
        raw.c_cc[VTIME] = 0;
        active_ = tcsetattr(fd_, TCSANOW, &raw) == 0;
    }
    ~RawTerminal() {
        if (active_) tcsetattr(fd_, TCSADRAIN, &saved_);
    }
    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

private:
    int     fd_;
    termios saved_{};
    bool    active_{false};
};

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

// Installs on_sigint without SA_RESTART so poll() wakes up; restores on exit.
class SigintScope {
public:
    SigintScope() {
        g_interrupted = 0;
        struct sigaction sa{};
        sa.sa_handler = on_sigint;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        installed_ = ::sigaction(SIGINT, &sa, &previous_) == 0;
    }
    ~SigintScope() {
        if (installed_) ::sigaction(SIGINT, &previous_, nullptr);
    }
    SigintScope(const SigintScope&) = delete;
    SigintScope& operator=(const SigintScope&) = delete;

private:
    struct sigaction previous_{};
    bool installed_{false};
};

bool write_all(int fd, const uint8_t* data, size_t n) {
    while (n > 0) {
        ssize_t w = ::write(fd, data, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

} // namespace

const std::vector<uint32_t> kCommonBaudRates = {115200, 9600, 74880, 57600, 38400, 19200, 4800};

Rfc2217Client::~Rfc2217Client() { close(); }

void Rfc2217Client::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    decoder_ = telnet::decoder{};
    negotiator_ = telnet::negotiator{};
    pending_.clear();
    refused_ = false;
}

Status Rfc2217Client::open(int port, uint32_t baud, int timeout_ms) {
    close();
    if (port < 1 || port > 65535) {
        return Status::error(ErrorKind::Usage, "bad_port", "port " + std::to_string(port) + " out of range");
    }

    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return errno_status("socket_failed", "socket");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    const std::string where = "127.0.0.1:" + std::to_string(port);
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof addr) != 0) {
        if (errno != EINPROGRESS) {
            Status st = errno_status("connect_failed", where);
            close();
            return st;
        }
        pollfd pfd{fd_, POLLOUT, 0};
        int pr;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);
        if (pr == 0) {
            close();
            return Status::error(ErrorKind::Connection, "timeout", where);
        }
        int err = 0;
        socklen_t len = sizeof err;
        if (pr < 0 || ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) {
            if (err != 0) errno = err;
            Status st = errno_status("connect_failed", where);
            close();
            return st;
        }
    }

    Status st = send_raw(negotiator_.start());
    if (!st.ok()) return st;

    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!negotiator_.local_enabled(telnet::OPT_COM_PORT) && !refused_) {
        int left = remaining_ms(deadline);
        if (left == 0) break;
        st = pump(left);
        if (!st.ok()) return st;
    }
    if (refused_) {
        close();
        return Status::error(ErrorKind::ProtocolParse, "rfc2217_refused",
                             where + " does not speak RFC 2217 (ser2net accepter must be telnet(rfc2217))");
    }
    if (!negotiator_.local_enabled(telnet::OPT_COM_PORT)) {
        spdlog::warn("rfc2217: {} did not confirm COM-PORT-OPTION, sending baud anyway", where);
    }

    spdlog::debug("rfc2217: connected to {} at {} baud", where, baud);
    return set_baud(baud);
}

Status Rfc2217Client::set_baud(uint32_t baud) {
    return send_raw(telnet::set_baudrate_command(baud));
}

// One read from the socket into pending_, answering negotiation on the way.
Status Rfc2217Client::pump(int timeout_ms) {
    if (fd_ < 0) return Status::error(ErrorKind::Connection, "not_connected", "rfc2217 client is closed");

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr < 0) {
        if (errno == EINTR) return Status::success();
        return errno_status("read_failed", "poll");
    }
    if (pr == 0) return Status::success();

    uint8_t buf[kChunk];
    ssize_t n = ::recv(fd_, buf, sizeof buf, 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return Status::success();
        return errno_status("read_failed", "recv");
    }
    if (n == 0) return Status::error(ErrorKind::Connection, "connection_closed", "server closed the connection");

    std::vector<uint8_t> reply;
    for (ssize_t i = 0; i < n; ++i) {
        uint8_t data = 0;
        telnet::negotiation neg;
        switch (decoder_.feed(buf[i], data, neg)) {
            case telnet::event::data:
                pending_.push_back(data);
                break;
            case telnet::event::negotiate:
                if (neg.option == telnet::OPT_COM_PORT && neg.verb == telnet::DONT) refused_ = true;
                negotiator_.respond(neg, reply);
                break;
            case telnet::event::none:
                break;
        }
    }
    if (!reply.empty()) return send_raw(reply);
    return Status::success();
}

Status Rfc2217Client::read(std::vector<uint8_t>& out, size_t max, int timeout_ms) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (pending_.size() < max) {
        int left = remaining_ms(deadline);
        if (left == 0) break;
        Status st = pump(left);
        if (!st.ok()) return st;
    }
    size_t take = pending_.size() < max ? pending_.size() : max;
    out.insert(out.end(), pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
    return Status::success();
}

Status Rfc2217Client::read_available(std::vector<uint8_t>& out, int timeout_ms) {
    if (pending_.empty()) {
        Status st = pump(timeout_ms);
        if (!st.ok()) return st;
    }
    out.insert(out.end(), pending_.begin(), pending_.end());
    pending_.clear();
    return Status::success();
}

Status Rfc2217Client::write(const uint8_t* data, size_t n) {
    std::vector<uint8_t> wire;
    telnet::escape(data, n, wire);
    return send_raw(wire);
}

Status Rfc2217Client::send_raw(const std::vector<uint8_t>& bytes) {
    if (fd_ < 0) return Status::error(ErrorKind::Connection, "not_connected", "rfc2217 client is closed");

    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t w = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
        if (w >= 0) {
            off += static_cast<size_t>(w);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            pollfd pfd{fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, 1000) <= 0) return Status::error(ErrorKind::Connection, "write_failed", "socket not writable");
            continue;
        }
        return errno_status("write_failed", "send");
    }
    return Status::success();
}

bool looks_like_text(const std::vector<uint8_t>& data) {
    if (data.size() < 5) return false;
    size_t printable = 0;
    for (uint8_t b : data) {
        if ((b >= 0x20 && b <= 0x7E) || b == '\n' || b == '\r' || b == '\t') ++printable;
    }
    return printable * 10 > data.size() * 7;
}

uint32_t detect_baud(int port, int connect_timeout_ms) {
    for (uint32_t rate : kCommonBaudRates) {
        Rfc2217Client client;
        Status st = client.open(port, rate, connect_timeout_ms);
        if (!st.ok()) {
            spdlog::debug("baud probe {}: {} {}", rate, st.reason, st.detail);
            continue;
        }
        std::vector<uint8_t> data;
        st = client.read(data, 100, 500);
        if (!st.ok()) {
            spdlog::debug("baud probe {}: {} {}", rate, st.reason, st.detail);
            continue;
        }
        spdlog::debug("baud probe {}: {} bytes", rate, data.size());
        if (looks_like_text(data)) return rate;
    }
    return kCommonBaudRates.front();
}

Status run_monitor(Rfc2217Client& client, bool interactive) {
    SigintScope sigint;
    std::unique_ptr<RawTerminal> terminal;
    if (interactive) terminal = std::make_unique<RawTerminal>(STDIN_FILENO);

    std::vector<uint8_t> data;
    while (!g_interrupted) {
        pollfd fds[2] = {{client.fd(), POLLIN, 0}, {STDIN_FILENO, POLLIN, 0}};
        const nfds_t nfds = interactive ? 2 : 1;
        int timeout = client.has_pending() ? 0 : 100;

        int pr = ::poll(fds, nfds, timeout);
        if (pr < 0) {
            if (errno == EINTR) continue;
            return errno_status("read_failed", "poll");
        }

        if (client.has_pending() || (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            data.clear();
            Status st = client.read_available(data, 0);
            if (!st.ok()) return st;
            if (!data.empty() && !write_all(STDOUT_FILENO, data.data(), data.size())) {
                return Status::error(ErrorKind::Io, "write_failed", "stdout closed");
            }
        }

        if (interactive && (fds[1].revents & POLLIN)) {
            uint8_t keys[64];
            ssize_t n = ::read(STDIN_FILENO, keys, sizeof keys);
            if (n <= 0) continue;
            size_t len = static_cast<size_t>(n);
            bool quit = false;
            for (size_t i = 0; i < len; ++i) {
                if (keys[i] == kCtrlC) { len = i; quit = true; break; }
            }
            if (len > 0) {
                Status st = client.write(keys, len);
                if (!st.ok()) return st;
            }
            if (quit) break;
        }
    }
    return Status::success();
}

} // namespace espfleet
