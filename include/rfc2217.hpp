#pragma once
/**
 * @page ef-rfc2217 espfleet Serial Monitor (Header)
 * @file rfc2217.hpp
 * @brief RFC 2217 client for a forwarded ser2net port, baud detection and the interactive monitor.
 *
 * @details
 * PURPOSE
 * -------
 * Once a tunnel is up, rfc2217://localhost:<local_port> is a remote UART. This
 * header declares the small client the monitor uses to talk to it:
 *
 *   - Rfc2217Client::open: TCP connect to 127.0.0.1, offer COM-PORT-OPTION and
 *     BINARY, wait briefly for the server to agree, then SET-BAUDRATE.
 *   - read / read_available: serial data with telnet commands stripped and
 *     negotiation answered inline.
 *   - write: serial data with IAC doubled.
 *
 * BAUD DETECTION
 * --------------
 * detect_baud() opens a fresh session at each common ESP rate, reads up to 100
 * bytes for half a second and accepts the first rate whose output looks like
 * text: at least 5 bytes, more than 70 % of them printable ASCII or \\t \\n \\r.
 * 115200 is the fallback. A silent board therefore always "detects" 115200.
 *
 * MONITOR
 * -------
 * run_monitor() relays socket -> stdout. In interactive mode it also puts
 * stdin into raw mode and relays keystrokes -> socket; byte 0x03 (Ctrl+C)
 * ends the session and the terminal is restored on every exit path. In
 * non-interactive mode SIGINT ends the session.
 *
 * EXAMPLE
 * -------
 * @code
 *   espfleet::Rfc2217Client client;
 *   auto st = client.open(4000, 115200, 2000);
 *   if (st.ok()) st = espfleet::run_monitor(client, isatty(0));
 * @endcode
 */

#include "espfleet/status.hpp"
#include "espfleet/telnet.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace espfleet {

/// Rates tried by detect_baud(), in order.
extern const std::vector<uint32_t> kCommonBaudRates;

class Rfc2217Client {
public:
    Rfc2217Client() = default;
    ~Rfc2217Client();

    Rfc2217Client(const Rfc2217Client&) = delete;
    Rfc2217Client& operator=(const Rfc2217Client&) = delete;

    /**
     * @brief Connect to 127.0.0.1:@p port, negotiate and set @p baud.
     *
     * @p timeout_ms bounds the TCP connect and, separately, the wait for the
     * server to accept COM-PORT-OPTION. A server that never answers is
     * tolerated (logged); one that refuses the option is an error
     * ("rfc2217_refused").
     */
    Status open(int port, uint32_t baud, int timeout_ms);

    Status set_baud(uint32_t baud);

    /// Append up to @p max data bytes to @p out, waiting at most @p timeout_ms for them all.
    Status read(std::vector<uint8_t>& out, size_t max, int timeout_ms);

    /// Append whatever data is available, waiting at most @p timeout_ms for the first batch.
    Status read_available(std::vector<uint8_t>& out, int timeout_ms);

    Status write(const uint8_t* data, size_t n);

    void close();

    bool is_open() const { return fd_ >= 0; }
    bool has_pending() const { return !pending_.empty(); }
    int fd() const { return fd_; }

private:
    Status pump(int timeout_ms);
    Status send_raw(const std::vector<uint8_t>& bytes);

    int                  fd_{-1};
    telnet::decoder      decoder_;
    telnet::negotiator   negotiator_;
    std::vector<uint8_t> pending_;
    bool                 refused_{false};
};

/// True when @p data has >= 5 bytes and more than 70 % are printable.
bool looks_like_text(const std::vector<uint8_t>& data);

/// First rate in kCommonBaudRates producing text on @p port, else 115200.
uint32_t detect_baud(int port, int connect_timeout_ms);

/**
 * @brief Relay the serial stream until Ctrl+C / SIGINT or the connection drops.
 *
 * @param interactive  stdin is a terminal and keystrokes should be forwarded.
 * @return success on a user-requested exit; Connection "connection_closed"
 *         when the server hangs up.
 */
Status run_monitor(Rfc2217Client& client, bool interactive);

} // namespace espfleet
