#pragma once

/**
 * @page ef-telnet espfleet Telnet / RFC 2217 Framing
 * @file telnet.hpp
 * @brief Byte-level telnet codec and option negotiator for talking to ser2net.
 *
 * @details
 * OVERVIEW
 * --------
 * ser2net exposes each serial port as a telnet(rfc2217) accepter. Serial data
 * travels as a telnet byte stream, so any 0xFF data byte must be doubled, and
 * the server interleaves option negotiation and subnegotiation with the data.
 * RFC 2217 adds option 44 (COM-PORT-OPTION), whose SET-BAUDRATE command
 * changes the line speed of the remote UART.
 *
 * WIRE FORMAT
 * -----------
 *   IAC  (0xFF) introduces a command. IAC IAC is a literal 0xFF data byte.
 *   WILL/WONT/DO/DONT (0xFB..0xFE) are followed by one option byte.
 *   SB (0xFA) <option> ... IAC SE (0xF0) wraps a subnegotiation.
 *   SET-BAUDRATE: IAC SB 44 1 <u32 big endian> IAC SE
 *
 * Any IAC byte inside the subnegotiation payload is doubled too.
 *
 * NEGOTIATION POLICY
 * ------------------
 * The client offers WILL COM-PORT-OPTION, WILL BINARY and DO BINARY. It
 * accepts BINARY in both directions and COM-PORT-OPTION on its own side;
 * every other option is refused. A request for a state we are already in is
 * never answered, which keeps the two sides from looping.
 *
 * EXAMPLE
 * -------
 * @code
 *   espfleet::telnet::decoder dec;
 *   espfleet::telnet::negotiator neg;
 *   std::vector<uint8_t> reply;
 *   for (uint8_t b : incoming) {
 *       uint8_t data = 0;
 *       espfleet::telnet::negotiation n;
 *       switch (dec.feed(b, data, n)) {
 *           case espfleet::telnet::event::data:      out.push_back(data); break;
 *           case espfleet::telnet::event::negotiate: neg.respond(n, reply); break;
 *           case espfleet::telnet::event::none:      break;
 *       }
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace espfleet {
namespace telnet {

static constexpr uint8_t IAC  = 0xFF;
static constexpr uint8_t DONT = 0xFE;
static constexpr uint8_t DO   = 0xFD;
static constexpr uint8_t WONT = 0xFC;
static constexpr uint8_t WILL = 0xFB;
static constexpr uint8_t SB   = 0xFA;
static constexpr uint8_t SE   = 0xF0;

static constexpr uint8_t OPT_BINARY          = 0;
static constexpr uint8_t OPT_COM_PORT        = 44;
static constexpr uint8_t COM_SET_BAUDRATE    = 1;

/// Append @p n data bytes to @p out, doubling every IAC.
inline void escape(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.reserve(out.size() + n + 4);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(in[i]);
        if (in[i] == IAC) out.push_back(IAC);
    }
}

/// IAC SB 44 1 <baud, 4 bytes big endian> IAC SE
inline std::vector<uint8_t> set_baudrate_command(uint32_t baud) {
    std::vector<uint8_t> out{IAC, SB, OPT_COM_PORT, COM_SET_BAUDRATE};
    const uint8_t value[4] = {
        static_cast<uint8_t>(baud >> 24), static_cast<uint8_t>(baud >> 16),
        static_cast<uint8_t>(baud >> 8),  static_cast<uint8_t>(baud)
    };
    escape(value, sizeof(value), out);
    out.push_back(IAC);
    out.push_back(SE);
    return out;
}

/// One WILL/WONT/DO/DONT request seen on the wire.
struct negotiation {
    uint8_t verb   = 0;
    uint8_t option = 0;
};

enum class event { none, data, negotiate };

/**
 * @brief Stateful decoder for byte-at-a-time feeds.
 *
 * Separates serial data from telnet commands. Subnegotiation payloads (the
 * server's acknowledgement of SET-BAUDRATE, line state notifications) are
 * consumed and dropped. Other two-byte commands (NOP, GA, ...) are ignored.
 */
struct decoder {
    enum class state { data, iac, option, sub, sub_iac };

    state   st   = state::data;
    uint8_t verb = 0;

    event feed(uint8_t b, uint8_t& data, negotiation& neg) {
        switch (st) {
            case state::data:
                if (b == IAC) { st = state::iac; return event::none; }
                data = b;
                return event::data;

            case state::iac:
                if (b == IAC) { st = state::data; data = IAC; return event::data; }
                if (b >= WILL) { verb = b; st = state::option; return event::none; }
                st = (b == SB) ? state::sub : state::data;
                return event::none;

            case state::option:
                st = state::data;
                neg.verb = verb;
                neg.option = b;
                return event::negotiate;

            case state::sub:
                if (b == IAC) st = state::sub_iac;
                return event::none;

            case state::sub_iac:
                // IAC SE closes; IAC IAC is an escaped payload byte.
                st = (b == SE) ? state::data : state::sub;
                return event::none;
        }
        return event::none;
    }
};

/**
 * @brief Option state for both directions, answering requests per the policy above.
 */
class negotiator {
public:
    /// Opening offers; also marks them as pending so the acks are not re-answered.
    std::vector<uint8_t> start() {
        requested_local_[OPT_COM_PORT] = true;
        requested_local_[OPT_BINARY] = true;
        requested_remote_[OPT_BINARY] = true;
        return {IAC, WILL, OPT_COM_PORT, IAC, WILL, OPT_BINARY, IAC, DO, OPT_BINARY};
    }

    /// Append the reply to @p n (if any) to @p out.
    void respond(const negotiation& n, std::vector<uint8_t>& out) {
        const uint8_t opt = n.option;
        switch (n.verb) {
            case DO:
                if (!accept_local(opt)) { send(out, WONT, opt); break; }
                if (!local_[opt]) {
                    local_[opt] = true;
                    if (!requested_local_[opt]) send(out, WILL, opt);
                }
                requested_local_[opt] = false;
                break;
            case DONT:
                if (local_[opt] || requested_local_[opt]) {
                    const bool was_on = local_[opt];
                    local_[opt] = false;
                    requested_local_[opt] = false;
                    if (was_on) send(out, WONT, opt);
                }
                break;
            case WILL:
                if (!accept_remote(opt)) { send(out, DONT, opt); break; }
                if (!remote_[opt]) {
                    remote_[opt] = true;
                    if (!requested_remote_[opt]) send(out, DO, opt);
                }
                requested_remote_[opt] = false;
                break;
            case WONT:
                if (remote_[opt] || requested_remote_[opt]) {
                    const bool was_on = remote_[opt];
                    remote_[opt] = false;
                    requested_remote_[opt] = false;
                    if (was_on) send(out, DONT, opt);
                }
                break;
            default:
                break;
        }
    }

    bool local_enabled(uint8_t opt) const { return local_[opt]; }
    bool remote_enabled(uint8_t opt) const { return remote_[opt]; }

private:
    static bool accept_local(uint8_t opt) { return opt == OPT_COM_PORT || opt == OPT_BINARY; }
    static bool accept_remote(uint8_t opt) { return opt == OPT_BINARY; }

    static void send(std::vector<uint8_t>& out, uint8_t verb, uint8_t opt) {
        out.push_back(IAC);
        out.push_back(verb);
        out.push_back(opt);
    }

    bool local_[256] = {};
    bool remote_[256] = {};
    bool requested_local_[256] = {};
    bool requested_remote_[256] = {};
};

} // namespace telnet
} // namespace espfleet
