#pragma once
/**
 * @file status.hpp
 * @brief Outcome type shared by every espfleet operation.
 *
 * @details
 * Operations that can fail for reasons outside our control (ssh could not
 * reach a host, a tunnel never came up, a file could not be written) return
 * a Status instead of throwing. Two fields matter to callers:
 *
 *   - kind:   coarse category, used for exit codes and branching.
 *   - reason: stable snake_case token ("connect_failed", "port_conflict").
 *             Scripts match on this; never reword an existing one.
 *
 * detail is free text for humans: what was tried, on which host/port/device.
 *
 * The CLI renders a failed Status as
 * @code
 *   status=error reason=connect_failed host=pi@rack1 detail="..."
 * @endcode
 */

#include <string>
#include <utility>

namespace espfleet {

enum class ErrorKind {
    None,
    Connection,     ///< cannot reach or authenticate to a host
    NotFound,       ///< unknown device name
    Conflict,       ///< remote port collision within a host
    ProtocolParse,  ///< remote output could not be understood
    Process,        ///< spawn/signal failure, tunnel did not come up
    Io,             ///< local file read/write failure
    Usage           ///< bad arguments from the caller
};

const char* to_string(ErrorKind kind);

struct Status {
    ErrorKind   kind = ErrorKind::None;
    std::string reason;
    std::string detail;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return Status{}; }
    static Status error(ErrorKind kind, std::string reason, std::string detail = {}) {
        return Status{kind, std::move(reason), std::move(detail)};
    }
};

} // namespace espfleet
