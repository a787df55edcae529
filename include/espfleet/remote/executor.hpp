#pragma once
/**
 * @file executor.hpp
 * @brief Abstract "run a shell command on host H" interface plus a scoped session.
 *
 * Contract:
 *  - run(host, cmd, out) executes @p cmd through the remote user's shell and
 *    fills stdout/stderr/exit_code.
 *  - A remote command that exits non-zero is a SUCCESSFUL run: the Status is
 *    ok and out.exit_code carries the code. Callers decide what it means.
 *  - ErrorKind::Connection is returned only when the host could not be
 *    reached or authenticated, or the command hung past the executor's bound.
 *  - connect(host) opens a session that later run(host, ...) calls reuse.
 *    Without an open session for that host, run() pays for a full connection
 *    per call. Use ScopedConnection for anything issuing several commands.
 *
 * Implementations hold at most one open session at a time.
 */

#include "espfleet/status.hpp"

#include <string>

namespace espfleet::remote {

struct CommandResult {
    std::string out;
    std::string err;
    int         exit_code{-1};
};

class RemoteExecutor {
public:
    virtual ~RemoteExecutor() = default;

    virtual Status connect(const std::string& host) = 0;
    virtual void   disconnect() = 0;
    /// Host of the open session, empty if none.
    virtual std::string connected_host() const = 0;

    virtual Status run(const std::string& host, const std::string& command, CommandResult& out) = 0;
};

/// Quote @p s for a POSIX shell: abc -> 'abc', it's -> 'it'"'"'s'.
std::string shell_quote(const std::string& s);

/**
 * @brief RAII session: connect in the constructor, disconnect in the destructor.
 *
 * If another session was already open to the same host, the scope reuses it
 * and leaves it open on exit.
 */
class ScopedConnection {
public:
    ScopedConnection(RemoteExecutor& exec, const std::string& host);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    const Status& status() const { return status_; }
    bool ok() const { return status_.ok(); }

private:
    RemoteExecutor& exec_;
    Status status_;
    bool owns_{false};
};

} // namespace espfleet::remote
