#pragma once
/**
 * @page ef-subprocess espfleet Subprocess Runner
 * @file subprocess.hpp
 * @brief fork/exec a command, optionally capture its output, bounded in time.
 *
 * @details
 * PURPOSE
 * -------
 * espfleet drives two external programs: ssh (remote commands, ControlMaster
 * sessions, background tunnels) and git (registry sync). This
 * is the single place that forks, wires pipes and waits, so timeout and
 * cleanup behavior is identical everywhere.
 *
 * MODES
 * -----
 * - capture = true: stdout and stderr are read through pipes with poll(2)
 *   until both hit EOF, then the child is reaped.
 * - capture = false: stdout goes to /dev/null and stderr is inherited. Use
 *   this for commands that daemonize (`ssh -f`): the backgrounded grandchild
 *   keeps any pipe we hand it open forever, so we only wait for the direct
 *   child's exit status.
 *
 * In both modes stdin is /dev/null and the whole run is bounded by
 * timeout_ms. On timeout the child gets SIGKILL, is reaped, and the result
 * carries timed_out = true with reason "timeout".
 *
 * ERRORS
 * ------
 * A non-zero exit code is NOT an error here; it is reported in exit_code.
 * Errors are reserved for "could not run it at all": pipe/fork failure,
 * exec failure (binary missing), timeout. exec errno is reported back to the
 * parent through a close-on-exec pipe, so "ssh: No such file or directory"
 * is distinguishable from ssh exiting 127.
 */

#include "espfleet/status.hpp"

#include <string>
#include <vector>

namespace espfleet {

struct ProcessOptions {
    int         timeout_ms = 60000;
    bool        capture    = true;
    std::string cwd;                 ///< empty: inherit
};

struct ProcessOutput {
    std::string out;
    std::string err;
    int         exit_code = -1;      ///< exit status, or 128+signal if killed
    bool        timed_out = false;
};

Status run_process(const std::vector<std::string>& argv, const ProcessOptions& opts, ProcessOutput& result);

/// Render argv for logs, single-quoting arguments with spaces.
std::string join_argv(const std::vector<std::string>& argv);

} // namespace espfleet
