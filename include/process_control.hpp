#pragma once
/**
 * @file process_control.hpp
 * @brief The slice of the operating system the tunnel layer depends on.
 *
 * Tunnels are background ssh processes we do not track in any file. The
 * process table is the source of truth: "which ssh is forwarding port 4000"
 * is answered by reading argv of every process. The answer can be stale by
 * the time it is used, so it sits behind this interface and tests substitute
 * a fake.
 *
 * Contract:
 *  - snapshot() lists processes visible to us, ascending pid. Processes that
 *    exit while being read are skipped.
 *  - signal(pid, sig) returns true iff kill(2) succeeded.
 *  - launch(argv, exit_code) runs a self-backgrounding command (ssh -f) and
 *    waits for the foreground part to exit. A failure to run it at all is a
 *    non-ok Status; the command's own failure is a non-zero exit_code.
 */

#include "espfleet/status.hpp"

#include <string>
#include <vector>

namespace espfleet {

struct ProcessInfo {
    int pid{0};
    std::vector<std::string> argv;
};

class ProcessControl {
public:
    virtual ~ProcessControl() = default;
    virtual std::vector<ProcessInfo> snapshot() const = 0;
    virtual bool signal(int pid, int sig) = 0;
    virtual Status launch(const std::vector<std::string>& argv, int& exit_code) = 0;
};

/// /proc/<pid>/cmdline + kill(2) + run_process().
class LinuxProcessControl : public ProcessControl {
public:
    explicit LinuxProcessControl(int launch_timeout_ms) : launch_timeout_ms_(launch_timeout_ms) {}

    std::vector<ProcessInfo> snapshot() const override;
    bool signal(int pid, int sig) override;
    Status launch(const std::vector<std::string>& argv, int& exit_code) override;

private:
    int launch_timeout_ms_;
};

/// Split a NUL-separated /proc cmdline blob into arguments.
std::vector<std::string> split_cmdline(const std::string& blob);

} // namespace espfleet
