#pragma once
/**
 * @page ef-tunnel-manager espfleet Tunnel Manager
 * @file tunnel_manager.hpp
 * @brief Create, find and kill the ssh port forwards that make remote boards local.
 *
 * @details
 * PURPOSE
 * -------
 * A "tunnel" is one background ssh process:
 *
 * @code
 *   ssh -f -N -L 4000:127.0.0.1:4000 -o ExitOnForwardFailure=yes
 *       -o ServerAliveInterval=30 -o BatchMode=yes -- pi@rack1
 * @endcode
 *
 * ser2net on the Pi listens on 127.0.0.1:4000 (remote side); after the
 * forward, esptool on the operator machine talks to rfc2217://localhost:4000.
 *
 * STATE MODEL
 * -----------
 * Per local port the state is Closed or Open, and it is never stored:
 *   - is_open(port): TCP connect to 127.0.0.1:port within probe_timeout_ms.
 *   - find_process(port): scan the process table for an ssh whose arguments
 *     carry "-L <port>:". The argument vector is the only bookkeeping; that
 *     is why the forward spec always starts with the bare local port.
 * Both are point-in-time answers. Another process can bind or free the port
 * a millisecond later.
 *
 * LIFECYCLE
 * ---------
 * create(host, local, remote):
 *   1) If an ssh already forwards @c local, SIGTERM it and wait kill_grace_ms
 *      so a stale forward (board moved, Pi rebooted) never shadows the new one.
 *   2) Launch the ssh above. ssh -f only backgrounds after the forward is
 *      bound (ExitOnForwardFailure), so a non-zero exit means it never worked:
 *      auth failure, unreachable host, local port taken.
 *   3) Wait confirm_delay_ms, then is_open(local). Unconfirmed is a failure,
 *      even though the process may still be starting; callers need a yes/no.
 * There is no retry loop; retry policy belongs to the caller.
 *
 * kill(port): SIGTERM (not SIGKILL) to the forwarder, so ssh tears the
 * channel down cleanly. Returns false when nothing forwards that port.
 *
 * Tunnels are detached. They outlive the espfleet invocation that made them,
 * and interrupting espfleet does not touch them.
 */

#include "espfleet/config.hpp"
#include "espfleet/status.hpp"
#include "process_control.hpp"

#include <optional>
#include <string>
#include <vector>

namespace espfleet {

enum class TunnelState { Closed, Open };

/// TCP connect to 127.0.0.1:@p port; true iff it succeeds within @p timeout_ms.
bool probe_port(int port, int timeout_ms);

/// True if @p argv runs @p program (compared by basename) and forwards local
/// port @p local_port.
bool is_forward_for(const std::vector<std::string>& argv, int local_port, const std::string& program = "ssh");

class TunnelManager {
public:
    TunnelManager(ProcessControl& procs, const Config& cfg);

    bool is_open(int local_port) const;
    TunnelState state(int local_port) const;
    std::optional<int> find_process(int local_port) const;

    Status create(const std::string& host, int local_port, int remote_port);
    bool kill(int local_port);

    std::vector<std::string> forward_argv(const std::string& host, int local_port, int remote_port) const;

private:
    ProcessControl& procs_;
    std::string     ssh_binary_;
    std::string     default_user_;
    int             server_alive_s_;
    TunnelTimeouts  timeouts_;
};

} // namespace espfleet
