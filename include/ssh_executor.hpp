#pragma once
/**
 * @page ef-ssh-executor espfleet SSH Executor
 * @file ssh_executor.hpp
 * @brief RemoteExecutor over the OpenSSH client with ControlMaster sessions.
 *
 * @details
 * PURPOSE
 * -------
 * Authenticating an ssh connection to a Raspberry Pi costs the better part of
 * a second. A scan of six boards runs a dozen commands. Instead of paying the
 * handshake per command, connect() starts an OpenSSH master connection and
 * every run() multiplexes a new channel over it:
 *
 * @code
 *   connect:    ssh -M -S <runtime_dir>/cm-%C -f -N -o BatchMode=yes
 *                   -o ConnectTimeout=10 -o ServerAliveInterval=30 -- pi@rack1
 *   run:        ssh -S <runtime_dir>/cm-%C -o BatchMode=yes
 *                   -o ConnectTimeout=10 -- pi@rack1 '<command>'
 *   disconnect: ssh -S <runtime_dir>/cm-%C -O exit -- pi@rack1
 * @endcode
 *
 * Without an open session run() uses the same command line; ssh then simply
 * finds no master socket and makes a direct connection for that one command.
 *
 * FAILURE MAPPING
 * ---------------
 * - ssh exits 255 on its own failures (DNS, refused, auth, host key). That is
 *   mapped to ErrorKind::Connection / "connect_failed" with ssh's stderr as
 *   detail. A remote command that itself exits 255 is indistinguishable and
 *   gets the same treatment; esptool, ls, systemctl and udevadm never do.
 * - A command running past Config::command_timeout_ms is killed and reported
 *   as ErrorKind::Connection / "timeout".
 * - A missing ssh binary is ErrorKind::Process / "spawn_failed".
 *
 * BatchMode=yes means no password prompts: key-based auth is required, and a
 * missing key is a clean connection failure instead of a hung terminal.
 */

#include "espfleet/config.hpp"
#include "espfleet/device.hpp"
#include "espfleet/remote/executor.hpp"

#include <string>
#include <vector>

namespace espfleet {

class SshExecutor : public remote::RemoteExecutor {
public:
    explicit SshExecutor(Config cfg);
    ~SshExecutor() override;

    SshExecutor(const SshExecutor&) = delete;
    SshExecutor& operator=(const SshExecutor&) = delete;

    Status connect(const std::string& host) override;
    void disconnect() override;
    std::string connected_host() const override { return host_; }

    Status run(const std::string& host, const std::string& command, remote::CommandResult& out) override;

    std::vector<std::string> master_argv(const HostSpec& host) const;
    std::vector<std::string> command_argv(const HostSpec& host, const std::string& command) const;
    std::vector<std::string> exit_argv(const HostSpec& host) const;

private:
    std::string control_path() const;

    Config      cfg_;
    std::string host_;     ///< host string as passed to connect(), empty if none
    HostSpec    spec_;
};

} // namespace espfleet
