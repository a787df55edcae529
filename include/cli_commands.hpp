#pragma once
/**
 * @page ef-cli-commands espfleet CLI Command Handlers
 * @file cli_commands.hpp
 * @brief One function per `espfleet` subcommand; main.cpp only parses and dispatches.
 *
 * @details
 * PURPOSE
 * -------
 * main.cpp owns argument parsing (CLI11) and nothing else. Every subcommand
 * lands in a cmd_* function here that composes the core modules and turns
 * their Status values into output and an exit code. The handlers take their
 * collaborators through CliContext, so tests drive them with a fake
 * RemoteExecutor / ProcessControl and string streams.
 *
 * OUTPUT CONTRACT
 * ---------------
 * - Results go to ctx.out as key=value lines, one record per line:
 *     device=bench-c3 state=connected port=4000 upload=rfc2217://localhost:4000
 * - Failures go to ctx.err as
 *     status=error reason=<token> kind=<kind> detail="..."
 *   optionally followed by a `hint: ...` line with the command to run next.
 *
 * EXIT CODES
 * ----------
 *   0  success (including "nothing to do")
 *   1  an operation failed (connection, process, io, not found, conflict)
 *   2  usage error
 *   3  registry document is corrupt (thrown, mapped in main)
 *
 * RegistryCorrupt is not caught here: it propagates to main.
 */

#include "espfleet/config.hpp"
#include "espfleet/remote/executor.hpp"
#include "espfleet/status.hpp"
#include "process_control.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace espfleet {

constexpr int kExitOk      = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage   = 2;
constexpr int kExitCorrupt = 3;

struct CliContext {
    Config                  cfg;
    remote::RemoteExecutor& exec;
    ProcessControl&         procs;
    std::ostream&           out;
    std::ostream&           err;
};

/// Print the status=error line (and hint) for @p st; returns the matching exit code.
int report_error(std::ostream& err, const Status& st, const std::string& hint = {});

struct RegisterArgs {
    std::string name;
    std::string chip_id;
    std::string host;
    std::optional<std::string> usb_path;
    std::optional<std::string> description;
    std::optional<int> port;
    std::optional<int> local_port;
};

int cmd_init(CliContext& ctx, const std::string& git_url);
int cmd_sync(CliContext& ctx);
int cmd_scan(CliContext& ctx, const std::string& host);
int cmd_register(CliContext& ctx, const RegisterArgs& args);
int cmd_unregister(CliContext& ctx, const std::string& name);

/// Empty @p device means every registered device. Non-zero if any device failed.
int cmd_connect(CliContext& ctx, const std::string& device);
int cmd_disconnect(CliContext& ctx, const std::string& device);
int cmd_status(CliContext& ctx);

/// Empty @p device_path means /dev/<name> when usb_path is set, else /dev/ttyUSB0.
int cmd_verify(CliContext& ctx, const std::string& device, const std::string& device_path);

/// @p baud 0 means auto-detect.
int cmd_monitor(CliContext& ctx, const std::string& device, int baud, bool raw);

/// @p show_only prints the current ser2net state instead of installing.
int cmd_setup(CliContext& ctx, const std::string& host, bool show_only);
int cmd_udev_install(CliContext& ctx, const std::string& host);

/// Empty @p host means the host of the first registered device.
int cmd_devices(CliContext& ctx, const std::string& host);

} // namespace espfleet
