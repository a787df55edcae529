#pragma once
/**
 * @page ef-chip-probe espfleet Chip Probe
 * @file chip_probe.hpp
 * @brief Remote discovery of ESP boards: list serial ports, run esptool, verify.
 *
 * @details
 * PURPOSE
 * -------
 * These functions answer "which board is on which port of that Pi" by running
 * esptool over a RemoteExecutor and handing the text to parse_chip_output().
 * They are the remote half of the chip identity module; the grammar itself
 * lives in espfleet/chip_identity.hpp.
 *
 * DISCOVERY STEPS
 * ---------------
 *   1) Run `~/.local/bin/esptool --port <P> --no-stub chip-id 2>&1 ||
 *      esptool --port <P> --no-stub chip-id 2>&1`
 *      (pip --user installs land in ~/.local/bin, distro packages on PATH).
 *   2) Non-zero exit and "command not found" / "No such file" in the output:
 *      esptool is missing. Install it once with pip (best effort) and retry
 *      step 1 exactly once.
 *   3) Still non-zero: no identity. Zero: parse the output; a parse that
 *      finds neither Chip ID nor MAC is also "no identity".
 *
 * Only transport problems (ErrorKind::Connection) come back as a failed
 * Status. A board that will not talk, a non-ESP serial adapter, or esptool
 * output we cannot read all end as `identity == std::nullopt`, so a scan
 * still reports the port.
 *
 * PERFORMANCE NOTES
 * -----------------
 * esptool resets each board into the bootloader; expect 2-4 s per port.
 * scan_host() opens one ScopedConnection for the whole scan.
 */

#include "espfleet/chip_identity.hpp"
#include "espfleet/remote/executor.hpp"
#include "espfleet/status.hpp"

#include <optional>
#include <string>
#include <vector>

namespace espfleet {

/// Serial device globs listed on the remote host.
extern const char* const kSerialListCommand;

std::string esptool_command(const std::string& device_path);

/// True if @p r looks like "esptool is not installed".
bool esptool_missing(const remote::CommandResult& r);

Status discover(remote::RemoteExecutor& exec, const std::string& host,
                const std::string& device_path, std::optional<ChipIdentity>& identity);

Status verify_device(remote::RemoteExecutor& exec, const std::string& host,
                     const std::string& device_path, const std::string& expected, VerifyResult& result);

Status list_serial_devices(remote::RemoteExecutor& exec, const std::string& host,
                           std::vector<std::string>& paths);

/// udev ID_PATH of @p device_path, empty if udevadm has nothing.
Status usb_path_for(remote::RemoteExecutor& exec, const std::string& host,
                    const std::string& device_path, std::string& usb_path);

/// "vendor, model" from udev properties, empty if unknown.
Status describe_serial_device(remote::RemoteExecutor& exec, const std::string& host,
                              const std::string& device_path, std::string& info);

struct ScanEntry {
    std::string device_path;
    std::optional<ChipIdentity> identity;
    std::string usb_path;
};

/**
 * @brief Probe every serial port on @p host over one session.
 *
 * Every listed path appears in @p entries, in listing order, whether or not
 * it yielded an identity. A connection failure mid-scan aborts the scan and
 * is returned; entries gathered so far are kept.
 */
Status scan_host(remote::RemoteExecutor& exec, const std::string& host, std::vector<ScanEntry>& entries);

} // namespace espfleet
