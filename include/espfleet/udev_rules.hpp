#pragma once
/**
 * @file udev_rules.hpp
 * @brief Stable /dev/<name> symlinks on the remote host, keyed by USB path.
 *
 * ttyUSB numbering follows enumeration order and shuffles on every reboot.
 * The USB topology path (udev ID_PATH) does not, as long as a board stays in
 * the same physical port, so each registered board gets:
 *
 * @code
 *   SUBSYSTEM=="tty", ENV{ID_PATH}=="<usb_path>", SYMLINK+="<name>", MODE="0666"
 * @endcode
 *
 * Rules are also saved under <registry_dir>/udev/<hostname>.rules so they
 * travel with the git-synced registry.
 */

#include "espfleet/config.hpp"
#include "espfleet/device.hpp"
#include "espfleet/remote/executor.hpp"
#include "espfleet/status.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace espfleet {

extern const char* const kUdevRulesPath;

/// Rules for the devices that have a usb_path; others are skipped.
std::string generate_udev_rules(const std::vector<DeviceRecord>& devices);

/// Write rules to <registry_dir>/udev/<hostname>.rules. @p path receives the file.
Status save_udev_rules(const Config& cfg, const std::string& host, const std::string& rules,
                       std::filesystem::path& path);

Status install_udev_rules(remote::RemoteExecutor& exec, const std::string& host, const std::string& rules);

} // namespace espfleet
