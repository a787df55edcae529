#pragma once
/**
 * @file ser2net.hpp
 * @brief ser2net.yaml generation and remote install.
 *
 * ser2net runs on each Pi and exposes every registered board as an RFC 2217
 * telnet port bound to localhost (the ssh tunnel reaches it from there).
 * One connection block per device:
 *
 * @code
 *   connection: &bench_c3
 *     accepter: telnet(rfc2217),tcp,4000
 *     connector: serialdev,/dev/bench-c3,115200n81,local
 *     options:
 *       kickolduser: true
 * @endcode
 *
 * The serial path is /dev/<name> when the board has a usb_path (the udev
 * rule creates that symlink), otherwise /dev/ttyUSB<index in the list>, which
 * is only right for single-board hosts; `espfleet udev-install` fixes that.
 *
 * Installing is "write config + restart service": no state is kept here.
 */

#include "espfleet/config.hpp"
#include "espfleet/device.hpp"
#include "espfleet/remote/executor.hpp"
#include "espfleet/status.hpp"

#include <string>
#include <vector>

namespace espfleet {

extern const char* const kSer2netConfigPath;

/// Device path ser2net should open for @p dev at position @p index.
std::string ser2net_device_path(const DeviceRecord& dev, size_t index);

std::string generate_ser2net_config(const std::vector<DeviceRecord>& devices, int baud = kDefaultBaud);

Status install_ser2net(remote::RemoteExecutor& exec, const std::string& host, const std::string& config);

struct Ser2netStatus {
    bool        active = false;
    std::string config;
};

Status ser2net_status(remote::RemoteExecutor& exec, const std::string& host, Ser2netStatus& status);

} // namespace espfleet
