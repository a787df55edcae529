#pragma once
/**
 * @file device.hpp
 * @brief Device record and host-spec value types.
 *
 * @details
 * A DeviceRecord is the registry unit: one physical board, where it is
 * plugged in (host + usb_path) and which ports reach it. The name is the
 * registry key and never changes once created.
 *
 * Port rules:
 *   - remote_port is the TCP port ser2net opens on @c host. It is unique per
 *     host; the Registry enforces that.
 *   - local_port is the operator-side end of the ssh forward. It starts equal
 *     to remote_port. Nothing enforces uniqueness across hosts: two boards on
 *     two Pis can both want 4000 locally, and it is up to the operator to pick
 *     a different --local-port for one of them.
 */

#include "espfleet/config.hpp"

#include <string>

namespace espfleet {

struct DeviceRecord {
    std::string name;
    std::string chip_id;      ///< "0x..." chip id, or a MAC for chips without one
    std::string host;         ///< "user@hostname"
    std::string usb_path;     ///< udev ID_PATH; empty if unknown
    int         remote_port = kDefaultBasePort;
    int         local_port  = kDefaultBasePort;
    std::string description;

    bool operator==(const DeviceRecord& o) const {
        return name == o.name && chip_id == o.chip_id && host == o.host &&
               usb_path == o.usb_path && remote_port == o.remote_port &&
               local_port == o.local_port && description == o.description;
    }
    bool operator!=(const DeviceRecord& o) const { return !(*this == o); }
};

/// "user@hostname" split into parts.
struct HostSpec {
    std::string user;
    std::string hostname;

    std::string str() const { return user + "@" + hostname; }
};

/**
 * @brief Parse "user@host" or bare "host".
 *
 * Splits at the first '@'. A bare hostname gets @p default_user.
 */
HostSpec parse_host(const std::string& host, const std::string& default_user);

/// Upload URL handed to esptool/platformio for a forwarded device.
std::string upload_url(int local_port);

} // namespace espfleet
