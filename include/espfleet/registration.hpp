#pragma once
/**
 * @file registration.hpp
 * @brief Turn a "register <name>" request into the record to store.
 *
 * @details
 * Re-registering a board under an existing name is common (new chip after a
 * swap, moved to another USB port). The rules:
 *
 *   - The previously assigned remote_port is kept unless @c port is given.
 *     Re-registration never silently moves a board to a new ser2net port,
 *     since that would break every operator's saved upload URL.
 *   - local_port: explicit override wins; otherwise it stays as stored when
 *     the remote port is kept, and follows the remote port when that changes.
 *   - usb_path and description: an unset optional keeps the stored value, a
 *     set one (including "") replaces it.
 *   - chip_id and host are always taken from the request.
 *
 * A new name gets @c port or Registry::allocate_port(host).
 *
 * The result is not written; the caller passes it to Registry::add().
 */

#include "espfleet/device.hpp"
#include "espfleet/registry.hpp"

#include <optional>
#include <string>

namespace espfleet {

struct RegistrationRequest {
    std::string name;
    std::string chip_id;
    std::string host;
    std::optional<std::string> usb_path;
    std::optional<std::string> description;
    std::optional<int> port;
    std::optional<int> local_port;
};

struct RegistrationPlan {
    DeviceRecord record;
    bool         updated = false;   ///< name already existed
    bool         port_kept = false; ///< previous remote_port carried over
};

RegistrationPlan plan_registration(const Registry& reg, const RegistrationRequest& req);

} // namespace espfleet
