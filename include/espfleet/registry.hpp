#pragma once
/**
 * @page ef-registry espfleet Device Registry
 * @file registry.hpp
 * @brief In-memory view of the device registry with identity and port rules.
 *
 * @details
 * PURPOSE
 * -------
 * The Registry is the roster of every board espfleet knows about. It sits on
 * top of DeviceStore and is the only place that decides:
 *   - that names are unique (they are the document keys),
 *   - that a remote port is used at most once per host,
 *   - which port a new board on a host gets.
 *
 * SNAPSHOT MODEL
 * --------------
 * The constructor loads the document once. Readers (list/get/by_host/
 * allocate_port) work on that snapshot. Every mutation (add/remove) reloads
 * from disk first, applies the change, and rewrites the whole document, so a
 * mutation never writes back stale entries another invocation added since
 * our snapshot. There is still no lock: two invocations mutating at once
 * race, and the later rename wins.
 *
 * PORT ALLOCATION
 * ---------------
 * allocate_port(host, base) scans upward from @p base and returns the first
 * port no record on @p host uses. Freed ports below the highest used one are
 * picked up again because the scan always starts at @p base. Allocation does
 * not reserve anything: two registrations against the same host at the same
 * moment can both be handed the same port. add() catches the collision only
 * if the first one has already been written.
 *
 * HOST MATCHING
 * -------------
 * by_host() compares the host string exactly. "rack1" and "pi@rack1" are
 * different keys here; callers normalize (see devices_for_host()).
 *
 * EXAMPLE
 * -------
 * @code
 *   espfleet::Registry reg{espfleet::DeviceStore{cfg.devices_file()}};
 *   int port = reg.allocate_port("pi@rack1");
 *   espfleet::DeviceRecord rec{"bench-c3", "0x5a1b2c3d", "pi@rack1", "", port, port, ""};
 *   auto st = reg.add(rec);
 *   if (!st.ok()) std::cerr << st.reason << "\n";
 * @endcode
 */

#include "espfleet/device.hpp"
#include "espfleet/device_store.hpp"
#include "espfleet/status.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace espfleet {

/// Two records on one host claiming the same remote port.
struct PortConflict {
    std::string host;
    int         port = 0;
    std::string first;
    std::string second;
};

class Registry {
public:
    /// Loads the document immediately. Throws RegistryCorrupt.
    explicit Registry(DeviceStore store);

    /// Re-read the document from disk. Throws RegistryCorrupt.
    void reload();

    std::vector<DeviceRecord> list() const;
    std::optional<DeviceRecord> get(const std::string& name) const;
    std::vector<DeviceRecord> by_host(const std::string& host) const;

    /**
     * @brief Insert or fully replace the record for rec.name, then persist.
     *
     * Fails with ErrorKind::Conflict ("port_conflict") when another name on
     * the same host already uses rec.remote_port; nothing is written then.
     * Fails with ErrorKind::Usage for an empty name or a port outside 1..65535.
     */
    Status add(const DeviceRecord& rec);

    /// Delete @p name if present and persist. @p st reports a failed write.
    bool remove(const std::string& name, Status& st);

    /// Smallest port >= @p base not used as remote_port on @p host.
    int allocate_port(const std::string& host, int base = kDefaultBasePort) const;

    /// Port collisions already present in the loaded document.
    std::vector<PortConflict> conflicts() const;

    const DeviceStore& store() const { return store_; }

private:
    DeviceStore    store_;
    nlohmann::json doc_;
};

/**
 * @brief Records on @p host, trying the literal string first and then the
 *        normalized "user@host" form (bare "rack1" finds "pi@rack1").
 */
std::vector<DeviceRecord> devices_for_host(const Registry& reg, const std::string& host,
                                           const std::string& default_user);

} // namespace espfleet
