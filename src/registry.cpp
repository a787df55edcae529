// ============================================================================
// registry.cpp - implementation for espfleet/registry.hpp
// ============================================================================

#include "espfleet/registry.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <set>
#include <utility>

using json = nlohmann::json;

namespace espfleet {

Registry::Registry(DeviceStore store) : store_(std::move(store)) {
    reload();
}

void Registry::reload() {
    json doc = store_.load();
    // Decode every entry up front so a bad field fails now, not mid-command.
    for (auto it = doc["device"].begin(); it != doc["device"].end(); ++it) {
        (void)record_from_json(it.key(), it.value());
    }
    doc_ = std::move(doc);
}

std::vector<DeviceRecord> Registry::list() const {
    std::vector<DeviceRecord> out;
    const json& devices = doc_["device"];
    for (auto it = devices.begin(); it != devices.end(); ++it) {
        out.push_back(record_from_json(it.key(), it.value()));
    }
    return out;
}

std::optional<DeviceRecord> Registry::get(const std::string& name) const {
    const json& devices = doc_["device"];
    auto it = devices.find(name);
    if (it == devices.end()) return std::nullopt;
    return record_from_json(name, *it);
}

std::vector<DeviceRecord> Registry::by_host(const std::string& host) const {
    std::vector<DeviceRecord> out;
    for (auto& rec : list()) {
        if (rec.host == host) out.push_back(std::move(rec));
    }
    return out;
}

Status Registry::add(const DeviceRecord& rec) {
    if (rec.name.empty()) {
        return Status::error(ErrorKind::Usage, "bad_name", "device name must not be empty");
    }
    if (rec.remote_port < 1 || rec.remote_port > 65535 ||
        rec.local_port < 1 || rec.local_port > 65535) {
        return Status::error(ErrorKind::Usage, "bad_port",
                             "ports must be in 1..65535 (remote=" + std::to_string(rec.remote_port) +
                             " local=" + std::to_string(rec.local_port) + ")");
    }

    reload();

    for (const auto& other : by_host(rec.host)) {
        if (other.name != rec.name && other.remote_port == rec.remote_port) {
            return Status::error(ErrorKind::Conflict, "port_conflict",
                                 "remote port " + std::to_string(rec.remote_port) + " on " + rec.host +
                                 " is already used by '" + other.name + "'");
        }
    }

    json next = doc_;
    next["device"][rec.name] = record_to_json(rec);
    Status st = store_.save(next);
    if (!st.ok()) return st;

    doc_ = std::move(next);
    spdlog::info("registry: stored '{}' host={} remote_port={} local_port={}",
                 rec.name, rec.host, rec.remote_port, rec.local_port);
    return Status::success();
}

bool Registry::remove(const std::string& name, Status& st) {
    st = Status::success();
    reload();

    if (!doc_["device"].contains(name)) return false;

    json next = doc_;
    next["device"].erase(name);
    st = store_.save(next);
    if (!st.ok()) return false;

    doc_ = std::move(next);
    spdlog::info("registry: removed '{}'", name);
    return true;
}

int Registry::allocate_port(const std::string& host, int base) const {
    std::set<int> used;
    for (const auto& rec : by_host(host)) used.insert(rec.remote_port);

    int port = base;
    while (used.count(port)) ++port;
    return port;
}

std::vector<PortConflict> Registry::conflicts() const {
    std::vector<PortConflict> out;
    std::map<std::pair<std::string, int>, std::string> seen;
    for (const auto& rec : list()) {
        auto key = std::make_pair(rec.host, rec.remote_port);
        auto it = seen.find(key);
        if (it == seen.end()) {
            seen.emplace(key, rec.name);
        } else {
            out.push_back({rec.host, rec.remote_port, it->second, rec.name});
        }
    }
    return out;
}

std::vector<DeviceRecord> devices_for_host(const Registry& reg, const std::string& host,
                                           const std::string& default_user) {
    auto found = reg.by_host(host);
    if (!found.empty()) return found;
    const std::string full = parse_host(host, default_user).str();
    if (full == host) return found;
    return reg.by_host(full);
}

} // namespace espfleet
