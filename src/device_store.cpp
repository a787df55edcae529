// ============================================================================
// device_store.cpp - implementation for espfleet/device_store.hpp
// ============================================================================

#include "espfleet/device_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace espfleet {

json record_to_json(const DeviceRecord& rec) {
    return json{
        {"chip_id", rec.chip_id},
        {"host", rec.host},
        {"usb_path", rec.usb_path},
        {"remote_port", rec.remote_port},
        {"local_port", rec.local_port},
        {"description", rec.description},
    };
}

template <typename T>
static void field(const json& entry, const std::string& name, const char* key, T& out) {
    auto it = entry.find(key);
    if (it == entry.end()) return;
    try {
        out = it->template get<T>();
    } catch (const json::type_error&) {
        throw RegistryCorrupt("device '" + name + "': field '" + key + "' has the wrong type");
    }
}

DeviceRecord record_from_json(const std::string& name, const json& entry) {
    if (!entry.is_object()) {
        throw RegistryCorrupt("device '" + name + "': entry is not an object");
    }
    DeviceRecord rec;
    rec.name = name;
    field(entry, name, "chip_id", rec.chip_id);
    field(entry, name, "host", rec.host);
    field(entry, name, "usb_path", rec.usb_path);
    field(entry, name, "remote_port", rec.remote_port);
    field(entry, name, "local_port", rec.local_port);
    field(entry, name, "description", rec.description);
    return rec;
}

DeviceStore::DeviceStore(fs::path file) : file_(std::move(file)) {}

json DeviceStore::load() const {
    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        spdlog::debug("store: {} missing, starting empty", file_.string());
        return json{{"device", json::object()}};
    }

    std::ifstream in(file_);
    if (!in) throw RegistryCorrupt("cannot open " + file_.string());

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw RegistryCorrupt(file_.string() + ": " + e.what());
    }

    if (!doc.is_object()) throw RegistryCorrupt(file_.string() + ": top level is not an object");
    if (!doc.contains("device")) doc["device"] = json::object();
    if (!doc["device"].is_object()) throw RegistryCorrupt(file_.string() + ": 'device' is not an object");
    return doc;
}

Status DeviceStore::save(const json& doc) const {
    std::error_code ec;
    fs::create_directories(file_.parent_path(), ec);
    if (ec) {
        return Status::error(ErrorKind::Io, "mkdir_failed",
                             file_.parent_path().string() + ": " + ec.message());
    }

    // Serialize first so a bad string never leaves a half-written tmp file.
    std::string text;
    try {
        text = doc.dump(2);
    } catch (const json::type_error& e) {
        return Status::error(ErrorKind::Usage, "bad_text",
                             file_.string() + ": text fields must be valid UTF-8 (" + e.what() + ")");
    }

    fs::path tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return Status::error(ErrorKind::Io, "write_failed", "cannot open " + tmp.string());
        out << text << "\n";
        out.flush();
        if (!out) return Status::error(ErrorKind::Io, "write_failed", "short write to " + tmp.string());
    }

    fs::rename(tmp, file_, ec);
    if (ec) {
        return Status::error(ErrorKind::Io, "write_failed",
                             "rename " + tmp.string() + " -> " + file_.string() + ": " + ec.message());
    }
    spdlog::debug("store: wrote {}", file_.string());
    return Status::success();
}

} // namespace espfleet
