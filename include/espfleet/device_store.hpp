#pragma once
/**
 * @file device_store.hpp
 * @brief Whole-document JSON persistence for the device registry.
 *
 * @details
 * The store knows nothing about ports or names; it moves one JSON document
 * between memory and disk:
 *
 * @code
 *   {
 *     "device": {
 *       "bench-c3": {
 *         "chip_id": "0x5a1b2c3d",
 *         "description": "C3 devkit, left rack",
 *         "host": "pi@rack1",
 *         "local_port": 4000,
 *         "remote_port": 4000,
 *         "usb_path": "platform-fd500000.pcie-pci-0000:01:00.0-usb-0:1.3:1.0"
 *       }
 *     }
 *   }
 * @endcode
 *
 * Saves are atomic: the document is written to "<file>.tmp" and renamed over
 * the target, so a crash never leaves a half-written registry. Keys come out
 * sorted (nlohmann::json default object ordering), which makes a
 * load → save → load cycle byte-stable and keeps git diffs small.
 *
 * There is no file locking. Two espfleet processes that mutate the registry
 * at the same moment race, and the last rename wins.
 */

#include "espfleet/device.hpp"
#include "espfleet/status.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace espfleet {

/// Thrown when the persisted document cannot be trusted. Aborts the invocation.
class RegistryCorrupt : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Entry object for @p rec (name is the key, so it is not stored inside).
nlohmann::json record_to_json(const DeviceRecord& rec);

/// Decode one entry; missing fields take defaults, wrong types throw RegistryCorrupt.
DeviceRecord record_from_json(const std::string& name, const nlohmann::json& entry);

class DeviceStore {
public:
    explicit DeviceStore(std::filesystem::path file);

    /// Read the document. Missing file yields {"device": {}}. Throws RegistryCorrupt.
    nlohmann::json load() const;

    /// Atomically replace the document on disk.
    Status save(const nlohmann::json& doc) const;

    const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
};

} // namespace espfleet
