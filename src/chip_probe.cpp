// ============================================================================
// chip_probe.cpp - implementation for chip_probe.hpp
// ============================================================================

#include "chip_probe.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace espfleet {

using remote::CommandResult;
using remote::RemoteExecutor;
using remote::shell_quote;

const char* const kSerialListCommand = "ls /dev/ttyUSB* /dev/ttyACM* /dev/ttyAMA* 2>/dev/null";

static const char* const kEsptoolInstall =
    "pip install esptool --break-system-packages 2>/dev/null || pip install esptool";

std::string esptool_command(const std::string& device_path) {
    const std::string port = shell_quote(device_path);
    return "~/.local/bin/esptool --port " + port + " --no-stub chip-id 2>&1 || "
           "esptool --port " + port + " --no-stub chip-id 2>&1";
}

bool esptool_missing(const CommandResult& r) {
    for (const std::string* s : {&r.out, &r.err}) {
        if (s->find("command not found") != std::string::npos) return true;
        if (s->find("No such file") != std::string::npos) return true;
    }
    return false;
}

Status discover(RemoteExecutor& exec, const std::string& host,
                const std::string& device_path, std::optional<ChipIdentity>& identity) {
    identity.reset();

    CommandResult r;
    Status st = exec.run(host, esptool_command(device_path), r);
    if (!st.ok()) return st;

    if (r.exit_code != 0 && esptool_missing(r)) {
        spdlog::info("probe: esptool missing on {}, installing with pip", host);
        CommandResult install;
        st = exec.run(host, kEsptoolInstall, install);
        if (!st.ok()) return st;
        if (install.exit_code != 0) {
            spdlog::warn("probe: esptool install on {} exited {}", host, install.exit_code);
        }
        st = exec.run(host, esptool_command(device_path), r);
        if (!st.ok()) return st;
    }

    if (r.exit_code != 0) {
        spdlog::debug("probe: {}:{} esptool exited {}", host, device_path, r.exit_code);
        return Status::success();
    }

    identity = parse_chip_output(r.out, device_path);
    if (!identity) {
        spdlog::debug("probe: {}:{} output had no Chip ID or MAC", host, device_path);
    }
    return Status::success();
}

Status verify_device(RemoteExecutor& exec, const std::string& host,
                     const std::string& device_path, const std::string& expected, VerifyResult& result) {
    result = VerifyResult{};
    std::optional<ChipIdentity> identity;
    Status st = discover(exec, host, device_path, identity);
    if (!st.ok()) return st;

    if (!identity) {
        result.detail = "Could not read chip info";
        return Status::success();
    }
    result = verify_identity(*identity, expected);
    return Status::success();
}

Status list_serial_devices(RemoteExecutor& exec, const std::string& host, std::vector<std::string>& paths) {
    paths.clear();
    CommandResult r;
    Status st = exec.run(host, kSerialListCommand, r);
    if (!st.ok()) return st;

    // ls exits 2 when some globs match nothing; the listing is still valid.
    std::istringstream in(r.out);
    std::string p;
    while (in >> p) paths.push_back(p);
    return Status::success();
}

// Value of KEY= in `udevadm info -q property` output.
static std::string udev_property(const std::string& text, const std::string& key) {
    std::istringstream in(text);
    std::string line;
    const std::string prefix = key + "=";
    while (std::getline(in, line)) {
        if (line.compare(0, prefix.size(), prefix) == 0) return line.substr(prefix.size());
    }
    return {};
}

static Status udev_properties(RemoteExecutor& exec, const std::string& host,
                              const std::string& device_path, std::string& text) {
    CommandResult r;
    Status st = exec.run(host, "udevadm info -q property -n " + shell_quote(device_path) + " 2>/dev/null", r);
    if (!st.ok()) return st;
    text = r.exit_code == 0 ? r.out : std::string();
    return Status::success();
}

Status usb_path_for(RemoteExecutor& exec, const std::string& host,
                    const std::string& device_path, std::string& usb_path) {
    usb_path.clear();
    std::string props;
    Status st = udev_properties(exec, host, device_path, props);
    if (!st.ok()) return st;
    usb_path = udev_property(props, "ID_PATH");
    return Status::success();
}

Status describe_serial_device(RemoteExecutor& exec, const std::string& host,
                              const std::string& device_path, std::string& info) {
    info.clear();
    std::string props;
    Status st = udev_properties(exec, host, device_path, props);
    if (!st.ok()) return st;

    std::string vendor = udev_property(props, "ID_VENDOR");
    std::string model  = udev_property(props, "ID_MODEL");
    info = vendor;
    if (!model.empty()) info += (info.empty() ? "" : ", ") + model;
    return Status::success();
}

Status scan_host(RemoteExecutor& exec, const std::string& host, std::vector<ScanEntry>& entries) {
    entries.clear();
    remote::ScopedConnection session(exec, host);
    if (!session.ok()) return session.status();

    std::vector<std::string> paths;
    Status st = list_serial_devices(exec, host, paths);
    if (!st.ok()) return st;
    spdlog::info("scan: {} serial device(s) on {}", paths.size(), host);

    for (const auto& path : paths) {
        ScanEntry entry;
        entry.device_path = path;
        st = discover(exec, host, path, entry.identity);
        if (!st.ok()) return st;
        st = usb_path_for(exec, host, path, entry.usb_path);
        if (!st.ok()) return st;
        entries.push_back(std::move(entry));
    }
    return Status::success();
}

} // namespace espfleet
