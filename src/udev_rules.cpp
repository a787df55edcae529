#include "espfleet/udev_rules.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace espfleet {

using remote::CommandResult;
using remote::shell_quote;

const char* const kUdevRulesPath = "/etc/udev/rules.d/99-espfleet.rules";

std::string generate_udev_rules(const std::vector<DeviceRecord>& devices) {
    std::ostringstream out;
    out << "# espfleet: persistent names for registered ESP boards\n";
    for (const auto& dev : devices) {
        if (dev.usb_path.empty()) continue;
        out << "SUBSYSTEM==\"tty\", ENV{ID_PATH}==\"" << dev.usb_path
            << "\", SYMLINK+=\"" << dev.name << "\", MODE=\"0666\"\n";
    }
    return out.str();
}

Status save_udev_rules(const Config& cfg, const std::string& host, const std::string& rules, fs::path& path) {
    const HostSpec spec = parse_host(host, cfg.default_user);
    const fs::path dir = cfg.registry_dir / "udev";
    path = dir / (spec.hostname + ".rules");

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Status::error(ErrorKind::Io, "mkdir_failed", dir.string() + ": " + ec.message());

    std::ofstream out(path, std::ios::trunc);
    if (!out) return Status::error(ErrorKind::Io, "write_failed", "cannot open " + path.string());
    out << rules;
    out.flush();
    if (!out) return Status::error(ErrorKind::Io, "write_failed", "short write to " + path.string());
    return Status::success();
}

Status install_udev_rules(remote::RemoteExecutor& exec, const std::string& host, const std::string& rules) {
    CommandResult r;
    Status st = exec.run(host, "printf '%s' " + shell_quote(rules) + " | sudo tee " + kUdevRulesPath + " > /dev/null", r);
    if (!st.ok()) return st;
    if (r.exit_code != 0) {
        return Status::error(ErrorKind::Process, "write_failed",
                             "writing " + std::string(kUdevRulesPath) + " on " + host + ": " + r.err);
    }

    st = exec.run(host, "sudo udevadm control --reload-rules && sudo udevadm trigger --subsystem-match=tty", r);
    if (!st.ok()) return st;
    if (r.exit_code != 0) {
        return Status::error(ErrorKind::Process, "reload_failed", "reloading udev on " + host + ": " + r.err);
    }

    spdlog::info("udev: rules installed on {}", host);
    return Status::success();
}

} // namespace espfleet
