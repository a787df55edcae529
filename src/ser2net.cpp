#include "espfleet/ser2net.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace espfleet {

using remote::CommandResult;
using remote::shell_quote;

const char* const kSer2netConfigPath = "/etc/ser2net.yaml";

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string ser2net_device_path(const DeviceRecord& dev, size_t index) {
    if (!dev.usb_path.empty()) return "/dev/" + dev.name;
    return "/dev/ttyUSB" + std::to_string(index);
}

std::string generate_ser2net_config(const std::vector<DeviceRecord>& devices, int baud) {
    std::ostringstream out;
    out << "%YAML 1.1\n---\n";
    for (size_t i = 0; i < devices.size(); ++i) {
        const DeviceRecord& dev = devices[i];
        std::string anchor = dev.name;
        std::replace(anchor.begin(), anchor.end(), '-', '_');

        out << "\n"
            << "connection: &" << anchor << "\n"
            << "  accepter: telnet(rfc2217),tcp," << dev.remote_port << "\n"
            << "  connector: serialdev," << ser2net_device_path(dev, i) << "," << baud << "n81,local\n"
            << "  options:\n"
            << "    kickolduser: true\n";
    }
    return out.str();
}

Status install_ser2net(remote::RemoteExecutor& exec, const std::string& host, const std::string& config) {
    CommandResult r;
    Status st = exec.run(host, "which ser2net || sudo apt-get install -y ser2net", r);
    if (!st.ok()) return st;
    if (r.exit_code != 0) {
        if (to_lower(r.err).find("permission denied") != std::string::npos ||
            r.err.find("password is required") != std::string::npos) {
            return Status::error(ErrorKind::Process, "sudo_required",
                                 "installing ser2net on " + host + " needs sudo; configure passwordless sudo "
                                 "or run `sudo apt-get install -y ser2net` there");
        }
        spdlog::warn("ser2net: install check on {} exited {}", host, r.exit_code);
    }

    st = exec.run(host, "printf '%s' " + shell_quote(config) + " | sudo tee " + kSer2netConfigPath + " > /dev/null", r);
    if (!st.ok()) return st;
    if (r.exit_code != 0) {
        return Status::error(ErrorKind::Process, "write_failed",
                             "writing " + std::string(kSer2netConfigPath) + " on " + host + ": " + r.err);
    }

    st = exec.run(host, "sudo systemctl restart ser2net && sudo systemctl enable ser2net", r);
    if (!st.ok()) return st;
    if (r.exit_code != 0) {
        return Status::error(ErrorKind::Process, "restart_failed",
                             "restarting ser2net on " + host + ": " + r.err);
    }

    spdlog::info("ser2net: configured and restarted on {}", host);
    return Status::success();
}

Status ser2net_status(remote::RemoteExecutor& exec, const std::string& host, Ser2netStatus& status) {
    status = Ser2netStatus{};
    CommandResult r;
    Status st = exec.run(host, "systemctl is-active ser2net", r);
    if (!st.ok()) return st;
    std::string state = r.out;
    while (!state.empty() && std::isspace(static_cast<unsigned char>(state.back()))) state.pop_back();
    status.active = state == "active";

    st = exec.run(host, std::string("cat ") + kSer2netConfigPath + " 2>/dev/null", r);
    if (!st.ok()) return st;
    if (r.exit_code == 0) status.config = r.out;
    return Status::success();
}

} // namespace espfleet
