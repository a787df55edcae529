#include "espfleet/device.hpp"

namespace espfleet {

HostSpec parse_host(const std::string& host, const std::string& default_user) {
    HostSpec spec;
    auto at = host.find('@');
    if (at == std::string::npos) {
        spec.user     = default_user;
        spec.hostname = host;
    } else {
        spec.user     = host.substr(0, at);
        spec.hostname = host.substr(at + 1);
    }
    return spec;
}

std::string upload_url(int local_port) {
    return "rfc2217://localhost:" + std::to_string(local_port);
}

} // namespace espfleet
