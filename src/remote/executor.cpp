#include "espfleet/remote/executor.hpp"

namespace espfleet::remote {

std::string shell_quote(const std::string& s) {
    std::string q = "'";
    for (char c : s) {
        if (c == '\'') q += "'\"'\"'";
        else q += c;
    }
    q += "'";
    return q;
}

ScopedConnection::ScopedConnection(RemoteExecutor& exec, const std::string& host) : exec_(exec) {
    if (exec_.connected_host() == host) return;  // reuse, not ours to close
    status_ = exec_.connect(host);
    owns_ = status_.ok();
}

ScopedConnection::~ScopedConnection() {
    if (owns_) exec_.disconnect();
}

} // namespace espfleet::remote
