#include "espfleet/status.hpp"

namespace espfleet {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Connection:    return "connection";
        case ErrorKind::NotFound:      return "not_found";
        case ErrorKind::Conflict:      return "conflict";
        case ErrorKind::ProtocolParse: return "protocol_parse";
        case ErrorKind::Process:       return "process";
        case ErrorKind::Io:            return "io";
        case ErrorKind::Usage:         return "usage";
    }
    return "unknown";
}

} // namespace espfleet
