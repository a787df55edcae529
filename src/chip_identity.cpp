// ============================================================================
// chip_identity.cpp - implementation for espfleet/chip_identity.hpp
// For the grammar see the matching .hpp. Samples live in tests/.
// ============================================================================

#include "espfleet/chip_identity.hpp"

#include <cctype>
#include <sstream>

namespace espfleet {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
static bool is_hex(char c)   { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

// First whitespace-delimited token starting at or after pos.
static std::string token_after(const std::string& line, size_t pos) {
    while (pos < line.size() && is_space(line[pos])) ++pos;
    size_t end = pos;
    while (end < line.size() && !is_space(line[end])) ++end;
    return line.substr(pos, end - pos);
}

static std::string parse_chip_type(const std::string& line) {
    static const std::string kIs   = "Chip is";
    static const std::string kType = "Chip type:";
    auto pos = line.find(kIs);
    if (pos != std::string::npos) return token_after(line, pos + kIs.size());
    pos = line.find(kType);
    if (pos != std::string::npos) return token_after(line, pos + kType.size());
    return {};
}

// "Chip ID: 0x<hex>" -> "0x<hex>", else empty.
static std::string parse_chip_id(const std::string& line) {
    static const std::string kKey = "Chip ID: 0x";
    auto pos = line.find(kKey);
    if (pos == std::string::npos) return {};
    size_t start = pos + kKey.size();
    size_t end = start;
    while (end < line.size() && is_hex(line[end])) ++end;
    if (end == start) return {};
    return "0x" + line.substr(start, end - start);
}

// "MAC:" + at least one whitespace + [0-9a-fA-F:]+
static std::string parse_mac(const std::string& line) {
    static const std::string kKey = "MAC:";
    auto pos = line.find(kKey);
    if (pos == std::string::npos) return {};
    size_t p = pos + kKey.size();
    if (p >= line.size() || !is_space(line[p])) return {};
    while (p < line.size() && is_space(line[p])) ++p;
    size_t end = p;
    while (end < line.size() && (is_hex(line[end]) || line[end] == ':')) ++end;
    return line.substr(p, end - p);
}

std::optional<ChipIdentity> parse_chip_output(const std::string& text, const std::string& device_path) {
    ChipIdentity id;
    id.device_path = device_path;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.find("Chip is") != std::string::npos || line.find("Chip type:") != std::string::npos) {
            std::string t = parse_chip_type(line);
            if (!t.empty()) id.chip_type = t;
        } else if (line.find("Chip ID:") != std::string::npos) {
            std::string c = parse_chip_id(line);
            if (!c.empty()) id.chip_id = c;
        } else if (line.find("MAC:") != std::string::npos && id.mac.empty()) {
            id.mac = parse_mac(line);
        }
    }

    if (id.chip_id.empty() && id.mac.empty()) return std::nullopt;
    return id;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

VerifyResult verify_identity(const ChipIdentity& identity, const std::string& expected) {
    VerifyResult r;
    const std::string& actual = identity.primary_id();
    if (actual.empty()) {
        r.detail = "No chip ID or MAC found";
        return r;
    }

    if (iequals(actual, expected)) {
        r.matched = true;
        r.field   = "combined";
        r.detail  = "Verified: " + actual;
    } else if (!identity.chip_id.empty() && iequals(identity.chip_id, expected)) {
        r.matched = true;
        r.field   = "chip_id";
        r.detail  = "Chip ID verified: " + identity.chip_id;
    } else if (!identity.mac.empty() && iequals(identity.mac, expected)) {
        r.matched = true;
        r.field   = "mac";
        r.detail  = "MAC verified: " + identity.mac;
    } else {
        r.detail = "Mismatch: expected " + expected + ", got " + actual;
    }
    return r;
}

} // namespace espfleet
