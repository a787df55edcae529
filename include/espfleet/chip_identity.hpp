#pragma once
/**
 * @page ef-chip-identity espfleet Chip Identity
 * @file chip_identity.hpp
 * @brief Parse esptool output into a typed identity and compare identities.
 *
 * @details
 * PURPOSE
 * -------
 * esptool prints identity data as loose human text, and its wording shifted
 * between releases. This header isolates the grammar from the ssh plumbing
 * so it can be tested against captured output with no network at all.
 *
 * GRAMMAR (per line, first rule that applies wins)
 * ------------------------------------------------
 *   1. "Chip is <type>" or "Chip type: <type>"
 *        chip_type = first whitespace-delimited token after the keyword
 *   2. "Chip ID: 0x<hex>"
 *        chip_id = "0x" + hex digits
 *   3. "MAC:" <whitespace> <[0-9a-fA-F:]+>
 *        mac = token, only if no MAC was seen yet
 *
 * Surrounding text on a line is ignored. Keywords are matched exactly as
 * written above. Only the first MAC counts: esptool reports the base MAC
 * first, and later "MAC:" lines (BASE MAC, MAC_EXT) describe the same chip.
 *
 * Sample (esptool v4):
 * @code
 *   Chip is ESP32-D0WD-V3 (revision v3.1)
 *   MAC: 08:3a:f2:6c:11:f4
 *   Chip ID: 0x6c11f4
 * @endcode
 *
 * A parse that yields neither chip_id nor MAC returns no identity; a chip
 * type alone is not an identity.
 *
 * VERIFICATION
 * ------------
 * Registries hold either a chip id or a MAC depending on chip family (the
 * ESP32-S2/S3/C3 report no Chip ID), so verify_identity() accepts either:
 *   1. combined value (chip_id if present, else MAC) vs expected,
 *   2. chip_id alone,
 *   3. MAC alone.
 * Comparison is ASCII case-insensitive. The first match names the field.
 */

#include <optional>
#include <string>

namespace espfleet {

struct ChipIdentity {
    std::string chip_type;
    std::string chip_id;
    std::string mac;
    std::string device_path;

    /// chip_id if present, else MAC.
    const std::string& primary_id() const { return chip_id.empty() ? mac : chip_id; }
};

std::optional<ChipIdentity> parse_chip_output(const std::string& text, const std::string& device_path);

struct VerifyResult {
    bool        matched = false;
    std::string field;    ///< "combined", "chip_id" or "mac" when matched
    std::string detail;   ///< human summary, e.g. "Verified: 0x6c11f4"
};

VerifyResult verify_identity(const ChipIdentity& identity, const std::string& expected);

/// ASCII case-insensitive equality.
bool iequals(const std::string& a, const std::string& b);

} // namespace espfleet
