#pragma once

#include <optional>
#include <string>

namespace hearth::common
{
    // Canonical form is upper-case, colon separated: "AA:BB:CC:DD:EE:FF".
    // Accepts ':' '-' or no separators; returns nullopt for anything else.
    std::optional<std::string> NormalizeMac(const std::string &raw);

    // Locally administered bit (0x02 of the first octet). Expects a
    // normalized MAC.
    bool IsRandomizedMac(const std::string &mac);

    // "AA:BB:CC" for a normalized MAC.
    std::string OuiPrefix(const std::string &mac);

    bool IsUnsetMac(const std::string &mac);
}
