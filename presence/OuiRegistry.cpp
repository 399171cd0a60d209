#include "OuiRegistry.hpp"
#include "../common/MacAddress.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>

namespace hearth::presence
{
    namespace
    {
        std::string Trim(const std::string &text)
        {
            size_t begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            size_t end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        // "AA:BB:CC" from "AA-BB-CC", "AABBCC" or "aa:bb:cc".
        std::optional<std::string> NormalizePrefix(const std::string &raw)
        {
            std::string digits;
            for (char c : raw)
            {
                if (c == ':' || c == '-' || c == '.')
                    continue;
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;
                digits.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
            if (digits.size() != 6)
                return std::nullopt;
            return digits.substr(0, 2) + ":" + digits.substr(2, 2) + ":" + digits.substr(4, 2);
        }
    }

    bool OuiRegistry::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[Resolver] WARNING: cannot open OUI file " << path << "\n";
            return false;
        }
        size_t count = Load(file);
        std::cout << "[Resolver] Loaded " << count << " vendor prefixes from " << path << "\n";
        return true;
    }

    size_t OuiRegistry::Load(std::istream &in)
    {
        size_t count = 0;
        std::string line;
        while (std::getline(in, line))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty() || trimmed[0] == '#')
                continue;

            std::string prefixText;
            std::string organization;

            // IEEE: "00-00-0C   (hex)\t\tCisco Systems, Inc", repeated as "(base 16)".
            size_t hex = trimmed.find("(hex)");
            size_t base16 = trimmed.find("(base 16)");
            if (hex != std::string::npos)
            {
                prefixText = Trim(trimmed.substr(0, hex));
                organization = Trim(trimmed.substr(hex + 5));
            }
            else if (base16 != std::string::npos)
            {
                prefixText = Trim(trimmed.substr(0, base16));
                organization = Trim(trimmed.substr(base16 + 9));
            }
            else
            {
                // nmap: "00000C Cisco Systems"
                size_t space = trimmed.find_first_of(" \t");
                if (space == std::string::npos)
                    continue;
                prefixText = trimmed.substr(0, space);
                organization = Trim(trimmed.substr(space));
            }

            auto prefix = NormalizePrefix(prefixText);
            if (!prefix || organization.empty())
                continue;

            m_vendors[*prefix] = organization;
            ++count;
        }
        return count;
    }

    void OuiRegistry::Add(const std::string &prefix, const std::string &organization)
    {
        auto normalized = NormalizePrefix(prefix);
        if (normalized)
            m_vendors[*normalized] = organization;
    }

    std::string OuiRegistry::Lookup(const std::string &mac) const
    {
        auto normalized = common::NormalizeMac(mac);
        if (!normalized)
            return "";
        auto it = m_vendors.find(common::OuiPrefix(*normalized));
        return it == m_vendors.end() ? "" : it->second;
    }
}
