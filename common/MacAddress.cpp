#include "MacAddress.hpp"
#include <cctype>

namespace hearth::common
{
    static int HexValue(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    std::optional<std::string> NormalizeMac(const std::string &raw)
    {
        std::string digits;
        digits.reserve(12);

        for (char c : raw)
        {
            if (c == ':' || c == '-' || c == '.')
                continue;
            if (HexValue(c) < 0)
                return std::nullopt;
            digits.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }

        if (digits.size() != 12)
            return std::nullopt;

        std::string mac;
        mac.reserve(17);
        for (size_t i = 0; i < digits.size(); i += 2)
        {
            if (!mac.empty())
                mac.push_back(':');
            mac.append(digits, i, 2);
        }
        return mac;
    }

    bool IsRandomizedMac(const std::string &mac)
    {
        if (mac.size() < 2)
            return false;
        int second = HexValue(mac[1]);
        if (second < 0)
            return false;
        return (second & 0x2) != 0;
    }

    std::string OuiPrefix(const std::string &mac)
    {
        return mac.substr(0, 8);
    }

    bool IsUnsetMac(const std::string &mac)
    {
        return mac == "00:00:00:00:00:00" || mac == "FF:FF:FF:FF:FF:FF";
    }
}
