#pragma once

#include <istream>
#include <string>
#include <unordered_map>

namespace hearth::presence
{
    // MAC prefix to organization name, read from an IEEE oui.txt or an
    // nmap-mac-prefixes style file.
    class OuiRegistry
    {
    public:
        // False (with a warning) when the file cannot be opened.
        bool LoadFile(const std::string &path);

        // Returns the number of prefixes read.
        size_t Load(std::istream &in);

        void Add(const std::string &prefix, const std::string &organization);

        // Empty when unknown. Accepts any MAC form NormalizeMac accepts.
        std::string Lookup(const std::string &mac) const;

        size_t Size() const { return m_vendors.size(); }

    private:
        std::unordered_map<std::string, std::string> m_vendors;
    };
}
