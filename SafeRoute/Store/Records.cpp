#include "SafeRoute/Store/Records.hpp"

#include <cctype>
#include <cstdio>

namespace SafeRoute
{
    namespace
    {
        bool IsIfnameChar(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        }

        // FNV-1a, 32 bit
        std::uint32_t Fnv1a(const std::string &s)
        {
            std::uint32_t h = 2166136261u;
            for (unsigned char c : s)
            {
                h ^= c;
                h *= 16777619u;
            }
            return h;
        }
    } // namespace

    std::string DeriveInterfaceName(const std::string &profile_name)
    {
        const std::string prefix = kInterfacePrefix;
        const std::size_t room   = kMaxInterfaceName - prefix.size();

        std::string sanitized;
        sanitized.reserve(profile_name.size());
        bool clean = true;
        for (char c : profile_name)
        {
            if (IsIfnameChar(c))
            {
                sanitized.push_back(c);
            }
            else
            {
                sanitized.push_back('_');
                clean = false;
            }
        }

        if (clean && !sanitized.empty() && sanitized.size() <= room)
        {
            return prefix + sanitized;
        }

        // 3 (prefix) + 7 + 1 + 4 = 15
        char tag[8];
        std::snprintf(tag, sizeof(tag), "%04x", static_cast<unsigned>(Fnv1a(profile_name) & 0xffffu));
        return prefix + sanitized.substr(0, 7) + "_" + tag;
    }
} // namespace SafeRoute
