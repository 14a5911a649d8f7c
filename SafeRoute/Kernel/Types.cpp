#include "SafeRoute/Kernel/Types.hpp"

namespace SafeRoute
{
    const char *ToString(OpResult r) noexcept
    {
        switch (r)
        {
            case OpResult::Applied:   return "applied";
            case OpResult::Unchanged: return "unchanged";
            case OpResult::Failed:    return "failed";
        }
        return "?";
    }

    std::string HostOf(const std::string &cidr)
    {
        const auto slash = cidr.find('/');
        if (slash == std::string::npos)
        {
            return cidr;
        }
        const std::string prefix = cidr.substr(slash + 1);
        if (prefix == "32" || prefix == "128")
        {
            return cidr.substr(0, slash);
        }
        return cidr;
    }

    std::string AsHostCidr(const std::string &address)
    {
        if (address.find('/') != std::string::npos)
        {
            return address;
        }
        return address + (address.find(':') != std::string::npos ? "/128" : "/32");
    }
} // namespace SafeRoute
