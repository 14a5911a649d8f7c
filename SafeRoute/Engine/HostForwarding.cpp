#include "SafeRoute/Engine/HostForwarding.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"
#include "SafeRoute/Store/Records.hpp"

#include <utility>

namespace SafeRoute
{
    HostForwarding::HostForwarding(NetworkControl &net, NatFirewall &fw)
        : net_(net), fw_(fw)
    {
    }

    HostReport HostForwarding::Prepare()
    {
        HostReport report;
        auto note = [&report](const std::string &what, const Outcome &o)
        {
            if (o.Ok())
            {
                report.applied.push_back(what);
                LOGD("host") << what << ": " << ToString(o.result);
            }
            else
            {
                report.failed.push_back(what);
                LOGW("host") << what << " failed: " << o.detail;
            }
        };

        const std::pair<const char *, const char *> sysctls[] = {
            {"net.ipv4.ip_forward", "1"},
            {"net.ipv4.conf.all.src_valid_mark", "1"},
        };
        for (const auto &kv : sysctls)
        {
            note(std::string(kv.first) + "=" + kv.second, net_.WriteSysctl(kv.first, kv.second));
        }

        try
        {
            note(std::string("forwarding ") + kInterfacePrefix + "*", fw_.EnsureForwarding(kInterfacePrefix));
        }
        catch (const KernelOperationError &e)
        {
            note(std::string("forwarding ") + kInterfacePrefix + "*", Outcome::Failed(e.what()));
        }

        LOGI("host") << "Host prepared: " << report.applied.size() << " ok, "
                     << report.failed.size() << " failed";
        return report;
    }
} // namespace SafeRoute
