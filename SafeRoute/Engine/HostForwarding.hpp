#pragma once

// HostForwarding.hpp — host-wide prerequisites for routing devices through
// sr_* tunnels: IP forwarding, src_valid_mark, masquerade, MSS clamp, forward.

#include "SafeRoute/Kernel/NatFirewall.hpp"
#include "SafeRoute/Kernel/NetworkControl.hpp"

#include <string>
#include <vector>

namespace SafeRoute
{
    struct HostReport
    {
        std::vector<std::string> applied;
        std::vector<std::string> failed;
    };

    class HostForwarding
    {
    public:
        HostForwarding(NetworkControl &net, NatFirewall &fw);

        /// Every step is best-effort and logged; nothing throws for kernel refusals.
        HostReport Prepare();

    private:
        NetworkControl &net_;
        NatFirewall    &fw_;
    };
} // namespace SafeRoute
