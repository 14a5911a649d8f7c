#pragma once

// NatFirewall.hpp — NAT chain surface: list / insert at head / delete, plus
// the host-wide forwarding rules for managed interfaces.

#include "SafeRoute/Kernel/Types.hpp"

#include <string>
#include <vector>

namespace SafeRoute
{
    class NatFirewall
    {
    public:
        virtual ~NatFirewall() = default;

        /// Create the DNAT table/chain if missing.
        virtual Outcome EnsureDnatChain() = 0;

        /// DNAT rules of the chain in evaluation order; positions are 1-based.
        /// Throws KernelOperationError if the listing itself fails.
        virtual std::vector<NatRule> ListDnatRules() = 0;

        /// Insert at the head of the chain.
        virtual Outcome InsertDnatRule(const NatRule &rule) = 0;

        /// Delete a rule taken from the latest listing.
        virtual Outcome DeleteDnatRule(const NatRule &rule) = 0;

        /// Masquerade, MSS clamp and forward-accept for interfaces matching prefix.
        virtual Outcome EnsureForwarding(const std::string &interface_prefix) = 0;
    };
} // namespace SafeRoute
