#pragma once

// Resolver.hpp — peer endpoint resolution (hostname => literal address).

#include <chrono>
#include <string>

namespace SafeRoute
{
    class EndpointResolver
    {
    public:
        virtual ~EndpointResolver() = default;

        /**
         * @brief Literal address for host; literals pass through unchanged.
         * @throws ResolutionError when the name does not resolve in time.
         */
        virtual std::string Resolve(const std::string &host) = 0;
    };

    /// getaddrinfo with a deadline; IPv4 answers are preferred.
    class SystemResolver : public EndpointResolver
    {
    public:
        explicit SystemResolver(std::chrono::milliseconds timeout);

        std::string Resolve(const std::string &host) override;

    private:
        std::chrono::milliseconds timeout_;
    };

    bool IsIpLiteral(const std::string &host);
} // namespace SafeRoute
