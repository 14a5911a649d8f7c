#include "SafeRoute/Kernel/Resolver.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <future>
#include <thread>
#include <vector>

namespace SafeRoute
{
    namespace
    {
        struct Answer
        {
            int         rc = 0;
            std::string v4;
            std::string v6;
        };

        Answer Lookup(const std::string &host)
        {
            addrinfo hints {};
            hints.ai_family   = AF_UNSPEC;
            hints.ai_socktype = SOCK_DGRAM;

            addrinfo *res = nullptr;
            Answer a;
            a.rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
            if (a.rc != 0) return a;

            for (addrinfo *p = res; p; p = p->ai_next)
            {
                char buf[INET6_ADDRSTRLEN] = {};
                if (p->ai_family == AF_INET && a.v4.empty())
                {
                    ::inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in *>(p->ai_addr)->sin_addr,
                                buf, sizeof(buf));
                    a.v4 = buf;
                }
                else if (p->ai_family == AF_INET6 && a.v6.empty())
                {
                    ::inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6 *>(p->ai_addr)->sin6_addr,
                                buf, sizeof(buf));
                    a.v6 = buf;
                }
            }
            ::freeaddrinfo(res);
            return a;
        }
    } // namespace

    bool IsIpLiteral(const std::string &host)
    {
        in6_addr tmp {};
        return ::inet_pton(AF_INET, host.c_str(), &tmp) == 1
            || ::inet_pton(AF_INET6, host.c_str(), &tmp) == 1;
    }

    SystemResolver::SystemResolver(std::chrono::milliseconds timeout) : timeout_(timeout)
    {
    }

    std::string SystemResolver::Resolve(const std::string &host)
    {
        if (IsIpLiteral(host)) return host;

        // getaddrinfo cannot be cancelled: the worker is detached and the
        // shared state outlives a timed-out caller.
        std::packaged_task<Answer(std::string)> task(&Lookup);
        std::future<Answer> fut = task.get_future();
        std::thread(std::move(task), host).detach();

        if (fut.wait_for(timeout_) != std::future_status::ready)
        {
            LOGW("tunnel") << "resolve " << host << ": timed out after " << timeout_.count() << " ms";
            throw ResolutionError("timed out resolving " + host);
        }

        const Answer a = fut.get();
        if (a.rc != 0)
        {
            throw ResolutionError("cannot resolve " + host + ": " + ::gai_strerror(a.rc));
        }
        const std::string &addr = a.v4.empty() ? a.v6 : a.v4;
        if (addr.empty())
        {
            throw ResolutionError("no address for " + host);
        }
        LOGD("tunnel") << "resolved " << host << " -> " << addr;
        return addr;
    }
} // namespace SafeRoute
