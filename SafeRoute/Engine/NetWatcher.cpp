#include "SafeRoute/Engine/NetWatcher.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>

#include <linux/rtnetlink.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/msg.h>
#include <netlink/handlers.h>

namespace SafeRoute
{
    namespace
    {
        int OnNlValid(nl_msg *, void *arg)
        {
            static_cast<NetWatcher *>(arg)->Kick();
            return NL_OK;
        }

        void DrainEventFd(int fd)
        {
            std::uint64_t val = 0;
            while (true)
            {
                const ssize_t rc = ::read(fd, &val, sizeof(val));
                if (rc < 0 && errno == EINTR) continue;
                return;
            }
        }

        void SignalEventFd(int fd)
        {
            if (fd < 0) return;
            const std::uint64_t one = 1;
            // eventfd counter overflow only means a kick is already pending
            if (::write(fd, &one, sizeof(one)) < 0 && errno != EAGAIN)
            {
                LOGT("host") << "eventfd write errno=" << errno;
            }
        }
    } // namespace

    NetWatcher::NetWatcher(ReapplyFn reapply, std::chrono::milliseconds debounce)
        : reapply_(std::move(reapply))
        , debounce_(debounce.count() > 0 ? debounce : std::chrono::milliseconds(2000))
    {
        stop_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        kick_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (stop_fd_ < 0 || kick_fd_ < 0)
        {
            Close_();
            throw KernelOperationError("NetWatcher: eventfd failed");
        }

        sk_ = nl_socket_alloc();
        if (!sk_)
        {
            Close_();
            throw KernelOperationError("NetWatcher: nl_socket_alloc failed");
        }
        int rc = nl_connect(sk_, NETLINK_ROUTE);
        if (rc == 0)
        {
            rc = nl_socket_add_memberships(sk_, RTNLGRP_IPV4_ROUTE, RTNLGRP_IPV6_ROUTE, 0);
        }
        if (rc != 0)
        {
            Close_();
            throw KernelOperationError(std::string("NetWatcher: netlink subscribe: ") + nl_geterror(rc));
        }

        nl_socket_disable_seq_check(sk_);
        nl_socket_modify_cb(sk_, NL_CB_VALID, NL_CB_CUSTOM, &OnNlValid, this);
        nl_socket_set_nonblocking(sk_);
        nl_fd_ = nl_socket_get_fd(sk_);

        thread_ = std::jthread([this](std::stop_token st) { Loop_(st); });
        LOGD("host") << "Route watcher armed (debounce=" << debounce_.count() << " ms)";
    }

    NetWatcher::~NetWatcher()
    {
        Stop();
    }

    void NetWatcher::Kick()
    {
        SignalEventFd(kick_fd_);
    }

    void NetWatcher::Stop()
    {
        if (thread_.joinable())
        {
            thread_.request_stop();
            SignalEventFd(stop_fd_);
            thread_.join();
        }
        Close_();
    }

    void NetWatcher::Close_()
    {
        if (sk_)
        {
            nl_socket_free(sk_);
            sk_ = nullptr;
        }
        if (stop_fd_ >= 0) { ::close(stop_fd_); stop_fd_ = -1; }
        if (kick_fd_ >= 0) { ::close(kick_fd_); kick_fd_ = -1; }
        nl_fd_ = -1;
    }

    bool NetWatcher::Debounce_(std::stop_token &st)
    {
        auto last_event = std::chrono::steady_clock::now();
        while (!st.stop_requested())
        {
            const auto elapsed = std::chrono::steady_clock::now() - last_event;
            if (elapsed >= debounce_) return true;

            const int timeout_ms = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(debounce_ - elapsed).count());

            pollfd p[3] = {{stop_fd_, POLLIN, 0}, {kick_fd_, POLLIN, 0}, {nl_fd_, POLLIN, 0}};
            const int rc = ::poll(p, 3, timeout_ms);
            if (rc < 0)
            {
                if (errno == EINTR) continue;
                LOGE("host") << "Route watcher: poll(debounce) errno=" << errno;
                return false;
            }
            if (p[0].revents & POLLIN) return false;
            if (p[2].revents & POLLIN)
            {
                (void) nl_recvmsgs_default(sk_);
            }
            if (p[1].revents & POLLIN)
            {
                DrainEventFd(kick_fd_);
                last_event = std::chrono::steady_clock::now();
            }
        }
        return false;
    }

    void NetWatcher::Loop_(std::stop_token st)
    {
        while (!st.stop_requested())
        {
            pollfd p[3] = {{stop_fd_, POLLIN, 0}, {kick_fd_, POLLIN, 0}, {nl_fd_, POLLIN, 0}};
            const int rc = ::poll(p, 3, -1);
            if (rc < 0)
            {
                if (errno == EINTR) continue;
                LOGE("host") << "Route watcher: poll errno=" << errno;
                break;
            }
            if (p[0].revents & POLLIN) break;

            if (p[2].revents & POLLIN)
            {
                // OnNlValid turns every route message into a kick
                (void) nl_recvmsgs_default(sk_);
            }
            if (!(p[1].revents & POLLIN)) continue;

            DrainEventFd(kick_fd_);
            if (!Debounce_(st)) break;

            try
            {
                LOGI("host") << "Routes changed, reapplying";
                reapply_();
            }
            catch (const std::exception &e)
            {
                LOGE("host") << "Reapply failed: " << e.what();
            }
        }
        LOGD("host") << "Route watcher stopped";
    }
} // namespace SafeRoute
