#pragma once

// NetWatcher.hpp — следит за маршрутами (RTNLGRP_IPV4/IPV6_ROUTE) и после
// паузы debounce вызывает callback. Daemon mode uses it to re-pin tunnel
// endpoints when the default gateway moves.

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <thread>

struct nl_sock;

namespace SafeRoute
{
    class NetWatcher
    {
    public:
        using ReapplyFn = std::function<void()>;

        /// @throws KernelOperationError if the netlink subscription fails.
        explicit NetWatcher(ReapplyFn reapply,
                            std::chrono::milliseconds debounce = std::chrono::milliseconds(2000));
        ~NetWatcher();

        NetWatcher(const NetWatcher&)            = delete;
        NetWatcher& operator=(const NetWatcher&) = delete;

        /// Request a reapply (coalesced by debounce).
        void Kick();

        void Stop();

    private:
        void Loop_(std::stop_token st);
        /// false: stop requested while waiting.
        bool Debounce_(std::stop_token &st);
        void Close_();

        ReapplyFn                 reapply_;
        std::chrono::milliseconds debounce_;

        nl_sock     *sk_      = nullptr;
        int          nl_fd_   = -1;
        int          stop_fd_ = -1;
        int          kick_fd_ = -1;
        std::jthread thread_;
    };
} // namespace SafeRoute
