#pragma once

// EngineLock.hpp — serialises mutations: in-process mutex plus flock(2)
// on a lock file shared with other saferoute processes.

#include <mutex>
#include <string>

namespace SafeRoute
{
    class EngineLock
    {
    public:
        /// Empty lock_file: in-process locking only.
        explicit EngineLock(std::string lock_file);

        class Scope
        {
        public:
            Scope(Scope &&other) noexcept;
            ~Scope();

            Scope(const Scope&)            = delete;
            Scope& operator=(const Scope&) = delete;
            Scope& operator=(Scope&&)      = delete;

        private:
            friend class EngineLock;
            Scope(std::unique_lock<std::mutex> lock, int fd);

            std::unique_lock<std::mutex> lock_;
            int                          fd_ = -1;
        };

        /// Blocks until both locks are held. @throws std::system_error
        Scope Acquire();

    private:
        std::string lock_file_;
    };
} // namespace SafeRoute
