#include "SafeRoute/Engine/EngineLock.hpp"
#include "SafeRoute/Logger.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <system_error>

namespace SafeRoute
{
    namespace
    {
        std::mutex &ProcessMutex()
        {
            static std::mutex mu;
            return mu;
        }
    } // namespace

    EngineLock::EngineLock(std::string lock_file) : lock_file_(std::move(lock_file))
    {
    }

    EngineLock::Scope::Scope(std::unique_lock<std::mutex> lock, int fd)
        : lock_(std::move(lock)), fd_(fd)
    {
    }

    EngineLock::Scope::Scope(Scope &&other) noexcept
        : lock_(std::move(other.lock_)), fd_(other.fd_)
    {
        other.fd_ = -1;
    }

    EngineLock::Scope::~Scope()
    {
        if (fd_ >= 0)
        {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    EngineLock::Scope EngineLock::Acquire()
    {
        std::unique_lock<std::mutex> lock(ProcessMutex());
        if (lock_file_.empty())
        {
            return Scope(std::move(lock), -1);
        }

        std::error_code ec;
        const auto parent = std::filesystem::path(lock_file_).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
        }

        const int fd = ::open(lock_file_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            throw std::system_error(errno, std::generic_category(), "open " + lock_file_);
        }

        while (::flock(fd, LOCK_EX) != 0)
        {
            if (errno == EINTR) continue;
            const int e = errno;
            ::close(fd);
            throw std::system_error(e, std::generic_category(), "flock " + lock_file_);
        }
        LOGT("engine") << "lock acquired: " << lock_file_;
        return Scope(std::move(lock), fd);
    }
} // namespace SafeRoute
