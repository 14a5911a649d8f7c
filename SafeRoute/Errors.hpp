#pragma once

// Errors.hpp — типизированные ошибки движка. Front ends map ErrorKind to
// exit codes or HTTP statuses.

#include <stdexcept>
#include <string>

namespace SafeRoute
{
    enum class ErrorKind
    {
        ConfigInvalid,
        Conflict,
        NotFound,
        ResolutionError,
        KernelOperationError
    };

    const char *ToString(ErrorKind kind) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorKind kind, const std::string &what)
            : std::runtime_error(what), kind_(kind)
        {
        }

        ErrorKind Kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    /// Malformed or missing definition sections/keys, bad names, bad JSON.
    class ConfigInvalid : public Error
    {
    public:
        explicit ConfigInvalid(const std::string &what)
            : Error(ErrorKind::ConfigInvalid, what) {}
    };

    /// Duplicate profile name or mapping IP.
    class Conflict : public Error
    {
    public:
        explicit Conflict(const std::string &what)
            : Error(ErrorKind::Conflict, what) {}
    };

    /// Unknown profile or mapping.
    class NotFound : public Error
    {
    public:
        explicit NotFound(const std::string &what)
            : Error(ErrorKind::NotFound, what) {}
    };

    /// Peer endpoint hostname did not resolve (or timed out).
    class ResolutionError : public Error
    {
    public:
        explicit ResolutionError(const std::string &what)
            : Error(ErrorKind::ResolutionError, what) {}
    };

    /// Interface/crypto/route/rule/firewall mutation rejected by the OS.
    class KernelOperationError : public Error
    {
    public:
        explicit KernelOperationError(const std::string &what)
            : Error(ErrorKind::KernelOperationError, what) {}
    };
} // namespace SafeRoute
