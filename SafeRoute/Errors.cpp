#include "SafeRoute/Errors.hpp"

namespace SafeRoute
{
    const char *ToString(ErrorKind kind) noexcept
    {
        switch (kind)
        {
            case ErrorKind::ConfigInvalid:        return "ConfigInvalid";
            case ErrorKind::Conflict:             return "Conflict";
            case ErrorKind::NotFound:             return "NotFound";
            case ErrorKind::ResolutionError:      return "ResolutionError";
            case ErrorKind::KernelOperationError: return "KernelOperationError";
        }
        return "Unknown";
    }
} // namespace SafeRoute
