#include "engine/Errors.hpp"

namespace ft::engine
{

char const *to_string(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::InvalidInput:
        return "invalid-input";
    case ErrorCode::NotADescriptorFile:
        return "not-a-descriptor-file";
    case ErrorCode::BlockedByHost:
        return "blocked-by-host";
    case ErrorCode::RemoteNotFound:
        return "remote-not-found";
    case ErrorCode::RemoteTimeout:
        return "remote-timeout";
    case ErrorCode::RemoteHttpError:
        return "remote-http-error";
    case ErrorCode::NotFound:
        return "not-found";
    case ErrorCode::InvalidPath:
        return "invalid-path";
    case ErrorCode::ArchiveBuildFailure:
        return "archive-build-failure";
    case ErrorCode::EngineFailure:
        return "engine-failure";
    }
    return "unknown";
}

int http_status_for(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::NotFound:
        return 404;
    case ErrorCode::ArchiveBuildFailure:
        return 500;
    default:
        return 400;
    }
}

} // namespace ft::engine
