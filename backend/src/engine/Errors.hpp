#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ft::engine
{

enum class ErrorCode
{
    InvalidInput,
    NotADescriptorFile,
    BlockedByHost,
    RemoteNotFound,
    RemoteTimeout,
    RemoteHttpError,
    NotFound,
    InvalidPath,
    ArchiveBuildFailure,
    EngineFailure,
};

char const *to_string(ErrorCode code) noexcept;

// HTTP status the request layer reports for a given error.
int http_status_for(ErrorCode code) noexcept;

class Error : public std::runtime_error
{
  public:
    Error(ErrorCode code, std::string const &message)
        : std::runtime_error(message), code_(code)
    {
    }

    ErrorCode code() const noexcept
    {
        return code_;
    }

    // Remote status code for RemoteHttpError (0 for transport failures).
    int remote_status() const noexcept
    {
        return remote_status_;
    }

    // Alternate locator the caller can retry with (BlockedByHost only).
    std::optional<std::string> const &remediation() const noexcept
    {
        return remediation_;
    }

    static Error remote_http(int status, std::string const &message)
    {
        Error error(ErrorCode::RemoteHttpError, message);
        error.remote_status_ = status;
        return error;
    }

    static Error blocked(std::string const &message,
                         std::optional<std::string> remediation)
    {
        Error error(ErrorCode::BlockedByHost, message);
        error.remediation_ = std::move(remediation);
        return error;
    }

  private:
    ErrorCode code_;
    int remote_status_ = 0;
    std::optional<std::string> remediation_;
};

// Outcome of an optimization the caller may ignore.
struct BestEffort
{
    bool ok = true;
    std::string error;

    static BestEffort failure(std::string message)
    {
        return BestEffort{false, std::move(message)};
    }
};

} // namespace ft::engine
