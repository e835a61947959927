#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ft::engine
{

struct FetchRequest
{
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string user_agent;
    std::chrono::milliseconds timeout{30000};
    bool follow_redirects = true;
};

struct FetchResponse
{
    long status = 0;
    std::vector<std::uint8_t> body;
    bool timed_out = false;
    // Set when no HTTP response was obtained at all.
    std::string transport_error;
};

class DescriptorFetcher
{
  public:
    virtual ~DescriptorFetcher() = default;
    virtual FetchResponse get(FetchRequest const &request) = 0;
};

// libcurl easy-handle fetcher; one handle per request.
class CurlFetcher final : public DescriptorFetcher
{
  public:
    CurlFetcher();
    ~CurlFetcher() override;
    CurlFetcher(CurlFetcher const &) = delete;
    CurlFetcher &operator=(CurlFetcher const &) = delete;

    FetchResponse get(FetchRequest const &request) override;
};

} // namespace ft::engine
