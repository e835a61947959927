#include "engine/HttpFetcher.hpp"

#include "utils/Log.hpp"

#include <curl/curl.h>

#include <memory>

namespace ft::engine
{

namespace
{
// Descriptor files are small; anything bigger is not one.
constexpr std::size_t kMaxBodyBytes = 64 * 1024 * 1024;

struct CurlDeleter
{
    void operator()(CURL *handle) const noexcept
    {
        curl_easy_cleanup(handle);
    }
};

struct HeaderListDeleter
{
    void operator()(curl_slist *list) const noexcept
    {
        curl_slist_free_all(list);
    }
};

std::size_t write_body(char *contents, std::size_t size, std::size_t nmemb,
                       void *userp)
{
    auto *body = static_cast<std::vector<std::uint8_t> *>(userp);
    auto const total = size * nmemb;
    if (body->size() + total > kMaxBodyBytes)
    {
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    body->insert(body->end(), contents, contents + total);
    return total;
}
} // namespace

CurlFetcher::CurlFetcher()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlFetcher::~CurlFetcher()
{
    curl_global_cleanup();
}

FetchResponse CurlFetcher::get(FetchRequest const &request)
{
    FetchResponse response;
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
    {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    curl_slist *raw_headers = nullptr;
    for (auto const &[name, value] : request.headers)
    {
        auto line = name + ": " + value;
        auto *appended = curl_slist_append(raw_headers, line.c_str());
        if (appended == nullptr)
        {
            curl_slist_free_all(raw_headers);
            response.transport_error = "failed to build request headers";
            return response;
        }
        raw_headers = appended;
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(raw_headers);

    auto *c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION,
                     request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout.count()));
    // empty string: offer every encoding this libcurl can decode
    curl_easy_setopt(c, CURLOPT_ACCEPT_ENCODING, "");
    if (!request.user_agent.empty())
    {
        curl_easy_setopt(c, CURLOPT_USERAGENT, request.user_agent.c_str());
    }
    if (headers)
    {
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &response.body);

    auto const code = curl_easy_perform(c);
    if (code == CURLE_OPERATION_TIMEDOUT)
    {
        response.timed_out = true;
        response.transport_error = curl_easy_strerror(code);
        return response;
    }
    if (code != CURLE_OK)
    {
        response.transport_error = curl_easy_strerror(code);
        FT_LOG_WARN("fetch of {} failed: {}", request.url,
                    response.transport_error);
        return response;
    }
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace ft::engine
