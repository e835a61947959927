#include "engine/IngestClassifier.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace ft::engine
{

namespace
{
constexpr std::size_t kMinDescriptorBytes = 20;
constexpr std::size_t kHtmlSniffBytes = 200;
constexpr std::size_t kContentHashLength = 40;
constexpr auto kFetchTimeout = std::chrono::seconds(30);

constexpr char const kBrowserUserAgent[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

constexpr std::array<std::string_view, 8> kRemediationTrackers = {
    "udp://open.demonii.com:1337/announce",
    "udp://tracker.openbittorrent.com:80",
    "udp://tracker.coppersurfer.tk:6969",
    "udp://glotorrents.pw:6969/announce",
    "udp://tracker.opentrackr.org:1337/announce",
    "udp://torrent.gresille.org:80/announce",
    "udp://p4p.arenabg.com:1337",
    "udp://tracker.leechers-paradise.org:6969",
};

bool is_hex(char ch) noexcept
{
    return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
}

bool starts_with_nocase(std::string_view text, std::string_view prefix)
{
    if (text.size() < prefix.size())
    {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(),
                      [](char a, char b)
                      {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

bool looks_like_html(std::vector<std::uint8_t> const &bytes)
{
    auto const n = std::min(bytes.size(), kHtmlSniffBytes);
    std::string preview(bytes.begin(), bytes.begin() + static_cast<long>(n));
    std::transform(preview.begin(), preview.end(), preview.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return preview.find("html") != std::string::npos ||
           preview.find('<') != std::string::npos;
}
} // namespace

std::string trim(std::string_view text)
{
    auto const is_space = [](unsigned char ch) { return std::isspace(ch); };
    while (!text.empty() && is_space(text.front()))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back()))
    {
        text.remove_suffix(1);
    }
    return std::string(text);
}

bool is_content_hash(std::string_view text) noexcept
{
    return text.size() == kContentHashLength &&
           std::all_of(text.begin(), text.end(), is_hex);
}

IngestClassifier::IngestClassifier(DescriptorFetcher &fetcher)
    : fetcher_(fetcher)
{
}

ClassifiedLocator IngestClassifier::classify(std::string_view locator) const
{
    auto value = trim(locator);
    if (starts_with_nocase(value, "magnet:"))
    {
        return {LocatorKind::DirectLink, std::move(value)};
    }
    if (starts_with_nocase(value, "http://") ||
        starts_with_nocase(value, "https://"))
    {
        return {LocatorKind::DescriptorUrl, std::move(value)};
    }
    if (is_content_hash(value))
    {
        return {LocatorKind::ContentHash, "magnet:?xt=urn:btih:" + value};
    }
    throw Error(ErrorCode::InvalidInput,
                "Invalid input. Expected magnet link, HTTP(S) URL, or "
                "40-character info hash");
}

std::string IngestClassifier::referer_for(std::string_view url)
{
    if (auto pos = url.find("/torrent/"); pos != std::string_view::npos)
    {
        return std::string(url.substr(0, pos));
    }
    if (auto pos = url.rfind('/'); pos != std::string_view::npos)
    {
        return std::string(url.substr(0, pos));
    }
    return std::string(url);
}

FetchRequest IngestClassifier::browser_request(std::string const &url)
{
    FetchRequest request;
    request.url = url;
    request.user_agent = kBrowserUserAgent;
    request.timeout = kFetchTimeout;
    request.follow_redirects = true;
    request.headers = {
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,"
                   "image/avif,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"DNT", "1"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"},
        {"Sec-Fetch-Dest", "document"},
        {"Sec-Fetch-Mode", "navigate"},
        {"Sec-Fetch-Site", "none"},
        {"Cache-Control", "max-age=0"},
        {"Referer", referer_for(url)},
    };
    return request;
}

std::optional<std::string>
IngestClassifier::remediation_magnet(std::string_view locator)
{
    std::size_t run = 0;
    for (std::size_t i = 0; i < locator.size(); ++i)
    {
        run = is_hex(locator[i]) ? run + 1 : 0;
        if (run == kContentHashLength)
        {
            auto const hash = locator.substr(i + 1 - kContentHashLength,
                                             kContentHashLength);
            std::string magnet = "magnet:?xt=urn:btih:";
            magnet.append(hash);
            magnet.append("&dn=");
            for (auto const tracker : kRemediationTrackers)
            {
                magnet.append("&tr=");
                magnet.append(tracker);
            }
            return magnet;
        }
    }
    return std::nullopt;
}

void IngestClassifier::validate_descriptor(
    std::vector<std::uint8_t> const &bytes)
{
    if (bytes.size() < kMinDescriptorBytes)
    {
        throw Error(ErrorCode::NotADescriptorFile,
                    "Downloaded file is too small to be a valid torrent");
    }
    if (bytes.front() == 'd')
    {
        return;
    }
    if (looks_like_html(bytes))
    {
        throw Error(ErrorCode::NotADescriptorFile,
                    "Received HTML instead of torrent file. The site may be "
                    "blocking automated downloads.");
    }
    throw Error(ErrorCode::NotADescriptorFile,
                "Downloaded file is not a valid torrent file (invalid bencode "
                "format)");
}

std::vector<std::uint8_t>
IngestClassifier::fetch_descriptor(std::string const &url) const
{
    FT_LOG_INFO("downloading torrent file from {}", url);
    auto response = fetcher_.get(browser_request(url));
    if (response.timed_out)
    {
        throw Error(ErrorCode::RemoteTimeout,
                    "Download timed out. The server may be slow or "
                    "unavailable.");
    }
    if (!response.transport_error.empty())
    {
        throw Error::remote_http(0, "Could not download torrent: " +
                                        response.transport_error);
    }
    if (response.status == 403)
    {
        FT_LOG_ERROR("403 Forbidden, site is blocking the download: {}", url);
        auto magnet = remediation_magnet(url);
        std::string message =
            "The torrent site is blocking automated downloads.";
        if (magnet)
        {
            message += " Use this magnet link instead: " + *magnet;
        }
        else
        {
            message += " Copy the magnet link from the torrent page, or "
                       "download the .torrent file in a browser and upload "
                       "it here.";
        }
        throw Error::blocked(message, std::move(magnet));
    }
    if (response.status == 404)
    {
        throw Error(ErrorCode::RemoteNotFound,
                    "Torrent not found (404). The link may be expired.");
    }
    if (response.status >= 400 || response.status < 200)
    {
        throw Error::remote_http(static_cast<int>(response.status),
                                 "HTTP " + std::to_string(response.status));
    }
    validate_descriptor(response.body);
    FT_LOG_INFO("downloaded torrent file ({} bytes)", response.body.size());
    return std::move(response.body);
}

} // namespace ft::engine
