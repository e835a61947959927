#pragma once

#include "engine/HttpFetcher.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ft::engine
{

enum class LocatorKind
{
    DirectLink,
    DescriptorUrl,
    ContentHash,
};

struct ClassifiedLocator
{
    LocatorKind kind = LocatorKind::DirectLink;
    // Trimmed input; for ContentHash the synthesized magnet link.
    std::string value;
};

class IngestClassifier
{
  public:
    explicit IngestClassifier(DescriptorFetcher &fetcher);

    // Throws Error(InvalidInput) for anything that is not a magnet link,
    // an http(s) URL or a 40 character hex content hash.
    ClassifiedLocator classify(std::string_view locator) const;

    // Downloads and validates a remote descriptor. No retries.
    std::vector<std::uint8_t> fetch_descriptor(std::string const &url) const;

    // Throws Error(NotADescriptorFile) unless bytes look like a bencoded
    // dictionary.
    static void validate_descriptor(std::vector<std::uint8_t> const &bytes);

    static FetchRequest browser_request(std::string const &url);
    static std::string referer_for(std::string_view url);
    static std::optional<std::string> remediation_magnet(
        std::string_view locator);

  private:
    DescriptorFetcher &fetcher_;
};

std::string trim(std::string_view text);
bool is_content_hash(std::string_view text) noexcept;

} // namespace ft::engine
