#pragma once

namespace ft::version
{

// Derived from FT_BUILD_VERSION so banners and user agents agree.
inline constexpr char const kSemanticVersion[] = FT_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] =
    "FastTorrent " FT_BUILD_VERSION;
inline constexpr char const kServiceName[] = "FastTorrent Downloader API";

} // namespace ft::version
