#include "utils/FS.hpp"

#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace ft::utils
{

namespace
{
std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}
} // namespace

std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> executable_path()
{
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
}

std::filesystem::path data_root()
{
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

std::optional<DiskUsage> disk_usage(std::filesystem::path const &path)
{
    std::error_code ec;
    auto const info = std::filesystem::space(path, ec);
    if (ec)
    {
        return std::nullopt;
    }
    DiskUsage usage;
    usage.total = info.capacity;
    usage.free = info.available;
    usage.used = info.capacity >= info.free ? info.capacity - info.free : 0;
    return usage;
}

} // namespace ft::utils
