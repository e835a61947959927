#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace ft::utils
{

std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();

// Creates the directory (and parents) if needed; nullopt when it cannot.
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate);

struct DiskUsage
{
    std::uintmax_t total = 0;
    std::uintmax_t used = 0;
    std::uintmax_t free = 0;
};

std::optional<DiskUsage> disk_usage(std::filesystem::path const &path);

} // namespace ft::utils
