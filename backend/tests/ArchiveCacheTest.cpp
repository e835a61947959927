#include "TestSupport.hpp"
#include "ZipReader.hpp"

#include "engine/ArchiveCache.hpp"
#include "engine/Errors.hpp"

#include <chrono>
#include <string>

#include <doctest/doctest.h>

using namespace ft::engine;
using ft::tests::read_zip;

namespace
{

std::vector<FileEntry> sample_files(std::filesystem::path const &root)
{
    ft::tests::write_file(root / "data" / "a.txt", "alpha alpha alpha");
    ft::tests::write_file(root / "data" / "sub" / "b.txt", "beta");
    return {{"a.txt", root / "data" / "a.txt", 17},
            {"sub/b.txt", root / "data" / "sub" / "b.txt", 4}};
}

} // namespace

TEST_CASE("archive names are sanitized")
{
    CHECK(ArchiveCache::sanitize_name("  My: Show? <2024>  ") == "My Show 2024");
    CHECK(ArchiveCache::sanitize_name("a/b\\c|d\"e*") == "abcde");
    CHECK(ArchiveCache::sanitize_name(" ?? ") == "download");
    CHECK(ArchiveCache::sanitize_name("") == "download");
}

TEST_CASE("built archive holds every file under its relative path")
{
    auto root = ft::tests::make_temp_root("archive-build");
    ArchiveCache cache(root / "temp");
    auto files = sample_files(root);

    auto entry = cache.build_if_needed("job", files, "My Show", Clock::now());
    CHECK(entry.path == root / "temp" / "job.zip");
    CHECK(entry.download_name() == "My Show.zip");
    CHECK_FALSE(std::filesystem::exists(root / "temp" / "job.zip.partial"));

    auto entries = read_zip(entry.path);
    REQUIRE(entries.size() == 2);
    CHECK(entries["a.txt"] == "alpha alpha alpha");
    CHECK(entries["sub/b.txt"] == "beta");
}

TEST_CASE("fresh archives are reused and stale ones rebuilt")
{
    auto root = ft::tests::make_temp_root("archive-reuse");
    ArchiveCache cache(root / "temp");
    auto files = sample_files(root);
    auto const past = Clock::now() - std::chrono::hours(1);

    auto first = cache.build_if_needed("job", files, "name", past);
    ft::tests::write_file(files[1].absolute_path, "changed");
    files[1].size = 7;

    cache.build_if_needed("job", files, "name", past);
    CHECK(read_zip(first.path)["sub/b.txt"] == "beta");

    cache.build_if_needed("job", files, "name",
                          Clock::now() + std::chrono::hours(1));
    CHECK(read_zip(first.path)["sub/b.txt"] == "changed");
}

TEST_CASE("an archive written before the freshness instant is stale")
{
    auto root = ft::tests::make_temp_root("archive-subsecond");
    ArchiveCache cache(root / "temp");
    auto files = sample_files(root);
    auto const second = std::chrono::floor<std::chrono::seconds>(Clock::now()) -
                        std::chrono::seconds(10);

    auto entry = cache.build_if_needed("job", files, "name", second);
    std::filesystem::last_write_time(
        entry.path, std::chrono::file_clock::from_sys(second));
    ft::tests::write_file(files[1].absolute_path, "complete");
    files[1].size = 8;

    cache.build_if_needed("job", files, "name",
                          second + std::chrono::milliseconds(900));
    CHECK(read_zip(entry.path)["sub/b.txt"] == "complete");
}

TEST_CASE("builds for a job that is no longer wanted are skipped")
{
    auto root = ft::tests::make_temp_root("archive-unwanted");
    ArchiveCache cache(root / "temp");
    try
    {
        cache.build_if_needed("job", sample_files(root), "name", Clock::now(),
                              [] { return false; });
        FAIL("expected NotFound");
    }
    catch (Error const &ex)
    {
        CHECK(ex.code() == ErrorCode::NotFound);
    }
    CHECK_FALSE(std::filesystem::exists(cache.archive_path("job")));
}

TEST_CASE("failed builds leave no artifact behind")
{
    auto root = ft::tests::make_temp_root("archive-fail");
    ArchiveCache cache(root / "temp");
    std::vector<FileEntry> files{
        {"missing.bin", root / "does-not-exist.bin", 10}};
    try
    {
        cache.build_if_needed("job", files, "name", Clock::now());
        FAIL("expected ArchiveBuildFailure");
    }
    catch (Error const &ex)
    {
        CHECK(ex.code() == ErrorCode::ArchiveBuildFailure);
    }
    CHECK_FALSE(std::filesystem::exists(root / "temp" / "job.zip"));
    CHECK_FALSE(std::filesystem::exists(root / "temp" / "job.zip.partial"));
}

TEST_CASE("remove deletes a cached archive")
{
    auto root = ft::tests::make_temp_root("archive-remove");
    ArchiveCache cache(root / "temp");
    auto entry =
        cache.build_if_needed("job", sample_files(root), "x", Clock::now());
    REQUIRE(std::filesystem::exists(entry.path));
    cache.remove("job");
    CHECK_FALSE(std::filesystem::exists(entry.path));
    cache.remove("job");
}
