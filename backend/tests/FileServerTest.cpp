#include "TestSupport.hpp"

#include "engine/ArchiveCache.hpp"
#include "engine/FileServer.hpp"
#include "engine/JobRegistry.hpp"

#include <chrono>
#include <functional>

#include <doctest/doctest.h>

using namespace ft::engine;
using ft::tests::FakeEngine;

namespace
{

struct FileServerFixture
{
    std::filesystem::path root;
    FakeEngine engine;
    ArchiveCache archives;
    JobRegistry registry;
    FileServer server;
    EngineHandle handle = kInvalidHandle;

    explicit FileServerFixture(std::string const &tag)
        : root(ft::tests::make_temp_root(tag)), archives(root / "temp"),
          registry(engine, archives), server(engine, registry, archives)
    {
        handle = engine.submit({});
        JobRecord record;
        record.id = "job";
        record.name = "Show: Season 1";
        record.save_path = root / "downloads";
        record.added_time = Clock::now() - std::chrono::minutes(5);
        record.link = ActiveLink{handle};
        registry.add_active(record);
        engine.set_manifest(handle, {{"show/e1.mkv", 3},
                                     {"show/e2.mkv", 3},
                                     {"show/e3.mkv", 3}});
    }

    void write(std::string const &relative)
    {
        ft::tests::write_file(root / "downloads" / relative, "abc");
    }
};

ErrorCode error_of(std::function<void()> const &action)
{
    try
    {
        action();
    }
    catch (Error const &ex)
    {
        return ex.code();
    }
    FAIL("expected an error");
    return ErrorCode::EngineFailure;
}

} // namespace

TEST_CASE("available files lists only files present on disk")
{
    FileServerFixture fx("files-available");
    CHECK(error_of([&] { fx.server.available_files("job"); }) ==
          ErrorCode::NotFound);

    fx.write("show/e2.mkv");
    auto files = fx.server.available_files("job");
    REQUIRE(files.size() == 1);
    CHECK(files[0].relative_path == "show/e2.mkv");
    CHECK(error_of([&] { fx.server.available_files("other"); }) ==
          ErrorCode::NotFound);
}

TEST_CASE("missing metadata surfaces as engine failure")
{
    FileServerFixture fx("files-nometa");
    fx.engine.set_metadata_ready(fx.handle, false);
    CHECK(error_of([&] { fx.server.files("job"); }) ==
          ErrorCode::EngineFailure);
}

TEST_CASE("traversal selectors are rejected before existence checks")
{
    FileServerFixture fx("files-traversal");
    CHECK(error_of([&] { fx.server.resolve("job", "../etc/passwd"); }) ==
          ErrorCode::InvalidPath);
    CHECK(error_of([&] { fx.server.resolve("job", "/etc/passwd"); }) ==
          ErrorCode::InvalidPath);
    CHECK(error_of([&] { fx.server.resolve("job", "show//e1.mkv"); }) ==
          ErrorCode::InvalidPath);
}

TEST_CASE("selected file is served directly")
{
    FileServerFixture fx("files-selected");
    fx.write("show/e1.mkv");
    fx.write("show/e3.mkv");
    auto served = fx.server.resolve("job", std::string("show/e3.mkv"));
    CHECK(served.path == fx.root / "downloads" / "show" / "e3.mkv");
    CHECK(served.download_name == "e3.mkv");
    CHECK(served.content_type == "application/octet-stream");

    CHECK(error_of([&] { fx.server.resolve("job", "show/e2.mkv"); }) ==
          ErrorCode::NotFound);
}

TEST_CASE("a single existing file needs no archive")
{
    FileServerFixture fx("files-single");
    fx.write("show/e1.mkv");
    auto served = fx.server.resolve("job", std::nullopt);
    CHECK(served.download_name == "e1.mkv");
    CHECK_FALSE(std::filesystem::exists(fx.archives.archive_path("job")));
}

TEST_CASE("several files are served as a named archive")
{
    FileServerFixture fx("files-archive");
    fx.write("show/e1.mkv");
    fx.write("show/e2.mkv");
    auto served = fx.server.resolve("job", std::nullopt);
    CHECK(served.path == fx.archives.archive_path("job"));
    CHECK(served.download_name == "Show Season 1.zip");
    CHECK(served.content_type == "application/zip");
    CHECK(std::filesystem::file_size(served.path) > 0);
}

TEST_CASE("completed jobs serve their stored snapshot")
{
    FileServerFixture fx("files-completed");
    fx.write("show/e1.mkv");
    auto record = fx.registry.get("job");
    auto snapshot = resolve_manifest(record.save_path, {{"show/e1.mkv", 3}});
    fx.registry.mark_completed(
        "job", make_completed_record(record, JobStats{}, snapshot,
                                     Clock::now()));
    fx.engine.remove(fx.handle, false);

    auto files = fx.server.files("job");
    REQUIRE(files.size() == 1);
    CHECK(files[0].relative_path == "show/e1.mkv");
}
