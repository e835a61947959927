#include "TestSupport.hpp"

#include "engine/ArchiveCache.hpp"
#include "engine/JobRegistry.hpp"

#include <chrono>
#include <set>

#include <doctest/doctest.h>

using namespace ft::engine;
using ft::tests::FakeEngine;

namespace
{

JobRecord active_record(std::string id, EngineHandle handle,
                        Clock::time_point added,
                        std::filesystem::path save_path = "/tmp")
{
    JobRecord record;
    record.id = std::move(id);
    record.state = "downloading";
    record.added_time = added;
    record.save_path = std::move(save_path);
    record.link = ActiveLink{handle};
    return record;
}

struct RegistryFixture
{
    std::filesystem::path root;
    FakeEngine engine;
    ArchiveCache archives;
    JobRegistry registry;

    explicit RegistryFixture(std::string const &tag)
        : root(ft::tests::make_temp_root(tag)), archives(root / "temp"),
          registry(engine, archives)
    {
    }
};

} // namespace

TEST_CASE("issued ids are unique uuid v4 strings")
{
    RegistryFixture fx("registry-ids");
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i)
    {
        auto id = fx.registry.issue_id();
        REQUIRE(id.size() == 36);
        CHECK(id[14] == '4');
        CHECK(ids.insert(id).second);
    }
}

TEST_CASE("get throws NotFound for unknown ids")
{
    RegistryFixture fx("registry-missing");
    try
    {
        fx.registry.get("nope");
        FAIL("expected NotFound");
    }
    catch (Error const &ex)
    {
        CHECK(ex.code() == ErrorCode::NotFound);
    }
}

TEST_CASE("merged view lists newest submissions first across both maps")
{
    RegistryFixture fx("registry-merged");
    auto now = Clock::now();
    auto h1 = fx.engine.submit({});
    auto h2 = fx.engine.submit({});
    fx.registry.add_active(active_record("old", h1, now - std::chrono::hours(2)));
    fx.registry.add_active(active_record("new", h2, now));

    auto completed = make_completed_record(
        active_record("old", h1, now - std::chrono::hours(2)), JobStats{}, {},
        now);
    REQUIRE(fx.registry.mark_completed("old", completed));

    auto view = fx.registry.merged_view();
    REQUIRE(view.size() == 2);
    CHECK(view[0].id == "new");
    CHECK(view[1].id == "old");
    CHECK(view[1].is_completed());
    CHECK(fx.registry.active_count() == 1);
}

TEST_CASE("mark_completed is a one-way transition")
{
    RegistryFixture fx("registry-complete");
    auto handle = fx.engine.submit({});
    auto record = active_record("job", handle, Clock::now());
    fx.registry.add_active(record);

    auto completed =
        make_completed_record(record, JobStats{}, {}, Clock::now());
    CHECK(fx.registry.mark_completed("job", completed));
    CHECK_FALSE(fx.registry.mark_completed("job", completed));
    CHECK_FALSE(fx.registry.mark_completed("unknown", completed));
    CHECK(fx.registry.is_completed("job"));
    CHECK(fx.registry.completed_at("job").has_value());
    CHECK(fx.registry.active_snapshot().empty());
}

TEST_CASE("update_stats ignores completed jobs")
{
    RegistryFixture fx("registry-stats");
    auto handle = fx.engine.submit({});
    auto record = active_record("job", handle, Clock::now());
    fx.registry.add_active(record);
    JobStats stats;
    stats.progress = 0.5;
    fx.registry.update_stats("job", stats);
    CHECK(fx.registry.get("job").progress == doctest::Approx(50.0));

    fx.registry.mark_completed(
        "job", make_completed_record(record, JobStats{}, {}, Clock::now()));
    stats.progress = 0.1;
    fx.registry.update_stats("job", stats);
    CHECK(fx.registry.get("job").progress == doctest::Approx(100.0));
}

TEST_CASE("removing an active job detaches it from the engine")
{
    RegistryFixture fx("registry-remove-active");
    auto descriptor = fx.root / "torrents" / "job.torrent";
    ft::tests::write_file(descriptor, ft::tests::kSampleDescriptor);
    auto handle = fx.engine.submit({});
    auto record = active_record("job", handle, Clock::now());
    record.descriptor_path = descriptor;
    fx.registry.add_active(record);

    fx.registry.remove("job", true);
    REQUIRE(fx.engine.removed.size() == 1);
    CHECK(fx.engine.removed[0].first == handle);
    CHECK(fx.engine.removed[0].second);
    CHECK_FALSE(fx.registry.contains("job"));
    CHECK_FALSE(std::filesystem::exists(descriptor));
    CHECK_THROWS_AS(fx.registry.remove("job", false), Error);
}

TEST_CASE("removing a completed job deletes snapshot files and empty folders")
{
    RegistryFixture fx("registry-remove-completed");
    auto save = fx.root / "downloads";
    auto keep = save / "keep.txt";
    auto a = save / "show" / "season" / "a.mkv";
    auto b = save / "show" / "b.mkv";
    ft::tests::write_file(keep, "keep");
    ft::tests::write_file(a, "aaaa");
    ft::tests::write_file(b, "bb");

    auto handle = fx.engine.submit({});
    auto record = active_record("job", handle, Clock::now(), save);
    fx.registry.add_active(record);
    fx.registry.mark_completed(
        "job", make_completed_record(record, JobStats{},
                                     {{"show/season/a.mkv", a, 4},
                                      {"show/b.mkv", b, 2}},
                                     Clock::now()));

    fx.registry.remove("job", true);
    CHECK_FALSE(std::filesystem::exists(a));
    CHECK_FALSE(std::filesystem::exists(b));
    CHECK_FALSE(std::filesystem::exists(save / "show"));
    CHECK(std::filesystem::exists(keep));
    CHECK(fx.engine.removed.empty());
}

TEST_CASE("prune stops at the first non-empty directory")
{
    auto root = ft::tests::make_temp_root("registry-prune");
    ft::tests::write_file(root / "a" / "marker", "x");
    std::filesystem::create_directories(root / "a" / "b" / "c");
    prune_empty_directories(root / "a" / "b" / "c");
    CHECK_FALSE(std::filesystem::exists(root / "a" / "b"));
    CHECK(std::filesystem::exists(root / "a" / "marker"));
}

TEST_CASE("prune never walks past the filesystem root")
{
    auto const top = std::filesystem::path("/fasttest-missing-dir");
    prune_empty_directories(top / "a" / "b");
    prune_empty_directories(top);
    prune_empty_directories("/");
    prune_empty_directories("relative-missing/dir");
    CHECK(std::filesystem::is_directory("/"));
    CHECK_FALSE(std::filesystem::exists(top));

    std::error_code ec;
    if (!std::filesystem::create_directory(top, ec) || ec)
    {
        MESSAGE("cannot create directories under /, skipping");
        return;
    }
    prune_empty_directories(top);
    CHECK_FALSE(std::filesystem::exists(top));
    CHECK(std::filesystem::is_directory("/"));
}
