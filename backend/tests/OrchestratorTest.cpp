#include "TestSupport.hpp"
#include "ZipReader.hpp"

#include "engine/Errors.hpp"
#include "engine/Orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include <doctest/doctest.h>

using namespace ft::engine;
using ft::tests::OrchestratorHarness;

namespace
{
constexpr char const kHash[] = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";

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

TEST_CASE("magnet and hash submissions reach the engine")
{
    OrchestratorHarness h("orch-submit");
    auto magnet_id = h.orchestrator->submit("magnet:?xt=urn:btih:abc", {});
    auto hash_id = h.orchestrator->submit(kHash, {});
    CHECK(magnet_id != hash_id);

    auto magnet = h.orchestrator->get(magnet_id);
    CHECK(magnet.source == SourceKind::Magnet);
    CHECK(magnet.save_path == h.root / "downloads");
    auto params = h.engine->snapshot(magnet.handle().value()).params;
    REQUIRE(params.magnet_uri.has_value());
    CHECK(*params.magnet_uri == "magnet:?xt=urn:btih:abc");
    CHECK(h.engine->snapshot(magnet.handle().value()).boosts == 1);

    auto hash = h.orchestrator->get(hash_id);
    CHECK(hash.source == SourceKind::Hash);
    auto hash_params = h.engine->snapshot(hash.handle().value()).params;
    CHECK(*hash_params.magnet_uri == std::string("magnet:?xt=urn:btih:") +
                                         kHash);
    CHECK(h.fetcher->requests.empty());
}

TEST_CASE("custom save path and sequential mode are honoured")
{
    OrchestratorHarness h("orch-options");
    SubmitOptions options;
    options.save_path = h.root / "custom" / "dir";
    options.sequential = true;
    auto id = h.orchestrator->submit(kHash, options);
    auto record = h.orchestrator->get(id);
    CHECK(record.save_path == h.root / "custom" / "dir");
    CHECK(std::filesystem::is_directory(h.root / "custom" / "dir"));
    CHECK(h.engine->snapshot(record.handle().value()).params.sequential);
}

TEST_CASE("url submissions fetch and store the descriptor")
{
    OrchestratorHarness h("orch-url");
    h.fetcher->push(200, ft::tests::kSampleDescriptor);
    auto id = h.orchestrator->submit("https://example.org/a.torrent", {});
    auto record = h.orchestrator->get(id);
    CHECK(record.source == SourceKind::Url);
    REQUIRE(record.descriptor_path.has_value());
    CHECK(*record.descriptor_path == h.root / "torrents" / (id + ".torrent"));
    CHECK(ft::tests::read_file(*record.descriptor_path) ==
          ft::tests::kSampleDescriptor);
    CHECK(h.engine->snapshot(record.handle().value()).params.descriptor ==
          ft::tests::sample_descriptor());
}

TEST_CASE("failed submissions leave no job behind")
{
    OrchestratorHarness h("orch-failures");
    CHECK(error_of([&] { h.orchestrator->submit("not a locator", {}); }) ==
          ErrorCode::InvalidInput);

    h.fetcher->push(404, "");
    CHECK(error_of([&]
                   { h.orchestrator->submit("https://a.example/x", {}); }) ==
          ErrorCode::RemoteNotFound);

    std::string html = "<html><body>nope</body></html>";
    CHECK(error_of(
              [&]
              {
                  h.orchestrator->submit_descriptor({html.begin(), html.end()},
                                                    {});
              }) == ErrorCode::NotADescriptorFile);

    h.engine->reject_submit = true;
    CHECK(error_of(
              [&]
              {
                  h.orchestrator->submit_descriptor(
                      ft::tests::sample_descriptor(), {});
              }) == ErrorCode::EngineFailure);
    CHECK(std::filesystem::is_empty(h.root / "torrents"));
    CHECK(h.orchestrator->list().empty());
}

TEST_CASE("boost failure does not fail the submission")
{
    OrchestratorHarness h("orch-boost");
    h.engine->fail_boost = true;
    auto id = h.orchestrator->submit(kHash, {});
    CHECK(h.orchestrator->get(id).handle().has_value());
}

TEST_CASE("pause and resume apply only to active jobs")
{
    OrchestratorHarness h("orch-pause");
    auto id = h.orchestrator->submit(kHash, {});
    auto handle = h.orchestrator->get(id).handle().value();
    h.orchestrator->pause(id);
    CHECK(h.engine->snapshot(handle).paused);
    h.orchestrator->resume(id);
    CHECK_FALSE(h.engine->snapshot(handle).paused);

    CHECK(error_of([&] { h.orchestrator->pause("missing"); }) ==
          ErrorCode::NotFound);

    h.finish(id, {{"file.bin", 1}});
    REQUIRE(h.orchestrator->get(id).is_completed());
    CHECK(error_of([&] { h.orchestrator->pause(id); }) == ErrorCode::NotFound);
    CHECK(error_of([&] { h.orchestrator->resume(id); }) ==
          ErrorCode::NotFound);
}

TEST_CASE("remove works for active and completed jobs")
{
    OrchestratorHarness h("orch-remove");
    auto active = h.orchestrator->submit(kHash, {});
    auto done = h.orchestrator->submit("magnet:?xt=urn:btih:done", {});
    h.finish(done, {{"done.bin", 1}});

    h.orchestrator->remove(active, false);
    h.orchestrator->remove(done, false);
    CHECK(h.orchestrator->list().empty());
    CHECK(error_of([&] { h.orchestrator->remove(active, false); }) ==
          ErrorCode::NotFound);
}

TEST_CASE("completed multi-file jobs download as one archive")
{
    OrchestratorHarness h("orch-archive");
    auto id = h.orchestrator->submit(kHash, {});
    auto downloads = h.root / "downloads";
    ft::tests::write_file(downloads / "show" / "a.txt", "first");
    ft::tests::write_file(downloads / "show" / "b.txt", "second");
    ft::tests::write_file(downloads / "show" / "extras" / "c.txt", "third");
    h.finish(id, {{"show/a.txt", 5},
                  {"show/b.txt", 6},
                  {"show/extras/c.txt", 5}});
    REQUIRE(h.orchestrator->get(id).is_completed());

    auto served = h.orchestrator->resolve_download(id, std::nullopt);
    CHECK(served.content_type == "application/zip");
    CHECK(served.download_name == "finished.zip");
    auto entries = ft::tests::read_zip(served.path);
    REQUIRE(entries.size() == 3);
    CHECK(entries["show/a.txt"] == "first");
    CHECK(entries["show/b.txt"] == "second");
    CHECK(entries["show/extras/c.txt"] == "third");

    auto const written = std::filesystem::last_write_time(served.path);
    auto again = h.orchestrator->resolve_download(id, std::nullopt);
    CHECK(again.path == served.path);
    CHECK(std::filesystem::last_write_time(again.path) == written);
}

TEST_CASE("removal waits for an in-flight completion pass")
{
    OrchestratorHarness h("orch-remove-race");
    auto id = h.orchestrator->submit(kHash, {});
    auto downloads = h.root / "downloads";
    ft::tests::write_file(downloads / "show" / "a.txt", "aaaa");
    ft::tests::write_file(downloads / "show" / "b.txt", "bbbb");

    std::atomic_bool removed{false};
    std::thread remover;
    h.engine->on_manifest = [&](EngineHandle)
    {
        remover = std::thread(
            [&]
            {
                h.orchestrator->remove(id, false);
                removed = true;
            });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK_FALSE(removed.load());
    };
    h.finish(id, {{"show/a.txt", 4}, {"show/b.txt", 4}});
    h.engine->on_manifest = nullptr;
    remover.join();

    CHECK(removed.load());
    CHECK(h.orchestrator->list().empty());
    CHECK_FALSE(std::filesystem::exists(h.root / "temp" / (id + ".zip")));
}

TEST_CASE("health reports active jobs and storage")
{
    OrchestratorHarness h("orch-health");
    h.orchestrator->submit(kHash, {});
    auto report = h.orchestrator->health();
    CHECK(report.active_jobs == 1);
    CHECK(report.dht_enabled);
    REQUIRE(report.storage.has_value());
    CHECK(report.storage->total > 0);
}

TEST_CASE("run loop publishes on submission and stops on request")
{
    OrchestratorHarness h("orch-run");
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t last_size = 0;
    int updates = 0;
    h.orchestrator->set_update_listener(
        [&](std::vector<JobRecord> const &jobs)
        {
            std::lock_guard<std::mutex> lock(mutex);
            last_size = jobs.size();
            ++updates;
            cv.notify_all();
        });

    std::thread loop([&] { h.orchestrator->run(); });
    h.orchestrator->submit(kHash, {});
    {
        std::unique_lock<std::mutex> lock(mutex);
        CHECK(cv.wait_for(lock, std::chrono::seconds(5),
                          [&] { return last_size == 1; }));
    }
    h.orchestrator->stop();
    loop.join();
    CHECK_FALSE(h.orchestrator->is_running());
    CHECK(updates >= 1);
}
