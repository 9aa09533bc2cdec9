#include <doctest/doctest.h>

#include <chrono>
#include <thread>

#include <nlohmann/json.hpp>

#include <dumploader/state_store.hpp>

#include "helpers.hpp"

using namespace dumploader;

namespace
{
    const Checksum c1{ ChecksumType::kSHA1, "87acec17cd9dcd20a716cc2cf67417b71c8a7016" };
}

TEST_SUITE("state_store")
{
    TEST_CASE("default_path")
    {
        CHECK_EQ(StateStore::default_path("/data").generic_string(), "/data/.dumploader/state.json");
    }

    TEST_CASE("missing_file_is_empty")
    {
        testing::TempDir dir;
        StateStore store(StateStore::default_path(dir.path()));
        REQUIRE(store.load());
        CHECK(store.snapshot().empty());
        CHECK_FALSE(store.get("a.txt").has_value());
        // The state directory is created up front.
        CHECK(fs::is_directory(dir.path() / ".dumploader"));
    }

    TEST_CASE("transitions")
    {
        testing::TempDir dir;
        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        REQUIRE(store.begin_transfer("a.txt"));
        auto s = store.get("a.txt");
        REQUIRE(s.has_value());
        CHECK_EQ(s->status, FileStatus::kIN_PROGRESS);
        CHECK_EQ(s->attempt_count, 1);
        CHECK(s->last_attempt.has_value());

        REQUIRE(store.record_progress("a.txt", 4));
        CHECK_EQ(store.get("a.txt")->bytes_downloaded, 4);

        // InProgress -> InProgress (resume after a crash) counts another attempt.
        REQUIRE(store.begin_transfer("a.txt"));
        CHECK_EQ(store.get("a.txt")->attempt_count, 2);
        CHECK_EQ(store.get("a.txt")->bytes_downloaded, 4);

        REQUIRE(store.mark_verified("a.txt", c1, 10));
        s = store.get("a.txt");
        CHECK_EQ(s->status, FileStatus::kVERIFIED);
        CHECK_EQ(s->checksum.value(), c1);
        CHECK_EQ(s->size.value(), 10);
        CHECK_EQ(s->bytes_downloaded, 10);

        // Verified is terminal for transfers.
        auto again = store.begin_transfer("a.txt");
        REQUIRE_FALSE(again);
        CHECK_EQ(again.error().code, ErrorCode::DL_STATE_TRANSITION);
        CHECK_FALSE(store.record_progress("a.txt", 1));
        CHECK_FALSE(store.mark_failed("a.txt", "x"));
        CHECK_EQ(store.get("a.txt")->status, FileStatus::kVERIFIED);

        REQUIRE(store.reset_to_pending("a.txt"));
        s = store.get("a.txt");
        CHECK_EQ(s->status, FileStatus::kPENDING);
        CHECK_EQ(s->bytes_downloaded, 0);
        CHECK_FALSE(s->size.has_value());
    }

    TEST_CASE("failed_then_retry")
    {
        testing::TempDir dir;
        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        REQUIRE(store.begin_transfer("b.txt"));
        REQUIRE(store.record_progress("b.txt", 7));
        REQUIRE(store.mark_failed("b.txt", "permanent_transfer_error: Status code: 404"));
        auto s = store.get("b.txt");
        CHECK_EQ(s->status, FileStatus::kFAILED);
        CHECK_EQ(s->bytes_downloaded, 7);
        CHECK_EQ(s->last_error, "permanent_transfer_error: Status code: 404");

        CHECK_FALSE(store.mark_verified("b.txt", c1, 10));
        CHECK_FALSE(store.reset_to_pending("b.txt"));

        REQUIRE(store.begin_transfer("b.txt"));
        CHECK_EQ(store.get("b.txt")->status, FileStatus::kIN_PROGRESS);
    }

    TEST_CASE("illegal_transitions_from_pending")
    {
        testing::TempDir dir;
        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        auto progress = store.record_progress("new.txt", 3);
        REQUIRE_FALSE(progress);
        CHECK_EQ(progress.error().code, ErrorCode::DL_STATE_TRANSITION);
        CHECK_FALSE(store.mark_verified("new.txt", c1, 10));
        // A rejected transition leaves no trace.
        CHECK_FALSE(store.get("new.txt").has_value());
    }

    TEST_CASE("durable_across_instances")
    {
        testing::TempDir dir;
        const fs::path path = dir.path() / "state.json";
        {
            StateStore store(path);
            REQUIRE(store.load());
            REQUIRE(store.begin_transfer("a.txt"));
            REQUIRE(store.mark_verified(
                "a.txt", c1, 10, std::chrono::system_clock::from_time_t(1704067200)));
            REQUIRE(store.begin_transfer("dir/b.txt"));
            REQUIRE(store.record_progress("dir/b.txt", 12));
        }
        CHECK_FALSE(fs::exists(dir.path() / "state.json.tmp"));

        StateStore reloaded(path);
        REQUIRE(reloaded.load());
        auto snapshot = reloaded.snapshot();
        REQUIRE_EQ(snapshot.size(), 2);
        CHECK_EQ(snapshot.at("a.txt").status, FileStatus::kVERIFIED);
        CHECK_EQ(snapshot.at("a.txt").checksum.value(), c1);
        REQUIRE(snapshot.at("a.txt").remote_modified.has_value());
        CHECK_EQ(std::chrono::system_clock::to_time_t(snapshot.at("a.txt").remote_modified.value()),
                 1704067200);
        CHECK_FALSE(snapshot.at("dir/b.txt").remote_modified.has_value());
        CHECK_EQ(snapshot.at("dir/b.txt").status, FileStatus::kIN_PROGRESS);
        CHECK_EQ(snapshot.at("dir/b.txt").bytes_downloaded, 12);
        CHECK_EQ(snapshot.at("dir/b.txt").path, "dir/b.txt");

        auto j = nlohmann::json::parse(testing::read_file(path));
        CHECK_EQ(j["version"].get<int>(), StateStore::format_version);
        CHECK_EQ(j["files"]["a.txt"]["status"].get<std::string>(), "verified");
    }

    TEST_CASE("unknown_fields_and_corrupt_entries")
    {
        testing::TempDir dir;
        const fs::path path = dir.path() / "state.json";
        testing::write_file(path, R"({
            "version": 1,
            "future_field": {"x": 1},
            "files": {
                "ok.txt": {"status": "in_progress", "bytes_downloaded": 5, "mirror": "m1"},
                "bad_status.txt": {"status": "exploded"},
                "bad_verified.txt": {"status": "verified"},
                "not_an_object.txt": 42
            }
        })");

        StateStore store(path);
        REQUIRE(store.load());
        CHECK_EQ(store.corrupted_entries(), 3);

        auto snapshot = store.snapshot();
        REQUIRE_EQ(snapshot.size(), 4);
        CHECK_EQ(snapshot.at("ok.txt").status, FileStatus::kIN_PROGRESS);
        CHECK_EQ(snapshot.at("ok.txt").bytes_downloaded, 5);
        CHECK_EQ(snapshot.at("bad_status.txt").status, FileStatus::kPENDING);
        CHECK_EQ(snapshot.at("bad_verified.txt").status, FileStatus::kPENDING);
        CHECK_EQ(snapshot.at("not_an_object.txt").status, FileStatus::kPENDING);
    }

    TEST_CASE("unreadable_file_is_moved_aside")
    {
        testing::TempDir dir;
        const fs::path path = dir.path() / "state.json";
        testing::write_file(path, "{ truncated");

        StateStore store(path);
        REQUIRE(store.load());
        CHECK(store.snapshot().empty());
        CHECK_FALSE(fs::exists(path));
        CHECK_EQ(testing::read_file(dir.path() / "state.json.corrupt"), "{ truncated");

        // The store keeps working.
        REQUIRE(store.begin_transfer("a.txt"));
        CHECK(fs::exists(path));
    }

    TEST_CASE("concurrent_mutations")
    {
        testing::TempDir dir;
        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        std::vector<std::thread> workers;
        for (int w = 0; w < 4; ++w)
        {
            workers.emplace_back(
                [&store, w]()
                {
                    const std::string path = "file" + std::to_string(w) + ".txt";
                    REQUIRE(store.begin_transfer(path));
                    for (std::uintmax_t i = 1; i <= 10; ++i)
                    {
                        REQUIRE(store.record_progress(path, i));
                    }
                    REQUIRE(store.mark_verified(path, c1, 10));
                });
        }
        for (auto& t : workers)
        {
            t.join();
        }

        StateStore reloaded(dir.path() / "state.json");
        REQUIRE(reloaded.load());
        auto snapshot = reloaded.snapshot();
        REQUIRE_EQ(snapshot.size(), 4);
        for (const auto& [path, state] : snapshot)
        {
            CHECK_EQ(state.status, FileStatus::kVERIFIED);
            CHECK_EQ(state.bytes_downloaded, 10);
        }
    }
}
