#include <chrono>
#include <ctime>

#include <sys/stat.h>

#include <doctest/doctest.h>

#include <dumploader/context.hpp>
#include <dumploader/planner.hpp>
#include <dumploader/state_store.hpp>
#include <dumploader/transfer_engine.hpp>
#include <dumploader/utils.hpp>

#include "helpers.hpp"
#include "test_server.hpp"

using namespace dumploader;

namespace
{
    Checksum sha256_of(const std::string& content)
    {
        return Checksum{ ChecksumType::kSHA256, sha256(content) };
    }

    TransferTask task_for(const testing::TestServer& server,
                          const fs::path& out_dir,
                          const std::string& path,
                          const std::string& content,
                          bool with_checksum = true)
    {
        TransferTask task;
        task.path = path;
        task.location = path;
        task.source_url = server.url() + "/" + path;
        task.destination = out_dir / path;
        task.expected_size = content.size();
        if (with_checksum)
        {
            task.expected_checksum = sha256_of(content);
        }
        return task;
    }

    std::string pattern(std::size_t size)
    {
        std::string s(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            s[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);
        }
        return s;
    }
}

TEST_SUITE("transfer_engine")
{
    TEST_CASE("downloads_files")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer server;
        server.set("/a.txt", "0123456789");
        server.set("/b.txt", "abcdefghijklmnopqrst");

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        std::vector<TransferTask> tasks{
            task_for(server, dir.path(), "b.txt", "abcdefghijklmnopqrst"),
            task_for(server, dir.path(), "a.txt", "0123456789"),
        };
        // A listed SHA1 is checked as such.
        tasks[0].expected_checksum
            = Checksum{ ChecksumType::kSHA1, "14A23AD70F2A5DD725575DE6C43E1CDD8B15E3E5" };

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run(tasks);
        REQUIRE_EQ(outcomes.size(), 2);
        CHECK_EQ(outcomes[0].path, "b.txt");
        std::uintmax_t transferred = 0;
        for (const auto& outcome : outcomes)
        {
            CHECK_EQ(outcome.status, TransferStatus::kSUCCESSFUL);
            CHECK_EQ(outcome.attempts, 1);
            CHECK_FALSE(outcome.error.has_value());
            transferred += outcome.bytes_transferred;
        }
        CHECK_EQ(transferred, 30);
        CHECK_EQ(outcomes[1].size, 10);

        CHECK_EQ(testing::read_file(dir.path() / "a.txt"), "0123456789");
        CHECK_EQ(testing::read_file(dir.path() / "b.txt"), "abcdefghijklmnopqrst");
        CHECK_FALSE(fs::exists(dir.path() / "a.txt.dlpart"));

        auto a = store.get("a.txt");
        REQUIRE(a.has_value());
        CHECK_EQ(a->status, FileStatus::kVERIFIED);
        CHECK_EQ(a->size.value(), 10);
        CHECK_EQ(a->checksum->checksum, sha256("0123456789"));
        CHECK_EQ(store.get("b.txt")->checksum->type, ChecksumType::kSHA1);
    }

    TEST_CASE("parallel_limit")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        ctx.max_parallel_downloads = 2;
        testing::TempDir dir;
        testing::TestServer server;

        std::vector<TransferTask> tasks;
        for (int i = 0; i < 6; ++i)
        {
            const std::string name = "dir" + std::to_string(i % 2) + "/f" + std::to_string(i);
            const std::string content = pattern(1000 + i);
            server.set("/" + name, content);
            tasks.push_back(task_for(server, dir.path(), name, content));
        }

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferEngine engine(ctx, store);
        auto outcomes = engine.run(tasks);
        REQUIRE_EQ(outcomes.size(), 6);
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            CHECK_EQ(outcomes[i].path, tasks[i].path);
            CHECK_EQ(outcomes[i].status, TransferStatus::kSUCCESSFUL);
        }
        CHECK_EQ(testing::read_file(dir.path() / "dir1/f5"), pattern(1005));
    }

    TEST_CASE("transient_errors_are_retried")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        ctx.retry_limit = 3;
        testing::TempDir dir;
        testing::TestServer server;

        testing::Resource flaky;
        flaky.body = "0123456789";
        flaky.scripted_statuses = { 503, 503 };
        server.set("/a.txt", flaky);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferEngine engine(ctx, store);
        std::vector<TransferTask> tasks{ task_for(server, dir.path(), "a.txt", "0123456789") };
        auto outcomes = engine.run(tasks);

        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(outcomes[0].attempts, 3);
        CHECK_EQ(server.requests("/a.txt").size(), 3);
        CHECK_EQ(store.get("a.txt")->status, FileStatus::kVERIFIED);
        CHECK_EQ(store.get("a.txt")->attempt_count, 3);
        CHECK_EQ(testing::read_file(dir.path() / "a.txt"), "0123456789");
    }

    TEST_CASE("retries_exhausted")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        ctx.retry_limit = 2;
        testing::TempDir dir;
        testing::TestServer server;

        testing::Resource down;
        down.body = "0123456789";
        down.scripted_statuses = { 500, 502, 200 };
        server.set("/a.txt", down);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task_for(server, dir.path(), "a.txt", "0123456789") });

        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kFAILED);
        CHECK_EQ(outcomes[0].attempts, 2);
        REQUIRE(outcomes[0].error.has_value());
        CHECK_EQ(outcomes[0].error->code, ErrorCode::DL_PERMANENT_TRANSFER);
        CHECK(contains(outcomes[0].error->reason, "giving up after 2 attempts"));
        CHECK_EQ(store.get("a.txt")->status, FileStatus::kFAILED);
        CHECK_FALSE(fs::exists(dir.path() / "a.txt"));
    }

    TEST_CASE("not_found_is_permanent")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer server;
        server.set("/a.txt", "0123456789");

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferEngine engine(ctx, store);
        std::vector<TransferTask> tasks{
            task_for(server, dir.path(), "missing.txt", "0123456789"),
            task_for(server, dir.path(), "a.txt", "0123456789"),
        };
        auto outcomes = engine.run(tasks);

        REQUIRE_EQ(outcomes.size(), 2);
        CHECK_EQ(outcomes[0].status, TransferStatus::kFAILED);
        CHECK_EQ(outcomes[0].attempts, 1);
        CHECK_EQ(outcomes[0].error->code, ErrorCode::DL_PERMANENT_TRANSFER);
        CHECK(contains(outcomes[0].error->reason, "404"));
        // One failure does not stop the others.
        CHECK_EQ(outcomes[1].status, TransferStatus::kSUCCESSFUL);

        auto missing = store.get("missing.txt");
        REQUIRE(missing.has_value());
        CHECK_EQ(missing->status, FileStatus::kFAILED);
        CHECK(contains(missing->last_error, "404"));
    }

    TEST_CASE("resume_partial_file")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer server;
        const std::string content = pattern(5000);
        server.set("/big.bin", content);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        REQUIRE(store.begin_transfer("big.bin"));
        REQUIRE(store.record_progress("big.bin", 2000));
        // More bytes on disk than recorded: only the recorded ones are trusted.
        testing::write_file(dir.path() / "big.bin.dlpart", content.substr(0, 2000) + "garbage");

        TransferTask task = task_for(server, dir.path(), "big.bin", content);
        task.resume_offset = 2000;

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(outcomes[0].bytes_transferred, 3000);

        auto requests = server.requests("/big.bin");
        REQUIRE_EQ(requests.size(), 1);
        CHECK_EQ(requests[0].range, "bytes=2000-");
        CHECK_EQ(requests[0].status, 206);
        CHECK_EQ(testing::read_file(dir.path() / "big.bin"), content);
        CHECK_EQ(store.get("big.bin")->status, FileStatus::kVERIFIED);
    }

    TEST_CASE("no_resume_without_checksum")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer server;
        const std::string content = pattern(3000);
        server.set("/plain.bin", content);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        testing::write_file(dir.path() / "plain.bin.dlpart", content.substr(0, 1000));

        TransferTask task = task_for(server, dir.path(), "plain.bin", content, false);
        task.resume_offset = 1000;

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        auto requests = server.requests("/plain.bin");
        REQUIRE_EQ(requests.size(), 1);
        CHECK(requests[0].range.empty());
        CHECK_EQ(testing::read_file(dir.path() / "plain.bin"), content);
        // The checksum is computed locally when none is listed.
        CHECK_EQ(store.get("plain.bin")->checksum->type, ChecksumType::kSHA256);
        CHECK_EQ(store.get("plain.bin")->checksum->checksum, sha256(content));
    }

    TEST_CASE("server_ignores_ranges")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        // Falling back to a full download must not need a second attempt.
        ctx.retry_limit = 1;
        testing::TempDir dir;
        testing::TestServer server;
        const std::string content = pattern(4000);
        testing::Resource no_ranges;
        no_ranges.body = content;
        no_ranges.honour_ranges = false;
        server.set("/r.bin", no_ranges);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        REQUIRE(store.begin_transfer("r.bin"));
        REQUIRE(store.record_progress("r.bin", 1500));
        testing::write_file(dir.path() / "r.bin.dlpart", content.substr(0, 1500));

        TransferTask task = task_for(server, dir.path(), "r.bin", content);
        task.resume_offset = 1500;

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(outcomes[0].attempts, 1);
        CHECK_EQ(testing::read_file(dir.path() / "r.bin"), content);
        CHECK_FALSE(fs::exists(dir.path() / "r.bin.dlpart"));
        CHECK_EQ(store.get("r.bin")->status, FileStatus::kVERIFIED);

        // One ranged request, answered with the whole file.
        auto requests = server.requests("/r.bin");
        REQUIRE_EQ(requests.size(), 1);
        CHECK_EQ(requests[0].range, "bytes=1500-");
        CHECK_EQ(requests[0].status, 200);
    }

    TEST_CASE("range_not_satisfiable_restarts")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        // The restart from 0 is not a failed attempt.
        ctx.retry_limit = 1;
        testing::TempDir dir;
        testing::TestServer server;
        const std::string content = "0123456789";
        server.set("/a.txt", content);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        REQUIRE(store.begin_transfer("a.txt"));
        REQUIRE(store.record_progress("a.txt", 10));
        testing::write_file(dir.path() / "a.txt.dlpart", "9876543210");

        TransferTask task = task_for(server, dir.path(), "a.txt", content);
        task.resume_offset = 10;

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(outcomes[0].attempts, 2);

        auto requests = server.requests("/a.txt");
        REQUIRE_EQ(requests.size(), 2);
        CHECK_EQ(requests[0].status, 416);
        CHECK(requests[1].range.empty());
        CHECK_EQ(testing::read_file(dir.path() / "a.txt"), content);
    }

    TEST_CASE("unknown_length")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer server;
        const std::string content = pattern(3000);
        testing::Resource unsized;
        unsized.body = content;
        unsized.send_content_length = false;
        server.set("/with_sum.bin", unsized);
        server.set("/bare.bin", unsized);

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        // Neither a listed size nor a Content-Length: the checksum alone decides.
        TransferTask with_sum = task_for(server, dir.path(), "with_sum.bin", content);
        with_sum.expected_size.reset();

        // Nothing at all to compare the download with.
        TransferTask bare = task_for(server, dir.path(), "bare.bin", content, false);
        bare.expected_size.reset();

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ with_sum, bare });
        REQUIRE_EQ(outcomes.size(), 2);

        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(testing::read_file(dir.path() / "with_sum.bin"), content);
        CHECK_EQ(store.get("with_sum.bin")->status, FileStatus::kVERIFIED);

        CHECK_EQ(outcomes[1].status, TransferStatus::kFAILED);
        CHECK_EQ(outcomes[1].attempts, 1);
        REQUIRE(outcomes[1].error.has_value());
        CHECK_EQ(outcomes[1].error->code, ErrorCode::DL_PERMANENT_TRANSFER);
        CHECK_FALSE(fs::exists(dir.path() / "bare.bin"));
        CHECK_EQ(store.get("bare.bin")->status, FileStatus::kFAILED);
    }

    TEST_CASE("listing_modification_time")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer server;
        server.set("/a.txt", "0123456789");

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());

        // The test server sends no Last-Modified, the listed time is used instead.
        const std::time_t listed = 1704067200;
        TransferTask task = task_for(server, dir.path(), "a.txt", "0123456789");
        task.last_modified = std::chrono::system_clock::from_time_t(listed);

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        REQUIRE_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);

        struct stat st;
        REQUIRE_EQ(::stat((dir.path() / "a.txt").c_str(), &st), 0);
        CHECK_EQ(st.st_mtime, listed);

        auto state = store.get("a.txt");
        REQUIRE(state.has_value());
        REQUIRE(state->remote_modified.has_value());
        CHECK_EQ(std::chrono::system_clock::to_time_t(state->remote_modified.value()), listed);
    }

    TEST_CASE("checksum_mismatch")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        ctx.retry_limit = 3;
        testing::TempDir dir;
        testing::TestServer server;
        server.set("/a.txt", "0123456789");

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferTask task = task_for(server, dir.path(), "a.txt", "0123456789");
        task.expected_checksum = sha256_of("something else");

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kFAILED);
        CHECK_EQ(outcomes[0].attempts, 3);
        CHECK_EQ(outcomes[0].error->code, ErrorCode::DL_BAD_CHECKSUM);
        CHECK_EQ(server.requests("/a.txt").size(), 3);

        auto state = store.get("a.txt");
        CHECK_EQ(state->status, FileStatus::kFAILED);
        CHECK_EQ(state->bytes_downloaded, 0);
        CHECK_FALSE(fs::exists(dir.path() / "a.txt"));
        CHECK_FALSE(fs::exists(dir.path() / "a.txt.dlpart"));
    }

    TEST_CASE("size_mismatch")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        ctx.retry_limit = 1;
        testing::TempDir dir;
        testing::TestServer server;
        server.set("/a.txt", "0123456789");

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferTask task = task_for(server, dir.path(), "a.txt", "0123456789", false);
        task.expected_size = 12;

        TransferEngine engine(ctx, store);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kFAILED);
        CHECK_EQ(outcomes[0].error->code, ErrorCode::DL_BAD_CHECKSUM);
        CHECK_FALSE(fs::exists(dir.path() / "a.txt"));
    }

    TEST_CASE("interrupt_and_resume")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        ctx.max_parallel_downloads = 1;
        testing::TempDir dir;
        testing::TestServer server;
        reset_interrupt();

        const std::string content = pattern(512 * 1024);
        testing::Resource slow;
        slow.body = content;
        slow.chunk_size = 16 * 1024;
        slow.chunk_delay = std::chrono::milliseconds(20);
        slow.on_sent = [](std::size_t sent)
        {
            if (sent >= 128 * 1024)
            {
                request_interrupt();
            }
        };
        server.set("/big.bin", slow);
        server.set("/later.txt", "0123456789");

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        std::vector<TransferTask> tasks{
            task_for(server, dir.path(), "big.bin", content),
            task_for(server, dir.path(), "later.txt", "0123456789"),
        };

        std::uintmax_t partial = 0;
        {
            TransferEngine engine(ctx, store);
            auto outcomes = engine.run(tasks);
            REQUIRE_EQ(outcomes.size(), 2);
            CHECK_EQ(outcomes[0].status, TransferStatus::kINTERRUPTED);
            CHECK_EQ(outcomes[1].status, TransferStatus::kNOT_STARTED);
            CHECK(server.requests("/later.txt").empty());

            auto state = store.get("big.bin");
            REQUIRE(state.has_value());
            CHECK_EQ(state->status, FileStatus::kIN_PROGRESS);
            partial = state->bytes_downloaded;
            CHECK(partial > 0);
            CHECK(partial < content.size());
            CHECK_FALSE(store.get("later.txt").has_value());
        }
        CHECK(is_sig_interrupted());
        reset_interrupt();

        testing::Resource fast;
        fast.body = content;
        server.set("/big.bin", fast);

        tasks[0].resume_offset = partial;
        TransferEngine engine(ctx, store);
        auto outcomes = engine.run(tasks);
        REQUIRE_EQ(outcomes.size(), 2);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(outcomes[0].bytes_transferred, content.size() - partial);
        CHECK_EQ(outcomes[1].status, TransferStatus::kSUCCESSFUL);

        auto requests = server.requests("/big.bin");
        REQUIRE_EQ(requests.size(), 2);
        CHECK_EQ(requests[1].range, "bytes=" + std::to_string(partial) + "-");
        CHECK(testing::read_file(dir.path() / "big.bin") == content);
        CHECK_EQ(store.get("big.bin")->status, FileStatus::kVERIFIED);
    }

    TEST_CASE("mirror_failover")
    {
        Context ctx;
        testing::set_test_timeouts(ctx);
        testing::TempDir dir;
        testing::TestServer broken;
        testing::TestServer healthy;

        testing::Resource unavailable;
        unavailable.body = "0123456789";
        unavailable.scripted_statuses = { 503, 503, 503, 503 };
        broken.set("/dumps/a.txt", unavailable);
        healthy.set("/dumps/a.txt", "0123456789");

        mirror_list mirrors{ std::make_shared<Mirror>(ctx, broken.url() + "/dumps"),
                             std::make_shared<Mirror>(ctx, healthy.url() + "/dumps") };

        StateStore store(dir.path() / "state.json");
        REQUIRE(store.load());
        TransferTask task = task_for(broken, dir.path(), "a.txt", "0123456789");

        TransferEngine engine(ctx, store, mirrors);
        auto outcomes = engine.run({ task });
        REQUIRE_EQ(outcomes.size(), 1);
        CHECK_EQ(outcomes[0].status, TransferStatus::kSUCCESSFUL);
        CHECK_EQ(outcomes[0].attempts, 2);
        CHECK(starts_with(outcomes[0].url, healthy.url()));
        CHECK_EQ(broken.requests("/dumps/a.txt").size(), 1);
        CHECK_EQ(healthy.requests("/dumps/a.txt").size(), 1);

        CHECK_EQ(engine.mirrors().size(), 2);
        CHECK_EQ(mirrors[1]->stats().succeeded, 1);
        CHECK_EQ(mirrors[0]->stats().failed, 1);
    }
}
