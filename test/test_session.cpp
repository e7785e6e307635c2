#include <doctest/doctest.h>

#include <vmxfer/context.hpp>
#include <vmxfer/session.hpp>

#include "helpers.hpp"

using namespace vmxfer;
using namespace std::chrono_literals;

namespace
{
    struct Fixture
    {
        Context ctx;
        test::TempDir dir;
        std::shared_ptr<test::MockFetcher> fetcher = std::make_shared<test::MockFetcher>();
        ExportDescriptor descriptor;
        std::vector<TransferTask> tasks;
        std::vector<std::string> bodies;

        Fixture()
        {
            ctx.parallelism = 2;
            ctx.progress_interval = 20ms;
            ctx.retry.initial_delay = 1ms;
            ctx.retry.max_delay = 5ms;
            ctx.retry.jitter = false;

            descriptor.subject_name = "web-01";
            descriptor.provider = "mock";
            descriptor.format = "ova";
            descriptor.output_dir = dir.path();
            descriptor.metadata["owner"] = "ops";

            for (unsigned i = 0; i < 3; ++i)
            {
                const std::string name = "disk-" + std::to_string(i) + ".vmdk";
                bodies.push_back(test::make_body(40000 + 10000 * i, i + 7));
                TransferTask task{ "mock://host/" + name, dir / name, bodies.back().size(), name };
                test::MockFetcher::Resource resource;
                resource.body = bodies.back();
                fetcher->add(task.url, resource);
                tasks.push_back(task);
            }
        }

        fs::path checkpoint_file() const
        {
            return CheckpointStore::default_path(dir.path(), descriptor.subject_name);
        }

        std::size_t total() const
        {
            std::size_t n = 0;
            for (const auto& b : bodies)
                n += b.size();
            return n;
        }
    };
}

TEST_SUITE("session")
{
    TEST_CASE("fresh_export_removes_checkpoint")
    {
        Fixture f;
        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->success());
        CHECK_EQ(report->succeeded, 3);
        CHECK_EQ(report->results.size(), 3);
        CHECK(report->checkpoint_deleted);
        REQUIRE(report->checkpoint_path);
        CHECK_EQ(report->checkpoint_path.value(), f.checkpoint_file());
        CHECK_FALSE(fs::exists(f.checkpoint_file()));
        for (std::size_t i = 0; i < f.tasks.size(); ++i)
            CHECK_EQ(test::read_file(f.tasks[i].destination), f.bodies[i]);
        CHECK_EQ(report->progress.downloaded, f.total());
    }

    TEST_CASE("resuming_a_finished_export_transfers_nothing")
    {
        Fixture f;
        Checkpoint cp(f.descriptor.subject_name, "mock", "ova", f.dir.path());
        for (std::size_t i = 0; i < f.tasks.size(); ++i)
        {
            test::write_file(f.tasks[i].destination, f.bodies[i]);
            cp.add_file(f.tasks[i].destination.string(), f.tasks[i].url, f.bodies[i].size());
            cp.update_file_progress(f.tasks[i].destination.string(), f.bodies[i].size(), FileStatus::kCOMPLETED);
        }
        REQUIRE(CheckpointStore(f.checkpoint_file()).save(cp));

        f.ctx.resume_from_checkpoint = true;
        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->success());
        CHECK_EQ(f.fetcher->requests(), 0);
        CHECK_EQ(report->skipped.size(), 3);
        CHECK(report->results.empty());
        CHECK_EQ(report->skipped_bytes, f.total());
        CHECK_EQ(report->progress.ratio(), doctest::Approx(1.0));
        CHECK(report->checkpoint_deleted);
    }

    TEST_CASE("interrupted_file_resumes_at_recorded_offset")
    {
        Fixture f;
        Checkpoint cp(f.descriptor.subject_name, "mock", "ova", f.dir.path());
        const auto& task = f.tasks[1];
        test::write_file(task.destination, f.bodies[1].substr(0, 20000));
        cp.add_file(task.destination.string(), task.url, task.expected_size);
        cp.update_file_progress(task.destination.string(), 20000, FileStatus::kDOWNLOADING);
        REQUIRE(CheckpointStore(f.checkpoint_file()).save(cp));

        f.ctx.resume_from_checkpoint = true;
        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->success());
        CHECK_EQ(f.fetcher->offsets(task.url), std::vector<std::size_t>{ 20000 });
        CHECK_EQ(f.fetcher->offsets(f.tasks[0].url), std::vector<std::size_t>{ 0 });
        CHECK_EQ(test::read_file(task.destination), f.bodies[1]);
    }

    TEST_CASE("failure_keeps_checkpoint_for_next_run")
    {
        Fixture f;
        test::MockFetcher::Resource broken;
        broken.body = f.bodies[2];
        broken.status = 403;
        f.fetcher->add(f.tasks[2].url, broken);

        {
            TransferSession session(f.ctx, f.fetcher);
            auto report = session.run(f.descriptor, f.tasks);
            REQUIRE(report);
            CHECK_FALSE(report->success());
            CHECK_EQ(report->succeeded, 2);
            CHECK_EQ(report->failed, 1);
            CHECK_FALSE(report->checkpoint_deleted);
        }

        auto saved = CheckpointStore(f.checkpoint_file()).load();
        REQUIRE(saved);
        CHECK_EQ(saved->metadata.at("owner"), "ops");
        CHECK_EQ(saved->file(f.tasks[0].destination.string())->status, FileStatus::kCOMPLETED);
        CHECK_EQ(saved->file(f.tasks[2].destination.string())->status, FileStatus::kFAILED);

        test::MockFetcher::Resource fixed;
        fixed.body = f.bodies[2];
        f.fetcher->add(f.tasks[2].url, fixed);
        const std::size_t before = f.fetcher->requests();

        f.ctx.resume_from_checkpoint = true;
        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->success());
        CHECK_EQ(report->skipped.size(), 2);
        CHECK_EQ(f.fetcher->requests() - before, 1);
        CHECK_EQ(test::read_file(f.tasks[2].destination), f.bodies[2]);
        CHECK_FALSE(fs::exists(f.checkpoint_file()));
    }

    TEST_CASE("corrupt_checkpoint_starts_fresh")
    {
        Fixture f;
        test::write_file(f.checkpoint_file(), "this is not json");
        f.ctx.resume_from_checkpoint = true;

        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->success());
        CHECK_EQ(f.fetcher->requests(), 3);
    }

    TEST_CASE("checkpoints_disabled")
    {
        Fixture f;
        f.ctx.enable_checkpoints = false;
        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->success());
        CHECK_FALSE(report->checkpoint_path.has_value());
        CHECK_FALSE(fs::exists(f.checkpoint_file()));
    }

    TEST_CASE("checkpoint_path_override")
    {
        Fixture f;
        f.ctx.checkpoint_path = f.dir / "state" / "export.checkpoint";
        TransferSession session(f.ctx, f.fetcher);
        CHECK_EQ(session.checkpoint_path(f.descriptor), f.ctx.checkpoint_path);
    }

    TEST_CASE("cancelled_before_start")
    {
        Fixture f;
        CancellationToken token;
        token.cancel();
        TransferSession session(f.ctx, f.fetcher, token);
        auto report = session.run(f.descriptor, f.tasks);
        REQUIRE(report);
        CHECK(report->cancelled);
        CHECK_FALSE(report->success());
        CHECK_EQ(report->not_started, 3);
        CHECK_EQ(f.fetcher->requests(), 0);
        CHECK(fs::exists(f.checkpoint_file()));
    }

    TEST_CASE("cancelled_mid_transfer_is_resumable")
    {
        Fixture f;
        f.ctx.parallelism = 1;
        test::MockFetcher::Resource slow;
        slow.body = test::make_body(2 << 20, 99);
        slow.chunk_delay = 10ms;
        TransferTask big{ "mock://host/big.vmdk", f.dir / "big.vmdk", slow.body.size(), "big.vmdk" };
        f.fetcher->add(big.url, slow);

        CancellationToken token;
        std::thread canceller(
            [token]() mutable
            {
                std::this_thread::sleep_for(200ms);
                token.cancel();
            });
        {
            TransferSession session(f.ctx, f.fetcher, token);
            auto report = session.run(f.descriptor, { big });
            canceller.join();
            REQUIRE(report);
            CHECK(report->cancelled);
            CHECK_EQ(report->interrupted, 1);
        }

        auto saved = CheckpointStore(f.checkpoint_file()).load();
        REQUIRE(saved);
        const auto* entry = saved->file(big.destination.string());
        REQUIRE(entry);
        CHECK_EQ(entry->status, FileStatus::kDOWNLOADING);
        CHECK(entry->downloaded_size > 0);
        CHECK(entry->downloaded_size < big.expected_size);
        const std::size_t offset = entry->downloaded_size;

        f.ctx.resume_from_checkpoint = true;
        TransferSession session(f.ctx, f.fetcher);
        auto report = session.run(f.descriptor, { big });
        REQUIRE(report);
        CHECK(report->success());
        CHECK_EQ(f.fetcher->offsets(big.url).back(), offset);
        CHECK_EQ(test::read_file(big.destination), slow.body);
    }
}
