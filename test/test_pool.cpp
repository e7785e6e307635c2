#include <doctest/doctest.h>

#include <set>

#include <vmxfer/context.hpp>
#include <vmxfer/pool.hpp>

#include "helpers.hpp"

using namespace vmxfer;
using namespace std::chrono_literals;

namespace
{
    void fast_retries(Context& ctx)
    {
        ctx.retry.max_attempts = 3;
        ctx.retry.initial_delay = 1ms;
        ctx.retry.max_delay = 5ms;
        ctx.retry.jitter = false;
        ctx.progress_interval = 20ms;
    }

    TransferTask serve(test::MockFetcher& fetcher,
                       const test::TempDir& dir,
                       const std::string& name,
                       const std::string& body,
                       test::MockFetcher::Resource resource = {})
    {
        const std::string url = "mock://host/" + name;
        resource.body = body;
        fetcher.add(url, resource);
        return TransferTask{ url, dir / name, body.size(), name };
    }
}

TEST_SUITE("pool")
{
    TEST_CASE("every_task_yields_one_result")
    {
        for (std::size_t workers : { 1, 2, 4 })
        {
            CAPTURE(workers);
            Context ctx;
            fast_retries(ctx);
            ctx.parallelism = workers;
            test::TempDir dir;
            auto fetcher = std::make_shared<test::MockFetcher>();

            std::vector<TransferTask> tasks;
            std::size_t total = 0;
            for (unsigned i = 0; i < 10; ++i)
            {
                auto body = test::make_body(1000 + i * 20000, i);
                total += body.size();
                tasks.push_back(serve(*fetcher, dir, "disk-" + std::to_string(i) + ".vmdk", body));
            }

            TransferPool pool(ctx, fetcher);
            CHECK_EQ(pool.worker_count(), workers);
            auto results = pool.download_batch(tasks);
            REQUIRE(results);
            REQUIRE_EQ(results->size(), tasks.size());

            std::set<std::string> names;
            for (const auto& r : *results)
            {
                CHECK(r.success);
                CHECK_FALSE(r.error.has_value());
                CHECK_EQ(r.bytes_written, r.task.expected_size);
                names.insert(r.task.name);
            }
            CHECK_EQ(names.size(), tasks.size());

            for (unsigned i = 0; i < 10; ++i)
                CHECK_EQ(test::read_file(tasks[i].destination), test::make_body(1000 + i * 20000, i));

            auto p = pool.progress();
            CHECK_EQ(p.downloaded, total);
            CHECK_EQ(p.total, total);
            CHECK_EQ(p.ratio(), doctest::Approx(1.0));
            CHECK_EQ(fetcher->requests(), tasks.size());
            CHECK(pool.close());
        }
    }

    TEST_CASE("submit_errors")
    {
        Context ctx;
        ctx.parallelism = 1;
        ctx.queue_capacity = 1;
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        auto a = serve(*fetcher, dir, "a", "aaaa");
        auto b = serve(*fetcher, dir, "b", "bbbb");

        TransferPool pool(ctx, fetcher);
        CHECK(pool.submit(a));
        auto full = pool.submit(b);
        REQUIRE_FALSE(full);
        CHECK_EQ(full.error().code, ErrorCode::XF_QUEUE_FULL);

        pool.cancel();
        auto down = pool.submit(b);
        REQUIRE_FALSE(down);
        CHECK_EQ(down.error().code, ErrorCode::XF_POOL_SHUTTING_DOWN);
        CHECK(pool.token().cancelled());
    }

    TEST_CASE("lifecycle")
    {
        Context ctx;
        auto fetcher = std::make_shared<test::MockFetcher>();
        CancellationToken parent;
        {
            TransferPool pool(ctx, fetcher, parent);
            REQUIRE(pool.start());
            auto again = pool.start();
            REQUIRE_FALSE(again);
            CHECK_EQ(again.error().code, ErrorCode::XF_POOL_STARTED);

            CHECK(pool.close());
            auto closed = pool.close();
            REQUIRE_FALSE(closed);
            CHECK_EQ(closed.error().code, ErrorCode::XF_POOL_CLOSED);
            CHECK_FALSE(pool.submit(TransferTask{}));
        }
        // closing the pool leaves the caller's token alone
        CHECK_FALSE(parent.cancelled());
    }

    TEST_CASE("results_are_consumed_manually")
    {
        Context ctx;
        fast_retries(ctx);
        ctx.parallelism = 2;
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        auto a = serve(*fetcher, dir, "a", test::make_body(5000));
        auto b = serve(*fetcher, dir, "b", test::make_body(7000));

        TransferPool pool(ctx, fetcher);
        REQUIRE(pool.submit(a));
        REQUIRE(pool.submit(b));
        REQUIRE(pool.start());

        std::size_t succeeded = 0;
        for (int i = 0; i < 2; ++i)
        {
            auto r = pool.results().pop_for(10s);
            REQUIRE(r);
            succeeded += r->success ? 1 : 0;
        }
        CHECK_EQ(succeeded, 2);
        CHECK(pool.close());
        CHECK(pool.results().closed());
    }

    TEST_CASE("short_source_is_a_size_mismatch")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        test::MockFetcher::Resource resource;
        resource.truncate_at = 500;
        auto task = serve(*fetcher, dir, "short", test::make_body(1000), resource);

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        REQUIRE_EQ(results->size(), 1);
        const auto& r = results->front();
        CHECK_FALSE(r.success);
        REQUIRE(r.error);
        CHECK_EQ(r.error->code, ErrorCode::XF_SIZE_MISMATCH);
        CHECK_EQ(r.bytes_written, 500);
        CHECK_EQ(fetcher->requests(), 1);
    }

    TEST_CASE("long_source_is_a_size_mismatch")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        auto task = serve(*fetcher, dir, "long", test::make_body(100000));
        task.expected_size = 50000;

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        REQUIRE(results->front().error);
        CHECK_EQ(results->front().error->code, ErrorCode::XF_SIZE_MISMATCH);
        CHECK(fs::file_size(task.destination) <= 50000);
    }

    TEST_CASE("missing_resource_fails_without_retry")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        TransferTask task{ "mock://host/nowhere", dir / "nowhere", 10, "nowhere" };

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        REQUIRE(results->front().error);
        CHECK_EQ(results->front().error->code, ErrorCode::XF_BADSTATUS);
        CHECK_EQ(fetcher->requests(), 1);
    }

    TEST_CASE("server_errors_are_retried")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        test::MockFetcher::Resource resource;
        resource.status = 503;
        auto task = serve(*fetcher, dir, "busy", "data", resource);

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        REQUIRE(results->front().error);
        CHECK_EQ(results->front().error->code, ErrorCode::XF_RETRIES_EXHAUSTED);
        CHECK_EQ(fetcher->requests(), 3);
    }

    TEST_CASE("resume_with_range")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        const auto body = test::make_body(100000);
        auto task = serve(*fetcher, dir, "disk.vmdk", body);
        test::write_file(task.destination, body.substr(0, 30000));
        task.offset = 30000;

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(results->front().bytes_written, body.size());
        CHECK_EQ(fetcher->offsets(task.url), std::vector<std::size_t>{ 30000 });
        CHECK_EQ(test::read_file(task.destination), body);
        CHECK_EQ(pool.progress().downloaded, body.size());
    }

    TEST_CASE("range_ignored_restarts_from_zero")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        const auto body = test::make_body(100000);
        test::MockFetcher::Resource resource;
        resource.honor_range = false;
        auto task = serve(*fetcher, dir, "disk.vmdk", body, resource);
        test::write_file(task.destination, std::string(30000, 'x'));
        task.offset = 30000;

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(test::read_file(task.destination), body);
        // the restart must not count the first 30000 bytes twice
        CHECK_EQ(pool.progress().downloaded, body.size());
    }

    TEST_CASE("partial_file_shorter_than_offset_restarts")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        const auto body = test::make_body(50000);
        auto task = serve(*fetcher, dir, "disk.vmdk", body);
        test::write_file(task.destination, body.substr(0, 100));
        task.offset = 20000;

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(fetcher->offsets(task.url), std::vector<std::size_t>{ 0 });
        CHECK_EQ(test::read_file(task.destination), body);
    }

    TEST_CASE("retry_continues_from_disk")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        const auto body = test::make_body(100000);
        test::MockFetcher::Resource resource;
        resource.fail_times = 1;
        resource.fail_after = 40000;
        auto task = serve(*fetcher, dir, "disk.vmdk", body, resource);

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(fetcher->offsets(task.url), std::vector<std::size_t>{ 0, 40000 });
        CHECK_EQ(test::read_file(task.destination), body);
        CHECK_EQ(pool.progress().downloaded, body.size());
    }

    TEST_CASE("unknown_size_is_discovered")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        auto task = serve(*fetcher, dir, "disk.vmdk", test::make_body(12345));
        task.expected_size = 0;

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(pool.progress().total, 12345);
        CHECK_EQ(pool.progress().downloaded, 12345);
    }

    TEST_CASE("complete_file_of_unknown_size_is_kept")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        const auto body = test::make_body(40000);
        auto task = serve(*fetcher, dir, "disk.vmdk", body);
        test::write_file(task.destination, body);
        task.expected_size = 0;
        task.offset = body.size();

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(results->front().bytes_written, body.size());
        // a 416 is not retried and does not restart the file
        CHECK_EQ(fetcher->offsets(task.url), std::vector<std::size_t>{ body.size() });
        CHECK_EQ(test::read_file(task.destination), body);
        CHECK_EQ(pool.progress().total, body.size());
        CHECK_EQ(pool.progress().downloaded, body.size());
    }

    TEST_CASE("bytes_on_disk_do_not_count_as_speed")
    {
        Context ctx;
        fast_retries(ctx);
        auto fetcher = std::make_shared<test::MockFetcher>();
        TransferPool pool(ctx, fetcher);
        pool.account_completed(std::size_t(8) * 1024 * 1024 * 1024);
        std::this_thread::sleep_for(5ms);

        auto p = pool.progress();
        CHECK_EQ(p.downloaded, std::size_t(8) * 1024 * 1024 * 1024);
        CHECK_EQ(p.total, std::size_t(8) * 1024 * 1024 * 1024);
        CHECK_EQ(p.speed_mbps, doctest::Approx(0.0));
    }

    TEST_CASE("resumed_prefix_does_not_count_as_speed")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        const auto body = test::make_body(100000);
        auto task = serve(*fetcher, dir, "disk.vmdk", body);
        test::write_file(task.destination, body);
        task.offset = body.size();

        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch({ task });
        REQUIRE(results);
        CHECK(results->front().success);
        CHECK_EQ(fetcher->requests(), 0);
        CHECK_EQ(pool.progress().downloaded, body.size());
        CHECK_EQ(pool.progress().speed_mbps, doctest::Approx(0.0));
    }

    TEST_CASE("cancellation_stops_the_batch")
    {
        Context ctx;
        fast_retries(ctx);
        ctx.parallelism = 2;
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        test::MockFetcher::Resource resource;
        resource.chunk_delay = 20ms;

        std::vector<TransferTask> tasks;
        for (int i = 0; i < 20; ++i)
            tasks.push_back(serve(*fetcher, dir, "disk-" + std::to_string(i), test::make_body(1 << 20), resource));

        CancellationToken token;
        TransferPool pool(ctx, fetcher, token);
        std::thread canceller(
            [token]() mutable
            {
                std::this_thread::sleep_for(150ms);
                token.cancel();
            });

        const auto start = std::chrono::steady_clock::now();
        auto results = pool.download_batch(tasks);
        canceller.join();
        CHECK(std::chrono::steady_clock::now() - start < 5s);

        REQUIRE(results);
        CHECK(results->size() < tasks.size());
        std::size_t cancelled = 0;
        for (const auto& r : *results)
            cancelled += r.cancelled() ? 1 : 0;
        CHECK(cancelled >= 1);
        CHECK(pool.token().cancelled());
        CHECK(pool.close());
    }

    TEST_CASE("progress_is_monotonic")
    {
        Context ctx;
        fast_retries(ctx);
        ctx.parallelism = 2;
        ctx.progress_interval = 5ms;
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        test::MockFetcher::Resource resource;
        resource.chunk_delay = 2ms;
        resource.fail_times = 1;
        resource.fail_after = 100000;

        std::vector<TransferTask> tasks;
        for (int i = 0; i < 4; ++i)
            tasks.push_back(serve(*fetcher, dir, "f" + std::to_string(i), test::make_body(300000), resource));

        std::vector<std::size_t> seen;
        TransferPool pool(ctx, fetcher);
        auto results = pool.download_batch(tasks, [&](const Progress& p) { seen.push_back(p.downloaded); });
        REQUIRE(results);
        REQUIRE_FALSE(seen.empty());
        for (std::size_t i = 1; i < seen.size(); ++i)
            CHECK(seen[i] >= seen[i - 1]);
        CHECK_EQ(seen.back(), 4 * 300000);
    }

    TEST_CASE("rate_limited_pool")
    {
        Context ctx;
        fast_retries(ctx);
        ctx.parallelism = 2;
        ctx.chunk_size = 10000;
        ctx.bandwidth_limit = 200000;
        ctx.bandwidth_burst = 20000;
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        auto a = serve(*fetcher, dir, "a", test::make_body(100000, 1));
        auto b = serve(*fetcher, dir, "b", test::make_body(100000, 2));

        TransferPool pool(ctx, fetcher);
        const auto start = std::chrono::steady_clock::now();
        auto results = pool.download_batch({ a, b });
        const double elapsed
            = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        REQUIRE(results);
        for (const auto& r : *results)
            CHECK(r.success);
        // 180000 bytes beyond the initial burst at 200000 B/s
        CHECK(elapsed >= 0.8);
    }

    TEST_CASE("checkpoint_follows_the_transfers")
    {
        Context ctx;
        fast_retries(ctx);
        test::TempDir dir;
        auto fetcher = std::make_shared<test::MockFetcher>();
        auto good = serve(*fetcher, dir, "good", test::make_body(5000));
        TransferTask bad{ "mock://host/bad", dir / "bad", 10, "bad" };

        auto session = std::make_shared<CheckpointSession>(
            Checkpoint("vm", "mock", "raw", dir.path()), dir / "cp.checkpoint");
        TransferPool pool(ctx, fetcher);
        pool.set_checkpoint(session);
        auto results = pool.download_batch({ good, bad });
        REQUIRE(results);

        auto cp = session->snapshot();
        REQUIRE(cp.file(good.destination.string()));
        CHECK_EQ(cp.file(good.destination.string())->status, FileStatus::kCOMPLETED);
        CHECK_EQ(cp.file(good.destination.string())->downloaded_size, 5000);
        REQUIRE(cp.file(bad.destination.string()));
        CHECK_EQ(cp.file(bad.destination.string())->status, FileStatus::kFAILED);
        CHECK(session->save_count() >= 2);
    }

    TEST_CASE("make_rate_limiter")
    {
        Context ctx;
        CHECK_FALSE(make_rate_limiter(ctx));

        ctx.bandwidth_limit = 5 * 1024 * 1024;
        auto fixed = make_rate_limiter(ctx);
        REQUIRE(fixed);
        CHECK_EQ(fixed->rate(), 5 * 1024 * 1024);
        CHECK_FALSE(dynamic_cast<AdaptiveRateLimiter*>(fixed.get()));

        ctx.adaptive_bandwidth = true;
        ctx.bandwidth_min = 1024 * 1024;
        auto adaptive = make_rate_limiter(ctx);
        REQUIRE(adaptive);
        auto* a = dynamic_cast<AdaptiveRateLimiter*>(adaptive.get());
        REQUIRE(a);
        CHECK_EQ(a->config().max_rate, 5 * 1024 * 1024);
        CHECK_EQ(a->rate(), 3 * 1024 * 1024);
    }
}
