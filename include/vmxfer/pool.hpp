#ifndef VMXFER_POOL_HPP
#define VMXFER_POOL_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <tl/expected.hpp>

#include <vmxfer/cancellation.hpp>
#include <vmxfer/checkpoint_session.hpp>
#include <vmxfer/errors.hpp>
#include <vmxfer/export.hpp>
#include <vmxfer/fetcher.hpp>
#include <vmxfer/queue.hpp>
#include <vmxfer/rate_limiter.hpp>
#include <vmxfer/retry.hpp>
#include <vmxfer/transfer.hpp>

namespace vmxfer
{
    class Context;

    // Limiter configured by the context: nothing when bandwidth is unlimited, an adaptive
    // limiter when requested.
    VMXFER_API std::shared_ptr<RateLimiter> make_rate_limiter(const Context& ctx);

    // Fixed set of worker threads pulling transfer tasks from a bounded queue.
    //
    // Every task yields exactly one TransferResult, in completion order. A task fails on its
    // own without affecting the pool; only cancellation of the pool's token stops the workers
    // early, and tasks still queued at that point never start.
    //
    // Workers block on a full result queue: with more tasks than the queue holds, results
    // have to be consumed while the pool runs (download_batch does this).
    class VMXFER_API TransferPool
    {
    public:
        using clock = std::chrono::steady_clock;
        using progress_callback_type = std::function<void(const Progress&)>;

        // The pool works on a child of `token`: cancelling the caller's token stops the pool,
        // closing the pool does not cancel the caller's token.
        TransferPool(const Context& ctx,
                     std::shared_ptr<Fetcher> fetcher,
                     const CancellationToken& token = {});
        ~TransferPool();

        TransferPool(const TransferPool&) = delete;
        TransferPool& operator=(const TransferPool&) = delete;

        void set_rate_limiter(std::shared_ptr<RateLimiter> limiter);
        void set_checkpoint(std::shared_ptr<CheckpointSession> checkpoint);
        void set_retry_policy(RetryPolicy policy);

        // Never blocks: XF_POOL_SHUTTING_DOWN once cancelled, XF_QUEUE_FULL when there is no
        // free slot.
        tl::expected<void, TransferError> submit(TransferTask task);
        // Waits for a free slot.
        tl::expected<void, TransferError> submit_blocking(TransferTask task);

        // XF_POOL_STARTED on a second call.
        tl::expected<void, TransferError> start();

        BoundedQueue<TransferResult>& results() noexcept
        {
            return m_results;
        }

        // Counters never decrease. Speed is the average since start() in MiB/s, bytes that
        // were already on disk are left out of it.
        Progress progress() const;

        // Credits bytes that are already on disk, e.g. files skipped on resume.
        void account_completed(std::size_t bytes);

        // Starts the pool if needed, submits every task and collects their results, calling
        // `progress_callback` on every progress interval. Returns early when cancelled, with
        // the results of the tasks that were in flight.
        tl::expected<std::vector<TransferResult>, TransferError> download_batch(
            std::vector<TransferTask> tasks, const progress_callback_type& progress_callback = {});

        // Lets the workers drain the queued tasks, joins them, closes the result queue and
        // cancels the pool token. XF_POOL_CLOSED on a second call.
        tl::expected<void, TransferError> close();

        void cancel();

        const CancellationToken& token() const noexcept
        {
            return m_token;
        }

        std::size_t worker_count() const noexcept
        {
            return m_worker_count;
        }

    private:
        struct TaskState;

        void worker_loop(std::size_t id);
        TransferResult run_task(const TransferTask& task);
        tl::expected<void, TransferError> transfer_once(const TransferTask& task,
                                                        std::size_t offset,
                                                        TaskState& state);
        void credit(TaskState& state, std::size_t position, bool on_disk = false);

        const Context& m_ctx;
        std::shared_ptr<Fetcher> m_fetcher;
        std::shared_ptr<RateLimiter> m_limiter;
        std::shared_ptr<CheckpointSession> m_checkpoint;
        RetryPolicy m_retry;
        CancellationToken m_token;

        std::size_t m_worker_count;
        BoundedQueue<TransferTask> m_tasks;
        BoundedQueue<TransferResult> m_results;
        std::vector<std::thread> m_workers;

        std::atomic<bool> m_started{ false };
        std::atomic<bool> m_closed{ false };
        std::atomic<std::size_t> m_live_workers{ 0 };
        std::atomic<std::size_t> m_downloaded{ 0 };
        // part of m_downloaded that was already on disk
        std::atomic<std::size_t> m_skipped{ 0 };
        std::atomic<std::size_t> m_total{ 0 };
        std::atomic<clock::rep> m_start_time{ 0 };
    };
}

#endif
