#include <algorithm>
#include <cstdio>
#include <exception>
#include <mutex>
#include <optional>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vmxfer/context.hpp>
#include <vmxfer/fileio.hpp>
#include <vmxfer/pool.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    std::shared_ptr<RateLimiter> make_rate_limiter(const Context& ctx)
    {
        if (ctx.adaptive_bandwidth)
        {
            AdaptiveRateConfig config;
            config.min_rate = ctx.bandwidth_min;
            config.max_rate = ctx.bandwidth_limit != 0 ? ctx.bandwidth_limit : ctx.bandwidth_max;
            return std::make_shared<AdaptiveRateLimiter>(config, ctx.bandwidth_burst);
        }
        if (ctx.bandwidth_limit == 0)
            return nullptr;
        return std::make_shared<RateLimiter>(ctx.bandwidth_limit, ctx.bandwidth_burst);
    }

    struct TransferPool::TaskState
    {
        // bytes of this task already added to the pool counter
        std::size_t credited = 0;
        // valid bytes in the destination file
        std::size_t position = 0;
        bool size_discovered = false;
    };

    namespace
    {
        TransferError file_error(ErrorCode code, const std::string& what, const fs::path& path, const std::error_code& ec)
        {
            return TransferError{ ErrorLevel::SERIOUS,
                                  code,
                                  fmt::format("{} {}: {}", what, path.string(), ec.message()),
                                  Retry::kNON_RETRYABLE };
        }

        // Writes the fetched body to the destination file in chunks, each one paid for with
        // rate limiter tokens.
        class FileSink : public FetchSink
        {
        public:
            using progress_type = std::function<void(std::size_t)>;

            FileSink(FileIO& file,
                     const TransferTask& task,
                     std::size_t offset,
                     std::size_t chunk_size,
                     RateLimiter* limiter,
                     const CancellationToken& token,
                     progress_type on_progress)
                : m_file(file)
                , m_task(task)
                , m_chunk_size(std::max<std::size_t>(chunk_size, 1))
                , m_limiter(limiter)
                , m_token(token)
                , m_on_progress(std::move(on_progress))
                , m_position(offset)
            {
            }

            bool on_response(const ResponseInfo& info) override
            {
                if (m_position > 0 && !info.range_honored)
                {
                    spdlog::warn("Range request for {} was not honored (status {}), restarting from 0",
                                 m_task.url,
                                 info.status);
                    std::error_code ec;
                    m_file.truncate(0, ec);
                    if (ec || m_file.seek(0, SEEK_SET) != 0)
                    {
                        m_error = file_error(ErrorCode::XF_IO, "Cannot truncate", m_file.path(), ec);
                        return false;
                    }
                    m_position = 0;
                }
                if (info.content_length)
                {
                    m_announced_size = m_position + info.content_length.value();
                    if (m_task.expected_size != 0 && m_announced_size != m_task.expected_size)
                    {
                        spdlog::warn("{}: source announces {} bytes, {} expected",
                                     m_task.name,
                                     m_announced_size.value(),
                                     m_task.expected_size);
                    }
                }
                return true;
            }

            bool on_data(const char* data, std::size_t size) override
            {
                while (size > 0)
                {
                    if (m_token.cancelled())
                    {
                        m_error = cancelled_error(m_task.name);
                        return false;
                    }

                    const std::size_t n = std::min(size, m_chunk_size);
                    if (m_task.expected_size != 0 && m_position + n > m_task.expected_size)
                    {
                        m_error = TransferError{
                            ErrorLevel::SERIOUS,
                            ErrorCode::XF_SIZE_MISMATCH,
                            fmt::format("{}: source is larger than the expected {} bytes",
                                        m_task.name,
                                        m_task.expected_size),
                            Retry::kNON_RETRYABLE
                        };
                        return false;
                    }

                    if (m_limiter)
                    {
                        auto waited = m_limiter->wait_n(n, m_token);
                        if (!waited)
                        {
                            m_error = cancelled_error(m_task.name);
                            return false;
                        }
                    }

                    const std::size_t written = m_file.write(data, n);
                    if (written != n)
                    {
                        m_position += written;
                        m_error = TransferError{ ErrorLevel::SERIOUS,
                                                 ErrorCode::XF_SHORT_WRITE,
                                                 fmt::format("Short write to {}: wrote {} of {} bytes",
                                                             m_file.path().string(),
                                                             written,
                                                             n),
                                                 Retry::kNON_RETRYABLE };
                        return false;
                    }
                    m_position += n;
                    data += n;
                    size -= n;
                    m_on_progress(m_position);
                }
                return true;
            }

            std::size_t position() const noexcept
            {
                return m_position;
            }

            const std::optional<TransferError>& error() const noexcept
            {
                return m_error;
            }

            std::optional<std::size_t> announced_size() const noexcept
            {
                return m_announced_size;
            }

        private:
            FileIO& m_file;
            const TransferTask& m_task;
            std::size_t m_chunk_size;
            RateLimiter* m_limiter;
            const CancellationToken& m_token;
            progress_type m_on_progress;
            std::size_t m_position;
            std::optional<std::size_t> m_announced_size;
            std::optional<TransferError> m_error;
        };

        std::optional<std::uintmax_t> size_on_disk(const fs::path& path)
        {
            std::error_code ec;
            auto size = fs::file_size(path, ec);
            if (ec)
                return std::nullopt;
            return size;
        }
    }

    /****************
     * TransferPool *
     ****************/

    TransferPool::TransferPool(const Context& ctx,
                               std::shared_ptr<Fetcher> fetcher,
                               const CancellationToken& token)
        : m_ctx(ctx)
        , m_fetcher(std::move(fetcher))
        , m_limiter(make_rate_limiter(ctx))
        , m_retry(ctx.retry)
        , m_token(token.child())
        , m_worker_count(std::max<std::size_t>(ctx.parallelism, 1))
        , m_tasks(ctx.effective_queue_capacity())
        , m_results(ctx.effective_queue_capacity())
    {
        m_start_time = clock::now().time_since_epoch().count();
    }

    TransferPool::~TransferPool()
    {
        if (!m_closed)
        {
            m_token.cancel();
            auto res = close();
            if (!res)
                res.error().log();
        }
    }

    void TransferPool::set_rate_limiter(std::shared_ptr<RateLimiter> limiter)
    {
        m_limiter = std::move(limiter);
    }

    void TransferPool::set_checkpoint(std::shared_ptr<CheckpointSession> checkpoint)
    {
        m_checkpoint = std::move(checkpoint);
    }

    void TransferPool::set_retry_policy(RetryPolicy policy)
    {
        m_retry = std::move(policy);
    }

    tl::expected<void, TransferError> TransferPool::submit(TransferTask task)
    {
        if (m_token.cancelled())
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS, ErrorCode::XF_POOL_SHUTTING_DOWN, "pool is shutting down" });
        }
        if (m_closed)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS, ErrorCode::XF_POOL_CLOSED, "pool is closed" });
        }

        const std::size_t size = task.expected_size;
        if (!m_tasks.try_push(std::move(task)))
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::INFO, ErrorCode::XF_QUEUE_FULL, "task queue is full" });
        }
        m_total += size;
        return {};
    }

    tl::expected<void, TransferError> TransferPool::submit_blocking(TransferTask task)
    {
        if (m_token.cancelled())
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS, ErrorCode::XF_POOL_SHUTTING_DOWN, "pool is shutting down" });
        }
        if (m_closed)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS, ErrorCode::XF_POOL_CLOSED, "pool is closed" });
        }

        const std::size_t size = task.expected_size;
        if (!m_tasks.push(std::move(task), m_token))
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS, ErrorCode::XF_POOL_SHUTTING_DOWN, "pool is shutting down" });
        }
        m_total += size;
        return {};
    }

    tl::expected<void, TransferError> TransferPool::start()
    {
        if (m_closed)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS, ErrorCode::XF_POOL_CLOSED, "pool is closed" });
        }
        bool expected = false;
        if (!m_started.compare_exchange_strong(expected, true))
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS, ErrorCode::XF_POOL_STARTED, "pool is already started" });
        }

        m_start_time = clock::now().time_since_epoch().count();
        m_live_workers = m_worker_count;
        m_workers.reserve(m_worker_count);
        for (std::size_t i = 0; i < m_worker_count; ++i)
        {
            m_workers.emplace_back(&TransferPool::worker_loop, this, i);
        }
        spdlog::info("Transfer pool started with {} workers", m_worker_count);
        return {};
    }

    void TransferPool::worker_loop(std::size_t id)
    {
        spdlog::debug("Worker {} started", id);
        while (auto task = m_tasks.pop(m_token))
        {
            TransferResult result;
            try
            {
                result = run_task(*task);
            }
            catch (const std::exception& e)
            {
                result = TransferResult{};
                result.task = *task;
                result.error = TransferError{ ErrorLevel::SERIOUS,
                                              ErrorCode::XF_UNKNOWNERROR,
                                              fmt::format("{}: {}", task->name, e.what()),
                                              Retry::kNON_RETRYABLE };
                result.error->log();
            }

            if (!m_results.push(std::move(result), m_token))
            {
                spdlog::warn("Worker {}: dropping result of {}, pool is shutting down", id, task->name);
            }
        }
        spdlog::debug("Worker {} stopped", id);
        --m_live_workers;
    }

    void TransferPool::credit(TaskState& state, std::size_t position, bool on_disk)
    {
        if (position > state.credited)
        {
            m_downloaded += position - state.credited;
            if (on_disk)
                m_skipped += position - state.credited;
            state.credited = position;
        }
    }

    TransferResult TransferPool::run_task(const TransferTask& task)
    {
        const auto start = clock::now();
        const std::string key = task.destination.string();

        TransferResult result;
        result.task = task;

        if (m_token.cancelled())
        {
            result.error = cancelled_error(task.name);
            return result;
        }

        spdlog::info("Transferring {} ({}) to {}",
                     task.name,
                     format_bytes(task.expected_size),
                     key);

        TaskState state;
        state.position = task.offset;
        credit(state, task.offset, true);
        if (m_checkpoint)
            m_checkpoint->begin_file(task);

        auto res = m_retry.retry(
            m_token,
            [&](std::size_t attempt) -> tl::expected<void, TransferError>
            {
                if (attempt > 1 && m_checkpoint)
                    m_checkpoint->note_retry(key);
                // a retry continues from what the previous attempt left on disk
                auto r = transfer_once(task, attempt > 1 ? state.position : task.offset, state);
                if (!r && !r.error().is_cancelled() && m_limiter)
                    m_limiter->record_error();
                return r;
            },
            fmt::format("transfer of {}", task.name));

        result.duration = clock::now() - start;
        result.bytes_written = state.position;

        if (res)
        {
            result.success = true;
            if (m_limiter)
                m_limiter->record_success();

            std::string checksum;
            if (m_ctx.compute_checksums)
                checksum = sha256sum(task.destination);
            if (m_checkpoint)
                m_checkpoint->complete_file(key, state.position, checksum);

            spdlog::info("Transferred {} ({}) in {:.1f}s",
                         task.name,
                         format_bytes(state.position),
                         std::chrono::duration<double>(result.duration).count());
            return result;
        }

        result.error = res.error();
        if (result.error->is_cancelled())
        {
            spdlog::info("Transfer of {} cancelled at {}", task.name, format_bytes(state.position));
            if (m_checkpoint)
                m_checkpoint->interrupt_file(key, state.position);
        }
        else
        {
            result.error->log();
            if (m_checkpoint)
                m_checkpoint->fail_file(key, state.position);
        }
        return result;
    }

    tl::expected<void, TransferError> TransferPool::transfer_once(const TransferTask& task,
                                                                  std::size_t offset,
                                                                  TaskState& state)
    {
        std::error_code ec;
        const fs::path& dest = task.destination;
        if (dest.has_parent_path())
        {
            fs::create_directories(dest.parent_path(), ec);
            if (ec)
                return tl::make_unexpected(file_error(
                    ErrorCode::XF_CANNOTCREATEDIR, "Cannot create directory for", dest, ec));
        }

        if (offset > 0)
        {
            auto on_disk = size_on_disk(dest);
            if (!on_disk || *on_disk < offset)
            {
                spdlog::warn("{}: partial file is shorter than {} bytes, restarting", task.name, offset);
                offset = 0;
            }
            else if (task.expected_size != 0 && offset >= task.expected_size)
            {
                if (*on_disk == task.expected_size)
                {
                    // every byte is already there
                    state.position = task.expected_size;
                    credit(state, state.position, true);
                    return {};
                }
                offset = 0;
            }
        }

        FileIO::mode_type mode = FileIO::write_binary;
        if (offset > 0)
            mode = FileIO::read_update_binary;
        FileIO file(dest, mode, ec);
        if (ec)
            return tl::make_unexpected(file_error(ErrorCode::XF_FILE, "Cannot open", dest, ec));
        if (offset > 0)
        {
            // drop anything past the resume point
            file.truncate(offset, ec);
            if (ec || file.seek(offset, SEEK_SET) != 0)
                return tl::make_unexpected(file_error(ErrorCode::XF_IO, "Cannot seek in", dest, ec));
        }
        state.position = offset;

        const std::string key = dest.string();
        FileSink sink(file,
                      task,
                      offset,
                      m_ctx.chunk_size,
                      m_limiter.get(),
                      m_token,
                      [&](std::size_t position)
                      {
                          state.position = position;
                          credit(state, position);
                          if (m_checkpoint)
                              m_checkpoint->update_progress(key, position);
                      });

        FetchRequest request;
        request.url = task.url;
        request.offset = offset;
        request.token = m_token;
        auto fetched = m_fetcher->fetch(request, sink);
        state.position = sink.position();

        if (!state.size_discovered && task.expected_size == 0 && sink.announced_size())
        {
            state.size_discovered = true;
            m_total += sink.announced_size().value();
        }

        file.flush(ec);
        if (sink.error())
            return tl::make_unexpected(sink.error().value());
        if (!fetched && offset > 0 && task.expected_size == 0
            && fetched.error().code == ErrorCode::XF_RANGE_NOT_SATISFIABLE)
        {
            // nothing left past the resume point, the partial file was already whole
            spdlog::info("{}: no data past byte {}, keeping the file as is", task.name, offset);
            state.position = offset;
            credit(state, offset, true);
            if (!state.size_discovered)
            {
                state.size_discovered = true;
                m_total += offset;
            }
            return {};
        }
        if (!fetched)
            return tl::make_unexpected(fetched.error());
        if (ec)
            return tl::make_unexpected(file_error(ErrorCode::XF_IO, "Cannot flush", dest, ec));

        std::optional<std::size_t> expected;
        if (task.expected_size != 0)
            expected = task.expected_size;
        else if (sink.announced_size())
            expected = sink.announced_size();

        if (expected && state.position != expected.value())
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS,
                               ErrorCode::XF_SIZE_MISMATCH,
                               fmt::format("{}: wrote {} bytes, expected {}",
                                           task.name,
                                           state.position,
                                           expected.value()),
                               Retry::kNON_RETRYABLE });
        }
        return {};
    }

    Progress TransferPool::progress() const
    {
        Progress p;
        p.downloaded = m_downloaded.load();
        p.total = m_total.load();
        const clock::time_point start{ clock::duration(m_start_time.load()) };
        const double elapsed = std::chrono::duration<double>(clock::now() - start).count();
        // bytes found on disk were not transferred by this pool
        const std::size_t skipped = std::min(m_skipped.load(), p.downloaded);
        if (elapsed > 0)
            p.speed_mbps = static_cast<double>(p.downloaded - skipped) / elapsed / (1024 * 1024);
        return p;
    }

    void TransferPool::account_completed(std::size_t bytes)
    {
        m_total += bytes;
        m_downloaded += bytes;
        m_skipped += bytes;
    }

    tl::expected<std::vector<TransferResult>, TransferError> TransferPool::download_batch(
        std::vector<TransferTask> tasks, const progress_callback_type& progress_callback)
    {
        if (m_closed)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS, ErrorCode::XF_POOL_CLOSED, "pool is closed" });
        }
        if (!m_started)
        {
            auto started = start();
            if (!started)
                return tl::make_unexpected(started.error());
        }

        std::vector<TransferResult> results;
        results.reserve(tasks.size());
        const std::size_t count = tasks.size();

        std::atomic<std::size_t> submitted{ 0 };
        std::atomic<bool> submitting{ true };
        std::thread submitter(
            [&]()
            {
                for (auto& task : tasks)
                {
                    const std::string name = task.name;
                    auto res = submit_blocking(std::move(task));
                    if (!res)
                    {
                        spdlog::warn("Could not submit {}: {}", name, res.error().reason);
                        break;
                    }
                    ++submitted;
                }
                submitting = false;
            });

        const auto interval = std::max(m_ctx.progress_interval, std::chrono::milliseconds(1));
        auto next_report = clock::now() + interval;
        while (results.size() < count)
        {
            const auto now = clock::now();
            const auto wait = next_report > now ? next_report - now : clock::duration::zero();
            if (auto result = m_results.pop_for(wait))
            {
                if (!result->success && !result->cancelled())
                {
                    spdlog::error("Transfer of {} failed: {}",
                                  result->task.name,
                                  result->error ? result->error->reason : "unknown error");
                }
                results.push_back(std::move(*result));
            }

            if (clock::now() >= next_report)
            {
                if (progress_callback)
                    progress_callback(progress());
                next_report += interval;
            }

            if (m_token.cancelled())
            {
                // collect what the in-flight tasks report, queued tasks never start
                if (m_live_workers == 0 && m_results.size() == 0)
                    break;
            }
            else if (!submitting && results.size() >= submitted)
            {
                break;
            }
        }
        submitter.join();

        if (progress_callback)
            progress_callback(progress());
        return results;
    }

    tl::expected<void, TransferError> TransferPool::close()
    {
        bool expected = false;
        if (!m_closed.compare_exchange_strong(expected, true))
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS, ErrorCode::XF_POOL_CLOSED, "pool is already closed" });
        }

        spdlog::info("Shutting down transfer pool");
        m_tasks.close();
        for (auto& worker : m_workers)
        {
            if (worker.joinable())
                worker.join();
        }
        m_results.close();
        m_token.cancel();
        spdlog::info("Transfer pool shutdown complete");
        return {};
    }

    void TransferPool::cancel()
    {
        m_token.cancel();
    }
}
