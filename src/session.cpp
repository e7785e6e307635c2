#include <algorithm>

#include <spdlog/spdlog.h>

#include <vmxfer/checkpoint.hpp>
#include <vmxfer/checkpoint_session.hpp>
#include <vmxfer/context.hpp>
#include <vmxfer/resume_planner.hpp>
#include <vmxfer/session.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    TransferSession::TransferSession(const Context& ctx,
                                     std::shared_ptr<Fetcher> fetcher,
                                     const CancellationToken& token)
        : m_ctx(ctx)
        , m_fetcher(std::move(fetcher))
        , m_token(token)
    {
    }

    void TransferSession::set_rate_limiter(std::shared_ptr<RateLimiter> limiter)
    {
        m_limiter = std::move(limiter);
    }

    fs::path TransferSession::checkpoint_path(const ExportDescriptor& descriptor) const
    {
        if (!m_ctx.checkpoint_path.empty())
            return m_ctx.checkpoint_path;
        return CheckpointStore::default_path(descriptor.output_dir, descriptor.subject_name);
    }

    tl::expected<SessionReport, TransferError> TransferSession::run(
        const ExportDescriptor& descriptor,
        const std::vector<TransferTask>& tasks,
        const TransferPool::progress_callback_type& progress_callback)
    {
        SessionReport report;
        std::vector<TransferTask> to_run;
        std::shared_ptr<CheckpointSession> checkpoint;

        if (m_ctx.enable_checkpoints)
        {
            const fs::path path = checkpoint_path(descriptor);
            report.checkpoint_path = path;

            std::optional<Checkpoint> loaded;
            if (m_ctx.resume_from_checkpoint)
            {
                auto res = CheckpointStore(path).load();
                if (res)
                {
                    loaded = std::move(res.value());
                }
                else if (res.error().code == ErrorCode::XF_NOT_FOUND)
                {
                    spdlog::info("No checkpoint at {}, starting a fresh export", path.string());
                }
                else
                {
                    spdlog::warn("Ignoring checkpoint: {}. Starting a fresh export",
                                 res.error().reason);
                }
            }

            Checkpoint cp = loaded ? std::move(loaded.value())
                                   : Checkpoint(descriptor.subject_name,
                                                descriptor.provider,
                                                descriptor.format,
                                                descriptor.output_dir);
            for (const auto& [key, value] : descriptor.metadata)
                cp.metadata[key] = value;

            ResumePlanner planner(ResumeOptions{ m_ctx.verify_checksum_on_resume });
            ResumePlan plan = planner.plan(cp, tasks);
            to_run = std::move(plan.tasks);
            report.skipped = std::move(plan.skipped);
            report.skipped_bytes = plan.skipped_bytes;
            if (plan.resumed_bytes > 0)
            {
                spdlog::info("Resuming {} already transferred", format_bytes(plan.resumed_bytes));
            }

            CheckpointPolicy policy;
            policy.save_on_complete = m_ctx.checkpoint_save_on_complete;
            policy.interval = m_ctx.checkpoint_interval;
            checkpoint = std::make_shared<CheckpointSession>(std::move(cp), path, policy);
            auto saved = checkpoint->flush();
            if (!saved)
            {
                spdlog::warn("Failed to save initial checkpoint: {}", saved.error().reason);
            }
        }
        else
        {
            to_run = tasks;
            for (auto& task : to_run)
                task.offset = 0;
        }

        const std::size_t scheduled = to_run.size();
        std::vector<TransferResult> results;
        {
            TransferPool pool(m_ctx, m_fetcher, m_token);
            if (m_limiter)
                pool.set_rate_limiter(m_limiter.value());
            if (checkpoint)
                pool.set_checkpoint(checkpoint);
            pool.account_completed(report.skipped_bytes);

            auto batch = pool.download_batch(std::move(to_run), progress_callback);
            if (!batch)
                return tl::make_unexpected(batch.error());
            results = std::move(batch.value());
            report.progress = pool.progress();

            auto closed = pool.close();
            if (!closed)
                closed.error().log();
        }

        for (const auto& result : results)
        {
            if (result.success)
                ++report.succeeded;
            else if (result.cancelled())
                ++report.interrupted;
            else
                ++report.failed;
        }
        report.not_started = scheduled - std::min(scheduled, results.size());
        report.cancelled = m_token.cancelled() || report.interrupted > 0;
        report.results = std::move(results);

        if (checkpoint)
        {
            if (report.success())
            {
                auto removed = CheckpointStore(checkpoint->path()).remove();
                if (removed)
                    report.checkpoint_deleted = true;
                else
                    removed.error().log();
            }
            else
            {
                auto saved = checkpoint->flush();
                if (saved)
                    spdlog::info("Checkpoint kept at {} for a later resume",
                                 checkpoint->path().string());
                else
                    saved.error().log();
            }
        }

        spdlog::info("Export of {}: {} succeeded, {} failed, {} interrupted, {} skipped",
                     descriptor.subject_name,
                     report.succeeded,
                     report.failed,
                     report.interrupted,
                     report.skipped.size());
        return report;
    }
}
