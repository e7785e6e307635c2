#ifndef VMXFER_SESSION_HPP
#define VMXFER_SESSION_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <vmxfer/cancellation.hpp>
#include <vmxfer/export.hpp>
#include <vmxfer/fetcher.hpp>
#include <vmxfer/pool.hpp>
#include <vmxfer/rate_limiter.hpp>
#include <vmxfer/transfer.hpp>

namespace vmxfer
{
    namespace fs = std::filesystem;

    class Context;

    // What is being exported, as recorded in the checkpoint.
    struct ExportDescriptor
    {
        std::string subject_name;
        std::string provider;
        std::string format;
        fs::path output_dir;
        std::map<std::string, std::string> metadata;
    };

    struct SessionReport
    {
        // one per task that ran, in completion order
        std::vector<TransferResult> results;
        // complete on disk from a previous run
        std::vector<TransferTask> skipped;
        std::size_t succeeded = 0;
        std::size_t failed = 0;
        std::size_t interrupted = 0;
        // queued tasks that never started because of cancellation
        std::size_t not_started = 0;
        std::size_t skipped_bytes = 0;
        bool cancelled = false;
        Progress progress;
        std::optional<fs::path> checkpoint_path;
        bool checkpoint_deleted = false;

        bool success() const noexcept
        {
            return !cancelled && failed == 0 && interrupted == 0 && not_started == 0;
        }
    };

    // Runs one export: loads and reconciles the checkpoint when resuming, runs every remaining
    // task through a TransferPool, then deletes the checkpoint on full success or keeps it for
    // a later resume.
    class VMXFER_API TransferSession
    {
    public:
        TransferSession(const Context& ctx,
                        std::shared_ptr<Fetcher> fetcher,
                        const CancellationToken& token = {});

        // Replaces the limiter the context would configure.
        void set_rate_limiter(std::shared_ptr<RateLimiter> limiter);

        tl::expected<SessionReport, TransferError> run(
            const ExportDescriptor& descriptor,
            const std::vector<TransferTask>& tasks,
            const TransferPool::progress_callback_type& progress_callback = {});

        fs::path checkpoint_path(const ExportDescriptor& descriptor) const;

        const CancellationToken& token() const noexcept
        {
            return m_token;
        }

    private:
        const Context& m_ctx;
        std::shared_ptr<Fetcher> m_fetcher;
        std::optional<std::shared_ptr<RateLimiter>> m_limiter;
        CancellationToken m_token;
    };
}

#endif
