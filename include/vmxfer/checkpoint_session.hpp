#ifndef VMXFER_CHECKPOINT_SESSION_HPP
#define VMXFER_CHECKPOINT_SESSION_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

#include <tl/expected.hpp>

#include <vmxfer/checkpoint.hpp>
#include <vmxfer/export.hpp>
#include <vmxfer/transfer.hpp>

namespace vmxfer
{
    struct CheckpointPolicy
    {
        bool save_on_complete = true;
        // 0 disables interval saves
        std::chrono::milliseconds interval{ 0 };
    };

    // Shared, lock protected checkpoint updated by the transfer workers.
    // Every mutation and the save that may follow it happen under one mutex, so each save is a
    // consistent snapshot. Failed saves are logged and never interrupt a transfer.
    class VMXFER_API CheckpointSession
    {
    public:
        using clock = std::chrono::steady_clock;

        CheckpointSession(Checkpoint checkpoint, fs::path path, CheckpointPolicy policy = {});

        CheckpointSession(const CheckpointSession&) = delete;
        CheckpointSession& operator=(const CheckpointSession&) = delete;

        // Marks the task's entry as downloading from its resume offset, adding it if needed.
        void begin_file(const TransferTask& task);
        void update_progress(const std::string& path, std::size_t downloaded);
        void complete_file(const std::string& path, std::size_t size, const std::string& checksum = {});
        // The next resume restarts this file from scratch.
        void fail_file(const std::string& path, std::size_t downloaded);
        // Cancelled mid-transfer: the partial file stays resumable. Always saved.
        void interrupt_file(const std::string& path, std::size_t downloaded);
        void note_retry(const std::string& path);

        tl::expected<void, TransferError> flush();

        Checkpoint snapshot() const;
        const fs::path& path() const noexcept;
        std::size_t save_count() const;

    private:
        void save_locked();
        void touch_locked(const std::string& path, std::size_t downloaded, FileStatus status);

        Checkpoint m_checkpoint;
        CheckpointStore m_store;
        CheckpointPolicy m_policy;
        clock::time_point m_last_save;
        std::size_t m_save_count = 0;
        mutable std::mutex m_mutex;
    };
}

#endif
