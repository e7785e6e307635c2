#include <spdlog/spdlog.h>

#include <vmxfer/checkpoint_session.hpp>

namespace vmxfer
{
    CheckpointSession::CheckpointSession(Checkpoint checkpoint,
                                         fs::path path,
                                         CheckpointPolicy policy)
        : m_checkpoint(std::move(checkpoint))
        , m_store(std::move(path))
        , m_policy(policy)
        , m_last_save(clock::now())
    {
    }

    void CheckpointSession::save_locked()
    {
        auto res = m_store.save(m_checkpoint);
        m_last_save = clock::now();
        if (!res)
        {
            spdlog::warn("Failed to save checkpoint: {}", res.error().reason);
            return;
        }
        ++m_save_count;
    }

    void CheckpointSession::touch_locked(const std::string& path,
                                         std::size_t downloaded,
                                         FileStatus status)
    {
        if (!m_checkpoint.update_file_progress(path, downloaded, status))
        {
            spdlog::debug("No checkpoint entry for {}", path);
        }
    }

    void CheckpointSession::begin_file(const TransferTask& task)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::string path = task.destination.string();
        m_checkpoint.add_file(path, task.url, task.expected_size);
        touch_locked(path, task.offset, FileStatus::kDOWNLOADING);
    }

    void CheckpointSession::update_progress(const std::string& path, std::size_t downloaded)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch_locked(path, downloaded, FileStatus::kDOWNLOADING);
        if (m_policy.interval.count() > 0 && clock::now() - m_last_save >= m_policy.interval)
        {
            save_locked();
        }
    }

    void CheckpointSession::complete_file(const std::string& path,
                                          std::size_t size,
                                          const std::string& checksum)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto* entry = m_checkpoint.file(path))
        {
            entry->total_size = size;
            if (!checksum.empty())
                entry->checksum = checksum;
        }
        touch_locked(path, size, FileStatus::kCOMPLETED);
        if (m_policy.save_on_complete || m_policy.interval.count() == 0)
        {
            save_locked();
        }
    }

    void CheckpointSession::fail_file(const std::string& path, std::size_t downloaded)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch_locked(path, downloaded, FileStatus::kFAILED);
        save_locked();
    }

    void CheckpointSession::interrupt_file(const std::string& path, std::size_t downloaded)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch_locked(path, downloaded, FileStatus::kDOWNLOADING);
        save_locked();
    }

    void CheckpointSession::note_retry(const std::string& path)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto* entry = m_checkpoint.file(path))
        {
            ++entry->retry_count;
        }
    }

    tl::expected<void, TransferError> CheckpointSession::flush()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto res = m_store.save(m_checkpoint);
        m_last_save = clock::now();
        if (res)
            ++m_save_count;
        return res;
    }

    Checkpoint CheckpointSession::snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_checkpoint;
    }

    const fs::path& CheckpointSession::path() const noexcept
    {
        return m_store.path();
    }

    std::size_t CheckpointSession::save_count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_save_count;
    }
}
