#include <optional>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vmxfer/resume_planner.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    namespace
    {
        // Size of the file on disk, nothing if it does not exist.
        std::optional<std::uintmax_t> file_size_on_disk(const fs::path& path)
        {
            std::error_code ec;
            if (!fs::is_regular_file(path, ec))
                return std::nullopt;
            auto size = fs::file_size(path, ec);
            if (ec)
                return std::nullopt;
            return size;
        }

        void demote(FileCheckpoint& entry)
        {
            entry.status = FileStatus::kPENDING;
            entry.downloaded_size = 0;
            entry.checksum.clear();
            entry.last_modified = std::chrono::system_clock::now();
        }
    }

    ResumePlanner::ResumePlanner(ResumeOptions options)
        : m_options(options)
    {
    }

    ResumeDecision ResumePlanner::decide(FileCheckpoint& entry, const TransferTask& task) const
    {
        ResumeDecision decision;
        decision.task = task;
        decision.task.offset = 0;

        const auto on_disk = file_size_on_disk(task.destination);
        switch (entry.status)
        {
            case FileStatus::kCOMPLETED:
            {
                if (!on_disk)
                {
                    decision.reason = "completed file is missing";
                }
                else if (*on_disk != entry.total_size
                         || (task.expected_size != 0 && task.expected_size != entry.total_size))
                {
                    decision.reason = fmt::format(
                        "size on disk {} does not match recorded size {}", *on_disk, entry.total_size);
                }
                else if (m_options.verify_checksum && !entry.checksum.empty()
                         && sha256sum(task.destination) != entry.checksum)
                {
                    decision.reason = "checksum mismatch";
                }
                else
                {
                    decision.action = ResumeAction::kSKIP;
                    decision.reason = "already completed";
                    return decision;
                }
                demote(entry);
                return decision;
            }
            case FileStatus::kDOWNLOADING:
            {
                if (entry.downloaded_size == 0)
                {
                    decision.reason = "no bytes recorded";
                }
                else if (!on_disk || *on_disk < entry.downloaded_size)
                {
                    decision.reason = fmt::format("partial file holds {} of {} recorded bytes",
                                                  on_disk.value_or(0),
                                                  entry.downloaded_size);
                }
                else
                {
                    decision.action = ResumeAction::kRESUME;
                    decision.task.offset = entry.downloaded_size;
                    decision.reason = fmt::format("resuming at byte {}", entry.downloaded_size);
                    return decision;
                }
                demote(entry);
                return decision;
            }
            default:
                decision.reason = fmt::format("status {}", to_string(entry.status));
                demote(entry);
                return decision;
        }
    }

    ResumePlan ResumePlanner::plan(Checkpoint& checkpoint, const std::vector<TransferTask>& tasks) const
    {
        ResumePlan result;
        for (const auto& task : tasks)
        {
            const std::string key = task.destination.string();
            FileCheckpoint* entry = checkpoint.file(key);

            ResumeDecision decision;
            if (entry == nullptr)
            {
                checkpoint.add_file(key, task.url, task.expected_size);
                decision.task = task;
                decision.task.offset = 0;
                decision.reason = "not in checkpoint";
            }
            else
            {
                if (entry->total_size == 0)
                    entry->total_size = task.expected_size;
                if (entry->url.empty())
                    entry->url = task.url;
                decision = decide(*entry, task);
            }

            spdlog::info("Resume {}: {} ({})", key, to_string(decision.action), decision.reason);
            switch (decision.action)
            {
                case ResumeAction::kSKIP:
                    result.skipped_bytes += entry->total_size;
                    result.skipped.push_back(decision.task);
                    break;
                case ResumeAction::kRESUME:
                    result.resumed_bytes += decision.task.offset;
                    result.tasks.push_back(decision.task);
                    break;
                default:
                    result.tasks.push_back(decision.task);
            }
            result.decisions.push_back(std::move(decision));
        }
        return result;
    }
}
