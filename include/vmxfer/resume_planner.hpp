#ifndef VMXFER_RESUME_PLANNER_HPP
#define VMXFER_RESUME_PLANNER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <vmxfer/checkpoint.hpp>
#include <vmxfer/enums.hpp>
#include <vmxfer/export.hpp>
#include <vmxfer/transfer.hpp>

namespace vmxfer
{
    struct ResumeOptions
    {
        // Recompute the SHA-256 of completed files that carry a checksum. Off by default: a
        // matching size is taken as proof of a completed download.
        bool verify_checksum = false;
    };

    struct ResumeDecision
    {
        TransferTask task;
        ResumeAction action = ResumeAction::kRESTART;
        std::string reason;
    };

    struct ResumePlan
    {
        // to submit, with their resume offset set
        std::vector<TransferTask> tasks;
        // already complete on disk
        std::vector<TransferTask> skipped;
        std::vector<ResumeDecision> decisions;
        std::size_t skipped_bytes = 0;
        std::size_t resumed_bytes = 0;
    };

    // Reconciles a loaded checkpoint with the files on disk before any task is submitted.
    class VMXFER_API ResumePlanner
    {
    public:
        explicit ResumePlanner(ResumeOptions options = {});

        // Decides for every task, demoting checkpoint entries that no longer match the disk.
        // Tasks without an entry are added to the checkpoint and downloaded from scratch.
        ResumePlan plan(Checkpoint& checkpoint, const std::vector<TransferTask>& tasks) const;

        ResumeDecision decide(FileCheckpoint& entry, const TransferTask& task) const;

    private:
        ResumeOptions m_options;
    };
}

#endif
