#include <doctest/doctest.h>

#include <vmxfer/resume_planner.hpp>

#include "helpers.hpp"

using namespace vmxfer;

namespace
{
    TransferTask make_task(const test::TempDir& dir, const std::string& name, std::size_t size)
    {
        return TransferTask{ "https://host/" + name, dir / name, size, name };
    }

    FileCheckpoint& entry_for(Checkpoint& cp, const TransferTask& task)
    {
        return cp.add_file(task.destination.string(), task.url, task.expected_size);
    }
}

TEST_SUITE("resume_planner")
{
    TEST_CASE("completed_file_is_skipped")
    {
        test::TempDir dir;
        auto task = make_task(dir, "disk.vmdk", 10);
        test::write_file(task.destination, "0123456789");

        Checkpoint cp("vm", "vsphere", "ova", dir.path());
        entry_for(cp, task);
        cp.update_file_progress(task.destination.string(), 10, FileStatus::kCOMPLETED);

        auto plan = ResumePlanner().plan(cp, { task });
        CHECK(plan.tasks.empty());
        REQUIRE_EQ(plan.skipped.size(), 1);
        CHECK_EQ(plan.skipped_bytes, 10);
        CHECK_EQ(plan.decisions[0].action, ResumeAction::kSKIP);
        CHECK_EQ(cp.file(task.destination.string())->status, FileStatus::kCOMPLETED);
    }

    TEST_CASE("completed_but_missing_restarts")
    {
        test::TempDir dir;
        auto task = make_task(dir, "disk.vmdk", 10);
        Checkpoint cp;
        entry_for(cp, task);
        cp.update_file_progress(task.destination.string(), 10, FileStatus::kCOMPLETED);

        auto plan = ResumePlanner().plan(cp, { task });
        REQUIRE_EQ(plan.tasks.size(), 1);
        CHECK_EQ(plan.tasks[0].offset, 0);
        CHECK_EQ(plan.decisions[0].action, ResumeAction::kRESTART);

        const auto* entry = cp.file(task.destination.string());
        CHECK_EQ(entry->status, FileStatus::kPENDING);
        CHECK_EQ(entry->downloaded_size, 0);
    }

    TEST_CASE("completed_with_wrong_size_restarts")
    {
        test::TempDir dir;
        auto task = make_task(dir, "disk.vmdk", 10);
        test::write_file(task.destination, "01234");
        Checkpoint cp;
        entry_for(cp, task);
        cp.update_file_progress(task.destination.string(), 10, FileStatus::kCOMPLETED);

        FileCheckpoint entry = *cp.file(task.destination.string());
        auto decision = ResumePlanner().decide(entry, task);
        CHECK_EQ(decision.action, ResumeAction::kRESTART);
        CHECK_EQ(entry.status, FileStatus::kPENDING);
    }

    TEST_CASE("checksum_verification")
    {
        test::TempDir dir;
        auto task = make_task(dir, "disk.vmdk", 3);
        test::write_file(task.destination, "abc");
        Checkpoint cp;
        entry_for(cp, task);
        cp.update_file_progress(task.destination.string(), 3, FileStatus::kCOMPLETED);
        cp.file(task.destination.string())->checksum = "0000";

        FileCheckpoint unchecked = *cp.file(task.destination.string());
        CHECK_EQ(ResumePlanner().decide(unchecked, task).action, ResumeAction::kSKIP);

        ResumeOptions options;
        options.verify_checksum = true;
        FileCheckpoint bad = *cp.file(task.destination.string());
        CHECK_EQ(ResumePlanner(options).decide(bad, task).action, ResumeAction::kRESTART);

        FileCheckpoint good = *cp.file(task.destination.string());
        good.checksum = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
        CHECK_EQ(ResumePlanner(options).decide(good, task).action, ResumeAction::kSKIP);
    }

    TEST_CASE("partial_file_resumes")
    {
        test::TempDir dir;
        auto task = make_task(dir, "disk.vmdk", 10);
        // the file may hold more than the checkpoint recorded, the extra bytes are rewritten
        test::write_file(task.destination, "0123456");
        Checkpoint cp;
        entry_for(cp, task);
        cp.update_file_progress(task.destination.string(), 5, FileStatus::kDOWNLOADING);

        auto plan = ResumePlanner().plan(cp, { task });
        REQUIRE_EQ(plan.tasks.size(), 1);
        CHECK_EQ(plan.tasks[0].offset, 5);
        CHECK_EQ(plan.resumed_bytes, 5);
        CHECK_EQ(plan.decisions[0].action, ResumeAction::kRESUME);
    }

    TEST_CASE("short_partial_file_restarts")
    {
        test::TempDir dir;
        auto task = make_task(dir, "disk.vmdk", 10);
        test::write_file(task.destination, "012");
        Checkpoint cp;
        entry_for(cp, task);
        cp.update_file_progress(task.destination.string(), 5, FileStatus::kDOWNLOADING);

        auto plan = ResumePlanner().plan(cp, { task });
        REQUIRE_EQ(plan.tasks.size(), 1);
        CHECK_EQ(plan.tasks[0].offset, 0);
        CHECK_EQ(plan.decisions[0].action, ResumeAction::kRESTART);
        CHECK_EQ(cp.file(task.destination.string())->status, FileStatus::kPENDING);
    }

    TEST_CASE("pending_and_failed_restart")
    {
        test::TempDir dir;
        auto pending = make_task(dir, "a", 10);
        auto failed = make_task(dir, "b", 10);
        test::write_file(failed.destination, "01234");
        Checkpoint cp;
        entry_for(cp, pending);
        entry_for(cp, failed);
        cp.update_file_progress(failed.destination.string(), 5, FileStatus::kFAILED);

        auto plan = ResumePlanner().plan(cp, { pending, failed });
        REQUIRE_EQ(plan.tasks.size(), 2);
        CHECK_EQ(plan.tasks[0].offset, 0);
        CHECK_EQ(plan.tasks[1].offset, 0);
        CHECK_EQ(cp.file(failed.destination.string())->downloaded_size, 0);
    }

    TEST_CASE("unknown_task_is_added")
    {
        test::TempDir dir;
        auto task = make_task(dir, "new.vmdk", 42);
        Checkpoint cp;
        auto plan = ResumePlanner().plan(cp, { task });
        REQUIRE_EQ(plan.tasks.size(), 1);
        const auto* entry = cp.file(task.destination.string());
        REQUIRE(entry);
        CHECK_EQ(entry->total_size, 42);
        CHECK_EQ(entry->url, task.url);
        CHECK_EQ(entry->status, FileStatus::kPENDING);
    }
}
