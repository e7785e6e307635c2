#ifndef VMXFER_TRANSFER_HPP
#define VMXFER_TRANSFER_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include <vmxfer/errors.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    namespace fs = std::filesystem;

    // One file to transfer, as produced by a provider client.
    struct TransferTask
    {
        std::string url;
        fs::path destination;
        std::size_t expected_size = 0;
        std::string name;

        // Byte offset to resume from. Set by the resume planner, 0 for a fresh download.
        std::size_t offset = 0;
    };

    struct TransferResult
    {
        TransferTask task;
        bool success = false;
        std::optional<TransferError> error;
        std::chrono::steady_clock::duration duration{};
        std::size_t bytes_written = 0;

        bool cancelled() const noexcept
        {
            return error && error->is_cancelled();
        }
    };

    struct Progress
    {
        std::size_t downloaded = 0;
        std::size_t total = 0;
        double speed_mbps = 0.0;

        double ratio() const noexcept
        {
            return total == 0 ? 0.0 : static_cast<double>(downloaded) / static_cast<double>(total);
        }
    };
}

#endif
