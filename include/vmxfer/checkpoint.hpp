#ifndef VMXFER_CHECKPOINT_HPP
#define VMXFER_CHECKPOINT_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <vmxfer/enums.hpp>
#include <vmxfer/errors.hpp>
#include <vmxfer/export.hpp>

namespace vmxfer
{
    namespace fs = std::filesystem;

    // Progress of one file of an export.
    // Invariant: downloaded_size <= total_size, and == total_size once completed.
    struct FileCheckpoint
    {
        std::string path;
        std::string url;
        std::size_t total_size = 0;
        std::size_t downloaded_size = 0;
        // SHA-256, lowercase hex, empty when not computed
        std::string checksum;
        FileStatus status = FileStatus::kPENDING;
        std::chrono::system_clock::time_point last_modified{};
        std::size_t retry_count = 0;
    };

    VMXFER_API void to_json(nlohmann::json& j, const FileCheckpoint& f);
    VMXFER_API void from_json(const nlohmann::json& j, FileCheckpoint& f);

    // Durable record of one export operation.
    class VMXFER_API Checkpoint
    {
    public:
        static constexpr const char* current_version = "1.0";

        std::string version = current_version;
        std::string subject_name;
        std::string provider;
        std::string format;
        fs::path output_path;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point updated_at{};
        std::map<std::string, std::string> metadata;
        std::vector<FileCheckpoint> files;

        Checkpoint() = default;
        Checkpoint(std::string subject_name,
                   std::string provider,
                   std::string format,
                   fs::path output_path);

        // Adds a pending entry, or returns the existing one for `path`.
        FileCheckpoint& add_file(const std::string& path, const std::string& url, std::size_t total_size);

        // Returns false if there is no entry for `path`.
        bool update_file_progress(const std::string& path,
                                  std::size_t downloaded_size,
                                  FileStatus status);

        FileCheckpoint* file(const std::string& path);
        const FileCheckpoint* file(const std::string& path) const;

        // False for a checkpoint without files.
        bool is_complete() const;
        // Downloaded over total bytes, in [0, 1].
        double progress() const;

        std::size_t total_size() const;
        std::size_t downloaded_size() const;

        nlohmann::json to_json() const;
        // Unknown fields are ignored and missing ones take their zero value.
        static tl::expected<Checkpoint, TransferError> from_json(const nlohmann::json& j);
    };

    // Reads and writes one checkpoint file. Each save is atomic: the file on disk is always
    // either the previous or the new complete document. Not safe for overlapping saves to the
    // same path, callers serialize them.
    class VMXFER_API CheckpointStore
    {
    public:
        explicit CheckpointStore(fs::path path);

        const fs::path& path() const noexcept
        {
            return m_path;
        }

        tl::expected<void, TransferError> save(const Checkpoint& checkpoint) const;
        // XF_NOT_FOUND if there is no file, XF_CORRUPT if it can't be parsed.
        tl::expected<Checkpoint, TransferError> load() const;
        // A missing file is not an error.
        tl::expected<void, TransferError> remove() const;
        bool exists() const;

        // {output_dir}/.{subject_name}.checkpoint
        static fs::path default_path(const fs::path& output_dir, const std::string& subject_name);

    private:
        fs::path m_path;
    };

    // SHA-256 of a file, lowercase hex.
    VMXFER_API tl::expected<std::string, TransferError> compute_checksum(const fs::path& path);

    VMXFER_API tl::expected<FileStatus, std::string> parse_file_status(const std::string& status);
}

#endif
