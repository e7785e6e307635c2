#include <algorithm>
#include <fstream>
#include <sstream>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vmxfer/checkpoint.hpp>
#include <vmxfer/fileio.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    tl::expected<FileStatus, std::string> parse_file_status(const std::string& status)
    {
        if (status == "pending")
            return FileStatus::kPENDING;
        if (status == "downloading")
            return FileStatus::kDOWNLOADING;
        if (status == "completed")
            return FileStatus::kCOMPLETED;
        if (status == "failed")
            return FileStatus::kFAILED;
        return tl::make_unexpected(fmt::format("unknown file status '{}'", status));
    }

    void to_json(nlohmann::json& j, const FileCheckpoint& f)
    {
        j = nlohmann::json{ { "path", f.path },
                            { "url", f.url },
                            { "totalSize", f.total_size },
                            { "downloadedSize", f.downloaded_size },
                            { "checksum", f.checksum },
                            { "status", to_string(f.status) },
                            { "lastModified", format_timestamp(f.last_modified) },
                            { "retryCount", f.retry_count } };
    }

    void from_json(const nlohmann::json& j, FileCheckpoint& f)
    {
        f.path = j.value("path", std::string());
        f.url = j.value("url", std::string());
        f.total_size = j.value("totalSize", std::size_t(0));
        f.downloaded_size = j.value("downloadedSize", std::size_t(0));
        f.checksum = j.value("checksum", std::string());
        f.retry_count = j.value("retryCount", std::size_t(0));
        f.last_modified = parse_timestamp(j.value("lastModified", std::string()));

        auto status = parse_file_status(j.value("status", std::string("pending")));
        if (status)
        {
            f.status = status.value();
        }
        else
        {
            spdlog::warn("Checkpoint entry {}: {}, treating it as pending", f.path, status.error());
            f.status = FileStatus::kPENDING;
        }

        if (f.total_size != 0 && f.downloaded_size > f.total_size)
        {
            spdlog::warn("Checkpoint entry {} records more bytes than its size", f.path);
            f.downloaded_size = f.total_size;
        }
        if (f.status == FileStatus::kCOMPLETED && f.downloaded_size != f.total_size)
        {
            spdlog::warn("Checkpoint entry {} is completed with a size mismatch", f.path);
            f.status = FileStatus::kDOWNLOADING;
        }
    }

    /**************
     * Checkpoint *
     **************/

    Checkpoint::Checkpoint(std::string subject_name,
                           std::string provider,
                           std::string format,
                           fs::path output_path)
        : subject_name(std::move(subject_name))
        , provider(std::move(provider))
        , format(std::move(format))
        , output_path(std::move(output_path))
        , created_at(std::chrono::system_clock::now())
        , updated_at(created_at)
    {
    }

    FileCheckpoint& Checkpoint::add_file(const std::string& path,
                                         const std::string& url,
                                         std::size_t total_size)
    {
        if (auto* existing = file(path))
            return *existing;

        FileCheckpoint entry;
        entry.path = path;
        entry.url = url;
        entry.total_size = total_size;
        entry.last_modified = std::chrono::system_clock::now();
        updated_at = entry.last_modified;
        files.push_back(std::move(entry));
        return files.back();
    }

    bool Checkpoint::update_file_progress(const std::string& path,
                                          std::size_t downloaded_size,
                                          FileStatus status)
    {
        auto* entry = file(path);
        if (!entry)
            return false;

        if (status == FileStatus::kCOMPLETED && entry->total_size == 0)
            entry->total_size = downloaded_size;
        if (entry->total_size != 0)
            downloaded_size = std::min(downloaded_size, entry->total_size);

        entry->downloaded_size = downloaded_size;
        entry->status = status;
        entry->last_modified = std::chrono::system_clock::now();
        updated_at = entry->last_modified;
        return true;
    }

    FileCheckpoint* Checkpoint::file(const std::string& path)
    {
        auto it = std::find_if(
            files.begin(), files.end(), [&](const FileCheckpoint& f) { return f.path == path; });
        return it == files.end() ? nullptr : &*it;
    }

    const FileCheckpoint* Checkpoint::file(const std::string& path) const
    {
        return const_cast<Checkpoint*>(this)->file(path);
    }

    bool Checkpoint::is_complete() const
    {
        if (files.empty())
            return false;
        return std::all_of(files.begin(),
                           files.end(),
                           [](const FileCheckpoint& f)
                           { return f.status == FileStatus::kCOMPLETED; });
    }

    std::size_t Checkpoint::total_size() const
    {
        std::size_t total = 0;
        for (const auto& f : files)
            total += f.total_size;
        return total;
    }

    std::size_t Checkpoint::downloaded_size() const
    {
        std::size_t total = 0;
        for (const auto& f : files)
            total += f.downloaded_size;
        return total;
    }

    double Checkpoint::progress() const
    {
        const std::size_t total = total_size();
        if (total == 0)
            return 0.0;
        return static_cast<double>(downloaded_size()) / static_cast<double>(total);
    }

    nlohmann::json Checkpoint::to_json() const
    {
        nlohmann::json j;
        j["version"] = version;
        j["subjectName"] = subject_name;
        j["provider"] = provider;
        j["format"] = format;
        j["outputPath"] = output_path.string();
        j["createdAt"] = format_timestamp(created_at);
        j["updatedAt"] = format_timestamp(updated_at);
        j["metadata"] = metadata;
        j["files"] = files;
        return j;
    }

    tl::expected<Checkpoint, TransferError> Checkpoint::from_json(const nlohmann::json& j)
    {
        if (!j.is_object())
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS, ErrorCode::XF_CORRUPT, "checkpoint is not a JSON object" });
        }

        Checkpoint cp;
        try
        {
            cp.version = j.value("version", std::string());
            auto version_parts = split(cp.version, ".", 1);
            if (version_parts.empty() || version_parts[0] != "1")
            {
                return tl::make_unexpected(
                    TransferError{ ErrorLevel::SERIOUS,
                                   ErrorCode::XF_CORRUPT,
                                   fmt::format("incompatible checkpoint version: '{}' (expected {})",
                                               cp.version,
                                               current_version) });
            }

            cp.subject_name = j.value("subjectName", std::string());
            cp.provider = j.value("provider", std::string());
            cp.format = j.value("format", std::string());
            cp.output_path = j.value("outputPath", std::string());
            cp.created_at = parse_timestamp(j.value("createdAt", std::string()));
            cp.updated_at = parse_timestamp(j.value("updatedAt", std::string()));
            if (j.contains("metadata") && !j["metadata"].is_null())
                cp.metadata = j["metadata"].get<std::map<std::string, std::string>>();
            if (j.contains("files") && !j["files"].is_null())
                cp.files = j["files"].get<std::vector<FileCheckpoint>>();
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS,
                ErrorCode::XF_CORRUPT,
                fmt::format("invalid checkpoint content: {}", e.what()) });
        }
        return cp;
    }

    /*******************
     * CheckpointStore *
     *******************/

    CheckpointStore::CheckpointStore(fs::path path)
        : m_path(std::move(path))
    {
    }

    fs::path CheckpointStore::default_path(const fs::path& output_dir,
                                           const std::string& subject_name)
    {
        return output_dir / fmt::format(".{}" CHECKPOINT_EXT, subject_name);
    }

    bool CheckpointStore::exists() const
    {
        std::error_code ec;
        return fs::exists(m_path, ec);
    }

    tl::expected<void, TransferError> CheckpointStore::save(const Checkpoint& checkpoint) const
    {
        std::error_code ec;
        if (m_path.has_parent_path())
        {
            fs::create_directories(m_path.parent_path(), ec);
            if (ec)
            {
                return tl::make_unexpected(TransferError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::XF_CANNOTCREATEDIR,
                    fmt::format("Cannot create checkpoint directory {}: {}",
                                m_path.parent_path().string(),
                                ec.message()),
                    Retry::kNON_RETRYABLE });
            }
        }

        const std::string content = checkpoint.to_json().dump(2);
        fs::path tmp_path = m_path;
        tmp_path += CHECKPOINT_TMPEXT;

        {
            FileIO out(tmp_path, FileIO::write_binary, ec);
            if (ec)
            {
                return tl::make_unexpected(
                    TransferError{ ErrorLevel::SERIOUS,
                                   ErrorCode::XF_FILE,
                                   fmt::format("Cannot open {}: {}", tmp_path.string(), ec.message()),
                                   Retry::kNON_RETRYABLE });
            }
            if (out.write(content.data(), content.size()) != content.size())
            {
                return tl::make_unexpected(
                    TransferError{ ErrorLevel::SERIOUS,
                                   ErrorCode::XF_IO,
                                   fmt::format("Short write to {}", tmp_path.string()),
                                   Retry::kNON_RETRYABLE });
            }
            out.sync(ec);
            if (!ec)
                out.close(ec);
            if (ec)
            {
                return tl::make_unexpected(
                    TransferError{ ErrorLevel::SERIOUS,
                                   ErrorCode::XF_IO,
                                   fmt::format("Cannot write {}: {}", tmp_path.string(), ec.message()),
                                   Retry::kNON_RETRYABLE });
            }
        }

        fs::rename(tmp_path, m_path, ec);
        if (ec)
        {
            return tl::make_unexpected(TransferError{
                ErrorLevel::SERIOUS,
                ErrorCode::XF_IO,
                fmt::format("Cannot rename {} to {}: {}", tmp_path.string(), m_path.string(), ec.message()),
                Retry::kNON_RETRYABLE });
        }
        spdlog::debug("Checkpoint saved to {}", m_path.string());
        return {};
    }

    tl::expected<Checkpoint, TransferError> CheckpointStore::load() const
    {
        if (!exists())
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::INFO,
                               ErrorCode::XF_NOT_FOUND,
                               fmt::format("No checkpoint at {}", m_path.string()),
                               Retry::kNON_RETRYABLE });
        }

        std::ifstream in(m_path, std::ios::binary);
        if (!in)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS,
                               ErrorCode::XF_FILE,
                               fmt::format("Cannot read checkpoint {}", m_path.string()),
                               Retry::kNON_RETRYABLE });
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(buffer.str());
        }
        catch (const nlohmann::json::parse_error& e)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS,
                               ErrorCode::XF_CORRUPT,
                               fmt::format("Cannot parse checkpoint {}: {}", m_path.string(), e.what()),
                               Retry::kNON_RETRYABLE });
        }

        auto checkpoint = Checkpoint::from_json(j);
        if (!checkpoint)
        {
            auto error = checkpoint.error();
            error.reason = fmt::format("{}: {}", m_path.string(), error.reason);
            return tl::make_unexpected(error);
        }
        spdlog::info("Loaded checkpoint {} ({} files, {:.1f}% done)",
                     m_path.string(),
                     checkpoint->files.size(),
                     checkpoint->progress() * 100.0);
        return checkpoint;
    }

    tl::expected<void, TransferError> CheckpointStore::remove() const
    {
        std::error_code ec;
        fs::remove(m_path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS,
                               ErrorCode::XF_IO,
                               fmt::format("Cannot delete checkpoint {}: {}", m_path.string(), ec.message()),
                               Retry::kNON_RETRYABLE });
        }
        spdlog::debug("Checkpoint {} deleted", m_path.string());
        return {};
    }

    tl::expected<std::string, TransferError> compute_checksum(const fs::path& path)
    {
        std::string sum = sha256sum(path);
        if (sum.empty())
        {
            return tl::make_unexpected(
                TransferError{ ErrorLevel::SERIOUS,
                               ErrorCode::XF_FILE,
                               fmt::format("Cannot compute checksum of {}", path.string()),
                               Retry::kNON_RETRYABLE });
        }
        return sum;
    }
}
