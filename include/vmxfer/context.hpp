#ifndef VMXFER_CONTEXT_HPP
#define VMXFER_CONTEXT_HPP

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <vmxfer/export.hpp>
#include <vmxfer/curl.hpp>
#include <vmxfer/retry.hpp>

namespace vmxfer
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    // Options provided when starting a vmxfer context.
    struct ContextOptions
    {
        // If set, specifies which SSL backend to use with CURL.
        std::optional<ssl_backend_t> ssl_backend;
    };

    class VMXFER_API Context
    {
    public:
        int verbosity = 0;

        // worker pool
        std::size_t parallelism = 4;
        // 0 means twice the parallelism
        std::size_t queue_capacity = 0;
        std::size_t chunk_size = 32 * 1024;
        std::chrono::milliseconds progress_interval{ 500 };

        // bandwidth, bytes per second, 0 = unlimited
        std::size_t bandwidth_limit = 0;
        std::size_t bandwidth_burst = 0;
        bool adaptive_bandwidth = false;
        std::size_t bandwidth_min = 1024 * 1024;
        std::size_t bandwidth_max = 100 * 1024 * 1024;

        // checkpoints
        bool enable_checkpoints = true;
        bool resume_from_checkpoint = false;
        // 0 = only save after every completed file
        std::chrono::seconds checkpoint_interval{ 0 };
        bool checkpoint_save_on_complete = true;
        // overrides {output_dir}/.{name}.checkpoint when set
        fs::path checkpoint_path;
        bool verify_checksum_on_resume = false;
        bool compute_checksums = false;

        RetryConfig retry;

        // ssl options
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        std::string user_agent = "vmxfer";
        proxy_map_type proxy_map;
        std::vector<std::string> additional_httpheaders;

        std::size_t effective_queue_capacity() const noexcept
        {
            return queue_capacity != 0 ? queue_capacity : 2 * std::max<std::size_t>(parallelism, 1);
        }

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context(ContextOptions options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

}

#endif
