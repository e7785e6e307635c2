#include <chrono>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vmxfer/config.hpp>
#include <vmxfer/context.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    namespace
    {
        YAML::Node section(const YAML::Node& root, const char* name)
        {
            if (!root.IsMap())
                throw config_error("configuration root must be a mapping");
            YAML::Node node = root[name];
            if (node && !node.IsNull() && !node.IsMap())
                throw config_error(fmt::format("'{}' must be a mapping", name));
            return node;
        }

        template <class T>
        void read(const YAML::Node& node, const char* key, T& out)
        {
            if (!node || !node[key])
                return;
            try
            {
                out = node[key].as<T>();
            }
            catch (const YAML::BadConversion&)
            {
                throw config_error(fmt::format("invalid value for '{}'", key));
            }
        }

        std::size_t as_size(const YAML::Node& value, const std::string& key)
        {
            if (!value.IsScalar())
                throw config_error(fmt::format("'{}' must be a byte size", key));
            try
            {
                return static_cast<std::size_t>(parse_byte_size(value.Scalar()));
            }
            catch (const std::invalid_argument& e)
            {
                throw config_error(fmt::format("invalid byte size for '{}': {}", key, e.what()));
            }
            catch (const std::out_of_range& e)
            {
                throw config_error(fmt::format("invalid byte size for '{}': {}", key, e.what()));
            }
        }

        void read_size(const YAML::Node& node, const char* key, std::size_t& out)
        {
            if (!node || !node[key])
                return;
            out = as_size(node[key], key);
        }

        template <class Duration>
        void read_seconds(const YAML::Node& node, const char* key, Duration& out)
        {
            double seconds = 0;
            if (!node || !node[key])
                return;
            read(node, key, seconds);
            if (seconds < 0)
                throw config_error(fmt::format("'{}' must not be negative", key));
            out = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds));
        }
    }

    void load_config(Context& ctx, const YAML::Node& root)
    {
        const YAML::Node transfer = section(root, "transfer");
        if (transfer)
        {
            read(transfer, "parallelism", ctx.parallelism);
            if (ctx.parallelism == 0)
                throw config_error("'parallelism' must be at least 1");
            read(transfer, "queue_capacity", ctx.queue_capacity);
            read_size(transfer, "chunk_size", ctx.chunk_size);
            if (ctx.chunk_size == 0)
                throw config_error("'chunk_size' must not be 0");
            read_seconds(transfer, "progress_interval", ctx.progress_interval);

            read_size(transfer, "bandwidth_limit", ctx.bandwidth_limit);
            read_size(transfer, "bandwidth_burst", ctx.bandwidth_burst);
            read(transfer, "adaptive_bandwidth", ctx.adaptive_bandwidth);
            read_size(transfer, "bandwidth_min", ctx.bandwidth_min);
            read_size(transfer, "bandwidth_max", ctx.bandwidth_max);

            read(transfer, "enable_checkpoints", ctx.enable_checkpoints);
            read(transfer, "resume_from_checkpoint", ctx.resume_from_checkpoint);
            read_seconds(transfer, "checkpoint_interval", ctx.checkpoint_interval);
            read(transfer, "checkpoint_save_on_complete", ctx.checkpoint_save_on_complete);
            std::string checkpoint_path;
            read(transfer, "checkpoint_path", checkpoint_path);
            if (!checkpoint_path.empty())
                ctx.checkpoint_path = checkpoint_path;
            read(transfer, "verify_checksum_on_resume", ctx.verify_checksum_on_resume);
            read(transfer, "compute_checksums", ctx.compute_checksums);

            read(transfer, "connect_timeout", ctx.connect_timeout);
            read(transfer, "low_speed_time", ctx.low_speed_time);
            read(transfer, "low_speed_limit", ctx.low_speed_limit);
            read(transfer, "disable_ssl", ctx.disable_ssl);
            std::string ca_info;
            read(transfer, "ssl_ca_info", ca_info);
            if (!ca_info.empty())
                ctx.ssl_ca_info = ca_info;
            read(transfer, "user_agent", ctx.user_agent);
            read(transfer, "proxies", ctx.proxy_map);
            read(transfer, "headers", ctx.additional_httpheaders);
        }

        const YAML::Node retry = section(root, "retry");
        if (retry)
        {
            read(retry, "max_attempts", ctx.retry.max_attempts);
            if (ctx.retry.max_attempts == 0)
                throw config_error("'max_attempts' must be at least 1");
            read_seconds(retry, "initial_delay", ctx.retry.initial_delay);
            read_seconds(retry, "max_delay", ctx.retry.max_delay);
            read(retry, "multiplier", ctx.retry.multiplier);
            read(retry, "jitter", ctx.retry.jitter);
        }
    }

    void load_config_file(Context& ctx, const fs::path& path)
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(path.string());
        }
        catch (const YAML::Exception& e)
        {
            throw config_error(fmt::format("cannot load {}: {}", path.string(), e.what()));
        }
        spdlog::info("Loading configuration from {}", path.string());
        load_config(ctx, root);
    }

    ExportDescriptor load_descriptor(const YAML::Node& root)
    {
        ExportDescriptor descriptor;
        const YAML::Node node = section(root, "export");
        if (!node)
            return descriptor;

        read(node, "name", descriptor.subject_name);
        read(node, "provider", descriptor.provider);
        read(node, "format", descriptor.format);
        std::string output_dir;
        read(node, "output_dir", output_dir);
        descriptor.output_dir = output_dir;
        read(node, "metadata", descriptor.metadata);
        return descriptor;
    }

    std::vector<TransferTask> load_tasks(const YAML::Node& root, const fs::path& output_dir)
    {
        std::vector<TransferTask> tasks;
        if (!root.IsMap())
            throw config_error("configuration root must be a mapping");
        const YAML::Node list = root["tasks"];
        if (!list)
            return tasks;
        if (!list.IsSequence())
            throw config_error("'tasks' must be a list");

        for (std::size_t i = 0; i < list.size(); ++i)
        {
            const YAML::Node item = list[i];
            if (!item.IsMap())
                throw config_error(fmt::format("task #{} must be a mapping", i));

            TransferTask task;
            std::string destination;
            read(item, "url", task.url);
            read(item, "destination", destination);
            if (task.url.empty() || destination.empty())
                throw config_error(fmt::format("task #{} needs a url and a destination", i));

            task.destination = destination;
            if (task.destination.is_relative() && !output_dir.empty())
                task.destination = output_dir / task.destination;
            read_size(item, "size", task.expected_size);
            read(item, "name", task.name);
            if (task.name.empty())
                task.name = task.destination.filename().string();
            tasks.push_back(std::move(task));
        }
        return tasks;
    }
}
