#ifndef VMXFER_CONFIG_HPP
#define VMXFER_CONFIG_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <vmxfer/export.hpp>
#include <vmxfer/session.hpp>
#include <vmxfer/transfer.hpp>

namespace vmxfer
{
    namespace fs = std::filesystem;

    class Context;

    // Raised for a malformed configuration document.
    class VMXFER_API config_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Reads the `transfer:` and `retry:` sections into `ctx`. Durations are seconds, byte sizes
    // are integers or carry a K/M/G/T suffix. Unknown keys are ignored.
    VMXFER_API void load_config(Context& ctx, const YAML::Node& root);
    VMXFER_API void load_config_file(Context& ctx, const fs::path& path);

    // Reads the `export:` section.
    VMXFER_API ExportDescriptor load_descriptor(const YAML::Node& root);

    // Reads the `tasks:` list. Relative destinations are resolved against `output_dir`.
    VMXFER_API std::vector<TransferTask> load_tasks(const YAML::Node& root,
                                                    const fs::path& output_dir = {});
}

#endif
