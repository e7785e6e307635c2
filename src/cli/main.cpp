#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <vmxfer/config.hpp>
#include <vmxfer/context.hpp>
#include <vmxfer/fetcher.hpp>
#include <vmxfer/session.hpp>
#include <vmxfer/utils.hpp>

using namespace vmxfer;

static bool show_progress_bars = true;
static volatile std::sig_atomic_t interrupted = 0;

extern "C" void
handle_sigint(int)
{
    interrupted = 1;
}

void
progress_callback(const Progress& progress)
{
    if (!show_progress_bars || progress.total == 0)
        return;

    const double ratio = std::min(progress.ratio(), 1.0);
    const std::size_t bar_width = 50;
    const std::size_t pos = static_cast<std::size_t>(bar_width * ratio);
    std::cout << "\r[";
    for (std::size_t i = 0; i < bar_width; ++i)
    {
        if (i < pos)
            std::cout << "=";
        else if (i == pos)
            std::cout << ">";
        else
            std::cout << " ";
    }
    std::cout << fmt::format("] {:5.1f} % {} / {} ({:.2f} MiB/s)",
                             ratio * 100.0,
                             format_bytes(progress.downloaded),
                             format_bytes(progress.total),
                             progress.speed_mbps);
    std::cout.flush();
}

int
handle_download(Context& ctx,
                const YAML::Node& config,
                const std::string& outdir,
                const CancellationToken& token)
{
    ExportDescriptor descriptor = load_descriptor(config);
    if (!outdir.empty())
        descriptor.output_dir = outdir;
    if (descriptor.output_dir.empty())
        descriptor.output_dir = fs::current_path();
    if (descriptor.subject_name.empty())
        descriptor.subject_name = descriptor.output_dir.filename().string();

    auto tasks = load_tasks(config, descriptor.output_dir);
    if (tasks.empty())
    {
        spdlog::error("No tasks to transfer");
        return 1;
    }

    TransferSession session(ctx, std::make_shared<CurlFetcher>(ctx), token);
    auto report = session.run(descriptor, tasks, progress_callback);
    if (show_progress_bars)
        std::cout << std::endl;

    if (!report)
    {
        spdlog::critical("Export failed: {}", report.error().reason);
        return 1;
    }

    for (const auto& result : report->results)
    {
        if (!result.success && !result.cancelled() && result.error)
        {
            std::cerr << "Failed: " << result.task.name << ": " << result.error->reason
                      << std::endl;
        }
    }
    std::cout << fmt::format("{} transferred, {} failed, {} skipped",
                             report->succeeded,
                             report->failed,
                             report->skipped.size())
              << std::endl;

    if (report->cancelled)
    {
        if (report->checkpoint_path)
            std::cout << "Interrupted, resume with --resume (checkpoint "
                      << report->checkpoint_path->string() << ")" << std::endl;
        return 2;
    }
    return report->success() ? 0 : 1;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Resilient parallel transfer of exported virtual machine disks" };

    bool resume = false;
    bool verbose = false;
    bool disable_ssl = false;
    std::string file, outdir, bandwidth;
    std::size_t parallelism = 0;

    CLI::App* s_dl = app.add_subcommand("download", "Download the files of an export");
    s_dl->add_option("-f", file, "YAML file describing the export and its tasks")->required();
    s_dl->add_option("-o", outdir, "Output directory");
    s_dl->add_flag("-r,--resume", resume, "Resume from the checkpoint of a previous run");
    s_dl->add_option("-j,--parallel", parallelism, "Number of parallel transfers");
    s_dl->add_option("--limit", bandwidth, "Bandwidth limit, e.g. 10M (bytes per second)");
    s_dl->add_flag("-k", disable_ssl, "Disable SSL verification");
    s_dl->add_flag("-v", verbose, "Enable verbose output");
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    vmxfer::Context ctx;

    if (verbose)
    {
        show_progress_bars = false;
        ctx.set_verbosity(1);
    }

    YAML::Node config;
    try
    {
        spdlog::info("Loading file {}", file);
        config = YAML::LoadFile(file);
        load_config(ctx, config);
        if (resume)
            ctx.resume_from_checkpoint = true;
        if (disable_ssl)
            ctx.disable_ssl = true;
        if (parallelism > 0)
            ctx.parallelism = parallelism;
        if (!bandwidth.empty())
            ctx.bandwidth_limit = static_cast<std::size_t>(parse_byte_size(bandwidth));
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Invalid configuration: {}", e.what());
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    CancellationToken token;
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);
    std::atomic<bool> done{ false };
    std::thread watcher(
        [&]()
        {
            while (!done)
            {
                if (interrupted)
                {
                    token.cancel();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

    int ret = 1;
    try
    {
        if (app.got_subcommand("download"))
            ret = handle_download(ctx, config, outdir, token);
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
        std::cerr << e.what() << std::endl;
        ret = 1;
    }

    done = true;
    watcher.join();
    return ret;
}
