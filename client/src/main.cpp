#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "chunklift/client/auth_provider.hpp"
#include "chunklift/client/batch_state.hpp"
#include "chunklift/client/config.hpp"
#include "chunklift/client/logger.hpp"
#include "chunklift/client/remote_session.hpp"
#include "chunklift/client/session_store.hpp"
#include "chunklift/client/upload_worker.hpp"
#include "chunklift/version.hpp"

namespace
{

    constexpr int kExitIncomplete = 2;

    std::filesystem::path absolute_normal(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

    // Expands directories into their regular files, each directory's files sorted.
    std::vector<std::filesystem::path> collect_files(const std::vector<std::filesystem::path> &inputs)
    {
        std::vector<std::filesystem::path> files;
        for (const auto &input : inputs)
        {
            const auto path = absolute_normal(input);
            if (std::filesystem::is_directory(path))
            {
                std::vector<std::filesystem::path> found;
                for (const auto &entry : std::filesystem::recursive_directory_iterator(path))
                {
                    if (entry.is_regular_file())
                    {
                        found.push_back(entry.path().lexically_normal());
                    }
                }
                std::sort(found.begin(), found.end());
                files.insert(files.end(), found.begin(), found.end());
            }
            else if (std::filesystem::is_regular_file(path))
            {
                files.push_back(path);
            }
            else
            {
                throw std::runtime_error("Not a file or directory: " + input.string());
            }
        }
        return files;
    }

    std::optional<std::filesystem::path> resolve_base_dir(const chunklift::client::UploaderConfig &config)
    {
        if (config.base_dir)
        {
            return absolute_normal(*config.base_dir);
        }
        if (config.inputs.size() == 1 && std::filesystem::is_directory(config.inputs.front()))
        {
            return absolute_normal(config.inputs.front());
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace chunklift::client;

    UploaderConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.show_help)
    {
        std::cout << "ChunkLift " << chunklift::version() << "\n"
                  << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    auto console = spdlog::stdout_color_mt("console");
    console->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
    spdlog::set_default_logger(console);

    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> base_dir;
    try
    {
        files = collect_files(config.inputs);
        base_dir = resolve_base_dir(config);
    }
    catch (const std::exception &ex)
    {
        spdlog::error("{}", ex.what());
        return EXIT_FAILURE;
    }
    if (files.empty())
    {
        spdlog::warn("Nothing to upload");
        return EXIT_SUCCESS;
    }

    Logger logger(config.log_path);
    logger.log("info", "chunklift ", chunklift::version(), " starting with ", files.size(), " files");

    SessionStore sessions(config.state_dir / "sessions");
    BatchState batch(config.state_dir / "batch.json");
    if (config.clear_sessions)
    {
        const auto cleared = sessions.clear();
        if (!cleared.ok())
        {
            spdlog::warn("Could not clear stored sessions: {}", cleared.message);
        }
    }

    TokenFileAuthProvider auth(config.token_file, std::cin, std::cout);
    const auto api_base = config.api_base;
    const auto http = config.http;
    PlannerServices services{
        sessions,
        batch,
        auth,
        [api_base, http]()
        { return std::make_unique<GraphSessionProtocol>(api_base, http); },
        logger,
        config.transfer,
    };

    std::atomic<bool> cancelled{false};
    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&cancelled](const std::error_code &ec, int /*signal*/)
                       {
        if (!ec) {
            cancelled = true;
            spdlog::warn("Cancelling after the current chunk...");
        } });
    std::thread signal_thread([&signal_context]
                              { signal_context.run(); });

    bool success = false;
    try
    {
        UploadWorker worker(std::move(services));
        success = worker.upload_batch(
            files, base_dir, config.remote_prefix, config.account_id,
            [](std::uint64_t uploaded, std::uint64_t total, double speed, double eta)
            {
                std::cout << "\rUploaded " << uploaded << " / " << total << " bytes";
                if (speed > 0.0)
                {
                    std::cout << spdlog::fmt_lib::format(" ({:.2f} MB/s, ETA {:.0f}s)", speed / (1024.0 * 1024.0), eta);
                }
                std::cout << "   " << std::flush;
            },
            [](const std::string &message)
            { std::cout << "\n"
                        << message << std::endl; },
            [&cancelled]()
            { return cancelled.load(); });
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Upload failed: {}", ex.what());
        logger.log("error", "fatal: ", ex.what());
    }

    signals.cancel();
    signal_context.stop();
    signal_thread.join();

    std::cout << std::endl;
    if (!success)
    {
        spdlog::warn("Batch incomplete; run the same command again to resume");
        return kExitIncomplete;
    }
    return EXIT_SUCCESS;
}
