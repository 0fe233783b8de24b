#include "chunklift/client/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "chunklift/client/chunk_sizer.hpp"
#include "chunklift/protocol.hpp"

namespace chunklift::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_size(const std::string &value, const std::string &option)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || parsed == 0)
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(option + " expects a positive byte count, got '" + value + "'");
            }
        }

        unsigned parse_count(const std::string &value, const std::string &option)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoul(value, &consumed);
                if (consumed != value.size())
                {
                    throw std::invalid_argument(value);
                }
                return static_cast<unsigned>(parsed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(option + " expects a number, got '" + value + "'");
            }
        }

        void validate(const UploaderConfig &config)
        {
            const auto &transfer = config.transfer;
            if (transfer.max_chunk_size < transfer.min_chunk_size)
            {
                throw std::runtime_error("--max-chunk must not be smaller than " +
                                         std::to_string(transfer.min_chunk_size) + " bytes");
            }
            if (transfer.max_chunk_size < protocol::kChunkAlignment)
            {
                throw std::runtime_error("--max-chunk must be at least one 320 KiB alignment unit");
            }
            const auto aligned_min = AdaptiveChunkSizer::align_up(transfer.min_chunk_size);
            if (AdaptiveChunkSizer::align_down(transfer.max_chunk_size) < aligned_min)
            {
                throw std::runtime_error("--max-chunk must be at least " + std::to_string(aligned_min) +
                                         " bytes once rounded down to 320 KiB units");
            }
        }

    } // namespace

    std::filesystem::path default_state_dir()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "ChunkLift";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunklift";
        }
        return std::filesystem::path(".chunklift");
    }

    void apply_config_file(UploaderConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file: " + path.string());
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw std::runtime_error("Config file is not a JSON object: " + path.string());
        }

        try
        {
            if (json.contains("api_base"))
            {
                config.api_base = json.at("api_base").get<std::string>();
            }
            if (json.contains("account"))
            {
                config.account_id = json.at("account").get<std::string>();
            }
            if (json.contains("remote"))
            {
                config.remote_prefix = json.at("remote").get<std::string>();
            }
            if (json.contains("token_file"))
            {
                config.token_file = std::filesystem::path(json.at("token_file").get<std::string>());
            }
            if (json.contains("state_dir"))
            {
                config.state_dir = std::filesystem::path(json.at("state_dir").get<std::string>());
            }
            if (json.contains("log"))
            {
                config.log_path = std::filesystem::path(json.at("log").get<std::string>());
            }
            config.transfer.initial_chunk_size = json.value("initial_chunk", config.transfer.initial_chunk_size);
            config.transfer.max_chunk_size = json.value("max_chunk", config.transfer.max_chunk_size);
            config.transfer.max_consecutive_failures = json.value("max_retries", config.transfer.max_consecutive_failures);
            config.http.max_idle_connections = json.value("max_idle_connections", config.http.max_idle_connections);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid value in config file " + path.string() + ": " + ex.what());
        }
    }

    UploaderConfig parse_arguments(int argc, char *argv[])
    {
        UploaderConfig config;
        config.state_dir = default_state_dir();
        config.api_base = std::string(protocol::kDefaultApiBase);

        // The config file is layered below every command-line option, wherever it appears.
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                apply_config_file(config, std::filesystem::path(argv[i + 1]));
            }
        }

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "--config")
            {
                (void)require_value(index, argc, argv, arg);
            }
            else if (arg == "--base")
            {
                config.base_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--remote")
            {
                config.remote_prefix = require_value(index, argc, argv, arg);
            }
            else if (arg == "--account")
            {
                config.account_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--token-file")
            {
                config.token_file = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--state-dir")
            {
                config.state_dir = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--api-base")
            {
                config.api_base = require_value(index, argc, argv, arg);
            }
            else if (arg == "--initial-chunk")
            {
                config.transfer.initial_chunk_size = parse_size(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--max-chunk")
            {
                config.transfer.max_chunk_size = parse_size(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--max-retries")
            {
                config.transfer.max_consecutive_failures = parse_count(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--clear-sessions")
            {
                config.clear_sessions = true;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.inputs.emplace_back(arg);
            }
        }

        if (config.show_help)
        {
            return config;
        }
        if (config.inputs.empty())
        {
            throw std::runtime_error("No files or directories given");
        }
        validate(config);
        return config;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "Usage: " << program_name << " [options] <path>...\n"
            << "  --base <dir>            base directory for remote relative paths\n"
            << "  --remote <prefix>       remote path prefix\n"
            << "  --account <id>          account identity passed to the token provider\n"
            << "  --token-file <file>     file holding the bearer token (re-read on refresh)\n"
            << "  --state-dir <dir>       persisted session/batch state location\n"
            << "  --config <file>         JSON config file (keys mirror long options)\n"
            << "  --api-base <url>        override the service base URL\n"
            << "  --initial-chunk <bytes> initial chunk size\n"
            << "  --max-chunk <bytes>     maximum chunk size\n"
            << "  --max-retries <n>       consecutive failures before suspending (0 = never)\n"
            << "  --log <file>            diagnostic log file\n"
            << "  --clear-sessions        delete stored upload sessions before starting\n"
            << "  --help                  show this message\n";
        return out.str();
    }

} // namespace chunklift::client
