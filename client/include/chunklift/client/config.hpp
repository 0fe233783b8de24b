#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunklift::client
{

    // Tuning of the per-file transfer loop.
    struct TransferSettings
    {
        std::uint64_t initial_chunk_size{8ULL * 1024 * 1024};
        std::uint64_t min_chunk_size{2ULL * 1024 * 1024};
        std::uint64_t max_chunk_size{60ULL * 1024 * 1024};
        std::chrono::seconds target_chunk_duration{8};
        double throughput_smoothing{0.3};
        unsigned resize_interval_chunks{2};
        double resize_hysteresis{0.25};
        unsigned checkpoint_interval_chunks{3};
        std::chrono::seconds checkpoint_interval{30};
        std::chrono::milliseconds backoff_base{1000};
        std::chrono::milliseconds backoff_cap{30000};
        std::chrono::milliseconds conflict_delay{1000};
        // 0 retries transient failures until success or cancellation.
        unsigned max_consecutive_failures{0};
        unsigned max_auth_rejections{3};
    };

    struct HttpSettings
    {
        long max_idle_connections{4};
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds control_timeout{10};
        // A chunk PUT is aborted when it moves less than 1 byte/s for this long.
        std::chrono::seconds stall_timeout{60};
    };

    struct UploaderConfig
    {
        std::vector<std::filesystem::path> inputs;
        std::optional<std::filesystem::path> base_dir;
        std::string remote_prefix;
        std::string account_id;
        std::optional<std::filesystem::path> token_file;
        std::filesystem::path state_dir;
        std::string api_base;
        std::optional<std::filesystem::path> log_path;
        bool clear_sessions{false};
        bool show_help{false};
        TransferSettings transfer;
        HttpSettings http;
    };

    std::filesystem::path default_state_dir();

    // Applies the keys of a JSON config file on top of `config`.
    void apply_config_file(UploaderConfig &config, const std::filesystem::path &path);

    UploaderConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace chunklift::client
