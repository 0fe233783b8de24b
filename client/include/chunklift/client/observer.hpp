#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace chunklift::client
{

    struct ProgressUpdate
    {
        std::uint64_t uploaded_bytes{};
        std::uint64_t total_bytes{};
        double speed_bytes_per_sec{};
        double eta_seconds{};
    };

    // Receives progress and user-facing log lines from a running transfer.
    class TransferObserver
    {
    public:
        virtual ~TransferObserver() = default;

        virtual void on_progress(const ProgressUpdate &update) = 0;

        virtual void on_log(const std::string &message) = 0;
    };

    using ProgressCallback = std::function<void(std::uint64_t uploaded_bytes, std::uint64_t total_bytes,
                                                double speed_bytes_per_sec, double eta_seconds)>;
    using LogCallback = std::function<void(const std::string &message)>;
    using CancellationCheck = std::function<bool()>;

} // namespace chunklift::client
