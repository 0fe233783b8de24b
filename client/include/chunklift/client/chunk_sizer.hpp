#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "chunklift/client/config.hpp"

namespace chunklift::client
{

    // Throughput-adaptive chunk length. Sizes are always whole alignment units within
    // [min_size(), max_size()]; only the caller may cut the last chunk of a file shorter.
    class AdaptiveChunkSizer
    {
    public:
        AdaptiveChunkSizer(const TransferSettings &settings, std::uint64_t file_size);

        std::uint64_t chunk_size() const noexcept
        {
            return current_;
        }

        std::uint64_t min_size() const noexcept
        {
            return min_;
        }

        std::uint64_t max_size() const noexcept
        {
            return max_;
        }

        // Smoothed throughput in bytes per second, 0 before the first sample.
        double average_throughput() const noexcept
        {
            return average_.value_or(0.0);
        }

        // Feeds one accepted chunk. Returns true when the chunk size changed.
        bool record_chunk(std::uint64_t bytes, std::chrono::duration<double> elapsed);

        // Forgets the throughput history and restarts the adjustment interval.
        void reset_measurements() noexcept;

        static std::uint64_t align_up(std::uint64_t bytes) noexcept;
        static std::uint64_t align_down(std::uint64_t bytes) noexcept;

    private:
        TransferSettings settings_;
        std::uint64_t min_;
        std::uint64_t max_;
        std::uint64_t current_;
        std::optional<double> average_;
        unsigned chunks_since_adjust_{0};
    };

} // namespace chunklift::client
