#include "chunklift/client/chunk_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "chunklift/protocol.hpp"

namespace chunklift::client
{

    namespace
    {
        constexpr double kMinimumSampleSeconds = 0.001;
    } // namespace

    AdaptiveChunkSizer::AdaptiveChunkSizer(const TransferSettings &settings, std::uint64_t file_size)
        : settings_(settings),
          min_(align_up(settings.min_chunk_size)),
          max_(std::max(align_down(settings.max_chunk_size), protocol::kChunkAlignment)),
          current_(0)
    {
        if (min_ > max_)
        {
            throw std::invalid_argument("maximum chunk size " + std::to_string(max_) +
                                        " is below the aligned minimum " + std::to_string(min_));
        }
        const auto wanted = file_size == 0 ? settings_.initial_chunk_size : std::min(settings_.initial_chunk_size, file_size);
        current_ = std::clamp(align_up(wanted), min_, max_);
    }

    bool AdaptiveChunkSizer::record_chunk(std::uint64_t bytes, std::chrono::duration<double> elapsed)
    {
        const double seconds = std::max(elapsed.count(), kMinimumSampleSeconds);
        const double sample = static_cast<double>(bytes) / seconds;
        if (average_)
        {
            average_ = settings_.throughput_smoothing * sample + (1.0 - settings_.throughput_smoothing) * *average_;
        }
        else
        {
            average_ = sample;
        }

        if (++chunks_since_adjust_ < settings_.resize_interval_chunks)
        {
            return false;
        }
        chunks_since_adjust_ = 0;

        const double target = *average_ * static_cast<double>(settings_.target_chunk_duration.count());
        const auto target_bytes = static_cast<std::uint64_t>(std::ceil(std::max(target, 1.0)));
        const auto proposed = std::clamp(align_up(target_bytes), min_, max_);
        const auto change = proposed > current_ ? proposed - current_ : current_ - proposed;
        if (static_cast<double>(change) < settings_.resize_hysteresis * static_cast<double>(current_))
        {
            return false;
        }
        current_ = proposed;
        return true;
    }

    void AdaptiveChunkSizer::reset_measurements() noexcept
    {
        average_.reset();
        chunks_since_adjust_ = 0;
    }

    std::uint64_t AdaptiveChunkSizer::align_up(std::uint64_t bytes) noexcept
    {
        const auto units = (bytes + protocol::kChunkAlignment - 1) / protocol::kChunkAlignment;
        return std::max<std::uint64_t>(units, 1) * protocol::kChunkAlignment;
    }

    std::uint64_t AdaptiveChunkSizer::align_down(std::uint64_t bytes) noexcept
    {
        return (bytes / protocol::kChunkAlignment) * protocol::kChunkAlignment;
    }

} // namespace chunklift::client
