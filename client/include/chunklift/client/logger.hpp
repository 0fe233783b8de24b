#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace chunklift::client
{

    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path = std::nullopt);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level_for(tag), "[{}] {}", tag,
                         std::string(buf.data(), buf.size()));
        }

    private:
        static spdlog::level::level_enum level_for(const std::string &tag);

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace chunklift::client
