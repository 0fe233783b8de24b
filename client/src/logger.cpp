#include "chunklift/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

namespace chunklift::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            else
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("chunklift", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v");
            logger_->set_level(spdlog::level::debug);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            spdlog::warn("Diagnostic log disabled: {}", ex.what());
            logger_.reset();
        }
    }

    spdlog::level::level_enum Logger::level_for(const std::string &tag)
    {
        if (tag == "error")
        {
            return spdlog::level::err;
        }
        if (tag == "warn" || tag == "retry")
        {
            return spdlog::level::warn;
        }
        if (tag == "debug" || tag == "chunk")
        {
            return spdlog::level::debug;
        }
        return spdlog::level::info;
    }

} // namespace chunklift::client
