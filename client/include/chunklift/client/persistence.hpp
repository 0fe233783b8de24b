#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "chunklift/error_codes.hpp"

namespace chunklift::client
{

    // Result of a best-effort persistence operation. Failures are reported, never thrown.
    struct StoreStatus
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept
        {
            return code == ErrorCode::Ok;
        }

        static StoreStatus failure(std::string message)
        {
            return StoreStatus{ErrorCode::PersistenceFailed, std::move(message)};
        }
    };

    struct JsonReadResult
    {
        std::optional<nlohmann::json> json;
        StoreStatus status;
    };

    // A missing file yields an empty result with an ok status.
    JsonReadResult read_json_file(const std::filesystem::path &path);

    // Writes through a temporary sibling and renames it over `path`.
    StoreStatus write_json_file(const std::filesystem::path &path, const nlohmann::json &json);

    StoreStatus remove_file(const std::filesystem::path &path);

} // namespace chunklift::client
