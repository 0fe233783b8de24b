#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "chunklift/client/persistence.hpp"

namespace chunklift::client
{

    enum class FileStatus : std::uint8_t
    {
        Pending,
        Incomplete,
        Done
    };

    std::string_view to_string(FileStatus status) noexcept;
    std::optional<FileStatus> file_status_from_string(std::string_view value) noexcept;

    // Absolute generic path -> status.
    using BatchMap = std::map<std::string, FileStatus>;

    struct BatchLoadResult
    {
        BatchMap entries;
        StoreStatus status;
    };

    // Batch-wide record of which files are done, kept until the whole batch completes.
    class BatchState
    {
    public:
        explicit BatchState(std::filesystem::path path);

        BatchLoadResult load() const;

        StoreStatus save(const BatchMap &entries) const;

        StoreStatus clear() const;

        static std::string key_for(const std::filesystem::path &path);

        const std::filesystem::path &path() const noexcept
        {
            return path_;
        }

    private:
        std::filesystem::path path_;
    };

} // namespace chunklift::client
