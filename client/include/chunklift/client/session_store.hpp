#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunklift/client/persistence.hpp"

namespace chunklift::client
{

    struct SessionDescriptor
    {
        std::string upload_url;
        std::string remote_path;
        std::uint64_t file_size{};
        // Last checkpointed server-confirmed offset.
        std::uint64_t uploaded{};
        std::chrono::system_clock::time_point last_update{};
    };

    struct SessionLoadResult
    {
        std::optional<SessionDescriptor> descriptor;
        StoreStatus status;
    };

    // Key of one resumable attempt: changes whenever the file's size or modification time does.
    std::string session_fingerprint(const std::filesystem::path &absolute_path, const std::string &remote_path,
                                    std::uint64_t file_size, std::int64_t modified_seconds);

    // Durable fingerprint -> descriptor records, one JSON file per in-flight upload.
    class SessionStore
    {
    public:
        explicit SessionStore(std::filesystem::path directory);

        SessionLoadResult load(const std::string &key) const;

        StoreStatus save(const std::string &key, const SessionDescriptor &descriptor) const;

        StoreStatus remove(const std::string &key) const;

        // Drops every stored session.
        StoreStatus clear() const;

        const std::filesystem::path &directory() const noexcept
        {
            return directory_;
        }

    private:
        std::filesystem::path session_path(const std::string &key) const;

        std::filesystem::path directory_;
    };

} // namespace chunklift::client
