#include "chunklift/client/session_store.hpp"

#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunklift/crypto.hpp"

namespace chunklift::client
{

    namespace
    {

        nlohmann::json to_json(const SessionDescriptor &descriptor)
        {
            return {
                {"uploadUrl", descriptor.upload_url},
                {"remote_path", descriptor.remote_path},
                {"file_size", descriptor.file_size},
                {"uploaded", descriptor.uploaded},
                {"last_update", std::chrono::duration_cast<std::chrono::seconds>(descriptor.last_update.time_since_epoch()).count()},
            };
        }

        std::optional<SessionDescriptor> descriptor_from_json(const nlohmann::json &json)
        {
            if (!json.is_object())
            {
                return std::nullopt;
            }
            SessionDescriptor descriptor{};
            descriptor.upload_url = json.value("uploadUrl", std::string{});
            descriptor.remote_path = json.value("remote_path", std::string{});
            descriptor.file_size = json.value("file_size", 0ULL);
            descriptor.uploaded = json.value("uploaded", 0ULL);
            const auto seconds = json.value("last_update", 0LL);
            descriptor.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
            if (descriptor.upload_url.empty())
            {
                return std::nullopt;
            }
            return descriptor;
        }

    } // namespace

    std::string session_fingerprint(const std::filesystem::path &absolute_path, const std::string &remote_path,
                                    std::uint64_t file_size, std::int64_t modified_seconds)
    {
        const auto base = absolute_path.lexically_normal().generic_string() + "|" + remote_path + "|" +
                          std::to_string(file_size) + "|" + std::to_string(modified_seconds);
        return crypto::sha256_hex(base);
    }

    SessionStore::SessionStore(std::filesystem::path directory)
        : directory_(std::move(directory)) {}

    SessionLoadResult SessionStore::load(const std::string &key) const
    {
        auto read = read_json_file(session_path(key));
        if (!read.status.ok() || !read.json)
        {
            return {std::nullopt, std::move(read.status)};
        }
        try
        {
            auto descriptor = descriptor_from_json(*read.json);
            if (!descriptor)
            {
                return {std::nullopt, StoreStatus::failure("Session record " + key + " has no upload URL")};
            }
            return {std::move(descriptor), {}};
        }
        catch (const nlohmann::json::exception &ex)
        {
            return {std::nullopt, StoreStatus::failure("Session record " + key + " is invalid: " + ex.what())};
        }
    }

    StoreStatus SessionStore::save(const std::string &key, const SessionDescriptor &descriptor) const
    {
        return write_json_file(session_path(key), to_json(descriptor));
    }

    StoreStatus SessionStore::remove(const std::string &key) const
    {
        return remove_file(session_path(key));
    }

    StoreStatus SessionStore::clear() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(directory_, ec))
        {
            return {};
        }
        std::vector<std::filesystem::path> victims;
        for (const auto &entry : std::filesystem::directory_iterator(directory_, ec))
        {
            std::error_code entry_ec;
            if (entry.is_regular_file(entry_ec) && entry.path().extension() == ".json")
            {
                victims.push_back(entry.path());
            }
        }
        if (ec)
        {
            return StoreStatus::failure("Cannot list " + directory_.string() + ": " + ec.message());
        }
        StoreStatus status;
        for (const auto &path : victims)
        {
            auto removed = remove_file(path);
            if (!removed.ok())
            {
                status = std::move(removed);
            }
        }
        return status;
    }

    std::filesystem::path SessionStore::session_path(const std::string &key) const
    {
        return directory_ / (key + ".json");
    }

} // namespace chunklift::client
