#include "chunklift/client/batch_state.hpp"

#include <system_error>

#include <nlohmann/json.hpp>

namespace chunklift::client
{

    std::string_view to_string(FileStatus status) noexcept
    {
        switch (status)
        {
        case FileStatus::Pending:
            return "pending";
        case FileStatus::Incomplete:
            return "incomplete";
        case FileStatus::Done:
            return "done";
        }
        return "pending";
    }

    std::optional<FileStatus> file_status_from_string(std::string_view value) noexcept
    {
        if (value == "pending")
        {
            return FileStatus::Pending;
        }
        if (value == "incomplete")
        {
            return FileStatus::Incomplete;
        }
        if (value == "done")
        {
            return FileStatus::Done;
        }
        return std::nullopt;
    }

    BatchState::BatchState(std::filesystem::path path)
        : path_(std::move(path)) {}

    BatchLoadResult BatchState::load() const
    {
        auto read = read_json_file(path_);
        if (!read.status.ok() || !read.json)
        {
            return {{}, std::move(read.status)};
        }
        if (!read.json->is_object())
        {
            return {{}, StoreStatus::failure("Batch record " + path_.string() + " is not an object")};
        }
        BatchMap entries;
        for (const auto &[key, value] : read.json->items())
        {
            const auto status = value.is_string() ? file_status_from_string(value.get<std::string>()) : std::nullopt;
            entries[key] = status.value_or(FileStatus::Pending);
        }
        return {std::move(entries), {}};
    }

    StoreStatus BatchState::save(const BatchMap &entries) const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[key, status] : entries)
        {
            json[key] = std::string(to_string(status));
        }
        return write_json_file(path_, json);
    }

    StoreStatus BatchState::clear() const
    {
        return remove_file(path_);
    }

    std::string BatchState::key_for(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal().generic_string();
    }

} // namespace chunklift::client
