#include "chunklift/client/persistence.hpp"

#include <fstream>
#include <system_error>

namespace chunklift::client
{

    JsonReadResult read_json_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            if (ec)
            {
                return {std::nullopt, StoreStatus::failure("Cannot access " + path.string() + ": " + ec.message())};
            }
            return {std::nullopt, {}};
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            return {std::nullopt, StoreStatus::failure("Cannot open " + path.string())};
        }
        auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded())
        {
            return {std::nullopt, StoreStatus::failure("Malformed JSON in " + path.string())};
        }
        return {std::move(json), {}};
    }

    StoreStatus write_json_file(const std::filesystem::path &path, const nlohmann::json &json)
    {
        std::error_code ec;
        const auto dir = path.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                return StoreStatus::failure("Cannot create " + dir.string() + ": " + ec.message());
            }
        }

        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                return StoreStatus::failure("Cannot open " + temp_path.string() + " for writing");
            }
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                return StoreStatus::failure("Write to " + temp_path.string() + " failed");
            }
        }

        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            return StoreStatus::failure("Cannot replace " + path.string() + ": " + ec.message());
        }
        return {};
    }

    StoreStatus remove_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            return StoreStatus::failure("Cannot remove " + path.string() + ": " + ec.message());
        }
        return {};
    }

} // namespace chunklift::client
