#include "chunklift/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace chunklift::protocol
{

    namespace
    {

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        std::string_view trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::optional<std::uint64_t> parse_number(std::string_view text)
        {
            text = trim(text);
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value{};
            const auto *first = text.data();
            const auto *last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last)
            {
                return std::nullopt;
            }
            return value;
        }

        bool is_unreserved(unsigned char ch)
        {
            return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/';
        }

        std::string encode_path(std::string_view path)
        {
            static constexpr char kHexDigits[] = "0123456789ABCDEF";
            std::string encoded;
            encoded.reserve(path.size());
            for (const char raw : path)
            {
                const auto ch = static_cast<unsigned char>(raw);
                if (is_unreserved(ch))
                {
                    encoded.push_back(raw);
                }
                else
                {
                    encoded.push_back('%');
                    encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
                    encoded.push_back(kHexDigits[ch & 0x0F]);
                }
            }
            return encoded;
        }

    } // namespace

    std::optional<std::string> RemoteResponse::header(std::string_view name) const
    {
        const auto it = headers.find(to_lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string_view to_string(ChunkResult result) noexcept
    {
        switch (result)
        {
        case ChunkResult::Completed:
            return "completed";
        case ChunkResult::Accepted:
            return "accepted";
        case ChunkResult::AuthRejected:
            return "auth_rejected";
        case ChunkResult::Conflict:
            return "conflict";
        case ChunkResult::SessionNotFound:
            return "session_not_found";
        case ChunkResult::TransportFailure:
            return "transport_failure";
        case ChunkResult::Transient:
            return "transient";
        }
        return "unknown";
    }

    ChunkResult classify_chunk_response(const RemoteResponse &response) noexcept
    {
        if (response.transport_failed)
        {
            return ChunkResult::TransportFailure;
        }
        switch (response.status)
        {
        case 200:
        case 201:
            return ChunkResult::Completed;
        case 202:
            return ChunkResult::Accepted;
        case 401:
            return ChunkResult::AuthRejected;
        case 404:
            return ChunkResult::SessionNotFound;
        case 409:
        case 416:
            return ChunkResult::Conflict;
        default:
            return ChunkResult::Transient;
        }
    }

    bool is_create_success(long status) noexcept
    {
        return status == 200 || status == 201;
    }

    bool is_query_success(long status) noexcept
    {
        return status == 200 || status == 201 || status == 202;
    }

    std::string format_content_range(std::uint64_t start, std::uint64_t length, std::uint64_t total)
    {
        const auto end = length == 0 ? start : start + length - 1;
        return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
    }

    std::optional<std::uint64_t> parse_range_header(std::string_view value)
    {
        value = trim(value);
        constexpr std::string_view kUnit = "bytes";
        if (value.size() >= kUnit.size() && to_lower(value.substr(0, kUnit.size())) == kUnit)
        {
            value.remove_prefix(kUnit.size());
            if (!value.empty() && value.front() == '=')
            {
                value.remove_prefix(1);
            }
        }
        const auto slash = value.find('/');
        if (slash != std::string_view::npos)
        {
            value = value.substr(0, slash);
        }
        const auto dash = value.find('-');
        if (dash == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto start = parse_number(value.substr(0, dash));
        const auto end = parse_number(value.substr(dash + 1));
        if (!start || !end || *end < *start)
        {
            return std::nullopt;
        }
        return *end + 1;
    }

    std::optional<std::uint64_t> parse_expected_ranges(const nlohmann::json &body)
    {
        if (!body.is_object())
        {
            return std::nullopt;
        }
        const auto it = body.find("nextExpectedRanges");
        if (it == body.end() || !it->is_array())
        {
            return std::nullopt;
        }
        std::optional<std::uint64_t> minimum;
        for (const auto &item : *it)
        {
            if (!item.is_string())
            {
                continue;
            }
            const auto text = item.get<std::string>();
            const auto start = parse_number(std::string_view(text).substr(0, text.find('-')));
            if (start && (!minimum || *start < *minimum))
            {
                minimum = start;
            }
        }
        return minimum;
    }

    std::optional<std::uint64_t> parse_confirmed_offset(const RemoteResponse &response)
    {
        for (const auto name : {std::string_view("range"), std::string_view("content-range")})
        {
            if (const auto value = response.header(name))
            {
                if (const auto offset = parse_range_header(*value))
                {
                    return offset;
                }
            }
        }
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded())
        {
            return std::nullopt;
        }
        return parse_expected_ranges(json);
    }

    std::optional<std::string> parse_upload_url(std::string_view body)
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        const auto it = json.find("uploadUrl");
        if (it == json.end() || !it->is_string())
        {
            return std::nullopt;
        }
        auto url = it->get<std::string>();
        if (url.empty())
        {
            return std::nullopt;
        }
        return url;
    }

    std::optional<std::chrono::seconds> parse_retry_after(const RemoteResponse &response)
    {
        const auto value = response.header("retry-after");
        if (!value)
        {
            return std::nullopt;
        }
        const auto seconds = parse_number(*value);
        if (!seconds)
        {
            return std::nullopt;
        }
        return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(*seconds));
    }

    std::string build_create_session_url(std::string_view api_base, std::string_view remote_path)
    {
        std::string base(api_base);
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        while (!remote_path.empty() && remote_path.front() == '/')
        {
            remote_path.remove_prefix(1);
        }
        return base + "/" + encode_path(remote_path) + ":/createUploadSession";
    }

} // namespace chunklift::protocol
