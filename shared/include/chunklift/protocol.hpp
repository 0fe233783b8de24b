/**
 * ChunkLift - Upload-session wire protocol helpers.
 *
 * Status classification, Content-Range formatting and the parsing of the
 * offsets a server reports back, shared by the HTTP transport and the engine.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chunklift::protocol
{

    // Every non-final chunk must be a multiple of this many bytes.
    constexpr std::uint64_t kChunkAlignment = 320 * 1024;

    constexpr std::string_view kDefaultApiBase = "https://graph.microsoft.com/v1.0/me/drive/root:";

    struct RemoteResponse
    {
        long status{0};
        bool transport_failed{false};
        std::string transport_error{};
        // Header names are stored lowercase.
        std::map<std::string, std::string> headers{};
        std::string body{};

        std::optional<std::string> header(std::string_view name) const;
    };

    enum class ChunkResult : std::uint8_t
    {
        Completed,
        Accepted,
        AuthRejected,
        Conflict,
        SessionNotFound,
        TransportFailure,
        Transient
    };

    std::string_view to_string(ChunkResult result) noexcept;

    ChunkResult classify_chunk_response(const RemoteResponse &response) noexcept;

    bool is_create_success(long status) noexcept;
    bool is_query_success(long status) noexcept;

    // "bytes <start>-<end>/<total>" for a chunk of `length` bytes at `start`.
    std::string format_content_range(std::uint64_t start, std::uint64_t length, std::uint64_t total);

    // Parses "bytes <start>-<end>[/<total>]" and returns end + 1.
    std::optional<std::uint64_t> parse_range_header(std::string_view value);

    // Minimum start among "<start>-" / "<start>-<end>" strings in nextExpectedRanges.
    std::optional<std::uint64_t> parse_expected_ranges(const nlohmann::json &body);

    // Explicit range header first, then the body's expected ranges.
    std::optional<std::uint64_t> parse_confirmed_offset(const RemoteResponse &response);

    std::optional<std::string> parse_upload_url(std::string_view body);

    std::optional<std::chrono::seconds> parse_retry_after(const RemoteResponse &response);

    std::string build_create_session_url(std::string_view api_base, std::string_view remote_path);

} // namespace chunklift::protocol
