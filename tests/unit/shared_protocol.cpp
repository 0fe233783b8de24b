#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "chunklift/crypto.hpp"
#include "chunklift/error_codes.hpp"
#include "chunklift/protocol.hpp"

using namespace chunklift;
using namespace chunklift::protocol;

void run_client_component_tests();
void run_transfer_engine_tests();
void run_transfer_planner_tests();

namespace
{

    RemoteResponse response_with(long status, std::string body = {})
    {
        RemoteResponse response;
        response.status = status;
        response.body = std::move(body);
        return response;
    }

    void test_chunk_classification()
    {
        assert(classify_chunk_response(response_with(200)) == ChunkResult::Completed);
        assert(classify_chunk_response(response_with(201)) == ChunkResult::Completed);
        assert(classify_chunk_response(response_with(202)) == ChunkResult::Accepted);
        assert(classify_chunk_response(response_with(401)) == ChunkResult::AuthRejected);
        assert(classify_chunk_response(response_with(404)) == ChunkResult::SessionNotFound);
        assert(classify_chunk_response(response_with(409)) == ChunkResult::Conflict);
        assert(classify_chunk_response(response_with(416)) == ChunkResult::Conflict);
        assert(classify_chunk_response(response_with(500)) == ChunkResult::Transient);
        assert(classify_chunk_response(response_with(503)) == ChunkResult::Transient);
        assert(classify_chunk_response(response_with(429)) == ChunkResult::Transient);

        RemoteResponse broken;
        broken.status = 202;
        broken.transport_failed = true;
        assert(classify_chunk_response(broken) == ChunkResult::TransportFailure);

        assert(is_create_success(200) && is_create_success(201) && !is_create_success(202));
        assert(is_query_success(202) && !is_query_success(404));
        assert(to_string(ChunkResult::SessionNotFound) == "session_not_found");
    }

    void test_content_range()
    {
        assert(format_content_range(0, 327680, 1000000) == "bytes 0-327679/1000000");
        assert(format_content_range(327680, 10, 327690) == "bytes 327680-327689/327690");
    }

    void test_range_parsing()
    {
        assert(parse_range_header("bytes 0-8519679/26214400") == 8519680);
        assert(parse_range_header("bytes=0-99") == 100);
        assert(parse_range_header(" Bytes 10-19 ") == 20);
        assert(!parse_range_header("bytes 20-10"));
        assert(!parse_range_header("bytes */100"));
        assert(!parse_range_header("garbage"));

        const auto body = nlohmann::json{{"nextExpectedRanges", nlohmann::json::array({"26214400-", "8519680-9000000"})}};
        assert(parse_expected_ranges(body) == 8519680);
        assert(!parse_expected_ranges(nlohmann::json{{"nextExpectedRanges", nlohmann::json::array()}}));
        assert(!parse_expected_ranges(nlohmann::json::array()));
    }

    void test_confirmed_offset_sources()
    {
        auto response = response_with(202, R"({"nextExpectedRanges":["4096-"]})");
        assert(parse_confirmed_offset(response) == 4096);

        response.headers["range"] = "bytes=0-1023";
        assert(parse_confirmed_offset(response) == 1024);
        assert(response.header("Range") == std::optional<std::string>("bytes=0-1023"));

        response.headers.erase("range");
        response.headers["content-range"] = "not a range";
        assert(parse_confirmed_offset(response) == 4096);

        assert(!parse_confirmed_offset(response_with(202, "<html>")));
        assert(!parse_confirmed_offset(response_with(202, "{}")));
    }

    void test_session_creation_parsing()
    {
        assert(parse_upload_url(R"({"uploadUrl":"https://up.example/s/1","expirationDateTime":"x"})") ==
               std::optional<std::string>("https://up.example/s/1"));
        assert(!parse_upload_url(R"({"uploadUrl":""})"));
        assert(!parse_upload_url(R"({"error":{"code":"accessDenied"}})"));
        assert(!parse_upload_url("not json"));

        assert(build_create_session_url("https://api.example/root:/", "/Backups/My File#1.bin") ==
               "https://api.example/root:/Backups/My%20File%231.bin:/createUploadSession");
        assert(build_create_session_url(kDefaultApiBase, "a/b.txt") ==
               "https://graph.microsoft.com/v1.0/me/drive/root:/a/b.txt:/createUploadSession");
    }

    void test_retry_after()
    {
        auto response = response_with(503);
        assert(!parse_retry_after(response));
        response.headers["retry-after"] = "7";
        assert(parse_retry_after(response) == std::chrono::seconds{7});
        response.headers["retry-after"] = "Wed, 21 Oct 2015 07:28:00 GMT";
        assert(!parse_retry_after(response));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::Ok) == "ok");
        assert(to_string(ErrorCode::InvalidResponse) == "invalid_response");
        assert(to_string(static_cast<ErrorCode>(9999)) == "unknown");

        std::set<std::string> descriptions;
        for (int code = 0; code <= static_cast<int>(ErrorCode::InternalError); ++code)
        {
            descriptions.insert(std::string(to_string(static_cast<ErrorCode>(code))));
        }
        assert(descriptions.size() == static_cast<std::size_t>(ErrorCode::InternalError) + 1);
        assert(descriptions.count("unknown") == 0);
    }

    void test_crypto()
    {
        assert(crypto::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(crypto::sha256_hex("").size() == 64);
        assert(crypto::random_uniform(0) == 0);
        for (int i = 0; i < 100; ++i)
        {
            assert(crypto::random_uniform(5) < 5);
        }
    }

} // namespace

int main()
{
    try
    {
        test_chunk_classification();
        test_content_range();
        test_range_parsing();
        test_confirmed_offset_sources();
        test_session_creation_parsing();
        test_retry_after();
        test_error_codes();
        test_crypto();
        run_client_component_tests();
        run_transfer_engine_tests();
        run_transfer_planner_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
