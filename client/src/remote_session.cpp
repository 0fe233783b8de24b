#include "chunklift/client/remote_session.hpp"

#include <utility>

namespace chunklift::client
{

    namespace
    {

        constexpr std::string_view kEmptyJsonBody = "{}";

        std::string bearer(const std::string &token)
        {
            return "Authorization: Bearer " + token;
        }

    } // namespace

    GraphSessionProtocol::GraphSessionProtocol(std::string api_base, HttpSettings settings)
        : api_base_(std::move(api_base)),
          settings_(settings),
          client_(settings) {}

    protocol::RemoteResponse GraphSessionProtocol::create_session(const std::string &remote_path, const std::string &token)
    {
        HttpRequest request;
        request.method = "POST";
        request.url = protocol::build_create_session_url(api_base_, remote_path);
        request.headers = {bearer(token), "Content-Type: application/json"};
        request.body = kEmptyJsonBody;
        request.timeout = settings_.control_timeout;
        return client_.perform(request);
    }

    protocol::RemoteResponse GraphSessionProtocol::query_status(const std::string &upload_url, const std::string &token)
    {
        HttpRequest request;
        request.method = "GET";
        request.url = upload_url;
        request.headers = {bearer(token)};
        request.timeout = settings_.control_timeout;
        return client_.perform(request);
    }

    protocol::RemoteResponse GraphSessionProtocol::upload_chunk(const std::string &upload_url, const std::string &token,
                                                                std::uint64_t offset, std::string_view data,
                                                                std::uint64_t total_size)
    {
        HttpRequest request;
        request.method = "PUT";
        request.url = upload_url;
        request.headers = {
            bearer(token),
            "Content-Length: " + std::to_string(data.size()),
            "Content-Range: " + protocol::format_content_range(offset, data.size(), total_size),
        };
        request.body = data;
        return client_.perform(request);
    }

    void GraphSessionProtocol::reset_connections()
    {
        client_.reset();
    }

} // namespace chunklift::client
