#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "chunklift/client/config.hpp"
#include "chunklift/client/http_client.hpp"
#include "chunklift/protocol.hpp"

namespace chunklift::client
{

    // Wire operations of the upload-session protocol. Implementations never throw for
    // HTTP-level failures; they report them through RemoteResponse.
    class RemoteSessionProtocol
    {
    public:
        virtual ~RemoteSessionProtocol() = default;

        virtual protocol::RemoteResponse create_session(const std::string &remote_path, const std::string &token) = 0;

        virtual protocol::RemoteResponse query_status(const std::string &upload_url, const std::string &token) = 0;

        virtual protocol::RemoteResponse upload_chunk(const std::string &upload_url, const std::string &token,
                                                      std::uint64_t offset, std::string_view data,
                                                      std::uint64_t total_size) = 0;

        // Discards pooled connections so the next call starts from a known state.
        virtual void reset_connections() = 0;
    };

    using RemoteProtocolFactory = std::function<std::unique_ptr<RemoteSessionProtocol>()>;

    class GraphSessionProtocol final : public RemoteSessionProtocol
    {
    public:
        GraphSessionProtocol(std::string api_base, HttpSettings settings);

        protocol::RemoteResponse create_session(const std::string &remote_path, const std::string &token) override;

        protocol::RemoteResponse query_status(const std::string &upload_url, const std::string &token) override;

        protocol::RemoteResponse upload_chunk(const std::string &upload_url, const std::string &token,
                                              std::uint64_t offset, std::string_view data,
                                              std::uint64_t total_size) override;

        void reset_connections() override;

    private:
        std::string api_base_;
        HttpSettings settings_;
        HttpClient client_;
    };

} // namespace chunklift::client
