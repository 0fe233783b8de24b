#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>

#include "chunklift/client/config.hpp"
#include "chunklift/protocol.hpp"

namespace chunklift::client
{

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        // Complete "Name: value" lines.
        std::vector<std::string> headers;
        // Not owned; must outlive perform().
        std::string_view body{};
        // Total deadline. Without one the request is only aborted when it stalls.
        std::optional<std::chrono::seconds> timeout;
    };

    // A libcurl easy handle and the connection cache it keeps between requests.
    class HttpClient
    {
    public:
        explicit HttpClient(HttpSettings settings);

        HttpClient(const HttpClient &) = delete;
        HttpClient &operator=(const HttpClient &) = delete;

        protocol::RemoteResponse perform(const HttpRequest &request);

        // Tears down every pooled connection; the next request opens fresh ones.
        void reset();

    private:
        struct HandleDeleter
        {
            void operator()(CURL *handle) const noexcept
            {
                curl_easy_cleanup(handle);
            }
        };

        CURL *acquire_handle();

        HttpSettings settings_;
        std::unique_ptr<CURL, HandleDeleter> handle_;
    };

} // namespace chunklift::client
