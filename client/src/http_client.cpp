#include "chunklift/client/http_client.hpp"

#include <cctype>
#include <mutex>
#include <stdexcept>

namespace chunklift::client
{

    namespace
    {

        struct HeaderListDeleter
        {
            void operator()(curl_slist *list) const noexcept
            {
                curl_slist_free_all(list);
            }
        };

        using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
                    throw std::runtime_error("curl_global_init failed");
                } });
        }

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::size_t on_body(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            auto *response = static_cast<protocol::RemoteResponse *>(userdata);
            response->body.append(data, size * count);
            return size * count;
        }

        std::size_t on_header(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            auto *response = static_cast<protocol::RemoteResponse *>(userdata);
            const std::string line(data, size * count);
            if (line.rfind("HTTP/", 0) == 0)
            {
                // Interim responses (100 Continue, redirects) start a new header block.
                response->headers.clear();
                return size * count;
            }
            const auto colon = line.find(':');
            if (colon != std::string::npos)
            {
                auto name = trim(line.substr(0, colon));
                for (auto &ch : name)
                {
                    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                }
                response->headers[name] = trim(line.substr(colon + 1));
            }
            return size * count;
        }

    } // namespace

    HttpClient::HttpClient(HttpSettings settings)
        : settings_(settings)
    {
        ensure_curl_global_init();
    }

    CURL *HttpClient::acquire_handle()
    {
        if (!handle_)
        {
            handle_.reset(curl_easy_init());
            if (!handle_)
            {
                throw std::runtime_error("Cannot initialize curl");
            }
        }
        else
        {
            // Clears options but keeps the connection cache.
            curl_easy_reset(handle_.get());
        }
        return handle_.get();
    }

    void HttpClient::reset()
    {
        handle_.reset();
    }

    protocol::RemoteResponse HttpClient::perform(const HttpRequest &request)
    {
        protocol::RemoteResponse response;
        CURL *curl = acquire_handle();

        curl_slist *list = nullptr;
        const auto append_header = [&list](const char *line)
        {
            auto *appended = curl_slist_append(list, line);
            if (appended == nullptr)
            {
                curl_slist_free_all(list);
                throw std::runtime_error("curl_slist_append failed");
            }
            list = appended;
        };
        for (const auto &header : request.headers)
        {
            append_header(header.c_str());
        }
        if (request.method != "GET")
        {
            append_header("Expect:");
        }
        HeaderList headers(list);

        char error_buffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, settings_.max_idle_connections);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);

        if (request.method == "GET")
        {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            if (request.method != "POST")
            {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
        }

        if (request.timeout)
        {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout->count()));
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(settings_.stall_timeout.count()));
        }

        const CURLcode res = curl_easy_perform(curl);
        // The handle keeps pointers to both; clear them before they go out of scope.
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
        if (res != CURLE_OK)
        {
            response.transport_failed = true;
            response.transport_error = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(res);
            return response;
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = status;
        return response;
    }

} // namespace chunklift::client
