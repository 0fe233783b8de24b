#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunklift/client/auth_provider.hpp"
#include "chunklift/client/observer.hpp"
#include "chunklift/client/remote_session.hpp"
#include "chunklift/client/transfer_engine.hpp"
#include "chunklift/protocol.hpp"

namespace chunklift::testing
{

    // Virtual time shared by the fake server and the engine under test.
    struct FakeClock
    {
        std::chrono::steady_clock::time_point now{};
        std::chrono::milliseconds slept{0};

        client::EngineClock engine_clock()
        {
            return client::EngineClock{
                [this]()
                { return now; },
                [this](std::chrono::milliseconds duration)
                {
                    now += duration;
                    slept += duration;
                },
            };
        }
    };

    struct ChunkCall
    {
        std::string upload_url;
        std::uint64_t offset{};
        std::uint64_t length{};
        std::uint64_t total{};
    };

    // In-memory upload-session service with the same status semantics as the real one.
    struct FakeUploadServer
    {
        struct Session
        {
            std::string remote_path;
            std::string data;
        };

        using ChunkHook = std::function<std::optional<protocol::RemoteResponse>(const ChunkCall &call, std::string_view data)>;

        std::map<std::string, Session> sessions;
        std::map<std::string, std::string> completed_files;
        std::string accepted_token{"token-1"};
        FakeClock *clock{nullptr};
        std::chrono::milliseconds chunk_duration{std::chrono::seconds{1}};
        bool fail_create{false};
        bool fail_queries{false};
        bool omit_upload_url{false};
        // Consulted before the normal handling; a returned response short-circuits it.
        ChunkHook chunk_hook;

        std::vector<ChunkCall> chunk_calls;
        std::uint64_t bytes_accepted{0};
        int create_calls{0};
        int query_calls{0};
        int connection_resets{0};
        int next_session{0};

        static protocol::RemoteResponse json_response(long status, const nlohmann::json &body)
        {
            protocol::RemoteResponse response;
            response.status = status;
            response.body = body.dump();
            return response;
        }

        static protocol::RemoteResponse expected_ranges(long status, std::uint64_t next)
        {
            return json_response(status, {{"nextExpectedRanges", nlohmann::json::array({std::to_string(next) + "-"})}});
        }

        static protocol::RemoteResponse transport_failure()
        {
            protocol::RemoteResponse response;
            response.transport_failed = true;
            response.transport_error = "Connection reset by peer";
            return response;
        }

        // Expires a session as the service does after its idle timeout.
        void expire(const std::string &upload_url)
        {
            sessions.erase(upload_url);
        }

        protocol::RemoteResponse create(const std::string &remote_path, const std::string &token)
        {
            ++create_calls;
            if (token != accepted_token)
            {
                return json_response(401, {{"error", "InvalidAuthenticationToken"}});
            }
            if (fail_create)
            {
                return json_response(403, {{"error", "accessDenied"}});
            }
            if (omit_upload_url)
            {
                return json_response(200, {{"expirationDateTime", "2030-01-01T00:00:00Z"}});
            }
            const auto url = "https://upload.example/session/" + std::to_string(++next_session);
            sessions[url] = Session{remote_path, {}};
            return json_response(200, {{"uploadUrl", url}, {"nextExpectedRanges", nlohmann::json::array({"0-"})}});
        }

        protocol::RemoteResponse query(const std::string &upload_url, const std::string &token)
        {
            ++query_calls;
            if (fail_queries)
            {
                return transport_failure();
            }
            if (token != accepted_token)
            {
                return json_response(401, {{"error", "InvalidAuthenticationToken"}});
            }
            const auto it = sessions.find(upload_url);
            if (it == sessions.end())
            {
                return json_response(404, {{"error", "itemNotFound"}});
            }
            return expected_ranges(200, it->second.data.size());
        }

        protocol::RemoteResponse upload(const std::string &upload_url, const std::string &token, std::uint64_t offset,
                                        std::string_view data, std::uint64_t total)
        {
            const ChunkCall call{upload_url, offset, data.size(), total};
            chunk_calls.push_back(call);
            if (clock != nullptr)
            {
                clock->now += chunk_duration;
            }
            if (chunk_hook)
            {
                if (auto scripted = chunk_hook(call, data))
                {
                    return *scripted;
                }
            }
            return accept(call, token, data);
        }

        protocol::RemoteResponse accept(const ChunkCall &call, const std::string &token, std::string_view data)
        {
            if (token != accepted_token)
            {
                return json_response(401, {{"error", "InvalidAuthenticationToken"}});
            }
            const auto it = sessions.find(call.upload_url);
            if (it == sessions.end())
            {
                return json_response(404, {{"error", "itemNotFound"}});
            }
            auto &session = it->second;
            if (call.offset != session.data.size())
            {
                return expected_ranges(416, session.data.size());
            }
            session.data.append(data.data(), data.size());
            bytes_accepted += data.size();
            if (session.data.size() >= call.total)
            {
                completed_files[session.remote_path] = session.data;
                sessions.erase(it);
                return json_response(201, {{"id", "item"}, {"size", call.total}});
            }
            return expected_ranges(202, session.data.size());
        }
    };

    class FakeRemote final : public client::RemoteSessionProtocol
    {
    public:
        explicit FakeRemote(FakeUploadServer &server)
            : server_(server) {}

        protocol::RemoteResponse create_session(const std::string &remote_path, const std::string &token) override
        {
            return server_.create(remote_path, token);
        }

        protocol::RemoteResponse query_status(const std::string &upload_url, const std::string &token) override
        {
            return server_.query(upload_url, token);
        }

        protocol::RemoteResponse upload_chunk(const std::string &upload_url, const std::string &token,
                                              std::uint64_t offset, std::string_view data,
                                              std::uint64_t total_size) override
        {
            return server_.upload(upload_url, token, offset, data, total_size);
        }

        void reset_connections() override
        {
            ++server_.connection_resets;
        }

    private:
        FakeUploadServer &server_;
    };

    class FakeAuth final : public client::AuthProvider
    {
    public:
        std::optional<std::string> silent_token{"token-1"};
        std::optional<std::string> interactive_token;
        int silent_calls{0};
        int interactive_calls{0};

        std::optional<std::string> token_silently(const std::string & /*account_id*/) override
        {
            ++silent_calls;
            return silent_token;
        }

        std::string token_interactive() override
        {
            ++interactive_calls;
            if (!interactive_token)
            {
                throw std::runtime_error("sign-in cancelled");
            }
            return *interactive_token;
        }
    };

    class RecordingObserver final : public client::TransferObserver
    {
    public:
        std::vector<client::ProgressUpdate> updates;
        std::vector<std::string> messages;
        bool throw_on_progress{false};

        void on_progress(const client::ProgressUpdate &update) override
        {
            updates.push_back(update);
            if (throw_on_progress)
            {
                throw std::runtime_error("observer broke");
            }
        }

        void on_log(const std::string &message) override
        {
            messages.push_back(message);
        }

        bool monotonic() const
        {
            for (std::size_t i = 1; i < updates.size(); ++i)
            {
                if (updates[i].uploaded_bytes < updates[i - 1].uploaded_bytes)
                {
                    return false;
                }
            }
            return true;
        }
    };

    inline std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    // Deterministic, position-dependent content so misplaced bytes are detectable.
    inline std::string make_content(std::uint64_t size, unsigned seed = 7)
    {
        std::string content(static_cast<std::size_t>(size), '\0');
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            content[i] = static_cast<char>((i * 31 + seed + i / 4096) & 0xFF);
        }
        return content;
    }

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

} // namespace chunklift::testing
