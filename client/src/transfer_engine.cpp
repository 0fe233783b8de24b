#include "chunklift/client/transfer_engine.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "chunklift/crypto.hpp"
#include "chunklift/protocol.hpp"

namespace chunklift::client
{

    namespace
    {

        constexpr auto kPauseSlice = std::chrono::milliseconds{250};
        constexpr unsigned kMaxSessionRestarts = 3;
        constexpr std::size_t kBodyExcerpt = 200;
        constexpr auto kMaxRetryAfter = std::chrono::milliseconds{std::chrono::minutes{10}};

        std::string megabytes(std::uint64_t bytes)
        {
            return spdlog::fmt_lib::format("{:.2f} MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
        }

        std::string describe_failure(const protocol::RemoteResponse &response)
        {
            if (response.transport_failed)
            {
                return response.transport_error;
            }
            return std::to_string(response.status) + " " + response.body.substr(0, kBodyExcerpt);
        }

    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        switch (state)
        {
        case TransferState::Init:
            return "init";
        case TransferState::SessionReady:
            return "session_ready";
        case TransferState::Transferring:
            return "transferring";
        case TransferState::Complete:
            return "complete";
        case TransferState::Suspended:
            return "suspended";
        case TransferState::FailedPermanent:
            return "failed_permanent";
        }
        return "unknown";
    }

    EngineClock EngineClock::system()
    {
        return EngineClock{
            []()
            { return std::chrono::steady_clock::now(); },
            [](std::chrono::milliseconds duration)
            { std::this_thread::sleep_for(duration); },
        };
    }

    struct ChunkTransferEngine::Run
    {
        Run(const FileUpload &upload_in, TransferObserver &observer_in, const CancellationCheck &is_cancelled_in,
            const TransferSettings &settings, std::uint64_t size)
            : upload(upload_in),
              observer(observer_in),
              is_cancelled(is_cancelled_in),
              file_size(size),
              sizer(settings, size),
              backoff(settings.backoff_base) {}

        bool cancelled() const
        {
            return is_cancelled && is_cancelled();
        }

        const FileUpload &upload;
        TransferObserver &observer;
        const CancellationCheck &is_cancelled;
        std::uint64_t file_size;
        std::string key;
        std::string token;
        SessionDescriptor descriptor;
        std::ifstream file;
        // Next byte to send. May come from the local checkpoint until the server confirms it.
        std::uint64_t confirmed{0};
        // Highest offset the server itself has confirmed for the current session.
        std::uint64_t server_floor{0};
        // Highest offset handed to the observer.
        std::uint64_t reported{0};
        AdaptiveChunkSizer sizer;
        std::chrono::milliseconds backoff;
        unsigned chunks_since_checkpoint{0};
        std::chrono::steady_clock::time_point last_checkpoint{};
        unsigned consecutive_failures{0};
        unsigned auth_rejections{0};
        unsigned session_restarts{0};
        TransferState state{TransferState::Init};
    };

    ChunkTransferEngine::ChunkTransferEngine(SessionStore &sessions, AuthProvider &auth,
                                             std::unique_ptr<RemoteSessionProtocol> remote, Logger &logger,
                                             TransferSettings settings, EngineClock clock)
        : sessions_(sessions),
          auth_(auth),
          remote_(std::move(remote)),
          logger_(logger),
          settings_(settings),
          clock_(std::move(clock)) {}

    TransferOutcome ChunkTransferEngine::transfer(const FileUpload &upload, TransferObserver &observer,
                                                  const CancellationCheck &is_cancelled)
    {
        std::error_code ec;
        const auto file_size = std::filesystem::file_size(upload.local_path, ec);
        std::filesystem::file_time_type modified{};
        if (!ec)
        {
            modified = std::filesystem::last_write_time(upload.local_path, ec);
        }
        if (ec)
        {
            logger_.log("error", "cannot stat ", upload.local_path.string(), ": ", ec.message());
            return TransferOutcome{TransferState::FailedPermanent, 0, 0, ErrorCode::FileIo,
                                   "Cannot read " + upload.local_path.string() + ": " + ec.message()};
        }

        Run run(upload, observer, is_cancelled, settings_, file_size);
        run.last_checkpoint = clock_.now();
        const auto modified_seconds = std::chrono::duration_cast<std::chrono::seconds>(modified.time_since_epoch()).count();
        run.key = session_fingerprint(upload.local_path, upload.remote_path, file_size,
                                      static_cast<std::int64_t>(modified_seconds));
        logger_.log("info", "transfer ", upload.local_path.string(), " -> ", upload.remote_path, " (", file_size,
                    " bytes, session key ", run.key.substr(0, 12), ", initial chunk ", run.sizer.chunk_size(), ")");

        run.file.open(upload.local_path, std::ios::binary);
        if (!run.file.is_open())
        {
            return finish(run, TransferState::FailedPermanent, ErrorCode::FileIo, "Could not open local file for reading");
        }

        if (!acquire_token(run))
        {
            return finish(run, TransferState::FailedPermanent, ErrorCode::AuthenticationFailed, "No access token available");
        }

        if (const auto opened = open_session(run); opened != ErrorCode::Ok)
        {
            return finish(run, TransferState::FailedPermanent, opened, "Failed to create upload session");
        }
        run.state = TransferState::SessionReady;

        synchronize_initial_offset(run);
        run.state = TransferState::Transferring;
        if (run.confirmed > 0)
        {
            notify(run, "Resuming upload from byte " + std::to_string(run.confirmed));
            report_progress(run, 0.0);
        }

        return transfer_chunks(run);
    }

    bool ChunkTransferEngine::acquire_token(Run &run)
    {
        auto token = auth_.token_silently(run.upload.account_id);
        if (!token || token->empty())
        {
            try
            {
                token = auth_.token_interactive();
            }
            catch (const std::exception &ex)
            {
                logger_.log("error", "interactive sign-in failed: ", ex.what());
                notify(run, std::string("Sign-in failed: ") + ex.what());
                return false;
            }
        }
        if (!token || token->empty())
        {
            return false;
        }
        run.token = std::move(*token);
        return true;
    }

    ErrorCode ChunkTransferEngine::open_session(Run &run)
    {
        auto loaded = sessions_.load(run.key);
        if (!loaded.status.ok())
        {
            logger_.log("warn", "ignoring stored session: ", loaded.status.message);
        }
        if (loaded.descriptor)
        {
            run.descriptor = std::move(*loaded.descriptor);
            logger_.log("info", "reusing upload session for ", run.upload.remote_path, " (checkpoint ",
                        run.descriptor.uploaded, ")");
            return ErrorCode::Ok;
        }
        return create_session(run);
    }

    ErrorCode ChunkTransferEngine::create_session(Run &run)
    {
        const auto response = remote_->create_session(run.upload.remote_path, run.token);
        if (response.transport_failed || !protocol::is_create_success(response.status))
        {
            notify(run, "Failed to create upload session: " + describe_failure(response));
            return ErrorCode::CreateSessionFailed;
        }
        auto upload_url = protocol::parse_upload_url(response.body);
        if (!upload_url)
        {
            notify(run, "Failed to create upload session: response carries no uploadUrl");
            return ErrorCode::InvalidResponse;
        }

        run.descriptor = SessionDescriptor{*upload_url, run.upload.remote_path, run.file_size, 0,
                                           std::chrono::system_clock::now()};
        const auto saved = sessions_.save(run.key, run.descriptor);
        if (!saved.ok())
        {
            logger_.log("warn", "session not persisted, resume unavailable: ", saved.message);
        }
        notify(run, "Upload session created");
        return ErrorCode::Ok;
    }

    void ChunkTransferEngine::synchronize_initial_offset(Run &run)
    {
        const auto response = remote_->query_status(run.descriptor.upload_url, run.token);
        std::optional<std::uint64_t> offset;
        if (!response.transport_failed && protocol::is_query_success(response.status))
        {
            offset = protocol::parse_confirmed_offset(response);
        }
        if (offset)
        {
            run.confirmed = std::min(*offset, run.file_size);
            run.server_floor = run.confirmed;
            logger_.log("info", "server confirmed ", run.confirmed, " bytes");
        }
        else
        {
            run.confirmed = std::min(run.descriptor.uploaded, run.file_size);
            logger_.log("warn", "status query failed (", describe_failure(response), "), using checkpoint ",
                        run.confirmed);
        }
    }

    bool ChunkTransferEngine::resynchronize(Run &run)
    {
        const auto response = remote_->query_status(run.descriptor.upload_url, run.token);
        if (response.transport_failed || !protocol::is_query_success(response.status))
        {
            logger_.log("retry", "status query failed: ", describe_failure(response));
            return false;
        }
        const auto offset = protocol::parse_confirmed_offset(response);
        if (!offset)
        {
            logger_.log("retry", "status query carried no offset");
            return false;
        }
        const auto aligned = std::clamp(*offset, run.server_floor, run.file_size);
        if (aligned != run.confirmed)
        {
            logger_.log("info", "realigned from ", run.confirmed, " to ", aligned);
        }
        run.confirmed = aligned;
        run.server_floor = aligned;
        return true;
    }

    bool ChunkTransferEngine::restart_session(Run &run)
    {
        const auto removed = sessions_.remove(run.key);
        if (!removed.ok())
        {
            logger_.log("warn", removed.message);
        }
        if (create_session(run) != ErrorCode::Ok)
        {
            return false;
        }

        // A recreated session holds none of the earlier bytes; only its own offset counts.
        const auto response = remote_->query_status(run.descriptor.upload_url, run.token);
        std::optional<std::uint64_t> offset;
        if (!response.transport_failed && protocol::is_query_success(response.status))
        {
            offset = protocol::parse_confirmed_offset(response);
        }
        run.confirmed = std::min(offset.value_or(0), run.file_size);
        run.server_floor = run.confirmed;
        run.sizer.reset_measurements();
        run.chunks_since_checkpoint = 0;
        return true;
    }

    TransferOutcome ChunkTransferEngine::transfer_chunks(Run &run)
    {
        std::vector<char> buffer;
        while (run.confirmed < run.file_size)
        {
            if (run.cancelled())
            {
                checkpoint(run);
                notify(run, "Upload paused at byte " + std::to_string(run.confirmed) + "; session saved for resume");
                return finish(run, TransferState::Suspended, ErrorCode::Cancelled, "Cancelled");
            }
            if (settings_.max_consecutive_failures > 0 && run.consecutive_failures >= settings_.max_consecutive_failures)
            {
                checkpoint(run);
                notify(run, "Giving up after " + std::to_string(run.consecutive_failures) +
                                " consecutive failures; session saved for resume");
                return finish(run, TransferState::Suspended, ErrorCode::RetriesExhausted, "Retry limit reached");
            }

            const auto offset = run.confirmed;
            const auto length = std::min(run.sizer.chunk_size(), run.file_size - offset);
            buffer.resize(static_cast<std::size_t>(length));
            run.file.clear();
            run.file.seekg(static_cast<std::streamoff>(offset));
            run.file.read(buffer.data(), static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(run.file.gcount()) != length)
            {
                checkpoint(run);
                notify(run, "Local file changed while uploading; session saved for resume");
                return finish(run, TransferState::Suspended, ErrorCode::FileIo, "Short read from local file");
            }

            const auto started = clock_.now();
            const auto response = remote_->upload_chunk(run.descriptor.upload_url, run.token, offset,
                                                        std::string_view(buffer.data(), buffer.size()), run.file_size);
            const std::chrono::duration<double> elapsed = clock_.now() - started;
            const auto result = protocol::classify_chunk_response(response);
            logger_.log("chunk", protocol::format_content_range(offset, length, run.file_size), " -> ",
                        protocol::to_string(result), " (", response.status, ")");

            switch (result)
            {
            case protocol::ChunkResult::Completed:
            {
                run.confirmed = run.file_size;
                const auto removed = sessions_.remove(run.key);
                if (!removed.ok())
                {
                    logger_.log("warn", removed.message);
                }
                const double seconds = std::max(elapsed.count(), 0.001);
                report_progress(run, static_cast<double>(length) / seconds);
                notify(run, "Uploaded " + run.upload.remote_path + " (" + megabytes(run.file_size) + ")");
                return finish(run, TransferState::Complete, ErrorCode::Ok, {});
            }
            case protocol::ChunkResult::Accepted:
                handle_accepted(run, response, length, elapsed);
                break;
            case protocol::ChunkResult::AuthRejected:
            {
                if (++run.auth_rejections > settings_.max_auth_rejections)
                {
                    checkpoint(run);
                    return finish(run, TransferState::FailedPermanent, ErrorCode::AuthenticationFailed,
                                  "Server keeps rejecting refreshed access tokens");
                }
                notify(run, "Access token rejected; refreshing");
                auto refreshed = auth_.token_silently(run.upload.account_id);
                if (!refreshed || refreshed->empty())
                {
                    checkpoint(run);
                    return finish(run, TransferState::FailedPermanent, ErrorCode::AuthenticationFailed,
                                  "Access token refresh failed");
                }
                run.token = std::move(*refreshed);
                resynchronize(run);
                break;
            }
            case protocol::ChunkResult::Conflict:
                ++run.consecutive_failures;
                logger_.log("retry", "range conflict: ", describe_failure(response));
                resynchronize(run);
                pause(run, settings_.conflict_delay);
                break;
            case protocol::ChunkResult::SessionNotFound:
                notify(run, "Upload session expired; creating a new one");
                if (++run.session_restarts > kMaxSessionRestarts || !restart_session(run))
                {
                    return finish(run, TransferState::FailedPermanent, ErrorCode::SessionExpired,
                                  "Could not recreate upload session");
                }
                break;
            case protocol::ChunkResult::TransportFailure:
                ++run.consecutive_failures;
                notify(run, "Network error, retrying: " + response.transport_error);
                run.sizer.reset_measurements();
                back_off(run);
                remote_->reset_connections();
                resynchronize(run);
                break;
            case protocol::ChunkResult::Transient:
                ++run.consecutive_failures;
                notify(run, "Chunk upload failed: " + describe_failure(response));
                run.sizer.reset_measurements();
                back_off(run, protocol::parse_retry_after(response).value_or(std::chrono::seconds{0}));
                resynchronize(run);
                break;
            }
        }

        // Every byte is accounted for on the server without an explicit completion response.
        const auto removed = sessions_.remove(run.key);
        if (!removed.ok())
        {
            logger_.log("warn", removed.message);
        }
        report_progress(run, 0.0);
        notify(run, "Uploaded " + run.upload.remote_path + " (" + megabytes(run.file_size) + ")");
        return finish(run, TransferState::Complete, ErrorCode::Ok, {});
    }

    void ChunkTransferEngine::handle_accepted(Run &run, const protocol::RemoteResponse &response, std::uint64_t sent,
                                              std::chrono::duration<double> elapsed)
    {
        const auto previous = run.confirmed;
        const auto expected = previous + sent;
        const auto reported = protocol::parse_confirmed_offset(response).value_or(expected);
        run.confirmed = std::clamp(reported, previous, run.file_size);
        run.server_floor = run.confirmed;
        if (run.confirmed != expected)
        {
            logger_.log("warn", "server confirmed ", run.confirmed, " instead of ", expected);
        }

        const double seconds = std::max(elapsed.count(), 0.001);
        const double speed = static_cast<double>(sent) / seconds;
        if (run.sizer.record_chunk(sent, elapsed))
        {
            logger_.log("info", "chunk size now ", run.sizer.chunk_size(), " bytes (",
                        static_cast<std::uint64_t>(run.sizer.average_throughput()), " B/s average)");
        }

        run.backoff = settings_.backoff_base;
        run.consecutive_failures = 0;
        run.auth_rejections = 0;
        run.session_restarts = 0;

        ++run.chunks_since_checkpoint;
        if (run.chunks_since_checkpoint >= settings_.checkpoint_interval_chunks ||
            clock_.now() - run.last_checkpoint >= settings_.checkpoint_interval)
        {
            checkpoint(run);
        }
        report_progress(run, speed);
    }

    void ChunkTransferEngine::checkpoint(Run &run)
    {
        run.descriptor.uploaded = run.confirmed;
        run.descriptor.last_update = std::chrono::system_clock::now();
        const auto saved = sessions_.save(run.key, run.descriptor);
        if (!saved.ok())
        {
            logger_.log("warn", "checkpoint at ", run.confirmed, " not saved: ", saved.message);
        }
        run.chunks_since_checkpoint = 0;
        run.last_checkpoint = clock_.now();
    }

    void ChunkTransferEngine::back_off(Run &run, std::chrono::milliseconds minimum)
    {
        const auto base = run.backoff;
        const auto jitter = std::chrono::milliseconds(
            crypto::random_uniform(static_cast<std::uint32_t>(base.count() / 4 + 1)));
        const auto wait = std::max(std::min(base + jitter, settings_.backoff_cap), std::min(minimum, kMaxRetryAfter));
        logger_.log("retry", "waiting ", wait.count(), " ms");
        pause(run, wait);
        run.backoff = std::min(base * 2, settings_.backoff_cap);
    }

    void ChunkTransferEngine::pause(Run &run, std::chrono::milliseconds duration)
    {
        auto remaining = duration;
        while (remaining.count() > 0 && !run.cancelled())
        {
            const auto step = std::min(remaining, kPauseSlice);
            clock_.sleep(step);
            remaining -= step;
        }
    }

    void ChunkTransferEngine::report_progress(Run &run, double speed)
    {
        run.reported = std::max(run.reported, run.confirmed);
        const double eta = speed > 0.0 ? static_cast<double>(run.file_size - run.reported) / speed : 0.0;
        try
        {
            run.observer.on_progress(ProgressUpdate{run.reported, run.file_size, speed, eta});
        }
        catch (const std::exception &ex)
        {
            logger_.log("warn", "progress observer failed: ", ex.what());
        }
    }

    void ChunkTransferEngine::notify(Run &run, const std::string &message)
    {
        logger_.log("info", message);
        try
        {
            run.observer.on_log(message);
        }
        catch (const std::exception &ex)
        {
            logger_.log("warn", "log observer failed: ", ex.what());
        }
    }

    TransferOutcome ChunkTransferEngine::finish(Run &run, TransferState state, ErrorCode error, std::string message)
    {
        run.state = state;
        const auto tag = state == TransferState::FailedPermanent ? "error" : (error == ErrorCode::Ok ? "info" : "warn");
        logger_.log(tag, "finished ", run.upload.remote_path, ": ", to_string(state), " at ", run.confirmed, "/",
                    run.file_size, message.empty() ? "" : " - ", message);
        return TransferOutcome{state, run.confirmed, run.file_size, error, std::move(message)};
    }

} // namespace chunklift::client
