#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "chunklift/client/auth_provider.hpp"
#include "chunklift/client/chunk_sizer.hpp"
#include "chunklift/client/config.hpp"
#include "chunklift/client/logger.hpp"
#include "chunklift/client/observer.hpp"
#include "chunklift/client/remote_session.hpp"
#include "chunklift/client/session_store.hpp"
#include "chunklift/error_codes.hpp"

namespace chunklift::client
{

    enum class TransferState : std::uint8_t
    {
        Init,
        SessionReady,
        Transferring,
        Complete,
        Suspended,
        FailedPermanent
    };

    std::string_view to_string(TransferState state) noexcept;

    struct FileUpload
    {
        std::filesystem::path local_path;
        std::string remote_path;
        std::string account_id;
    };

    struct TransferOutcome
    {
        TransferState state{TransferState::Init};
        std::uint64_t confirmed_offset{};
        std::uint64_t file_size{};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};

        bool completed() const noexcept
        {
            return state == TransferState::Complete;
        }
    };

    // Time source and sleep used by the retry loop; tests substitute virtual time.
    struct EngineClock
    {
        std::function<std::chrono::steady_clock::time_point()> now;
        std::function<void(std::chrono::milliseconds)> sleep;

        static EngineClock system();
    };

    // Uploads one file through a resumable upload session, chunk by chunk, recovering from
    // transport errors, token expiry, offset conflicts and expired sessions. Owns the remote
    // protocol instance (and its connection pool) for the duration of the transfer.
    class ChunkTransferEngine
    {
    public:
        ChunkTransferEngine(SessionStore &sessions, AuthProvider &auth, std::unique_ptr<RemoteSessionProtocol> remote,
                            Logger &logger, TransferSettings settings, EngineClock clock = EngineClock::system());

        TransferOutcome transfer(const FileUpload &upload, TransferObserver &observer,
                                 const CancellationCheck &is_cancelled);

    private:
        struct Run;

        bool acquire_token(Run &run);
        ErrorCode open_session(Run &run);
        ErrorCode create_session(Run &run);
        void synchronize_initial_offset(Run &run);
        bool resynchronize(Run &run);
        bool restart_session(Run &run);
        TransferOutcome transfer_chunks(Run &run);
        void handle_accepted(Run &run, const protocol::RemoteResponse &response, std::uint64_t sent,
                             std::chrono::duration<double> elapsed);
        void checkpoint(Run &run);
        void back_off(Run &run, std::chrono::milliseconds minimum = std::chrono::milliseconds{0});
        void pause(Run &run, std::chrono::milliseconds duration);
        void report_progress(Run &run, double speed);
        void notify(Run &run, const std::string &message);
        TransferOutcome finish(Run &run, TransferState state, ErrorCode error, std::string message);

        SessionStore &sessions_;
        AuthProvider &auth_;
        std::unique_ptr<RemoteSessionProtocol> remote_;
        Logger &logger_;
        TransferSettings settings_;
        EngineClock clock_;
    };

} // namespace chunklift::client
