#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunklift/client/auth_provider.hpp"
#include "chunklift/client/batch_state.hpp"
#include "chunklift/client/config.hpp"
#include "chunklift/client/logger.hpp"
#include "chunklift/client/observer.hpp"
#include "chunklift/client/remote_session.hpp"
#include "chunklift/client/session_store.hpp"
#include "chunklift/client/transfer_engine.hpp"
#include "chunklift/error_codes.hpp"

namespace chunklift::client
{

    struct BatchRequest
    {
        // Absolute paths, already filtered and ordered by the caller.
        std::vector<std::filesystem::path> files;
        std::optional<std::filesystem::path> base_dir;
        std::string remote_prefix;
        std::string account_id;
    };

    struct BatchReport
    {
        bool success{false};
        std::size_t files_total{};
        std::size_t files_done{};
        std::uint64_t bytes_total{};
        std::uint64_t bytes_completed{};
        ErrorCode error{ErrorCode::Ok};
        // File the batch stopped at, when it did not complete.
        std::optional<std::filesystem::path> halted_at;
        std::chrono::duration<double> elapsed{};
    };

    // <prefix>/<top-level dir of base>/<path relative to base>, '/'-separated, no empty segments.
    std::string build_remote_path(const std::filesystem::path &file, const std::optional<std::filesystem::path> &base_dir,
                                  const std::string &remote_prefix);

    struct PlannerServices
    {
        SessionStore &sessions;
        BatchState &batch;
        AuthProvider &auth;
        RemoteProtocolFactory remote_factory;
        Logger &logger;
        TransferSettings settings;
        EngineClock clock{EngineClock::system()};
    };

    // Uploads a batch strictly in order, one file at a time, stopping at the first file that
    // does not complete so a later run resumes exactly there.
    class TransferPlanner
    {
    public:
        explicit TransferPlanner(PlannerServices services);

        BatchReport run(const BatchRequest &request, TransferObserver &observer, const CancellationCheck &is_cancelled);

    private:
        PlannerServices services_;
    };

} // namespace chunklift::client
