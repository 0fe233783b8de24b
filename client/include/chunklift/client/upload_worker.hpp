#pragma once

#include <asio/thread_pool.hpp>

#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "chunklift/client/observer.hpp"
#include "chunklift/client/transfer_planner.hpp"

namespace chunklift::client
{

    struct UploadCallbacks
    {
        ProgressCallback on_progress;
        LogCallback on_log;
        CancellationCheck is_cancelled;
    };

    // Runs batches on one dedicated thread and delivers callbacks on another, so neither the
    // caller nor a slow observer ever blocks the transfer.
    class UploadWorker
    {
    public:
        explicit UploadWorker(PlannerServices services);
        ~UploadWorker();

        UploadWorker(const UploadWorker &) = delete;
        UploadWorker &operator=(const UploadWorker &) = delete;

        std::future<BatchReport> submit(BatchRequest request, UploadCallbacks callbacks);

        // Blocking convenience around submit(); true when every file was uploaded.
        bool upload_batch(const std::vector<std::filesystem::path> &files,
                          const std::optional<std::filesystem::path> &base_dir, const std::string &remote_prefix,
                          const std::string &account_id, ProgressCallback on_progress, LogCallback on_log,
                          CancellationCheck is_cancelled);

    private:
        TransferPlanner planner_;
        asio::thread_pool pool_;
    };

} // namespace chunklift::client
