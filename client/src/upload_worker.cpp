#include "chunklift/client/upload_worker.hpp"

#include <asio/post.hpp>

#include <exception>
#include <memory>
#include <utility>

#include "chunklift/client/event_channel.hpp"

namespace chunklift::client
{

    UploadWorker::UploadWorker(PlannerServices services)
        : planner_(std::move(services)),
          pool_(1) {}

    UploadWorker::~UploadWorker()
    {
        pool_.join();
    }

    std::future<BatchReport> UploadWorker::submit(BatchRequest request, UploadCallbacks callbacks)
    {
        auto promise = std::make_shared<std::promise<BatchReport>>();
        auto future = promise->get_future();
        auto channel = std::make_shared<EventChannel>(std::move(callbacks.on_progress), std::move(callbacks.on_log));

        asio::post(pool_, [this, promise, channel, request = std::move(request),
                           is_cancelled = std::move(callbacks.is_cancelled)]()
                   {
            try {
                auto report = planner_.run(request, *channel, is_cancelled);
                channel->close();
                promise->set_value(std::move(report));
            } catch (const std::exception &) {
                channel->close();
                promise->set_exception(std::current_exception());
            } });
        return future;
    }

    bool UploadWorker::upload_batch(const std::vector<std::filesystem::path> &files,
                                    const std::optional<std::filesystem::path> &base_dir,
                                    const std::string &remote_prefix, const std::string &account_id,
                                    ProgressCallback on_progress, LogCallback on_log, CancellationCheck is_cancelled)
    {
        BatchRequest request{files, base_dir, remote_prefix, account_id};
        UploadCallbacks callbacks{std::move(on_progress), std::move(on_log), std::move(is_cancelled)};
        return submit(std::move(request), std::move(callbacks)).get().success;
    }

} // namespace chunklift::client
