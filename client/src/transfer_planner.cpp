#include "chunklift/client/transfer_planner.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace chunklift::client
{

    namespace
    {

        struct PlannedFile
        {
            std::filesystem::path path;
            std::string key;
            std::uint64_t size{};
        };

        std::string gigabytes(std::uint64_t bytes)
        {
            return spdlog::fmt_lib::format("{:.2f} GB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
        }

        std::string megabytes(std::uint64_t bytes)
        {
            return spdlog::fmt_lib::format("{:.2f} MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
        }

        // Lifts per-file progress to batch totals and keeps the visible total from regressing.
        class BatchProgress final : public TransferObserver
        {
        public:
            BatchProgress(TransferObserver &downstream, Logger &logger, std::uint64_t total_bytes)
                : downstream_(downstream),
                  logger_(logger),
                  total_bytes_(total_bytes) {}

            void begin_file(std::uint64_t completed_before, std::uint64_t expected_size)
            {
                completed_before_ = completed_before;
                expected_size_ = expected_size;
            }

            void on_progress(const ProgressUpdate &update) override
            {
                const auto file_bytes = std::min(update.uploaded_bytes, expected_size_);
                publish(completed_before_ + file_bytes, update.speed_bytes_per_sec);
            }

            void on_log(const std::string &message) override
            {
                try
                {
                    downstream_.on_log(message);
                }
                catch (const std::exception &ex)
                {
                    logger_.log("warn", "log observer failed: ", ex.what());
                }
            }

            void publish(std::uint64_t uploaded, double speed)
            {
                visible_ = std::max(visible_, std::min(uploaded, total_bytes_));
                const double eta = speed > 0.0 ? static_cast<double>(total_bytes_ - visible_) / speed : 0.0;
                try
                {
                    downstream_.on_progress(ProgressUpdate{visible_, total_bytes_, speed, eta});
                }
                catch (const std::exception &ex)
                {
                    logger_.log("warn", "progress observer failed: ", ex.what());
                }
            }

            std::uint64_t visible() const noexcept
            {
                return visible_;
            }

        private:
            TransferObserver &downstream_;
            Logger &logger_;
            std::uint64_t total_bytes_;
            std::uint64_t completed_before_{0};
            std::uint64_t expected_size_{0};
            std::uint64_t visible_{0};
        };

        std::string normalize_remote(std::string path)
        {
            std::replace(path.begin(), path.end(), '\\', '/');
            std::string result;
            result.reserve(path.size());
            for (const char ch : path)
            {
                if (ch == '/' && (result.empty() || result.back() == '/'))
                {
                    continue;
                }
                result.push_back(ch);
            }
            while (!result.empty() && result.back() == '/')
            {
                result.pop_back();
            }
            return result;
        }

    } // namespace

    std::string build_remote_path(const std::filesystem::path &file, const std::optional<std::filesystem::path> &base_dir,
                                  const std::string &remote_prefix)
    {
        std::string relative;
        if (base_dir && !base_dir->empty())
        {
            auto base = base_dir->lexically_normal();
            if (!base.has_filename())
            {
                base = base.parent_path();
            }
            const auto inside = file.lexically_normal().lexically_relative(base);
            const auto top_level = base.filename();
            if (inside.empty() || *inside.begin() == "..")
            {
                relative = (top_level / file.filename()).generic_string();
            }
            else
            {
                relative = (top_level / inside).generic_string();
            }
        }
        else
        {
            relative = file.filename().generic_string();
        }
        return normalize_remote(remote_prefix + "/" + relative);
    }

    TransferPlanner::TransferPlanner(PlannerServices services)
        : services_(std::move(services)) {}

    BatchReport TransferPlanner::run(const BatchRequest &request, TransferObserver &observer,
                                     const CancellationCheck &is_cancelled)
    {
        const auto started = std::chrono::steady_clock::now();
        auto &logger = services_.logger;
        BatchReport report;

        auto loaded = services_.batch.load();
        if (!loaded.status.ok())
        {
            logger.log("warn", "batch state unreadable, starting fresh: ", loaded.status.message);
        }
        auto entries = std::move(loaded.entries);

        std::vector<PlannedFile> planned;
        planned.reserve(request.files.size());
        for (const auto &path : request.files)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            PlannedFile file{path, BatchState::key_for(path), ec ? 0 : size};
            report.bytes_total += file.size;
            entries.try_emplace(file.key, FileStatus::Pending);
            planned.push_back(std::move(file));
        }
        report.files_total = planned.size();

        auto persist = [&]()
        {
            const auto saved = services_.batch.save(entries);
            if (!saved.ok())
            {
                logger.log("warn", "batch state not saved: ", saved.message);
            }
        };
        persist();

        BatchProgress progress(observer, logger, report.bytes_total);
        std::uint64_t completed = 0;
        for (const auto &file : planned)
        {
            if (entries[file.key] == FileStatus::Done)
            {
                completed += file.size;
                ++report.files_done;
            }
        }
        progress.on_log("Found " + std::to_string(planned.size()) + " files, total " + gigabytes(report.bytes_total));
        if (completed > 0)
        {
            progress.on_log("Resuming batch: " + std::to_string(report.files_done) + " files already uploaded");
            progress.publish(completed, 0.0);
        }

        for (const auto &file : planned)
        {
            if (entries[file.key] == FileStatus::Done)
            {
                logger.log("info", "skipping completed ", file.key);
                continue;
            }
            if (is_cancelled && is_cancelled())
            {
                progress.on_log("Upload cancelled; batch will resume from " + file.path.filename().string());
                report.error = ErrorCode::Cancelled;
                report.halted_at = file.path;
                break;
            }

            const auto remote_path = build_remote_path(file.path, request.base_dir, request.remote_prefix);
            progress.on_log("Uploading " + remote_path + " (" + megabytes(file.size) + ")");
            progress.begin_file(completed, file.size);

            ChunkTransferEngine engine(services_.sessions, services_.auth, services_.remote_factory(), logger,
                                       services_.settings, services_.clock);
            const auto outcome = engine.transfer(FileUpload{file.path, remote_path, request.account_id}, progress,
                                                 is_cancelled);

            const bool done = outcome.confirmed_offset >= file.size && outcome.state != TransferState::FailedPermanent;
            entries[file.key] = done ? FileStatus::Done : FileStatus::Incomplete;
            persist();

            completed += std::min(outcome.confirmed_offset, file.size);
            progress.publish(completed, 0.0);

            if (!done)
            {
                report.error = outcome.error == ErrorCode::Ok ? ErrorCode::InternalError : outcome.error;
                report.halted_at = file.path;
                progress.on_log("Upload of " + remote_path + " incomplete (" + std::string(to_string(outcome.error)) +
                                (outcome.message.empty() ? "" : ": " + outcome.message) +
                                "); remaining files postponed");
                break;
            }
            ++report.files_done;
        }

        report.bytes_completed = progress.visible();
        report.elapsed = std::chrono::steady_clock::now() - started;
        if (report.halted_at)
        {
            logger.log("warn", "batch halted at ", report.halted_at->string(), " after ", report.files_done, "/",
                       report.files_total, " files");
            return report;
        }

        const auto cleared = services_.batch.clear();
        if (!cleared.ok())
        {
            logger.log("warn", "batch state not removed: ", cleared.message);
        }
        report.success = true;
        progress.on_log(spdlog::fmt_lib::format("All files uploaded ({} in {:.1f}s)", gigabytes(report.bytes_total),
                                                report.elapsed.count()));
        return report;
    }

} // namespace chunklift::client
