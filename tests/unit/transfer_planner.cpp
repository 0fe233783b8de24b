#include <algorithm>
#include <cassert>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "chunklift/client/batch_state.hpp"
#include "chunklift/client/logger.hpp"
#include "chunklift/client/session_store.hpp"
#include "chunklift/client/transfer_planner.hpp"
#include "chunklift/client/upload_worker.hpp"

#include "fake_remote.hpp"

using namespace chunklift;
using namespace chunklift::client;
using chunklift::testing::FakeUploadServer;

namespace
{

    constexpr std::uint64_t kUnit = 320 * 1024;

    struct PlannerHarness
    {
        explicit PlannerHarness(const std::string &name)
            : root(testing::fresh_directory(name)),
              sessions(root / "state" / "sessions"),
              batch(root / "state" / "batch.json")
        {
            settings.initial_chunk_size = kUnit;
            settings.min_chunk_size = kUnit;
            settings.max_chunk_size = 4 * kUnit;
            server.clock = &clock;
        }

        ~PlannerHarness()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        std::filesystem::path add_file(const std::string &name, std::uint64_t size, unsigned seed)
        {
            const auto path = root / "data" / name;
            testing::write_file(path, testing::make_content(size, seed));
            return path;
        }

        PlannerServices services()
        {
            auto &fake = server;
            return PlannerServices{
                sessions,
                batch,
                auth,
                [&fake]()
                { return std::make_unique<testing::FakeRemote>(fake); },
                logger,
                settings,
                clock.engine_clock(),
            };
        }

        BatchRequest request(std::vector<std::filesystem::path> files) const
        {
            return BatchRequest{std::move(files), root / "data", "Backups", "me@example.com"};
        }

        BatchReport run(const std::vector<std::filesystem::path> &files, const CancellationCheck &is_cancelled = {})
        {
            TransferPlanner planner(services());
            return planner.run(request(files), observer, is_cancelled);
        }

        std::string remote_of(const std::string &upload_url) const
        {
            const auto it = server.sessions.find(upload_url);
            return it == server.sessions.end() ? std::string{} : it->second.remote_path;
        }

        std::filesystem::path root;
        SessionStore sessions;
        BatchState batch;
        TransferSettings settings;
        testing::FakeClock clock;
        FakeUploadServer server;
        testing::FakeAuth auth;
        testing::RecordingObserver observer;
        Logger logger;
    };

    bool contains_message(const std::vector<std::string> &messages, const std::string &needle)
    {
        return std::any_of(messages.begin(), messages.end(), [&needle](const std::string &message)
                           { return message.find(needle) != std::string::npos; });
    }

    void test_batch_halts_and_resumes_in_order()
    {
        PlannerHarness harness("chunklift_planner_halt");
        harness.settings.max_consecutive_failures = 1;
        const auto a = harness.add_file("a.bin", 2 * kUnit + 10, 1);
        const auto b = harness.add_file("b.bin", 3 * kUnit + 20, 2);
        const auto c = harness.add_file("c.bin", kUnit + 30, 3);
        const std::vector<std::filesystem::path> files{a, b, c};
        const std::uint64_t total = (2 * kUnit + 10) + (3 * kUnit + 20) + (kUnit + 30);

        auto &server = harness.server;
        server.chunk_hook = [&harness](const testing::ChunkCall &call, std::string_view) -> std::optional<protocol::RemoteResponse>
        {
            if (harness.remote_of(call.upload_url) == "Backups/data/b.bin")
            {
                return FakeUploadServer::transport_failure();
            }
            return std::nullopt;
        };

        const auto halted = harness.run(files);

        assert(!halted.success);
        assert(halted.files_total == 3);
        assert(halted.files_done == 1);
        assert(halted.bytes_total == total);
        assert(halted.bytes_completed == 2 * kUnit + 10);
        assert(halted.error == ErrorCode::RetriesExhausted);
        assert(halted.halted_at == b);
        assert(server.completed_files.count("Backups/data/a.bin") == 1);
        assert(server.create_calls == 2);

        const auto state = harness.batch.load();
        assert(state.status.ok());
        assert(state.entries.at(BatchState::key_for(a)) == FileStatus::Done);
        assert(state.entries.at(BatchState::key_for(b)) == FileStatus::Incomplete);
        assert(state.entries.at(BatchState::key_for(c)) == FileStatus::Pending);
        assert(contains_message(harness.observer.messages, "Found 3 files"));
        assert(contains_message(harness.observer.messages, "remaining files postponed"));

        server.chunk_hook = nullptr;
        harness.observer.updates.clear();
        harness.observer.messages.clear();
        const auto resumed = harness.run(files);

        assert(resumed.success);
        assert(resumed.files_done == 3);
        assert(resumed.bytes_completed == total);
        assert(!resumed.halted_at);
        // a.bin is skipped; b.bin resumes its stored session; only c.bin needs a new one.
        assert(server.create_calls == 3);
        assert(server.bytes_accepted == total);
        assert(server.completed_files.count("Backups/data/b.bin") == 1);
        assert(server.completed_files.count("Backups/data/c.bin") == 1);
        assert(!std::filesystem::exists(harness.batch.path()));

        const auto &updates = harness.observer.updates;
        assert(!updates.empty());
        assert(updates.front().uploaded_bytes == 2 * kUnit + 10);
        assert(updates.back().uploaded_bytes == total);
        assert(updates.back().total_bytes == total);
        assert(harness.observer.monotonic());
        assert(contains_message(harness.observer.messages, "Resuming batch: 1 files already uploaded"));
        assert(contains_message(harness.observer.messages, "All files uploaded"));
    }

    void test_aggregate_progress_survives_restarted_file()
    {
        PlannerHarness harness("chunklift_planner_monotonic");
        const auto a = harness.add_file("a.bin", kUnit, 4);
        const auto b = harness.add_file("b.bin", 6 * kUnit, 5);

        auto &server = harness.server;
        int b_chunks = 0;
        server.chunk_hook = [&harness, &b_chunks](const testing::ChunkCall &call, std::string_view) -> std::optional<protocol::RemoteResponse>
        {
            if (harness.remote_of(call.upload_url) == "Backups/data/b.bin" && ++b_chunks == 3)
            {
                harness.server.expire(call.upload_url);
            }
            return std::nullopt;
        };

        const auto report = harness.run({a, b});

        assert(report.success);
        assert(server.create_calls == 3);
        assert(harness.observer.monotonic());
        assert(harness.observer.updates.back().uploaded_bytes == 7 * kUnit);
    }

    void test_missing_file_halts_batch()
    {
        PlannerHarness harness("chunklift_planner_missing");
        const auto a = harness.add_file("a.bin", kUnit, 6);
        const auto gone = harness.root / "data" / "gone.bin";
        const auto c = harness.add_file("c.bin", kUnit, 7);

        const auto report = harness.run({a, gone, c});

        assert(!report.success);
        assert(report.error == ErrorCode::FileIo);
        assert(report.halted_at == gone);
        assert(report.files_done == 1);
        assert(harness.batch.load().entries.at(BatchState::key_for(gone)) == FileStatus::Incomplete);
        assert(harness.server.completed_files.count("Backups/data/c.bin") == 0);
    }

    void test_cancelled_batch_leaves_files_pending()
    {
        PlannerHarness harness("chunklift_planner_cancel");
        const auto a = harness.add_file("a.bin", kUnit, 8);
        const auto b = harness.add_file("b.bin", kUnit, 9);

        const auto report = harness.run({a, b}, []()
                                        { return true; });

        assert(!report.success);
        assert(report.error == ErrorCode::Cancelled);
        assert(report.halted_at == a);
        assert(harness.server.create_calls == 0);
        const auto state = harness.batch.load();
        assert(state.entries.at(BatchState::key_for(a)) == FileStatus::Pending);
        assert(state.entries.at(BatchState::key_for(b)) == FileStatus::Pending);
    }

    void test_upload_worker_delivers_callbacks()
    {
        PlannerHarness harness("chunklift_planner_worker");
        const auto a = harness.add_file("a.bin", 2 * kUnit, 10);
        const auto b = harness.add_file("b.bin", 3 * kUnit + 1, 11);
        const std::uint64_t total = 5 * kUnit + 1;

        std::mutex mutex;
        std::vector<std::uint64_t> progress;
        std::vector<std::string> logs;
        bool success = false;
        {
            UploadWorker worker(harness.services());
            success = worker.upload_batch(
                {a, b}, harness.root / "data", "Backups", "me@example.com",
                [&](std::uint64_t uploaded, std::uint64_t batch_total, double, double)
                {
                    std::lock_guard lock(mutex);
                    assert(batch_total == total);
                    progress.push_back(uploaded);
                },
                [&](const std::string &message)
                {
                    std::lock_guard lock(mutex);
                    logs.push_back(message);
                },
                []()
                { return false; });

            auto report = worker.submit(harness.request({a, b}), UploadCallbacks{}).get();
            assert(report.success);
            assert(report.files_total == 2);
        }

        assert(success);
        assert(!progress.empty());
        assert(progress.back() == total);
        assert(std::is_sorted(progress.begin(), progress.end()));
        assert(contains_message(logs, "Uploading Backups/data/a.bin"));
        assert(contains_message(logs, "All files uploaded"));
        assert(harness.server.completed_files.size() == 2);
    }

} // namespace

void run_transfer_planner_tests()
{
    test_batch_halts_and_resumes_in_order();
    test_aggregate_progress_survives_restarted_file();
    test_missing_file_halts_batch();
    test_cancelled_batch_leaves_files_pending();
    test_upload_worker_delivers_callbacks();
}
