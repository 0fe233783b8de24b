#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "chunklift/client/observer.hpp"

namespace chunklift::client
{

    // Bounded hand-off from the transfer worker to caller callbacks, which run on a
    // dedicated dispatcher thread. Publishing never waits for the callbacks.
    class EventChannel final : public TransferObserver
    {
    public:
        static constexpr std::size_t kDefaultCapacity = 256;

        EventChannel(ProgressCallback on_progress, LogCallback on_log, std::size_t capacity = kDefaultCapacity);
        ~EventChannel() override;

        EventChannel(const EventChannel &) = delete;
        EventChannel &operator=(const EventChannel &) = delete;

        void on_progress(const ProgressUpdate &update) override;

        void on_log(const std::string &message) override;

        // Stops accepting events, delivers everything still queued and joins the dispatcher.
        void close();

        std::size_t dropped_events() const noexcept
        {
            return dropped_.load();
        }

    private:
        struct Event
        {
            bool is_progress{};
            ProgressUpdate progress{};
            std::string message{};
        };

        void publish(Event event);
        void dispatch_loop();
        void deliver(const Event &event);

        ProgressCallback on_progress_;
        LogCallback on_log_;
        std::size_t capacity_;
        std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<Event> queue_;
        bool closed_{false};
        std::atomic<std::size_t> dropped_{0};
        std::thread dispatcher_;
    };

} // namespace chunklift::client
