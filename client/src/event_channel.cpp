#include "chunklift/client/event_channel.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace chunklift::client
{

    EventChannel::EventChannel(ProgressCallback on_progress, LogCallback on_log, std::size_t capacity)
        : on_progress_(std::move(on_progress)),
          on_log_(std::move(on_log)),
          capacity_(std::max<std::size_t>(capacity, 1))
    {
        dispatcher_ = std::thread([this]
                                  { dispatch_loop(); });
    }

    EventChannel::~EventChannel()
    {
        close();
    }

    void EventChannel::on_progress(const ProgressUpdate &update)
    {
        publish(Event{true, update, {}});
    }

    void EventChannel::on_log(const std::string &message)
    {
        publish(Event{false, {}, message});
    }

    void EventChannel::publish(Event event)
    {
        {
            std::lock_guard lock(mutex_);
            if (closed_)
            {
                return;
            }
            if (queue_.size() >= capacity_)
            {
                // Progress is cumulative: the oldest queued update is superseded by any newer one.
                auto stale = std::find_if(queue_.begin(), queue_.end(), [](const Event &queued)
                                          { return queued.is_progress; });
                if (stale != queue_.end())
                {
                    queue_.erase(stale);
                }
                else
                {
                    ++dropped_;
                    return;
                }
                ++dropped_;
            }
            queue_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    void EventChannel::close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_one();
        if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id())
        {
            dispatcher_.join();
        }
    }

    void EventChannel::dispatch_loop()
    {
        std::unique_lock lock(mutex_);
        for (;;)
        {
            ready_.wait(lock, [this]
                        { return closed_ || !queue_.empty(); });
            if (queue_.empty())
            {
                return;
            }
            auto event = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            deliver(event);
            lock.lock();
        }
    }

    void EventChannel::deliver(const Event &event)
    {
        try
        {
            if (event.is_progress)
            {
                if (on_progress_)
                {
                    on_progress_(event.progress.uploaded_bytes, event.progress.total_bytes,
                                 event.progress.speed_bytes_per_sec, event.progress.eta_seconds);
                }
            }
            else if (on_log_)
            {
                on_log_(event.message);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Transfer observer callback failed: {}", ex.what());
        }
    }

} // namespace chunklift::client
