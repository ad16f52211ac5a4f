#pragma once

/**
 * @file observability_sink.h
 * @brief Fire-and-forget copy of ledger events to an exporter
 */

#include "event_ledger.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace carebridge {

/**
 * @brief Destination for observability events
 */
class IEventExporter {
public:
    virtual ~IEventExporter() = default;

    virtual VoidResult deliver(const Event& event) = 0;
    virtual std::string name() const = 0;
};

/// Writes each event as one JSON line through the Logger
class LogEventExporter : public IEventExporter {
public:
    VoidResult deliver(const Event& event) override;
    std::string name() const override { return "log"; }
};

/// POSTs each event as JSON to a feed server
class FeedEventExporter : public IEventExporter {
public:
    FeedEventExporter(const std::string& url, int timeout_ms);

    VoidResult deliver(const Event& event) override;
    std::string name() const override { return "feed"; }

private:
    std::string url_;
    int timeout_ms_;
};

/**
 * @brief Bounded, drop-oldest queue drained by one worker thread
 *
 * publish() never waits on delivery. When the queue is full the oldest
 * queued event is discarded; the number of discarded events is delivered as
 * an observability.dropped meta-event ahead of the next real event.
 */
class ObservabilitySink {
public:
    ObservabilitySink(std::shared_ptr<IEventExporter> exporter, size_t capacity);
    ~ObservabilitySink();

    ObservabilitySink(const ObservabilitySink&) = delete;
    ObservabilitySink& operator=(const ObservabilitySink&) = delete;

    void start();
    void stop();  ///< Drains what is queued, then joins the worker

    void publish(const Event& event);

    /// Block until the queue is empty and nothing is in delivery (tests, shutdown)
    bool wait_idle(int timeout_ms);

    uint64_t dropped_count() const { return dropped_total_.load(); }
    uint64_t delivered_count() const { return delivered_total_.load(); }
    size_t capacity() const { return capacity_; }

private:
    void worker_thread();
    Event make_drop_event(uint64_t dropped) const;

    std::shared_ptr<IEventExporter> exporter_;
    size_t capacity_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Event> queue_;
    uint64_t pending_drops_ = 0;
    bool busy_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> dropped_total_{0};
    std::atomic<uint64_t> delivered_total_{0};
    std::thread worker_;
};

} // namespace carebridge
