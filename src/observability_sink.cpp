#include "observability_sink.h"
#include "common.h"
#include "http_client.h"
#include "logger.h"
#include <chrono>

namespace carebridge {

VoidResult LogEventExporter::deliver(const Event& event) {
    Logger::info("[OBS] " + event.to_json().dump());
    return {};
}

FeedEventExporter::FeedEventExporter(const std::string& url, int timeout_ms)
    : url_(url), timeout_ms_(timeout_ms) {}

VoidResult FeedEventExporter::deliver(const Event& event) {
    auto result = http_post_json(url_, event.to_json().dump(), timeout_ms_, timeout_ms_);
    if (result.is_error()) {
        return result.error();
    }
    long status = result.value().status;
    if (status < 200 || status >= 300) {
        return make_network_error("feed server returned HTTP " + std::to_string(status));
    }
    return {};
}

ObservabilitySink::ObservabilitySink(std::shared_ptr<IEventExporter> exporter, size_t capacity)
    : exporter_(std::move(exporter)), capacity_(capacity == 0 ? 1 : capacity) {}

ObservabilitySink::~ObservabilitySink() {
    stop();
}

void ObservabilitySink::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&ObservabilitySink::worker_thread, this);
    LOG_INFO("Observability sink started (exporter=" + exporter_->name() +
             ", capacity=" + std::to_string(capacity_) + ")");
}

void ObservabilitySink::stop() {
    if (!running_.exchange(false)) return;
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (dropped_total_ > 0) {
        LOG_WARN("Observability sink stopped, " + std::to_string(dropped_total_.load()) + " events dropped");
    }
}

void ObservabilitySink::publish(const Event& event) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            pending_drops_++;
            dropped = true;
        }
        queue_.push_back(event);
    }
    if (dropped) {
        dropped_total_++;
    }
    queue_cv_.notify_one();
}

bool ObservabilitySink::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return queue_.empty() && !busy_; });
}

Event ObservabilitySink::make_drop_event(uint64_t dropped) const {
    Event meta;
    meta.kind = EventKind::ObservabilityDropped;
    meta.timestamp_ms = wall_clock_ms();
    meta.payload["dropped"] = dropped;
    meta.payload["dropped_total"] = dropped_total_.load();
    meta.payload["capacity"] = capacity_;
    return meta;
}

void ObservabilitySink::worker_thread() {
    while (true) {
        Event event;
        uint64_t drops = 0;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) {
                // Stopped and drained
                idle_cv_.notify_all();
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            drops = pending_drops_;
            pending_drops_ = 0;
            busy_ = true;
        }

        if (drops > 0) {
            Event meta = make_drop_event(drops);
            LOG_WARN("Observability queue overflow: dropped " + std::to_string(drops) + " oldest events");
            auto r = exporter_->deliver(meta);
            if (r.is_error()) {
                LOG_WARN("Observability export failed (" + exporter_->name() + "): " + r.error().message);
            }
        }

        auto r = exporter_->deliver(event);
        if (r.is_error()) {
            LOG_WARN("Observability export failed (" + exporter_->name() + "): " + r.error().message);
        } else {
            delivered_total_++;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace carebridge
