#include "session_registry.h"
#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include "collaborators/handoff_service.h"
#include "collaborators/resource_directory.h"
#include "collaborators/risk_classifier.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

using json = nlohmann::json;

namespace carebridge {

namespace {

const int kFeedTimeoutMs = 500;

} // namespace

json SessionSnapshot::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["phase"] = phase_name(phase);
    j["consented"] = consented;
    j["message_count"] = message_count;
    j["peak_severity"] = severity_name(peak_severity);
    j["last_severity"] = severity_name(last_severity);
    j["created_at_ms"] = created_at_ms;
    j["last_activity_ms"] = last_activity_ms;
    j["close_reason"] = close_reason;
    j["escalation_unresolved"] = escalation_unresolved;
    if (escalation) j["escalation"] = escalation->to_json();
    j["last_sequence"] = last_sequence;
    return j;
}

SessionServices make_services(const Config& config) {
    SessionServices services;
    auto gate = std::make_shared<RedactionGate>(config.redaction.max_input_chars);
    services.gate = gate;
    services.ledger = std::make_shared<EventLedger>(gate);
    services.router = std::make_shared<IntentRouter>();

    std::shared_ptr<IRiskClassifier> classifier;
    if (!config.risk.classifier_endpoint.empty()) {
        classifier = std::make_shared<HttpRiskClassifier>(config.risk.classifier_endpoint,
                                                          config.risk.classifier_timeout_ms);
        LOG_INFO("Risk classifier: " + config.risk.classifier_endpoint);
    } else {
        LOG_INFO("Risk classifier: keyword rules only");
    }
    services.risk = std::make_shared<RiskMonitor>(config.risk, classifier);

    auto directory = std::make_shared<StaticResourceDirectory>();
    if (!config.resources.directory_file.empty()) {
        auto loaded = directory->load_file(config.resources.directory_file);
        if (loaded.is_error()) {
            LOG_WARN("Resource directory " + config.resources.directory_file + " not loaded: " +
                     loaded.error().message + " (using built-in data)");
        }
    }
    services.directory = directory;

    std::shared_ptr<IHandoffService> handoff;
    if (!config.escalation.handoff_endpoint.empty()) {
        handoff = std::make_shared<HttpHandoffService>(config.escalation.handoff_endpoint,
                                                       config.escalation.attempt_timeout_ms);
    } else {
        LOG_WARN("No hand-off service configured; escalations deliver directives only");
    }
    services.escalation = std::make_shared<EscalationCoordinator>(
        config.escalation, config.risk.emergency_threshold, services.ledger, handoff, directory);

    if (!config.generation.endpoint.empty()) {
        services.generator = std::make_shared<LLMClient>(config.generation);
        LOG_INFO("Generator: " + config.generation.endpoint + " (" + config.generation.model_name + ")");
    } else {
        LOG_INFO("Generator: canned phase responses");
    }
    return services;
}

class SessionRegistry::Impl {
public:
    Impl(const Config& config, SessionServices services, std::shared_ptr<SessionRecorder> recorder,
         std::shared_ptr<ObservabilitySink> observability)
        : config_(config)
        , services_(std::move(services))
        , recorder_(std::move(recorder))
        , observability_(std::move(observability))
        , rng_(std::random_device{}()) {
        if (recorder_) {
            std::shared_ptr<SessionRecorder> recorder_ref = recorder_;
            services_.ledger->add_sink([recorder_ref](const Event& event) {
                auto r = recorder_ref->append_event(event);
                if (r.is_error()) {
                    LOG_ERROR("Durable append failed: " + r.error().message);
                }
            });
        }
        if (observability_) {
            std::shared_ptr<ObservabilitySink> sink_ref = observability_;
            services_.ledger->add_sink([sink_ref](const Event& event) { sink_ref->publish(event); });
        }
        if (config_.observability.log_events) {
            services_.ledger->add_sink([](const Event& event) { LOG_DEBUG("[Event] " + event.to_json().dump()); });
        }
    }

    ~Impl() { stop(); }

    void start() {
        if (running_.exchange(true)) return;
        if (observability_) observability_->start();
        idle_thread_ = std::thread(&Impl::sweeper_loop, this, false);
        hard_thread_ = std::thread(&Impl::sweeper_loop, this, true);
        LOG_REGISTRY("Sweepers started (interval " + std::to_string(config_.session.sweep_interval_ms) + "ms)");
    }

    void stop() {
        if (!running_.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lock(sweep_mutex_);
        }
        sweep_cv_.notify_all();
        if (idle_thread_.joinable()) idle_thread_.join();
        if (hard_thread_.joinable()) hard_thread_.join();
        if (observability_) observability_->stop();
        LOG_REGISTRY("Sweepers stopped");
    }

    Result<std::string> create_session(const std::map<std::string, std::string>& metadata) {
        Session session;
        session.id = new_session_id();
        session.metadata = metadata;
        session.created_at_ms = wall_clock_ms();
        session.last_activity_ms = session.created_at_ms;
        session.created_at = Clock::now();
        session.last_activity = session.created_at;
        session.phase_entered_at = session.created_at;

        auto entry = std::make_shared<Entry>();
        entry->machine = std::make_unique<SessionStateMachine>(session, config_, services_);
        const std::string id = session.id;
        {
            std::lock_guard<std::mutex> session_lock(entry->mutex);
            {
                std::unique_lock<std::shared_mutex> lock(map_mutex_);
                sessions_[id] = entry;
            }
            entry->machine->start();
            persist(*entry);
        }
        created_++;
        LOG_REGISTRY("Created " + id);
        return id;
    }

    Result<TurnOutcome> submit_turn(const std::string& session_id, const TurnRequest& request) {
        std::shared_ptr<Entry> entry = find(session_id);
        if (!entry) return make_not_found_error(session_id);

        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->machine->is_closed()) {
            return make_session_closed_error(session_id);
        }
        auto outcome = entry->machine->handle_turn(request);
        if (outcome.is_error()) return outcome;

        turns_++;
        if (outcome.value().escalated) escalations_++;
        persist(*entry);
        if (outcome.value().closed) mark_closed(*entry);
        return outcome;
    }

    VoidResult close_session(const std::string& session_id, const std::string& reason) {
        std::shared_ptr<Entry> entry = find(session_id);
        if (!entry) return make_not_found_error(session_id);

        std::lock_guard<std::mutex> lock(entry->mutex);
        auto closed = entry->machine->force_close(reason);
        if (closed.is_error()) return closed;
        persist(*entry);
        mark_closed(*entry);
        return {};
    }

    Result<SessionSnapshot> snapshot(const std::string& session_id) const {
        std::shared_ptr<Entry> entry = find(session_id);
        if (!entry) return make_not_found_error(session_id);

        std::lock_guard<std::mutex> lock(entry->mutex);
        const Session& s = entry->machine->session();
        SessionSnapshot snap;
        snap.session_id = s.id;
        snap.phase = s.phase;
        snap.consented = s.consented;
        snap.message_count = s.message_count;
        for (const auto& v : s.risk_history) {
            snap.peak_severity = max_severity(snap.peak_severity, v.severity);
        }
        if (!s.risk_history.empty()) snap.last_severity = s.risk_history.back().severity;
        snap.created_at_ms = s.created_at_ms;
        snap.last_activity_ms = s.last_activity_ms;
        snap.close_reason = s.close_reason;
        snap.escalation_unresolved = s.escalation_unresolved;
        snap.escalation = s.escalation;
        snap.last_sequence = services_.ledger->last_sequence(s.id);
        return snap;
    }

    std::vector<std::string> active_sessions() const {
        std::vector<std::string> ids;
        for (const auto& [id, entry] : entries()) {
            if (!entry->closed.load()) ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    VoidResult restore_session(const std::string& session_id) {
        if (find(session_id)) {
            return make_error(ErrorType::InvalidInput, "session " + session_id + " is already loaded");
        }
        if (!recorder_) {
            return make_not_found_error(session_id);
        }
        auto events = recorder_->load_events(session_id);
        if (events.is_error()) return events.error();

        auto seeded = services_.ledger->seed(session_id, events.value());
        if (seeded.is_error()) return seeded;

        Session session;
        session.id = session_id;
        auto entry = std::make_shared<Entry>();
        entry->machine = std::make_unique<SessionStateMachine>(session, config_, services_);
        auto loaded = entry->machine->load_from_events(events.value());
        if (loaded.is_error()) {
            services_.ledger->archive(session_id);
            services_.ledger->release(session_id);
            LOG_ERROR("Restore of " + session_id + " rejected: " + loaded.error().message);
            return loaded;
        }

        std::lock_guard<std::mutex> session_lock(entry->mutex);
        {
            std::unique_lock<std::shared_mutex> lock(map_mutex_);
            if (sessions_.count(session_id)) {
                return make_error(ErrorType::InvalidInput, "session " + session_id + " is already loaded");
            }
            sessions_[session_id] = entry;
        }
        if (entry->machine->is_closed()) {
            services_.ledger->archive(session_id);
            mark_closed(*entry);
        } else {
            json p;
            p["events"] = events.value().size();
            p["phase"] = phase_name(entry->machine->phase());
            p["escalation_unresolved"] = entry->machine->session().escalation_unresolved;
            auto appended = services_.ledger->append(session_id, EventKind::SessionRestored, p);
            if (appended.is_error()) {
                LOG_ERROR("Cannot record restore of " + session_id + ": " + appended.error().message);
            }
            persist(*entry);
        }
        restored_++;
        LOG_REGISTRY("Restored " + session_id + " in " + phase_name(entry->machine->phase()) + " from " +
                     std::to_string(events.value().size()) + " events");
        return {};
    }

    size_t sweep_idle(TimePoint now) {
        size_t closed = 0;
        for (const auto& [id, entry] : entries()) {
            if (entry->closed.load()) continue;
            // A session mid-turn is by definition not idle
            std::unique_lock<std::mutex> lock(entry->mutex, std::try_to_lock);
            if (!lock.owns_lock()) continue;
            if (entry->machine->is_closed()) continue;

            if (entry->machine->on_tick(now)) {
                persist(*entry);
                if (entry->machine->is_closed()) {
                    mark_closed(*entry);
                    closed++;
                    continue;
                }
            }

            const Session& s = entry->machine->session();
            if (s.escalation_unresolved) continue;
            if (ms_between(s.last_activity, now) < config_.session.idle_timeout_ms) continue;

            auto r = entry->machine->force_close("idle_timeout");
            if (r.is_error()) {
                LOG_WARN("Idle close of " + id + " failed: " + r.error().message);
                continue;
            }
            persist(*entry);
            mark_closed(*entry);
            idle_closed_++;
            closed++;
        }
        return closed;
    }

    size_t sweep_hard(TimePoint now) {
        size_t closed = 0;
        std::vector<std::string> expired;
        for (const auto& [id, entry] : entries()) {
            if (entry->closed.load(std::memory_order_acquire)) {
                if (ms_between(entry->closed_at, now) >= config_.session.closed_retention_ms) {
                    expired.push_back(id);
                }
                continue;
            }
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->machine->is_closed()) continue;
            if (ms_between(entry->machine->session().created_at, now) < config_.session.hard_timeout_ms) continue;

            auto r = entry->machine->force_close("hard_timeout");
            if (r.is_error()) {
                LOG_WARN("Hard close of " + id + " failed: " + r.error().message);
                continue;
            }
            persist(*entry);
            mark_closed(*entry);
            hard_closed_++;
            closed++;
        }

        if (!expired.empty()) {
            std::unique_lock<std::shared_mutex> lock(map_mutex_);
            for (const auto& id : expired) {
                sessions_.erase(id);
                services_.ledger->release(id);
            }
            LOG_REGISTRY("Evicted " + std::to_string(expired.size()) + " closed session(s)");
        }
        return closed;
    }

    RegistryStats stats() const {
        RegistryStats st;
        for (const auto& [id, entry] : entries()) {
            if (entry->closed.load()) st.retained_closed++;
            else st.active++;
        }
        st.created = created_.load();
        st.restored = restored_.load();
        st.closed = closed_.load();
        st.turns = turns_.load();
        st.escalations = escalations_.load();
        st.idle_closed = idle_closed_.load();
        st.hard_closed = hard_closed_.load();
        st.observability_dropped = observability_ ? observability_->dropped_count() : 0;
        return st;
    }

    std::shared_ptr<EventLedger> ledger() const { return services_.ledger; }

private:
    struct Entry {
        mutable std::mutex mutex;
        std::unique_ptr<SessionStateMachine> machine;
        std::atomic<bool> closed{false};
        TimePoint closed_at;
    };

    std::shared_ptr<Entry> find(const std::string& session_id) const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> entries() const {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        return {sessions_.begin(), sessions_.end()};
    }

    /// Caller holds entry.mutex
    void mark_closed(Entry& entry) {
        if (entry.closed.load(std::memory_order_relaxed)) return;
        // closed_at is written once, before closed is published to the sweeper
        entry.closed_at = Clock::now();
        entry.closed.store(true, std::memory_order_release);
        closed_++;
    }

    /// Caller holds entry.mutex
    void persist(const Entry& entry) {
        if (!recorder_) return;
        const Session& s = entry.machine->session();
        auto r = recorder_->write_record(s.id, s.to_record());
        if (r.is_error()) {
            LOG_ERROR("Session record write failed for " + s.id + ": " + r.error().message);
        }
    }

    std::string new_session_id() {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_int_distribution<uint32_t> dist;
        for (;;) {
            std::string id = "sess-" + utils::to_hex32(dist(rng_)) + utils::to_hex32(dist(rng_));
            if (!find(id) && !(recorder_ && recorder_->has_session(id))) return id;
        }
    }

    void sweeper_loop(bool hard) {
        const auto interval = std::chrono::milliseconds(std::max(10, config_.session.sweep_interval_ms));
        while (running_) {
            {
                std::unique_lock<std::mutex> lock(sweep_mutex_);
                sweep_cv_.wait_for(lock, interval, [this] { return !running_; });
            }
            if (!running_) break;
            size_t n = hard ? sweep_hard(Clock::now()) : sweep_idle(Clock::now());
            if (n > 0) {
                LOG_REGISTRY(std::string(hard ? "Hard" : "Idle") + " sweep closed " + std::to_string(n) +
                             " session(s)");
            }
        }
    }

    Config config_;
    SessionServices services_;
    std::shared_ptr<SessionRecorder> recorder_;
    std::shared_ptr<ObservabilitySink> observability_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    std::atomic<bool> running_{false};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::thread idle_thread_;
    std::thread hard_thread_;

    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> restored_{0};
    std::atomic<uint64_t> closed_{0};
    std::atomic<uint64_t> turns_{0};
    std::atomic<uint64_t> escalations_{0};
    std::atomic<uint64_t> idle_closed_{0};
    std::atomic<uint64_t> hard_closed_{0};
};

namespace {

std::shared_ptr<SessionRecorder> make_recorder(const Config& config) {
    if (!config.store.enabled) return nullptr;
    return std::make_shared<SessionRecorder>(config.store.dir);
}

std::shared_ptr<ObservabilitySink> make_observability(const Config& config) {
    std::shared_ptr<IEventExporter> exporter;
    if (!config.observability.feed_url.empty()) {
        exporter = std::make_shared<FeedEventExporter>(config.observability.feed_url, kFeedTimeoutMs);
    } else {
        exporter = std::make_shared<LogEventExporter>();
    }
    return std::make_shared<ObservabilitySink>(exporter, config.observability.queue_capacity);
}

} // namespace

SessionRegistry::SessionRegistry(const Config& config)
    : SessionRegistry(config, make_services(config), make_recorder(config), make_observability(config)) {}

SessionRegistry::SessionRegistry(const Config& config, SessionServices services,
                                 std::shared_ptr<SessionRecorder> recorder,
                                 std::shared_ptr<ObservabilitySink> observability)
    : pimpl_(std::make_unique<Impl>(config, std::move(services), std::move(recorder), std::move(observability))) {}

SessionRegistry::~SessionRegistry() = default;

void SessionRegistry::start() {
    pimpl_->start();
}

void SessionRegistry::stop() {
    pimpl_->stop();
}

Result<std::string> SessionRegistry::create_session(const std::map<std::string, std::string>& metadata) {
    return pimpl_->create_session(metadata);
}

Result<TurnOutcome> SessionRegistry::submit_turn(const std::string& session_id, const TurnRequest& request) {
    return pimpl_->submit_turn(session_id, request);
}

VoidResult SessionRegistry::close_session(const std::string& session_id, const std::string& reason) {
    return pimpl_->close_session(session_id, reason);
}

Result<SessionSnapshot> SessionRegistry::snapshot(const std::string& session_id) const {
    return pimpl_->snapshot(session_id);
}

std::vector<std::string> SessionRegistry::active_sessions() const {
    return pimpl_->active_sessions();
}

VoidResult SessionRegistry::restore_session(const std::string& session_id) {
    return pimpl_->restore_session(session_id);
}

size_t SessionRegistry::sweep_idle(TimePoint now) {
    return pimpl_->sweep_idle(now);
}

size_t SessionRegistry::sweep_hard(TimePoint now) {
    return pimpl_->sweep_hard(now);
}

RegistryStats SessionRegistry::stats() const {
    return pimpl_->stats();
}

std::shared_ptr<EventLedger> SessionRegistry::ledger() const {
    return pimpl_->ledger();
}

} // namespace carebridge
