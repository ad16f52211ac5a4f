#include "event_ledger.h"
#include "common.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

using json = nlohmann::json;

namespace carebridge {

namespace {

struct KindName {
    EventKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {EventKind::SessionCreated, "session.created"},
    {EventKind::TurnReceived, "turn.received"},
    {EventKind::RiskAssessed, "risk.assessed"},
    {EventKind::RiskDegraded, "risk.degraded"},
    {EventKind::PhaseTransition, "phase.transition"},
    {EventKind::GuardViolation, "guard.violation"},
    {EventKind::ResponseGenerated, "response.generated"},
    {EventKind::ResourceDelivered, "resource.delivered"},
    {EventKind::EscalationDirective, "escalation.directive"},
    {EventKind::EscalationAttempt, "escalation.attempt"},
    {EventKind::EscalationResolved, "escalation.resolved"},
    {EventKind::EscalationUnresolved, "escalation.unresolved"},
    {EventKind::CollaboratorDegraded, "collaborator.degraded"},
    {EventKind::SessionClosed, "session.closed"},
    {EventKind::SessionRestored, "session.restored"},
    {EventKind::ObservabilityDropped, "observability.dropped"},
};

/// Replace every string value (recursively) with its sanitized form
void redact_payload(json& node, const RedactionGate& gate) {
    if (node.is_string()) {
        RedactionResult r = gate.redact(node.get<std::string>());
        if (r.changed()) {
            node = r.sanitized;
        }
    } else if (node.is_array() || node.is_object()) {
        for (auto& child : node) {
            redact_payload(child, gate);
        }
    }
}

} // namespace

const char* event_kind_name(EventKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "unknown";
}

bool parse_event_kind(const std::string& name, EventKind& out) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            out = entry.kind;
            return true;
        }
    }
    return false;
}

json Event::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["sequence"] = sequence;
    j["kind"] = event_kind_name(kind);
    j["timestamp_ms"] = timestamp_ms;
    j["payload"] = payload;
    return j;
}

Result<Event> Event::from_json(const json& j) {
    try {
        Event e;
        e.session_id = j.at("session_id").get<std::string>();
        e.sequence = j.at("sequence").get<uint64_t>();
        std::string kind = j.at("kind").get<std::string>();
        if (!parse_event_kind(kind, e.kind)) {
            return make_parse_error("unknown event kind: " + kind);
        }
        e.timestamp_ms = j.value("timestamp_ms", static_cast<int64_t>(0));
        if (j.contains("payload")) e.payload = j["payload"];
        return e;
    } catch (const json::exception& ex) {
        return make_parse_error(std::string("malformed event: ") + ex.what());
    }
}

class EventLedger::Impl {
public:
    explicit Impl(std::shared_ptr<const RedactionGate> gate) : gate_(std::move(gate)) {}

    Result<Event> append(const std::string& session_id, EventKind kind, json payload,
                         const std::vector<std::string>& verbatim_fields) {
        if (!payload.is_object()) {
            json wrapped = json::object();
            wrapped["value"] = std::move(payload);
            payload = std::move(wrapped);
        }
        if (gate_) {
            for (auto it = payload.begin(); it != payload.end(); ++it) {
                if (std::find(verbatim_fields.begin(), verbatim_fields.end(), it.key()) != verbatim_fields.end()) {
                    continue;
                }
                redact_payload(it.value(), *gate_);
            }
        }

        std::shared_ptr<Stream> stream = get_or_create(session_id);

        // Delivery lock first: subscribers see events in sequence order
        std::unique_lock<std::mutex> delivery(stream->delivery_mutex);
        Event event;
        std::vector<Callback> subscribers;
        {
            std::lock_guard<std::mutex> lock(stream->data_mutex);
            if (stream->archived) {
                return make_error(ErrorType::InvalidInput,
                                  "ledger stream for " + session_id + " is archived");
            }
            event.session_id = session_id;
            event.sequence = stream->next_sequence++;
            event.kind = kind;
            event.timestamp_ms = wall_clock_ms();
            event.payload = std::move(payload);
            stream->events.push_back(event);

            for (const auto& sink : sinks_snapshot()) {
                sink(event);
            }
            for (const auto& [id, cb] : stream->subscribers) {
                subscribers.push_back(cb);
            }
        }

        LOG_LEDGER(session_id + " #" + std::to_string(event.sequence) + " " + event_kind_name(kind));

        for (const auto& cb : subscribers) {
            cb(event);
        }
        return event;
    }

    std::vector<Event> replay(const std::string& session_id, uint64_t from_sequence) const {
        std::shared_ptr<Stream> stream = find(session_id);
        if (!stream) return {};
        std::lock_guard<std::mutex> lock(stream->data_mutex);
        std::vector<Event> out;
        for (const auto& e : stream->events) {
            if (e.sequence >= from_sequence) out.push_back(e);
        }
        return out;
    }

    SubscriberId subscribe(const std::string& session_id, Callback callback) {
        std::shared_ptr<Stream> stream = get_or_create(session_id);
        SubscriberId id = next_subscriber_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(stream->data_mutex);
            stream->subscribers[id] = std::move(callback);
        }
        std::lock_guard<std::mutex> lock(subscriber_index_mutex_);
        subscriber_index_[id] = session_id;
        return id;
    }

    bool unsubscribe(SubscriberId id) {
        std::string session_id;
        {
            std::lock_guard<std::mutex> lock(subscriber_index_mutex_);
            auto it = subscriber_index_.find(id);
            if (it == subscriber_index_.end()) return false;
            session_id = it->second;
            subscriber_index_.erase(it);
        }
        std::shared_ptr<Stream> stream = find(session_id);
        if (!stream) return false;
        std::lock_guard<std::mutex> lock(stream->data_mutex);
        return stream->subscribers.erase(id) > 0;
    }

    void add_sink(Callback sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void archive(const std::string& session_id) {
        std::shared_ptr<Stream> stream = find(session_id);
        if (!stream) return;
        std::lock_guard<std::mutex> lock(stream->data_mutex);
        stream->archived = true;
    }

    bool is_archived(const std::string& session_id) const {
        std::shared_ptr<Stream> stream = find(session_id);
        if (!stream) return false;
        std::lock_guard<std::mutex> lock(stream->data_mutex);
        return stream->archived;
    }

    VoidResult seed(const std::string& session_id, const std::vector<Event>& events) {
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].sequence != i + 1 || events[i].session_id != session_id) {
                return make_error(ErrorType::InvalidInput,
                                  "persisted stream for " + session_id + " has a gap or foreign event at position " +
                                  std::to_string(i + 1));
            }
        }
        std::unique_lock<std::shared_mutex> lock(streams_mutex_);
        if (streams_.count(session_id)) {
            return make_error(ErrorType::InvalidInput, "ledger stream for " + session_id + " already exists");
        }
        auto stream = std::make_shared<Stream>();
        stream->events = events;
        stream->next_sequence = events.size() + 1;
        streams_[session_id] = stream;
        return {};
    }

    bool release(const std::string& session_id) {
        std::unique_lock<std::shared_mutex> lock(streams_mutex_);
        auto it = streams_.find(session_id);
        if (it == streams_.end()) return false;
        {
            std::lock_guard<std::mutex> data(it->second->data_mutex);
            if (!it->second->archived) return false;
        }
        streams_.erase(it);
        return true;
    }

    uint64_t last_sequence(const std::string& session_id) const {
        std::shared_ptr<Stream> stream = find(session_id);
        if (!stream) return 0;
        std::lock_guard<std::mutex> lock(stream->data_mutex);
        return stream->next_sequence - 1;
    }

    bool has_stream(const std::string& session_id) const {
        return static_cast<bool>(find(session_id));
    }

private:
    struct Stream {
        std::mutex data_mutex;
        std::mutex delivery_mutex;
        std::vector<Event> events;
        uint64_t next_sequence = 1;
        bool archived = false;
        std::map<SubscriberId, Callback> subscribers;
    };

    std::shared_ptr<Stream> find(const std::string& session_id) const {
        std::shared_lock<std::shared_mutex> lock(streams_mutex_);
        auto it = streams_.find(session_id);
        return it == streams_.end() ? nullptr : it->second;
    }

    std::shared_ptr<Stream> get_or_create(const std::string& session_id) {
        {
            std::shared_lock<std::shared_mutex> lock(streams_mutex_);
            auto it = streams_.find(session_id);
            if (it != streams_.end()) return it->second;
        }
        std::unique_lock<std::shared_mutex> lock(streams_mutex_);
        auto& slot = streams_[session_id];
        if (!slot) slot = std::make_shared<Stream>();
        return slot;
    }

    std::vector<Callback> sinks_snapshot() const {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        return sinks_;
    }

    std::shared_ptr<const RedactionGate> gate_;

    mutable std::shared_mutex streams_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Stream>> streams_;

    mutable std::mutex sinks_mutex_;
    std::vector<Callback> sinks_;

    std::mutex subscriber_index_mutex_;
    std::map<SubscriberId, std::string> subscriber_index_;
    std::atomic<SubscriberId> next_subscriber_{1};
};

EventLedger::EventLedger(std::shared_ptr<const RedactionGate> gate)
    : pimpl_(std::make_unique<Impl>(std::move(gate))) {}

EventLedger::~EventLedger() = default;

Result<Event> EventLedger::append(const std::string& session_id, EventKind kind, json payload,
                                  const std::vector<std::string>& verbatim_fields) {
    return pimpl_->append(session_id, kind, std::move(payload), verbatim_fields);
}

std::vector<Event> EventLedger::replay(const std::string& session_id, uint64_t from_sequence) const {
    return pimpl_->replay(session_id, from_sequence);
}

EventLedger::SubscriberId EventLedger::subscribe(const std::string& session_id, Callback callback) {
    return pimpl_->subscribe(session_id, std::move(callback));
}

bool EventLedger::unsubscribe(SubscriberId id) {
    return pimpl_->unsubscribe(id);
}

void EventLedger::add_sink(Callback sink) {
    pimpl_->add_sink(std::move(sink));
}

void EventLedger::archive(const std::string& session_id) {
    pimpl_->archive(session_id);
}

bool EventLedger::is_archived(const std::string& session_id) const {
    return pimpl_->is_archived(session_id);
}

VoidResult EventLedger::seed(const std::string& session_id, const std::vector<Event>& events) {
    return pimpl_->seed(session_id, events);
}

bool EventLedger::release(const std::string& session_id) {
    return pimpl_->release(session_id);
}

uint64_t EventLedger::last_sequence(const std::string& session_id) const {
    return pimpl_->last_sequence(session_id);
}

bool EventLedger::has_stream(const std::string& session_id) const {
    return pimpl_->has_stream(session_id);
}

} // namespace carebridge
