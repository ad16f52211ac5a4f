#include "state_machine.h"
#include "logger.h"
#include "core/bounded_call.h"
#include <algorithm>
#include <set>

using json = nlohmann::json;

namespace carebridge {

namespace {

const char* kConsentPrompt =
    "Hi, I'm a peer-support companion. I'm not a therapist or an emergency service, and "
    "if you are in danger please contact your local emergency number. "
    "Do you consent to continue? (yes/no)";
const char* kConsentDeclined =
    "That's okay. I can only continue once you agree. Reply yes whenever you're ready.";
const char* kWelcome = "Thank you. What's been on your mind today?";
const char* kTriageAck = "Thank you for telling me. I'm listening.";
const char* kFarewell = "Thank you for talking with me. Take care of yourself.";
const char* kConsentRevoked =
    "Understood. I've stopped and removed anything I was holding for this conversation. Take care.";

const size_t kSummaryChars = 280;

/// Risk categories that map directly to resource categories
const std::set<std::string> kResourceCategories = {"suicide", "self_harm", "harm_to_others", "abuse", "crisis"};

std::string truncate(const std::string& s, size_t n) {
    if (s.size() <= n) return s;
    // Do not split a UTF-8 sequence
    size_t cut = n;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "...";
}

json manifest_types(const RedactionResult& r) {
    json types = json::array();
    for (const auto& entry : r.manifest) {
        types.push_back(entry.type);
    }
    return types;
}

Error first_error(const Result<Event>& r) {
    return r.is_error() ? r.error() : Error();
}

} // namespace

bool SessionStateMachine::is_legal_transition(Phase from, Phase to) {
    switch (from) {
        case Phase::Init:
            return to == Phase::Consented || to == Phase::Close || to == Phase::Escalate;
        case Phase::Consented:
            return to == Phase::Triage || to == Phase::Close || to == Phase::Escalate;
        case Phase::Triage:
            return to == Phase::SupportLoop || to == Phase::Close || to == Phase::Escalate;
        case Phase::SupportLoop:
            return to == Phase::Resources || to == Phase::RiskCheck || to == Phase::Close || to == Phase::Escalate;
        case Phase::RiskCheck:
            return to == Phase::SupportLoop || to == Phase::Close || to == Phase::Escalate;
        case Phase::Resources:
            return to == Phase::SupportLoop || to == Phase::Close || to == Phase::Escalate;
        case Phase::Escalate:
            return to == Phase::Close;
        case Phase::Close:
            return false;
    }
    return false;
}

class SessionStateMachine::Impl {
public:
    Impl(Session session, const Config& config, SessionServices services)
        : session_(std::move(session))
        , config_(config)
        , services_(std::move(services)) {}

    void start() {
        now_ = Clock::now();
        json p;
        p["locale"] = session_.locale(config_.session.default_locale);
        p["metadata"] = session_.metadata;
        p["max_messages"] = config_.session.max_messages;
        p["consent_timeout_ms"] = config_.session.consent_timeout_ms;
        emit(EventKind::SessionCreated, p);
        LOG_SESSION(session_.id + " created");
    }

    Result<TurnOutcome> handle_turn(const TurnRequest& request) {
        if (session_.phase == Phase::Close) {
            return make_session_closed_error(session_.id);
        }
        now_ = Clock::now();
        pending_close_.clear();
        response_source_ = "system";

        TurnOutcome out;
        out.session_id = session_.id;
        out.first_sequence = services_.ledger->last_sequence(session_.id) + 1;

        session_.message_count++;
        session_.last_activity = now_;
        session_.last_activity_ms = wall_clock_ms();
        out.turn = session_.message_count;
        const Phase turn_phase = session_.phase;

        // 1. Redaction; nothing downstream sees the raw text
        RedactionResult redacted = services_.gate->redact(request.text);
        vault_.capture(redacted, request.text);
        out.sanitized_text = redacted.sanitized;

        json turn;
        turn["turn"] = session_.message_count;
        turn["phase"] = phase_name(turn_phase);
        turn["text"] = redacted.sanitized;
        turn["redactions"] = redacted.manifest.size();
        turn["redaction_types"] = manifest_types(redacted);
        if (redacted.failed_closed) {
            turn["redaction_failed"] = true;
            turn["error"] = error_type_name(ErrorType::RedactionFailure);
            turn["failure_reason"] = redacted.failure_reason;
        }
        if (request.consent.has_value()) turn["consent_signal"] = *request.consent;
        if (request.request_resources) turn["resources_requested"] = true;
        if (request.request_exit) turn["exit_requested"] = true;
        emit(EventKind::TurnReceived, turn);
        LOG_TRACE(session_.id, "turn", "n=" + std::to_string(session_.message_count) +
                  " phase=" + phase_name(turn_phase) +
                  " redactions=" + std::to_string(redacted.manifest.size()));

        // 2. Intent; explicit caller signals take precedence over text
        TurnIntent intent;
        if (!redacted.failed_closed) {
            intent = services_.router->decide(redacted.sanitized);
        }
        std::optional<bool> consent = request.consent.has_value() ? request.consent : intent.consent;
        const bool wants_resources = request.request_resources || intent.wants_resources;
        const bool wants_exit = request.request_exit || intent.wants_exit;
        const bool revokes = intent.revokes_consent || (request.consent.has_value() && !*request.consent);

        // 3. Risk on every turn, in every phase
        RiskVerdict verdict = assess(redacted, turn_phase);
        out.verdict = verdict;
        memory_.add_user_message(redacted.sanitized);

        // 4. Phase guards, fast-path first
        std::string response;
        if (turn_phase == Phase::Escalate) {
            // Exit and revocation still close; close() resolves a pending plan
            if (wants_exit) {
                pending_close_ = "user_exit";
                response = std::string(kFarewell) + " " + escalation_reply();
            } else if (revokes && session_.consented) {
                vault_.set_consent(false);
                pending_close_ = "consent_revoked";
                response = std::string(kConsentRevoked) + " " + escalation_reply();
            } else {
                response = escalation_reply();
            }
            response_source_ = "directive";
        } else if (at_least(verdict.severity, config_.risk.escalation_threshold)) {
            out.escalated = true;
            json extra;
            extra["severity"] = severity_name(verdict.severity);
            extra["signals"] = verdict.signals;
            if (transition(Phase::Escalate, "risk_fast_path", extra)) {
                run_escalation(verdict.severity);
            }
            response = escalation_reply();
            response_source_ = "directive";
        } else if (wants_exit) {
            pending_close_ = "user_exit";
            response = kFarewell;
        } else if (revokes && session_.consented) {
            vault_.set_consent(false);
            pending_close_ = "consent_revoked";
            response = kConsentRevoked;
        } else {
            response = phase_local(turn_phase, consent, wants_resources, redacted.sanitized, out);
        }

        // 5. Message cap; an unresolved escalation stays open for its retries
        if (pending_close_.empty() && session_.phase != Phase::Close && session_.phase != Phase::Escalate &&
            session_.message_count >= config_.session.max_messages) {
            pending_close_ = "message_cap";
        }

        if (!response.empty()) {
            memory_.add_assistant_message(response);
            json p;
            p["turn"] = session_.message_count;
            p["phase"] = phase_name(session_.phase);
            p["text"] = response;
            p["source"] = response_source_;
            // Generator text is model output and stays subject to redaction
            if (response_source_ == "generator") {
                emit(EventKind::ResponseGenerated, p);
            } else {
                emit(EventKind::ResponseGenerated, p, {"text"});
            }
        }

        if (!pending_close_.empty()) {
            close(pending_close_);
            pending_close_.clear();
        }

        out.phase = session_.phase;
        out.closed = session_.phase == Phase::Close;
        out.close_reason = session_.close_reason;
        out.escalation = session_.escalation;
        out.response = response;
        out.last_sequence = services_.ledger->last_sequence(session_.id);
        return out;
    }

    VoidResult force_close(const std::string& reason) {
        if (session_.phase == Phase::Close) {
            return make_session_closed_error(session_.id);
        }
        now_ = Clock::now();
        Error err = close(reason);
        if (err) return err;
        return {};
    }

    bool on_tick(TimePoint now) {
        if (session_.phase == Phase::Close) return false;
        now_ = now;
        const int64_t in_phase = ms_between(session_.phase_entered_at, now);

        switch (session_.phase) {
            case Phase::Init:
                if (in_phase >= config_.session.consent_timeout_ms) {
                    LOG_SESSION(session_.id + " consent timeout");
                    close("consent_timeout");
                    return true;
                }
                return false;
            case Phase::Triage:
                if (in_phase >= config_.session.triage_timeout_ms) {
                    auto turns = memory_.recent_user_turns(1);
                    session_.triage_summary = turns.empty() ? "" : truncate(turns.back(), kSummaryChars);
                    session_.triage_degraded = true;
                    json extra;
                    extra["triage_summary"] = session_.triage_summary;
                    extra["degraded"] = true;
                    transition(Phase::SupportLoop, "triage_timeout", extra);
                    return true;
                }
                return false;
            case Phase::Escalate:
                if (session_.escalation_unresolved && now >= session_.next_escalation_retry) {
                    retry_escalation();
                    return true;
                }
                return false;
            default:
                return false;
        }
    }

    VoidResult load_from_events(const std::vector<Event>& events) {
        auto replayed = SessionStateMachine::replay(events);
        if (replayed.is_error()) return replayed.error();
        const ReplayState& st = replayed.value();

        const TimePoint now = Clock::now();
        const int64_t wall_now = wall_clock_ms();
        session_.phase = st.phase;
        session_.consented = st.consented;
        session_.message_count = st.message_count;
        session_.risk_history = st.risk_history;
        session_.close_reason = st.close_reason;
        session_.triage_summary = st.triage_summary;
        session_.triage_degraded = st.triage_degraded;
        session_.escalation_unresolved = st.escalation_unresolved;
        session_.escalation_retry_rounds = st.escalation_retry_rounds;
        session_.escalation = st.escalation;
        if (!st.metadata.empty()) session_.metadata = st.metadata;
        session_.created_at_ms = st.created_at_ms;
        session_.last_activity_ms = st.last_activity_ms ? st.last_activity_ms : st.created_at_ms;
        session_.created_at = now - Duration(std::max<int64_t>(0, wall_now - session_.created_at_ms));
        session_.last_activity = now - Duration(std::max<int64_t>(0, wall_now - session_.last_activity_ms));
        // Phase timers restart on restore
        session_.phase_entered_at = now;
        session_.next_escalation_retry = now;

        memory_.clear();
        for (const auto& msg : st.history) {
            if (msg.role == memory::MessageRole::User) {
                memory_.add_user_message(msg.content);
            } else if (msg.role == memory::MessageRole::Assistant) {
                memory_.add_assistant_message(msg.content);
            }
        }
        vault_.set_consent(session_.consented && config_.redaction.reversible_tokens &&
                           session_.phase != Phase::Close);
        return {};
    }

    const Session& session() const { return session_; }
    const TokenVault& vault() const { return vault_; }
    const memory::ConversationMemory& memory() const { return memory_; }

private:
    // =========================================================================
    // Ledger helpers
    // =========================================================================

    Result<Event> emit(EventKind kind, json payload, const std::vector<std::string>& verbatim_fields = {}) {
        auto r = services_.ledger->append(session_.id, kind, std::move(payload), verbatim_fields);
        if (r.is_error()) {
            LOG_ERROR("Ledger append failed for " + session_.id + " (" + event_kind_name(kind) + "): " +
                      r.error().message);
        }
        return r;
    }

    bool transition(Phase to, const std::string& reason, json extra = json::object()) {
        const Phase from = session_.phase;
        if (!SessionStateMachine::is_legal_transition(from, to)) {
            json g;
            g["guard"] = "transition_table";
            g["from"] = phase_name(from);
            g["to"] = phase_name(to);
            g["reason"] = reason;
            g["error"] = error_type_name(ErrorType::GuardViolation);
            emit(EventKind::GuardViolation, g);
            LOG_ERROR("Illegal transition " + std::string(phase_name(from)) + " -> " + phase_name(to) +
                      " in " + session_.id);
            return false;
        }
        extra["from"] = phase_name(from);
        extra["to"] = phase_name(to);
        extra["reason"] = reason;
        emit(EventKind::PhaseTransition, extra);
        session_.phase = to;
        session_.phase_entered_at = now_;
        LOG_SESSION(session_.id + " " + phase_name(from) + " -> " + phase_name(to) + " (" + reason + ")");
        return true;
    }

    Error close(const std::string& reason) {
        if (session_.phase == Phase::Close) return Error();

        if (session_.escalation_unresolved && session_.escalation) {
            EscalationPlan& plan = *session_.escalation;
            plan.status = PlanStatus::Failed;
            plan.failure_reason = "session_closed";
            session_.escalation_unresolved = false;
            json p;
            p["plan_id"] = plan.plan_id;
            p["status"] = plan_status_name(plan.status);
            p["reason"] = plan.failure_reason;
            p["close_reason"] = reason;
            p["retry_rounds"] = session_.escalation_retry_rounds;
            p["error"] = error_type_name(ErrorType::EscalationExhausted);
            emit(EventKind::EscalationResolved, p);
            LOG_ESCALATION(session_.id + " closed with escalation unresolved (" + reason + ")");
        }

        transition(Phase::Close, reason);
        session_.close_reason = reason;

        Severity peak = Severity::None;
        for (const auto& v : session_.risk_history) {
            peak = max_severity(peak, v.severity);
        }
        json p;
        p["reason"] = reason;
        p["message_count"] = session_.message_count;
        p["duration_ms"] = ms_between(session_.created_at, now_);
        p["peak_severity"] = severity_name(peak);
        auto closed = emit(EventKind::SessionClosed, p);

        vault_.purge();
        vault_.set_consent(false);
        services_.ledger->archive(session_.id);
        LOG_SESSION(session_.id + " closed (" + reason + ")");
        return first_error(closed);
    }

    // =========================================================================
    // Risk
    // =========================================================================

    RiskVerdict assess(const RedactionResult& redacted, Phase turn_phase) {
        RiskVerdict verdict;
        if (redacted.failed_closed) {
            verdict = services_.risk->uninspectable_verdict(redacted.failure_reason);
        } else {
            RiskContext context;
            const size_t keep = std::max(config_.risk.context_turns, config_.risk.sustained_window);
            const auto& history = session_.risk_history;
            const size_t from = history.size() > keep ? history.size() - keep : 0;
            context.recent_verdicts.assign(history.begin() + static_cast<std::ptrdiff_t>(from), history.end());
            context.recent_turns = memory_.recent_user_turns(config_.risk.context_turns);
            verdict = services_.risk->assess(redacted.sanitized, context);
        }
        session_.risk_history.push_back(verdict);

        json p;
        p["turn"] = session_.message_count;
        p["phase"] = phase_name(turn_phase);
        p["verdict"] = verdict_to_json(verdict);
        if (turn_phase == Phase::SupportLoop) {
            p["check"] = phase_name(Phase::RiskCheck);
        }
        if (turn_phase == Phase::Escalate) {
            p["recorded_only"] = true;
        }
        emit(verdict.degraded ? EventKind::RiskDegraded : EventKind::RiskAssessed, p);
        LOG_RISK(session_.id + " severity=" + severity_name(verdict.severity) +
                 (verdict.degraded ? " (degraded)" : ""));
        return verdict;
    }

    /// Resource category from the latest signals, "general" when nothing specific fired
    std::string resource_category() const {
        if (session_.risk_history.empty()) return "general";
        for (const auto& signal : session_.risk_history.back().signals) {
            std::string prefix = signal.substr(0, signal.find(':'));
            if (kResourceCategories.count(prefix)) return prefix;
        }
        return at_least(session_.risk_history.back().severity, Severity::Medium) ? "crisis" : "general";
    }

    // =========================================================================
    // Phase-local processing
    // =========================================================================

    std::string phase_local(Phase phase, const std::optional<bool>& consent, bool wants_resources,
                            const std::string& sanitized, TurnOutcome& out) {
        switch (phase) {
            case Phase::Init:
                return handle_consent(consent);
            case Phase::Consented:
                // Only reachable after a restore of an interrupted turn
                transition(Phase::Triage, "automatic");
                return handle_triage(sanitized);
            case Phase::Triage:
                return handle_triage(sanitized);
            case Phase::Resources:
            case Phase::RiskCheck:
                transition(Phase::SupportLoop, "resume");
                return handle_support(wants_resources, out);
            case Phase::SupportLoop:
                return handle_support(wants_resources, out);
            case Phase::Escalate:
            case Phase::Close:
                break;
        }
        return escalation_reply();
    }

    std::string handle_consent(const std::optional<bool>& consent) {
        if (consent.has_value() && *consent) {
            session_.consented = true;
            vault_.set_consent(config_.redaction.reversible_tokens);
            transition(Phase::Consented, "consent_granted");
            transition(Phase::Triage, "automatic");
            return kWelcome;
        }
        json g;
        g["guard"] = "consent";
        g["reason"] = consent.has_value() ? "consent_denied" : "consent_missing";
        g["phase"] = phase_name(Phase::Init);
        g["error"] = error_type_name(ErrorType::GuardViolation);
        emit(EventKind::GuardViolation, g);
        LOG_SESSION(session_.id + " consent guard held (" + g["reason"].get<std::string>() + ")");
        return consent.has_value() ? kConsentDeclined : kConsentPrompt;
    }

    std::string handle_triage(const std::string& sanitized) {
        auto generated = generate(Phase::Triage);
        const bool degraded = services_.generator && !generated;

        session_.triage_summary = truncate(sanitized, kSummaryChars);
        session_.triage_degraded = degraded;
        json extra;
        extra["triage_summary"] = session_.triage_summary;
        extra["degraded"] = degraded;
        transition(Phase::SupportLoop, degraded ? "triage_degraded" : "triage_complete", extra);

        if (generated && !generated->text.empty()) {
            response_source_ = "generator";
            return generated->text;
        }
        if (services_.generator) {
            response_source_ = "fallback";
            return config_.generation.fallback_phrase;
        }
        return kTriageAck;
    }

    std::string handle_support(bool wants_resources, TurnOutcome& out) {
        if (wants_resources) {
            return deliver_resources("user_request", "", out);
        }
        auto generated = generate(Phase::SupportLoop);
        if (!generated) {
            response_source_ = services_.generator ? "fallback" : "system";
            return config_.generation.fallback_phrase;
        }
        response_source_ = "generator";
        std::string reply = generated->text.empty() ? config_.generation.fallback_phrase : generated->text;
        if (generated->resource_need) {
            std::string resources = deliver_resources("generator_signal", generated->resource_category, out);
            response_source_ = "generator";
            return reply + "\n\n" + resources;
        }
        return reply;
    }

    std::string deliver_resources(const std::string& trigger, const std::string& category_hint, TurnOutcome& out) {
        const std::string category = category_hint.empty() ? resource_category() : category_hint;
        const std::string locale = session_.locale(config_.session.default_locale);
        transition(Phase::Resources, trigger);

        std::string text;
        if (services_.directory) {
            auto bundle = services_.directory->lookup(locale, category);
            if (bundle.is_ok()) {
                out.resources = bundle.value();
                json p;
                p["category"] = category;
                p["locale"] = locale;
                p["count"] = bundle.value().resources.size();
                p["resources"] = bundle.value().to_json();
                emit(EventKind::ResourceDelivered, p, {"resources"});
                text = bundle.value().render();
            } else {
                json p;
                p["collaborator"] = "resource_directory";
                p["error"] = error_type_name(bundle.error().type);
                p["detail"] = bundle.error().message;
                emit(EventKind::CollaboratorDegraded, p);
            }
        }
        if (text.empty()) {
            text = build_directive(false, "", config_.escalation.crisis_line);
            json p;
            p["category"] = category;
            p["locale"] = locale;
            p["count"] = 0;
            p["fallback"] = "crisis_line";
            emit(EventKind::ResourceDelivered, p);
        }
        response_source_ = "resources";

        if (session_.message_count >= config_.session.max_messages) {
            pending_close_ = "message_cap";
        } else if (ms_between(session_.created_at, now_) >= config_.session.hard_timeout_ms) {
            pending_close_ = "hard_timeout";
        } else {
            transition(Phase::SupportLoop, "resources_delivered");
        }
        return text;
    }

    /// Bounded generator call; empty on failure (recorded as collaborator.degraded)
    std::optional<GeneratedResponse> generate(Phase phase) {
        if (!services_.generator) return std::nullopt;
        std::shared_ptr<IResponseGenerator> generator = services_.generator;
        std::vector<memory::ConversationMessage> context =
            memory_.get_recent_messages(static_cast<size_t>(config_.generation.context_max_turns));

        auto result = call_with_timeout<GeneratedResponse>(
            [generator, phase, context]() { return generator->generate(phase, context); },
            config_.generation.timeout_ms, "generator " + generator->name());
        if (result.is_error()) {
            json p;
            p["collaborator"] = generator->name();
            p["role"] = "generator";
            p["phase"] = phase_name(phase);
            p["error"] = error_type_name(result.error().type);
            p["detail"] = result.error().message;
            p["fallback"] = true;
            emit(EventKind::CollaboratorDegraded, p);
            LOG_WARN("Generator degraded for " + session_.id + ": " + result.error().message);
            return std::nullopt;
        }
        return result.value();
    }

    // =========================================================================
    // Escalation
    // =========================================================================

    Result<EscalationPlan> call_coordinator(Severity severity) {
        if (!services_.escalation) {
            return make_collaborator_error("no escalation coordinator configured");
        }
        std::string summary = "severity=" + std::string(severity_name(severity)) +
                              " phase_before=" + (session_.triage_summary.empty() ? "early" : "support") +
                              " turns=" + std::to_string(session_.message_count);
        if (!session_.triage_summary.empty()) {
            summary += " summary=" + session_.triage_summary;
        }
        try {
            return services_.escalation->escalate(session_.id, severity, summary,
                                                  session_.locale(config_.session.default_locale));
        } catch (const std::exception& e) {
            return make_collaborator_error(std::string("escalation coordinator threw: ") + e.what());
        }
    }

    void run_escalation(Severity severity) {
        auto result = call_coordinator(severity);
        if (result.is_ok()) {
            adopt_plan(result.value());
            return;
        }
        mark_unresolved(severity, result.error());
    }

    void adopt_plan(EscalationPlan plan) {
        plan.retry_rounds = session_.escalation_retry_rounds;
        session_.escalation = std::move(plan);
        session_.escalation_unresolved = false;
        if (session_.escalation->is_terminal()) {
            pending_close_ = session_.escalation->status == PlanStatus::Completed ? "escalation_completed"
                                                                                  : "escalation_failed";
        }
    }

    void mark_unresolved(Severity severity, const Error& error) {
        const std::string locale = session_.locale(config_.session.default_locale);
        if (!session_.escalation) {
            EscalationPlan plan;
            plan.plan_id = "esc-" + session_.id + "-local";
            plan.session_id = session_.id;
            plan.severity = severity;
            const bool emergency = at_least(severity, config_.risk.emergency_threshold);
            plan.channel = emergency ? "emergency_services" : "warm_transfer";
            plan.priority = emergency ? 0 : 1;
            plan.status = PlanStatus::Pending;
            plan.emergency_number = services_.directory ? services_.directory->emergency_number(locale) : "911";
            plan.crisis_line = config_.escalation.crisis_line;
            plan.directive = build_directive(emergency, plan.emergency_number, plan.crisis_line);
            session_.escalation = plan;
        } else {
            session_.escalation->severity = max_severity(session_.escalation->severity, severity);
        }
        session_.escalation->failure_reason = error.message;
        session_.escalation_unresolved = true;
        session_.next_escalation_retry = now_ + Duration(config_.escalation.retry_interval_ms);

        json p;
        p["plan_id"] = session_.escalation->plan_id;
        p["severity"] = severity_name(session_.escalation->severity);
        p["channel"] = session_.escalation->channel;
        p["reason"] = error.message;
        p["error"] = error_type_name(error.type);
        p["retry_round"] = session_.escalation_retry_rounds;
        p["retry_limit"] = config_.escalation.retry_limit;
        p["next_retry_in_ms"] = config_.escalation.retry_interval_ms;
        p["directive"] = session_.escalation->directive;
        emit(EventKind::EscalationUnresolved, p);
        LOG_ESCALATION(session_.id + " unresolved (" + error.message + "), retry in " +
                       std::to_string(config_.escalation.retry_interval_ms) + "ms");
    }

    void retry_escalation() {
        session_.escalation_retry_rounds++;
        const Severity severity = session_.escalation ? session_.escalation->severity : Severity::High;
        LOG_ESCALATION(session_.id + " retry round " + std::to_string(session_.escalation_retry_rounds));

        auto result = call_coordinator(severity);
        if (result.is_ok()) {
            adopt_plan(result.value());
            if (!pending_close_.empty()) {
                close(pending_close_);
                pending_close_.clear();
            }
            return;
        }
        if (session_.escalation_retry_rounds >= config_.escalation.retry_limit) {
            EscalationPlan& plan = *session_.escalation;
            plan.status = PlanStatus::Failed;
            plan.failure_reason = "coordinator_unavailable";
            plan.retry_rounds = session_.escalation_retry_rounds;
            session_.escalation_unresolved = false;
            json p;
            p["plan_id"] = plan.plan_id;
            p["status"] = plan_status_name(plan.status);
            p["reason"] = plan.failure_reason;
            p["detail"] = result.error().message;
            p["retry_rounds"] = session_.escalation_retry_rounds;
            p["error"] = error_type_name(ErrorType::EscalationExhausted);
            emit(EventKind::EscalationResolved, p);
            LOG_ESCALATION(session_.id + " escalation exhausted after " +
                           std::to_string(session_.escalation_retry_rounds) + " retry rounds");
            close("escalation_failed");
            return;
        }
        mark_unresolved(severity, result.error());
    }

    std::string escalation_reply() const {
        if (!session_.escalation) {
            return build_directive(false, "", config_.escalation.crisis_line);
        }
        const EscalationPlan& plan = *session_.escalation;
        std::string reply = plan.directive;
        switch (plan.status) {
            case PlanStatus::Completed:
                reply += " I've asked a trained counselor to join you; they'll be with you shortly.";
                break;
            case PlanStatus::Failed:
                reply += " I wasn't able to connect you with a counselor directly, so please reach out "
                         "using the number above.";
                break;
            case PlanStatus::Pending:
            case PlanStatus::InProgress:
                reply += " I'm working on connecting you with a person who can help.";
                break;
        }
        return reply;
    }

    Session session_;
    Config config_;
    SessionServices services_;
    memory::ConversationMemory memory_;
    TokenVault vault_;

    TimePoint now_;
    std::string pending_close_;
    std::string response_source_;
};

// =============================================================================
// Replay
// =============================================================================

namespace {

Error replay_escalation(const Event& e, std::optional<EscalationPlan>& plan) {
    const json& p = e.payload;
    if (!plan) {
        plan = EscalationPlan();
        plan->session_id = e.session_id;
    }
    plan->plan_id = p.value("plan_id", plan->plan_id);
    switch (e.kind) {
        case EventKind::EscalationDirective: {
            Severity s;
            if (parse_severity(p.value("severity", ""), s)) plan->severity = s;
            plan->channel = p.value("channel", plan->channel);
            plan->directive = p.value("directive", plan->directive);
            plan->emergency_number = p.value("emergency_number", plan->emergency_number);
            plan->crisis_line = p.value("crisis_line", plan->crisis_line);
            break;
        }
        case EventKind::EscalationAttempt: {
            HandoffAttempt a;
            a.number = p.value("attempt", 0);
            a.outcome = p.value("outcome", "");
            a.detail = p.value("detail", "");
            a.timestamp_ms = e.timestamp_ms;
            plan->attempts.push_back(a);
            plan->status = PlanStatus::InProgress;
            break;
        }
        case EventKind::EscalationResolved: {
            PlanStatus status;
            std::string name = p.value("status", "");
            if (!parse_plan_status(name, status)) {
                return make_parse_error("unknown plan status in event " + std::to_string(e.sequence) + ": " + name);
            }
            plan->status = status;
            plan->transfer_reference = p.value("reference", plan->transfer_reference);
            plan->failure_reason = p.value("reason", plan->failure_reason);
            break;
        }
        case EventKind::EscalationUnresolved: {
            Severity s;
            if (parse_severity(p.value("severity", ""), s)) plan->severity = s;
            plan->channel = p.value("channel", plan->channel);
            plan->directive = p.value("directive", plan->directive);
            plan->status = PlanStatus::Pending;
            break;
        }
        default:
            break;
    }
    return Error();
}

} // namespace

Result<SessionStateMachine::ReplayState> SessionStateMachine::replay(const std::vector<Event>& events) {
    ReplayState st;
    st.trajectory.push_back(Phase::Init);

    for (size_t i = 0; i < events.size(); ++i) {
        const Event& e = events[i];
        if (e.sequence != i + 1) {
            return make_error(ErrorType::InvalidInput, "event stream has a gap at position " + std::to_string(i + 1) +
                              " (sequence " + std::to_string(e.sequence) + ")");
        }
        const json& p = e.payload;

        try {
            switch (e.kind) {
                case EventKind::SessionCreated:
                    if (p.contains("metadata") && p["metadata"].is_object()) {
                        st.metadata = p["metadata"].get<std::map<std::string, std::string>>();
                    }
                    st.created_at_ms = e.timestamp_ms;
                    break;

                case EventKind::TurnReceived:
                    st.message_count = p.value("turn", st.message_count + 1);
                    st.last_activity_ms = e.timestamp_ms;
                    st.history.push_back(memory::ConversationMessage::user(p.value("text", "")));
                    break;

                case EventKind::RiskAssessed:
                case EventKind::RiskDegraded: {
                    if (!p.contains("verdict")) {
                        return make_parse_error("risk event " + std::to_string(e.sequence) + " has no verdict");
                    }
                    auto v = verdict_from_json(p["verdict"]);
                    if (v.is_error()) return v.error();
                    st.risk_history.push_back(v.value());
                    break;
                }

                case EventKind::PhaseTransition: {
                    Phase from, to;
                    if (!parse_phase(p.value("from", ""), from) || !parse_phase(p.value("to", ""), to)) {
                        return make_parse_error("transition event " + std::to_string(e.sequence) +
                                                " names an unknown phase");
                    }
                    if (from != st.phase) {
                        return make_guard_violation("transition at " + std::to_string(e.sequence) + " leaves " +
                                                    phase_name(from) + " while the session is in " +
                                                    phase_name(st.phase));
                    }
                    if (!is_legal_transition(from, to)) {
                        return make_guard_violation("illegal transition " + std::string(phase_name(from)) +
                                                    " -> " + phase_name(to) + " at " + std::to_string(e.sequence));
                    }
                    st.phase = to;
                    st.trajectory.push_back(to);
                    if (to == Phase::Consented) st.consented = true;
                    if (from == Phase::Triage && to == Phase::SupportLoop) {
                        st.triage_summary = p.value("triage_summary", "");
                        st.triage_degraded = p.value("degraded", false);
                    }
                    break;
                }

                case EventKind::SessionClosed:
                    st.close_reason = p.value("reason", "");
                    break;

                case EventKind::EscalationUnresolved:
                    st.escalation_unresolved = true;
                    st.escalation_retry_rounds = p.value("retry_round", st.escalation_retry_rounds);
                    if (Error err = replay_escalation(e, st.escalation)) return err;
                    break;

                case EventKind::EscalationResolved:
                    st.escalation_unresolved = false;
                    st.escalation_retry_rounds = p.value("retry_rounds", st.escalation_retry_rounds);
                    if (Error err = replay_escalation(e, st.escalation)) return err;
                    break;

                case EventKind::EscalationDirective:
                case EventKind::EscalationAttempt:
                    if (Error err = replay_escalation(e, st.escalation)) return err;
                    break;

                case EventKind::ResponseGenerated:
                    st.history.push_back(memory::ConversationMessage::assistant(p.value("text", "")));
                    break;

                default:
                    break;
            }
        } catch (const json::exception& ex) {
            return make_parse_error("malformed payload in event " + std::to_string(e.sequence) + ": " + ex.what());
        }
    }
    if (st.escalation) st.escalation->retry_rounds = st.escalation_retry_rounds;
    return st;
}

// =============================================================================
// Public interface
// =============================================================================

SessionStateMachine::SessionStateMachine(Session session, const Config& config, SessionServices services)
    : pimpl_(std::make_unique<Impl>(std::move(session), config, std::move(services))) {}

SessionStateMachine::~SessionStateMachine() = default;

void SessionStateMachine::start() {
    pimpl_->start();
}

Result<TurnOutcome> SessionStateMachine::handle_turn(const TurnRequest& request) {
    return pimpl_->handle_turn(request);
}

VoidResult SessionStateMachine::force_close(const std::string& reason) {
    return pimpl_->force_close(reason);
}

bool SessionStateMachine::on_tick(TimePoint now) {
    return pimpl_->on_tick(now);
}

const Session& SessionStateMachine::session() const {
    return pimpl_->session();
}

Phase SessionStateMachine::phase() const {
    return pimpl_->session().phase;
}

bool SessionStateMachine::is_closed() const {
    return pimpl_->session().phase == Phase::Close;
}

const TokenVault& SessionStateMachine::vault() const {
    return pimpl_->vault();
}

const memory::ConversationMemory& SessionStateMachine::memory() const {
    return pimpl_->memory();
}

VoidResult SessionStateMachine::load_from_events(const std::vector<Event>& events) {
    return pimpl_->load_from_events(events);
}

} // namespace carebridge
