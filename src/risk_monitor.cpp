#include "risk_monitor.h"
#include "core/bounded_call.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <regex>
#include <sstream>

namespace carebridge {

namespace {

struct KeywordCategory {
    std::string name;
    Severity base;
    std::vector<std::string> phrases;
};

struct RiskPattern {
    std::string name;
    Severity severity;
    std::regex re;
};

std::vector<KeywordCategory> default_categories() {
    return {
        {"suicide", Severity::High, {
            "kill myself", "end my life", "suicide", "suicidal", "want to die", "better off dead",
            "no reason to live", "plan to die", "final goodbye", "last message", "end it all",
            "take my own life"}},
        {"self_harm", Severity::Medium, {
            "cut myself", "cutting myself", "self harm", "hurt myself", "burn myself", "hit myself",
            "punish myself", "bleeding", "scars"}},
        {"harm_to_others", Severity::High, {
            "kill them", "kill him", "kill her", "hurt someone", "attack", "violent", "weapon",
            "revenge", "payback", "make them suffer"}},
        {"abuse", Severity::Medium, {
            "abuse", "abused", "abusive", "hits me", "beats me", "not safe at home",
            "afraid to go home", "domestic violence"}},
        {"crisis", Severity::Medium, {
            "emergency", "crisis", "help now", "immediate", "urgent", "can't take it",
            "breaking point", "last straw", "can't go on"}},
    };
}

const std::vector<std::string> kImmediacy = {"right now", "now", "tonight", "today", "immediately"};
const std::vector<std::string> kPlan = {"plan", "going to", "will", "intend", "decided"};
const std::vector<std::string> kMeans = {"gun", "pills", "rope", "knife", "weapon"};
const std::vector<std::string> kSpecific = {"suicide", "kill myself", "end my life"};
const std::vector<std::string> kAmbiguity = {"joke", "joking", "just kidding", "not really", "metaphor"};

/// Typographic apostrophes to ASCII so "can’t" matches "can't"
std::string ascii_apostrophes(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (i + 2 < text.size() &&
            static_cast<unsigned char>(text[i]) == 0xE2 &&
            static_cast<unsigned char>(text[i + 1]) == 0x80 &&
            (static_cast<unsigned char>(text[i + 2]) == 0x98 || static_cast<unsigned char>(text[i + 2]) == 0x99)) {
            out += '\'';
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

std::string join(const std::vector<std::string>& parts) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) oss << ",";
        oss << parts[i];
    }
    return oss.str();
}

} // namespace

class RiskMonitor::Impl {
public:
    Impl(const RiskConfig& config, std::shared_ptr<IRiskClassifier> classifier)
        : config_(config), classifier_(std::move(classifier)), categories_(default_categories()) {
        for (const auto& [name, phrases] : config_.keyword_overrides) {
            std::vector<std::string> normalized;
            for (const auto& p : phrases) {
                std::string n = utils::fold_for_matching(ascii_apostrophes(p));
                if (!n.empty()) normalized.push_back(n);
            }
            auto it = std::find_if(categories_.begin(), categories_.end(),
                                   [&](const KeywordCategory& c) { return c.name == name; });
            if (it != categories_.end()) {
                it->phrases = normalized;
            } else {
                categories_.push_back({name, Severity::Medium, normalized});
            }
        }

        const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        patterns_.push_back({"suicide_plan", Severity::Medium,
            std::regex(R"(\b(?:plan|going to|will|intend)\b.*\b(?:kill|die|dying|suicide))", flags)});
        patterns_.push_back({"immediate_risk", Severity::High,
            std::regex(R"(\b(?:right now|tonight|today|immediately)\b.*\b(?:kill|die|dying|suicide|harm))", flags)});
        patterns_.push_back({"means_available", Severity::Medium,
            std::regex(R"(\b(?:gun|pills|rope|knife|weapon)s?\b.*\b(?:have|got|access)\b)", flags)});

        std::ostringstream oss;
        oss << "RiskMonitor initialized: categories=" << categories_.size()
            << ", classifier=" << (classifier_ ? classifier_->name() : std::string("none"))
            << ", escalation_threshold=" << severity_name(config_.escalation_threshold);
        LOG_RISK(oss.str());
    }

    RiskVerdict assess(const std::string& sanitized_text, const RiskContext& context) const {
        // Classifier first so it overlaps with the keyword path
        std::future<Result<ClassifierVerdict>> pending;
        if (classifier_) {
            auto classifier = classifier_;
            std::vector<std::string> recent = tail(context.recent_turns, config_.context_turns);
            std::string text = sanitized_text;
            pending = launch_detached<ClassifierVerdict>(
                [classifier, text, recent]() { return classifier->classify(text, recent); },
                "risk classifier");
        }

        RiskVerdict verdict = keyword_verdict(sanitized_text);

        if (classifier_) {
            Result<ClassifierVerdict> classified =
                await_bounded(pending, config_.classifier_timeout_ms, "risk classifier");
            if (classified.is_ok()) {
                combine(verdict, classified.value());
            } else {
                degrade(verdict, classified.error().message);
            }
        }

        apply_sustained_rule(verdict, context);
        verdict.timestamp_ms = wall_clock_ms();

        if (verdict.severity != Severity::None || verdict.degraded) {
            LOG_RISK(std::string("verdict severity=") + severity_name(verdict.severity) +
                     " confidence=" + std::to_string(verdict.confidence) +
                     " source=" + verdict.source +
                     (verdict.degraded ? " degraded" : "") +
                     " signals=[" + join(verdict.signals) + "]");
        }
        return verdict;
    }

    RiskVerdict keyword_verdict(const std::string& sanitized_text) const {
        RiskVerdict verdict;
        verdict.source = "keyword";
        verdict.timestamp_ms = wall_clock_ms();

        const std::string text = utils::fold_for_matching(ascii_apostrophes(sanitized_text));
        if (text.empty()) {
            return verdict;
        }

        const bool immediate = !utils::first_phrase_match(text, kImmediacy).empty();
        const bool plan = !utils::first_phrase_match(text, kPlan).empty();
        const bool means = !utils::first_phrase_match(text, kMeans).empty();
        const bool ambiguous = !utils::first_phrase_match(text, kAmbiguity).empty();

        float best_confidence = 0.0f;
        for (const auto& category : categories_) {
            std::vector<std::string> found;
            for (const auto& phrase : category.phrases) {
                if (utils::contains_phrase(text, phrase)) {
                    found.push_back(phrase);
                }
            }
            if (found.empty()) continue;

            Severity severity = category.base;
            if (immediate && at_least(severity, Severity::Medium)) severity = raise_one(severity);
            if (plan && !at_least(severity, Severity::High)) severity = raise_one(severity);
            if (means && at_least(severity, Severity::Medium)) severity = raise_one(severity);

            float bonus = std::min(static_cast<float>(found.size()) * constants::risk::PER_KEYWORD_CONFIDENCE,
                                   constants::risk::MAX_KEYWORD_BONUS);
            for (const auto& f : found) {
                if (std::find(kSpecific.begin(), kSpecific.end(), f) != kSpecific.end()) {
                    bonus += constants::risk::SPECIFIC_KEYWORD_BONUS;
                    break;
                }
            }
            if (ambiguous) bonus -= constants::risk::AMBIGUITY_PENALTY;
            float confidence = std::clamp(constants::risk::BASE_CONFIDENCE + bonus, 0.0f, 1.0f);

            for (const auto& f : found) {
                verdict.signals.push_back(category.name + ":" + f);
            }
            take_max(verdict, severity, confidence, best_confidence);
        }

        for (const auto& pattern : patterns_) {
            bool matched = false;
            try {
                matched = std::regex_search(text, pattern.re);
            } catch (const std::regex_error& e) {
                Logger::warn(std::string("[Risk] pattern ") + pattern.name + " failed: " + e.what() +
                             "; treating as matched");
                matched = true;
            }
            if (matched) {
                verdict.signals.push_back("pattern:" + pattern.name);
                take_max(verdict, pattern.severity, 0.8f, best_confidence);
            }
        }

        if (verdict.severity == Severity::None) {
            verdict.confidence = 0.5f;
        }
        return verdict;
    }

    RiskVerdict uninspectable_verdict(const std::string& reason) const {
        RiskVerdict verdict;
        verdict.severity = Severity::Medium;
        verdict.confidence = constants::risk::DEGRADED_CONFIDENCE;
        verdict.degraded = true;
        verdict.floored = true;
        verdict.degraded_reason = reason;
        verdict.source = "keyword";
        verdict.signals.push_back("content_uninspectable");
        verdict.timestamp_ms = wall_clock_ms();
        return verdict;
    }

    bool has_classifier() const { return static_cast<bool>(classifier_); }

private:
    static void take_max(RiskVerdict& verdict, Severity severity, float confidence, float& best_confidence) {
        if (static_cast<int>(severity) > static_cast<int>(verdict.severity)) {
            verdict.severity = severity;
            verdict.confidence = confidence;
            best_confidence = confidence;
        } else if (severity == verdict.severity && confidence > best_confidence) {
            verdict.confidence = confidence;
            best_confidence = confidence;
        }
    }

    static void combine(RiskVerdict& verdict, const ClassifierVerdict& classified) {
        for (const auto& label : classified.labels) {
            verdict.signals.push_back("classifier:" + label);
        }
        const Severity keyword = verdict.severity;
        if (static_cast<int>(classified.severity) > static_cast<int>(keyword)) {
            verdict.severity = classified.severity;
            verdict.confidence = std::clamp(classified.confidence, 0.0f, 1.0f);
            verdict.source = keyword == Severity::None ? "classifier" : "combined";
        } else if (classified.severity == keyword && keyword != Severity::None) {
            verdict.confidence = std::max(verdict.confidence, std::clamp(classified.confidence, 0.0f, 1.0f));
            verdict.source = "combined";
        } else if (keyword == Severity::None) {
            verdict.confidence = std::clamp(classified.confidence, 0.0f, 1.0f);
            verdict.source = "combined";
        }
    }

    static void degrade(RiskVerdict& verdict, const std::string& reason) {
        verdict.degraded = true;
        verdict.degraded_reason = reason;
        verdict.signals.push_back("classifier_unavailable");
        if (!at_least(verdict.severity, Severity::Medium)) {
            verdict.floored = true;
            verdict.severity = Severity::Medium;
            verdict.confidence = constants::risk::DEGRADED_CONFIDENCE;
        }
        Logger::warn("[Risk] classifier unavailable (" + reason + "); verdict floored at medium");
    }

    void apply_sustained_rule(RiskVerdict& verdict, const RiskContext& context) const {
        const size_t window = config_.sustained_window;
        if (window < 2 || verdict.floored || !at_least(verdict.severity, Severity::Medium)) return;
        if (at_least(verdict.severity, Severity::High)) return;
        if (context.recent_verdicts.size() < window - 1) return;
        auto start = context.recent_verdicts.end() - static_cast<std::ptrdiff_t>(window - 1);
        bool sustained = std::all_of(start, context.recent_verdicts.end(), [](const RiskVerdict& v) {
            return !v.floored && at_least(v.severity, Severity::Medium);
        });
        if (sustained) {
            verdict.severity = Severity::High;
            verdict.signals.push_back("sustained_risk");
        }
    }

    static std::vector<std::string> tail(const std::vector<std::string>& items, size_t n) {
        if (items.size() <= n) return items;
        return std::vector<std::string>(items.end() - static_cast<std::ptrdiff_t>(n), items.end());
    }

    RiskConfig config_;
    std::shared_ptr<IRiskClassifier> classifier_;
    std::vector<KeywordCategory> categories_;
    std::vector<RiskPattern> patterns_;
};

RiskMonitor::RiskMonitor(const RiskConfig& config, std::shared_ptr<IRiskClassifier> classifier)
    : pimpl_(std::make_unique<Impl>(config, std::move(classifier))) {}

RiskMonitor::~RiskMonitor() = default;

RiskVerdict RiskMonitor::assess(const std::string& sanitized_text, const RiskContext& context) const {
    return pimpl_->assess(sanitized_text, context);
}

RiskVerdict RiskMonitor::keyword_verdict(const std::string& sanitized_text) const {
    return pimpl_->keyword_verdict(sanitized_text);
}

RiskVerdict RiskMonitor::uninspectable_verdict(const std::string& reason) const {
    return pimpl_->uninspectable_verdict(reason);
}

bool RiskMonitor::has_classifier() const {
    return pimpl_->has_classifier();
}

} // namespace carebridge
