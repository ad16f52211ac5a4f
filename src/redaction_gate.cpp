#include "redaction_gate.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <regex>

namespace carebridge {

namespace {

struct EntityPattern {
    std::string type;
    std::regex re;
    int group;  ///< Sub-match to mask (0 = whole match)
};

struct Span {
    size_t start;
    size_t end;
    size_t priority;  ///< Index into the pattern list; lower wins the label of a merged span
};

std::vector<EntityPattern> build_patterns() {
    using std::regex;
    const auto ecma = regex::ECMAScript | regex::optimize;
    const auto icase = ecma | regex::icase;

    std::vector<EntityPattern> p;
    p.push_back({"ssn", regex(R"(\b\d{3}-\d{2}-\d{4}\b)", ecma), 0});
    p.push_back({"credit_card", regex(R"(\b(?:\d{4}[- ]?){3}\d{4}\b)", ecma), 0});
    p.push_back({"email", regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", ecma), 0});
    p.push_back({"phone", regex(R"((?:\+?1[-.\s]?)?(?:\(\d{3}\)\s?|\b\d{3}[-.\s]?)\d{3}[-.\s]?\d{4}\b)", ecma), 0});
    p.push_back({"ip_address", regex(R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", ecma), 0});
    p.push_back({"date", regex(R"(\b\d{1,2}[/-]\d{1,2}[/-](?:\d{4}|\d{2})\b)", ecma), 0});
    p.push_back({"date", regex(R"(\b\d{4}-\d{2}-\d{2}\b)", ecma), 0});
    p.push_back({"date", regex(R"(\b(?:jan|feb|mar|apr|may|jun|jul|aug|sep|sept|oct|nov|dec)[a-z]*\.?\s+\d{1,2}(?:st|nd|rd|th)?(?:,?\s+\d{4})?\b)", icase), 0});
    p.push_back({"medical_record", regex(R"(\b(?:mrn|medical record(?: number| no\.?)?|patient id)\s*[:#]?\s*([a-z0-9-]{4,12})\b)", icase), 1});
    p.push_back({"insurance_id", regex(R"(\b[A-Z]{2,3}\d{6,10}\b)", ecma), 0});
    p.push_back({"address", regex(R"(\b\d{1,5}\s+(?:[a-z0-9]+\s+){1,3}(?:street|st|avenue|ave|road|rd|boulevard|blvd|lane|ln|drive|dr|court|ct|way|place|pl|terrace|circle)\b\.?)", icase), 0});
    p.push_back({"zip_code", regex(R"(\b\d{5}(?:-\d{4})?\b)", ecma), 0});
    p.push_back({"person_name", regex(R"(\b(?:[Mm]y name is|[Mm]y name's|[Cc]all me|[Nn]amed)\s+([A-Z][A-Za-z'-]+(?:\s+[A-Z][A-Za-z'-]+)?))", ecma), 1});
    p.push_back({"person_name", regex(R"(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof)\.?\s+[A-Z][A-Za-z'-]+)", ecma), 0});
    p.push_back({"medication", regex(
        R"(\b(?:sertraline|zoloft|fluoxetine|prozac|escitalopram|lexapro|citalopram|celexa|paroxetine|paxil|)"
        R"(venlafaxine|effexor|duloxetine|cymbalta|bupropion|wellbutrin|mirtazapine|trazodone|lithium|)"
        R"(lamotrigine|lamictal|quetiapine|seroquel|olanzapine|zyprexa|aripiprazole|abilify|risperidone|)"
        R"(clonazepam|klonopin|lorazepam|ativan|alprazolam|xanax|diazepam|valium|methylphenidate|ritalin|adderall)\b)",
        icase), 0});
    p.push_back({"medication", regex(R"(\b\d+(?:\.\d+)?\s?(?:mg|mcg|ml)\b)", icase), 0});
    p.push_back({"diagnosis", regex(R"(\bdiagnosed with\s+([a-z]+(?:[ -][a-z]+){0,3}))", icase), 1});
    p.push_back({"diagnosis", regex(
        R"(\b(?:bipolar(?: disorder)?|schizophrenia|schizoaffective(?: disorder)?|ptsd|)"
        R"(borderline personality disorder|major depressive disorder|generalized anxiety disorder|)"
        R"(obsessive compulsive disorder|ocd|adhd|anorexia(?: nervosa)?|bulimia(?: nervosa)?)\b)",
        icase), 0});
    return p;
}

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

class RedactionGate::Impl {
public:
    explicit Impl(size_t max_input_chars)
        : max_input_chars_(max_input_chars),
          patterns_(build_patterns()),
          existing_token_(R"(\[(?:[A-Z_]+:[0-9a-f]{8}|REDACTED)\])", std::regex::ECMAScript) {}

    RedactionResult redact(const std::string& raw) const {
        if (max_input_chars_ > 0 && raw.size() > max_input_chars_) {
            return fail_closed(raw, "input exceeds " + std::to_string(max_input_chars_) + " bytes");
        }
        if (!utils::is_valid_utf8(raw)) {
            return fail_closed(raw, "invalid encoding");
        }

        std::vector<Span> spans;
        std::vector<Span> protected_spans;
        try {
            // Tokens from an earlier pass stay untouched so redaction is idempotent
            for (std::sregex_iterator it(raw.begin(), raw.end(), existing_token_), end; it != end; ++it) {
                size_t start = static_cast<size_t>(it->position(0));
                protected_spans.push_back({start, start + static_cast<size_t>(it->length(0)), 0});
            }

            for (size_t i = 0; i < patterns_.size(); ++i) {
                const auto& pattern = patterns_[i];
                for (std::sregex_iterator it(raw.begin(), raw.end(), pattern.re), end; it != end; ++it) {
                    const auto& m = *it;
                    if (!m[pattern.group].matched || m.length(pattern.group) == 0) continue;
                    size_t start = static_cast<size_t>(m.position(pattern.group));
                    size_t stop = start + static_cast<size_t>(m.length(pattern.group));
                    if (overlaps_any(start, stop, protected_spans)) continue;
                    spans.push_back({start, stop, i});
                }
            }
        } catch (const std::regex_error& e) {
            return fail_closed(raw, std::string("pattern engine error: ") + e.what());
        } catch (const std::exception& e) {
            return fail_closed(raw, std::string("detection error: ") + e.what());
        }

        RedactionResult result;
        if (spans.empty()) {
            result.sanitized = raw;
            return result;
        }

        std::vector<Span> merged = merge(std::move(spans));

        std::string out;
        out.reserve(raw.size());
        size_t cursor = 0;
        for (const auto& span : merged) {
            const std::string& type = patterns_[span.priority].type;
            RedactionEntry entry;
            entry.type = type;
            entry.start = span.start;
            entry.length = span.end - span.start;
            entry.token = token_for(type, raw.substr(entry.start, entry.length));

            out.append(raw, cursor, span.start - cursor);
            out += "[" + upper(type) + ":" + entry.token + "]";
            cursor = span.end;
            result.manifest.push_back(std::move(entry));
        }
        out.append(raw, cursor, std::string::npos);
        result.sanitized = std::move(out);

        LOG_REDACT("masked " + std::to_string(result.manifest.size()) + " entities");
        return result;
    }

private:
    static bool overlaps_any(size_t start, size_t stop, const std::vector<Span>& others) {
        for (const auto& o : others) {
            if (start < o.end && o.start < stop) return true;
        }
        return false;
    }

    /// Union overlapping spans; the merged span keeps the highest-priority label
    static std::vector<Span> merge(std::vector<Span> spans) {
        std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
            if (a.start != b.start) return a.start < b.start;
            return a.end > b.end;
        });
        std::vector<Span> merged;
        for (const auto& s : spans) {
            if (!merged.empty() && s.start < merged.back().end) {
                Span& cur = merged.back();
                cur.end = std::max(cur.end, s.end);
                cur.priority = std::min(cur.priority, s.priority);
            } else {
                merged.push_back(s);
            }
        }
        return merged;
    }

    static RedactionResult fail_closed(const std::string& raw, const std::string& reason) {
        RedactionResult result;
        result.sanitized = RedactionGate::kFullMask;
        result.failed_closed = true;
        result.failure_reason = reason;
        RedactionEntry entry;
        entry.type = "unclassified";
        entry.start = 0;
        entry.length = raw.size();
        entry.token = token_for("unclassified", raw);
        result.manifest.push_back(std::move(entry));
        Logger::warn("[Redact] failing closed: " + reason);
        return result;
    }

    size_t max_input_chars_;
    std::vector<EntityPattern> patterns_;
    std::regex existing_token_;
};

RedactionGate::RedactionGate(size_t max_input_chars)
    : pimpl_(std::make_unique<Impl>(max_input_chars)) {}

RedactionGate::~RedactionGate() = default;

RedactionResult RedactionGate::redact(const std::string& raw) const {
    return pimpl_->redact(raw);
}

std::string RedactionGate::token_for(const std::string& type, const std::string& value) {
    return utils::to_hex32(utils::fnv1a_32(type + '\x1f' + value));
}

// =============================================================================
// TokenVault
// =============================================================================

void TokenVault::set_consent(bool granted) {
    std::lock_guard<std::mutex> lock(mutex_);
    consent_ = granted;
    if (!granted) {
        values_.clear();
    }
}

bool TokenVault::consent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consent_;
}

void TokenVault::capture(const RedactionResult& result, const std::string& raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!consent_ || result.failed_closed) return;
    for (const auto& entry : result.manifest) {
        if (entry.start + entry.length <= raw.size()) {
            values_[entry.token] = raw.substr(entry.start, entry.length);
        }
    }
}

std::optional<std::string> TokenVault::lookup(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!consent_) return std::nullopt;
    auto it = values_.find(token);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

size_t TokenVault::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

void TokenVault::purge() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

} // namespace carebridge
