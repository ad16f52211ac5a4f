#pragma once

/**
 * @file redaction_gate.h
 * @brief Raw text -> sanitized text + entity manifest
 *
 * Conservative by construction: when in doubt a span is masked. Overlapping
 * detections merge into one masked span. On any failure the whole text is
 * masked (fail closed); raw text never leaves this component.
 */

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace carebridge {

/**
 * @brief One masked span
 */
struct RedactionEntry {
    std::string type;    ///< "email", "phone", "person_name", ... or "unclassified"
    size_t start = 0;    ///< Offset in the raw text
    size_t length = 0;   ///< Length in the raw text
    std::string token;   ///< Stable token; same (type, value) always yields the same token
};

struct RedactionResult {
    std::string sanitized;
    std::vector<RedactionEntry> manifest;
    bool failed_closed = false;  ///< Whole input masked because detection could not complete
    std::string failure_reason;  ///< Set when failed_closed (never contains input text)

    bool changed() const { return failed_closed || !manifest.empty(); }
};

class RedactionGate {
public:
    /// Replacement used when failing closed
    static constexpr const char* kFullMask = "[REDACTED]";

    explicit RedactionGate(size_t max_input_chars = 16384);
    ~RedactionGate();

    RedactionGate(const RedactionGate&) = delete;
    RedactionGate& operator=(const RedactionGate&) = delete;

    /**
     * @brief Sanitize text
     *
     * Stateless and safe to call concurrently. Each entity becomes
     * "[TYPE:token]" in the sanitized output.
     */
    RedactionResult redact(const std::string& raw) const;

    /**
     * @brief Stable token for an entity value (8 hex digits of FNV-1a over type and value)
     */
    static std::string token_for(const std::string& type, const std::string& value);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Consent-gated token -> value store for reversible lookup
 *
 * Owned by the caller, one per session. Captures values only while consent is
 * granted; revoking consent purges everything.
 */
class TokenVault {
public:
    void set_consent(bool granted);
    bool consent() const;

    /// Record every manifest entry's raw value; no-op without consent or on fail-closed results
    void capture(const RedactionResult& result, const std::string& raw);

    /// Look up a token; empty without consent
    std::optional<std::string> lookup(const std::string& token) const;

    size_t size() const;
    void purge();

private:
    mutable std::mutex mutex_;
    bool consent_ = false;
    std::map<std::string, std::string> values_;
};

} // namespace carebridge
