#pragma once

#include "common.h"
#include "config.h"
#include "collaborators/risk_classifier.h"
#include <memory>
#include <string>
#include <vector>

namespace carebridge {

/**
 * @brief Result of one risk evaluation
 */
struct RiskVerdict {
    Severity severity = Severity::None;
    float confidence = 0.0f;
    std::vector<std::string> signals;  ///< "suicide:kill myself", "pattern:immediate_risk", "classifier:<label>", ...
    bool degraded = false;             ///< Classifier configured but unavailable; severity floored at MEDIUM
    bool floored = false;              ///< Severity comes only from the degraded floor, not from any signal
    std::string source = "keyword";    ///< "keyword", "classifier" or "combined"
    std::string degraded_reason;
    int64_t timestamp_ms = 0;          ///< Wall clock
};

/**
 * @brief What the monitor may look at besides the current turn
 */
struct RiskContext {
    std::vector<RiskVerdict> recent_verdicts;  ///< Oldest first
    std::vector<std::string> recent_turns;     ///< Sanitized, oldest first
};

/**
 * @brief Two-path risk evaluation over sanitized text
 *
 * The keyword path always runs. When a classifier is configured it runs in
 * parallel under the configured bound; the verdict is the max severity of
 * both paths. A classifier that fails or times out yields a degraded verdict
 * with severity at least MEDIUM. Without a classifier the keyword path
 * stands alone.
 *
 * Sustained risk: when this verdict and the previous (window - 1) verdicts
 * are all at least MEDIUM on real signals, severity is raised to HIGH.
 * Floored verdicts never count toward it.
 */
class RiskMonitor {
public:
    RiskMonitor(const RiskConfig& config, std::shared_ptr<IRiskClassifier> classifier = nullptr);
    ~RiskMonitor();

    RiskMonitor(const RiskMonitor&) = delete;
    RiskMonitor& operator=(const RiskMonitor&) = delete;

    RiskVerdict assess(const std::string& sanitized_text, const RiskContext& context) const;

    /// Keyword path only (no classifier, no sustained rule)
    RiskVerdict keyword_verdict(const std::string& sanitized_text) const;

    /// Fixed verdict for a turn whose content could not be inspected (redaction failed closed)
    RiskVerdict uninspectable_verdict(const std::string& reason) const;

    bool has_classifier() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
