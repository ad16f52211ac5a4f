#pragma once

/**
 * @file risk_classifier.h
 * @brief Risk classifier collaborator interface
 *
 * Allows swapping classifier backends (HTTP model service, on-device model,
 * test fakes). The Risk Monitor bounds every call and treats failure as a
 * degraded verdict.
 */

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>

namespace carebridge {

struct ClassifierVerdict {
    Severity severity = Severity::None;
    float confidence = 0.0f;
    std::vector<std::string> labels;  ///< Backend-specific categories
};

class IRiskClassifier {
public:
    virtual ~IRiskClassifier() = default;

    /**
     * @brief Classify sanitized text
     * @param sanitized_text Redacted turn text
     * @param recent_context Redacted prior turns, oldest first
     */
    virtual Result<ClassifierVerdict> classify(const std::string& sanitized_text,
                                               const std::vector<std::string>& recent_context) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Model service over HTTP
 *
 * POSTs {"text": ..., "context": [...]} and expects
 * {"severity": "high", "confidence": 0.9, "labels": [...]}.
 */
class HttpRiskClassifier : public IRiskClassifier {
public:
    HttpRiskClassifier(const std::string& endpoint, int timeout_ms);

    Result<ClassifierVerdict> classify(const std::string& sanitized_text,
                                       const std::vector<std::string>& recent_context) override;
    std::string name() const override { return "http_classifier"; }

private:
    std::string endpoint_;
    int timeout_ms_;
};

} // namespace carebridge
