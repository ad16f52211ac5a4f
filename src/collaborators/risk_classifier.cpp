#include "collaborators/risk_classifier.h"
#include "http_client.h"
#include "logger.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace carebridge {

HttpRiskClassifier::HttpRiskClassifier(const std::string& endpoint, int timeout_ms)
    : endpoint_(endpoint), timeout_ms_(timeout_ms) {}

Result<ClassifierVerdict> HttpRiskClassifier::classify(const std::string& sanitized_text,
                                                       const std::vector<std::string>& recent_context) {
    json request;
    request["text"] = sanitized_text;
    request["context"] = recent_context;

    auto response = http_post_json(endpoint_, request.dump(), timeout_ms_);
    if (response.is_error()) {
        return response.error();
    }
    if (response.value().status != 200) {
        return make_collaborator_error("classifier returned HTTP " + std::to_string(response.value().status));
    }

    try {
        json body = json::parse(response.value().body);
        ClassifierVerdict verdict;
        std::string severity = body.at("severity").get<std::string>();
        if (!parse_severity(severity, verdict.severity)) {
            return make_parse_error("classifier returned unknown severity: " + severity);
        }
        verdict.confidence = std::clamp(body.value("confidence", 0.0f), 0.0f, 1.0f);
        if (body.contains("labels") && body["labels"].is_array()) {
            for (const auto& label : body["labels"]) {
                if (label.is_string()) verdict.labels.push_back(label.get<std::string>());
            }
        }
        return verdict;
    } catch (const json::exception& e) {
        LOG_DEBUG(std::string("Classifier response unparsable: ") + e.what());
        return make_parse_error(std::string("classifier response: ") + e.what());
    }
}

} // namespace carebridge
