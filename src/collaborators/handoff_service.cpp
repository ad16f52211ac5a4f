#include "collaborators/handoff_service.h"
#include "http_client.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace carebridge {

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::Connected:   return "connected";
        case TransferStatus::Queued:      return "queued";
        case TransferStatus::Unavailable: return "unavailable";
        case TransferStatus::Rejected:    return "rejected";
    }
    return "unavailable";
}

bool parse_transfer_status(const std::string& name, TransferStatus& out) {
    if (name == "connected") out = TransferStatus::Connected;
    else if (name == "queued") out = TransferStatus::Queued;
    else if (name == "unavailable") out = TransferStatus::Unavailable;
    else if (name == "rejected") out = TransferStatus::Rejected;
    else return false;
    return true;
}

HttpHandoffService::HttpHandoffService(const std::string& endpoint, int timeout_ms)
    : endpoint_(endpoint), timeout_ms_(timeout_ms) {}

Result<TransferOutcome> HttpHandoffService::initiate(const std::string& context_summary) {
    json request;
    request["context_summary"] = context_summary;

    auto response = http_post_json(endpoint_, request.dump(), timeout_ms_);
    if (response.is_error()) {
        return response.error();
    }
    long status = response.value().status;
    if (status == 503) {
        TransferOutcome outcome;
        outcome.status = TransferStatus::Unavailable;
        outcome.detail = "HTTP 503";
        return outcome;
    }
    if (status < 200 || status >= 300) {
        return make_collaborator_error("hand-off service returned HTTP " + std::to_string(status));
    }

    try {
        json body = json::parse(response.value().body);
        TransferOutcome outcome;
        std::string state = body.value("status", "");
        if (!parse_transfer_status(state, outcome.status)) {
            return make_parse_error("hand-off service returned unknown status: " + state);
        }
        outcome.reference = body.value("reference", "");
        outcome.detail = body.value("detail", "");
        return outcome;
    } catch (const json::exception& e) {
        return make_parse_error(std::string("hand-off response: ") + e.what());
    }
}

} // namespace carebridge
