#pragma once

/**
 * @file handoff_service.h
 * @brief Warm-transfer collaborator interface
 *
 * Invoked only by the Escalation Coordinator, one call per attempt.
 */

#include "errors.h"
#include <string>

namespace carebridge {

enum class TransferStatus {
    Connected,    ///< A human responder has the session
    Queued,       ///< Accepted, responder will pick up
    Unavailable,  ///< No responder right now; worth another attempt
    Rejected      ///< Refused outright
};

const char* transfer_status_name(TransferStatus status);
bool parse_transfer_status(const std::string& name, TransferStatus& out);

inline bool transfer_accepted(TransferStatus status) {
    return status == TransferStatus::Connected || status == TransferStatus::Queued;
}

struct TransferOutcome {
    TransferStatus status = TransferStatus::Unavailable;
    std::string reference;  ///< Service-side transfer id, if any
    std::string detail;
};

class IHandoffService {
public:
    virtual ~IHandoffService() = default;

    /**
     * @param context_summary Redacted summary for the responder
     */
    virtual Result<TransferOutcome> initiate(const std::string& context_summary) = 0;

    virtual std::string name() const = 0;
};

/// POSTs {"context_summary": ...} and reads {"status", "reference", "detail"}
class HttpHandoffService : public IHandoffService {
public:
    HttpHandoffService(const std::string& endpoint, int timeout_ms);

    Result<TransferOutcome> initiate(const std::string& context_summary) override;
    std::string name() const override { return "http_handoff"; }

private:
    std::string endpoint_;
    int timeout_ms_;
};

} // namespace carebridge
