#pragma once

#include "errors.h"
#include <string>

namespace carebridge {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Blocking JSON POST over libcurl
 *
 * Transport failures come back as NetworkError; a non-2xx status is still a
 * successful result and the caller decides what it means.
 */
Result<HttpResponse> http_post_json(const std::string& url, const std::string& body,
                                    long timeout_ms, long connect_timeout_ms = 1000);

} // namespace carebridge
