#pragma once

#include <string>

namespace vpb::infra::http {

struct HttpsGetRequest {
    std::string host;
    std::string target{"/"};
    int timeoutSec = 20;
    bool verifyPeer = true;
    // Response header to hand back verbatim (e.g. a rate-limit weight), empty for none.
    std::string captureHeader;
};

struct HttpsResponse {
    unsigned status = 0U;
    std::string body;
    std::string capturedHeader;
    std::string finalHost;
    std::string finalTarget;
};

// Blocking HTTPS GET that follows up to five same-scheme redirects.
// Throws std::runtime_error on transport errors; HTTP error statuses are returned.
HttpsResponse httpsGet(const HttpsGetRequest& request);

}  // namespace vpb::infra::http
