#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace infra::http {

struct JsonResponse {
    unsigned status = 0U;
    std::string body;
    std::string retry_after_header;
};

// Signature shared by the real client and the fakes used by adapter tests.
using HttpsGetter =
    std::function<JsonResponse(const std::string& host, const std::string& target, std::chrono::milliseconds timeout)>;

// Performs one HTTPS GET (following up to five same-scheme redirects). The
// timeout bounds every blocking step: resolve, connect, handshake, write and
// read. Throws std::runtime_error on transport errors; HTTP error statuses
// are returned to the caller.
JsonResponse https_get_json_response(const std::string& host,
                                     const std::string& target,
                                     std::chrono::milliseconds timeout);

HttpsGetter default_getter();

std::string url_encode(const std::string& value);

}  // namespace infra::http
