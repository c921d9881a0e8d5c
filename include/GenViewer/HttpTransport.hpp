#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace GenViewer {

struct HttpResponse {
    long httpCode = 0;
    std::string body;
    std::string transportError; // empty when the request reached the server
    bool ok() const { return transportError.empty() && (httpCode >= 200 && httpCode < 300); }

    // Parse the body as JSON. Returns false (and leaves `out` alone) when it is not JSON.
    bool bodyJson(nlohmann::json& out, std::string* outError = nullptr) const;
};

// Blocking HTTP seam used by AssetFetcher. Implementations must be callable from
// worker threads.
struct IHttpTransport {
    virtual ~IHttpTransport() = default;
    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body, const std::string& contentType) = 0;
};

} // namespace GenViewer
