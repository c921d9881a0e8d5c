#pragma once

#include <string>
#include <GenViewer/HttpTransport.hpp>

namespace GenViewer {

// libcurl implementation of IHttpTransport
// - one easy handle per request, so concurrent calls from worker threads are safe
// - every request is bounded by the configured timeout
class CurlHttpClient : public IHttpTransport {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    void setTimeoutSeconds(long seconds) { timeoutSeconds_ = seconds; }

    HttpResponse get(const std::string& url) override;
    HttpResponse post(const std::string& url, const std::string& body, const std::string& contentType) override;

private:
    enum class Method { Get, Post };
    HttpResponse perform(Method method, const std::string& url, const std::string* body, const std::string& contentType);

    long timeoutSeconds_ = 30;
};

} // namespace GenViewer
