#include <GenViewer/CurlHttpClient.hpp>
#include <curl/curl.h>
#include <plog/Log.h>
#include <mutex>
#include <string>

namespace GenViewer {

namespace {

std::once_flag s_curlInitOnce;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp){
    size_t realsize = size * nmemb;
    std::string* mem = reinterpret_cast<std::string*>(userp);
    if(mem) mem->append(reinterpret_cast<char*>(contents), realsize);
    return realsize;
}

} // namespace

CurlHttpClient::CurlHttpClient(){
    std::call_once(s_curlInitOnce, [](){
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if(rc != CURLE_OK) PLOGE << "http:curl_global_init failed: " << curl_easy_strerror(rc);
    });
}

CurlHttpClient::~CurlHttpClient(){
    // curl_global_cleanup is left to process exit; other clients may still be alive
}

HttpResponse CurlHttpClient::get(const std::string& url){
    return perform(Method::Get, url, nullptr, std::string());
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body, const std::string& contentType){
    return perform(Method::Post, url, &body, contentType);
}

HttpResponse CurlHttpClient::perform(Method method, const std::string& url, const std::string* body, const std::string& contentType){
    HttpResponse resp;
    CURL* curl = curl_easy_init();
    if(!curl){ resp.transportError = "curl_easy_init failed"; return resp; }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // called from worker threads
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if(method == Method::Post){
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, body ? (long)body->size() : 0L);
    }

    struct curl_slist* headers = nullptr;
    if(!contentType.empty()){
        std::string ct = "Content-Type: " + contentType;
        headers = curl_slist_append(headers, ct.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    PLOGV << "http:" << (method == Method::Post ? "POST " : "GET ") << url;
    CURLcode res = curl_easy_perform(curl);
    if(res != CURLE_OK){ resp.transportError = curl_easy_strerror(res); }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.httpCode);
    PLOGD << "http:" << url << " -> " << resp.httpCode << " bytes=" << resp.body.size() << (resp.transportError.empty() ? std::string() : " error=" + resp.transportError);

    if(headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return resp;
}

} // namespace GenViewer
