#include <GenViewer/AssetFetcher.hpp>
#include <GenViewer/ModelLoader.hpp>
#include <plog/Log.h>
#include <tracy/Tracy.hpp>
#include <utility>

namespace GenViewer {

const char* toString(FetchError e){
    switch(e){
        case FetchError::None: return "none";
        case FetchError::Network: return "network";
        case FetchError::Parse: return "parse";
    }
    return "unknown";
}

namespace {

ModelFetchResult fetchModelWith(IHttpTransport& transport, const std::string& url, const std::string& formatHint){
    ZoneScopedN("AssetFetcher::fetchModel");
    ModelFetchResult result;
    HttpResponse resp = transport.get(url);
    result.httpCode = resp.httpCode;
    if(!resp.transportError.empty()){
        result.error = FetchError::Network;
        result.message = "Failed to load model: " + resp.transportError;
        PLOGW << "fetch:GET " << url << " transport error: " << resp.transportError;
        return result;
    }
    if(!resp.ok()){
        result.error = FetchError::Network;
        result.message = "Failed to load model (HTTP " + std::to_string(resp.httpCode) + ")";
        PLOGW << "fetch:GET " << url << " status " << resp.httpCode;
        return result;
    }
    std::vector<uint8_t> bytes(resp.body.begin(), resp.body.end());
    auto mesh = std::make_shared<Mesh>();
    std::string parseError;
    if(!ModelLoader::parseMeshFromMemory(bytes, formatHint, *mesh, &parseError)){
        result.error = FetchError::Parse;
        result.message = "Failed to parse model: " + parseError;
        return result;
    }
    mesh->name = url;
    result.mesh = std::move(mesh);
    PLOGI << "fetch:model ok url=" << url << " bytes=" << bytes.size();
    return result;
}

GenerateResult triggerGenerateWith(IHttpTransport& transport, const std::string& url){
    ZoneScopedN("AssetFetcher::triggerGenerate");
    GenerateResult result;
    HttpResponse resp = transport.post(url, std::string(), std::string());
    result.httpCode = resp.httpCode;
    if(!resp.transportError.empty()){
        result.error = FetchError::Network;
        result.message = "Failed to generate model: " + resp.transportError;
        PLOGW << "fetch:POST " << url << " transport error: " << resp.transportError;
        return result;
    }
    if(!resp.ok()){
        result.error = FetchError::Network;
        result.message = "Failed to generate model";
        PLOGW << "fetch:POST " << url << " status " << resp.httpCode;
        return result;
    }
    nlohmann::json j;
    if(!resp.bodyJson(j) || !j.is_object() || !j.contains("message") || !j["message"].is_string()){
        result.error = FetchError::Parse;
        result.message = "Invalid response from generate endpoint";
        PLOGW << "fetch:POST " << url << " unexpected body: " << resp.body.substr(0, 200);
        return result;
    }
    result.message = j["message"].get<std::string>();
    PLOGI << "fetch:generate ok url=" << url << " message='" << result.message << "'";
    return result;
}

} // namespace

AssetFetcher::AssetFetcher(std::shared_ptr<IHttpTransport> transport, std::string formatHint)
    : transport_(std::move(transport)), formatHint_(std::move(formatHint)) {}

ModelFetchResult AssetFetcher::fetchModelNow(const std::string& url) const {
    return fetchModelWith(*transport_, url, formatHint_);
}

GenerateResult AssetFetcher::triggerGenerateNow(const std::string& url) const {
    return triggerGenerateWith(*transport_, url);
}

// The worker holds its own reference to the transport, so the fetcher may be
// destroyed while a request is still running.
std::future<ModelFetchResult> AssetFetcher::fetchModel(const std::string& url){
    auto transport = transport_;
    auto hint = formatHint_;
    return std::async(std::launch::async, [transport, url, hint](){
        return fetchModelWith(*transport, url, hint);
    });
}

std::future<GenerateResult> AssetFetcher::triggerGenerate(const std::string& url){
    auto transport = transport_;
    return std::async(std::launch::async, [transport, url](){
        return triggerGenerateWith(*transport, url);
    });
}

} // namespace GenViewer
