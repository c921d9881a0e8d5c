#pragma once

#include <future>
#include <memory>
#include <string>
#include <GenViewer/HttpTransport.hpp>
#include <GenViewer/Mesh.hpp>

namespace GenViewer {

enum class FetchError { None, Network, Parse };

const char* toString(FetchError e);

struct ModelFetchResult {
    std::shared_ptr<const Mesh> mesh; // set only on success
    FetchError error = FetchError::None;
    long httpCode = 0;
    std::string message; // human readable failure text
    bool ok() const { return error == FetchError::None && mesh != nullptr; }
};

struct GenerateResult {
    std::string message; // server message on success, failure text otherwise
    FetchError error = FetchError::None;
    long httpCode = 0;
    bool ok() const { return error == FetchError::None; }
};

/**
 * @brief Talks to the asset server.
 *
 * fetchModel/triggerGenerate run the blocking *Now variants on a worker
 * thread and hand back a future. Results never throw across the future;
 * failures are reported through FetchError. There is no retry.
 */
class AssetFetcher {
public:
    explicit AssetFetcher(std::shared_ptr<IHttpTransport> transport, std::string formatHint = "obj");

    std::future<ModelFetchResult> fetchModel(const std::string& url);
    std::future<GenerateResult> triggerGenerate(const std::string& url);

    ModelFetchResult fetchModelNow(const std::string& url) const;
    GenerateResult triggerGenerateNow(const std::string& url) const;

private:
    std::shared_ptr<IHttpTransport> transport_;
    std::string formatHint_;
};

} // namespace GenViewer
