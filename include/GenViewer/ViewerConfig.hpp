#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace GenViewer {

// Startup parameters. Precedence, lowest first: defaults, --config JSON file,
// GENVIEWER_SERVER_URL, remaining command line flags.
struct ViewerConfig {
    std::string serverUrl = "http://192.168.0.117:5000";
    std::string modelPath = "/model";
    std::string generatePath = "/generate";
    std::string modelFormatHint = "obj";
    long timeoutSeconds = 30;
    bool loadOnStartup = true;

    std::string logLevel = "info";
    std::string logFile; // empty: console only

    int windowWidth = 540;
    int windowHeight = 960;

    std::string modelUrl() const { return buildUrl(modelPath); }
    std::string generateUrl() const { return buildUrl(generatePath); }
    std::string buildUrl(const std::string& path) const;

    // Overlay keys present in `j` onto this config
    bool applyJson(const nlohmann::json& j, std::string* outError = nullptr);
    bool loadFromFile(const std::string& path, std::string* outError = nullptr);
    void applyEnvironment();

    // Parse argv. Sets showHelp on --help. Unknown flags are an error.
    bool parseArgs(int argc, char** argv, std::string* outError = nullptr);
    bool showHelp = false;

    static const char* usage();
};

} // namespace GenViewer
