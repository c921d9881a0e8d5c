#include <GenViewer/ViewerConfig.hpp>
#include <plog/Log.h>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace GenViewer {

std::string ViewerConfig::buildUrl(const std::string& path) const {
    std::string base = serverUrl;
    while(!base.empty() && base.back() == '/') base.pop_back();
    if(path.empty()) return base;
    if(path.front() == '/') return base + path;
    return base + "/" + path;
}

bool ViewerConfig::applyJson(const nlohmann::json& j, std::string* outError){
    if(!j.is_object()){
        if(outError) *outError = "config root must be a JSON object";
        return false;
    }
    try{
        if(j.contains("serverUrl")) serverUrl = j.at("serverUrl").get<std::string>();
        if(j.contains("modelPath")) modelPath = j.at("modelPath").get<std::string>();
        if(j.contains("generatePath")) generatePath = j.at("generatePath").get<std::string>();
        if(j.contains("modelFormatHint")) modelFormatHint = j.at("modelFormatHint").get<std::string>();
        if(j.contains("timeoutSeconds")) timeoutSeconds = j.at("timeoutSeconds").get<long>();
        if(j.contains("loadOnStartup")) loadOnStartup = j.at("loadOnStartup").get<bool>();
        if(j.contains("logLevel")) logLevel = j.at("logLevel").get<std::string>();
        if(j.contains("logFile")) logFile = j.at("logFile").get<std::string>();
        if(j.contains("window")){
            const auto& w = j.at("window");
            if(w.contains("width")) windowWidth = w.at("width").get<int>();
            if(w.contains("height")) windowHeight = w.at("height").get<int>();
        }
    } catch(const nlohmann::json::exception& ex){
        if(outError) *outError = ex.what();
        return false;
    }
    if(timeoutSeconds <= 0){
        if(outError) *outError = "timeoutSeconds must be positive";
        return false;
    }
    return true;
}

bool ViewerConfig::loadFromFile(const std::string& path, std::string* outError){
    std::ifstream in(path);
    if(!in){
        if(outError) *outError = "cannot open config file: " + path;
        return false;
    }
    nlohmann::json j;
    try{
        j = nlohmann::json::parse(in);
    } catch(const nlohmann::json::parse_error& ex){
        if(outError) *outError = "config file is not valid JSON: " + path + " (" + ex.what() + ")";
        return false;
    }
    PLOGD << "config:loaded " << path;
    return applyJson(j, outError);
}

void ViewerConfig::applyEnvironment(){
    const char* env = std::getenv("GENVIEWER_SERVER_URL");
    if(env && *env){
        serverUrl = env;
        PLOGD << "config:server url from environment";
    }
}

bool ViewerConfig::parseArgs(int argc, char** argv, std::string* outError){
    std::vector<std::string> args;
    for(int i=1;i<argc;++i) args.emplace_back(argv[i]);

    auto fail = [outError](const std::string& msg){ if(outError) *outError = msg; return false; };

    // config file first so that every other source can override it
    for(size_t i=0;i<args.size();++i){
        if(args[i] == "--config"){
            if(i + 1 >= args.size()) return fail("--config requires a path");
            if(!loadFromFile(args[i+1], outError)) return false;
        }
    }
    applyEnvironment();

    for(size_t i=0;i<args.size();++i){
        const std::string& a = args[i];
        auto next = [&](std::string& value)->bool{
            if(i + 1 >= args.size()) return false;
            value = args[++i];
            return true;
        };
        std::string value;
        if(a == "--help" || a == "-h"){ showHelp = true; }
        else if(a == "--config"){ ++i; }
        else if(a == "--server"){ if(!next(value)) return fail("--server requires a URL"); serverUrl = value; }
        else if(a == "--log-level"){ if(!next(value)) return fail("--log-level requires a value"); logLevel = value; }
        else if(a == "--log-file"){ if(!next(value)) return fail("--log-file requires a path"); logFile = value; }
        else if(a == "--format"){ if(!next(value)) return fail("--format requires an extension"); modelFormatHint = value; }
        else if(a == "--no-startup-load"){ loadOnStartup = false; }
        else if(a == "--timeout"){
            if(!next(value)) return fail("--timeout requires seconds");
            char* end = nullptr;
            long t = std::strtol(value.c_str(), &end, 10);
            if(!end || *end != '\0' || t <= 0) return fail("--timeout must be a positive integer");
            timeoutSeconds = t;
        }
        else return fail("unknown option: " + a);
    }
    if(serverUrl.empty()) return fail("server URL must not be empty");
    return true;
}

const char* ViewerConfig::usage(){
    return "Usage: genviewer [options]\n"
           "  --server <url>        asset server base URL\n"
           "  --config <path>       JSON config file\n"
           "  --timeout <seconds>   HTTP timeout\n"
           "  --format <ext>        model payload format hint (default obj)\n"
           "  --log-level <level>   verbose|debug|info|warning|error|fatal|none\n"
           "  --log-file <path>     also log to a rolling file\n"
           "  --no-startup-load     do not fetch the model at startup\n"
           "  --help                show this text\n";
}

} // namespace GenViewer
