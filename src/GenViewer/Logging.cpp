#include <GenViewer/Logging.hpp>
#include <GenViewer/ViewerConfig.hpp>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <algorithm>
#include <cctype>

namespace GenViewer {

bool parseSeverity(const std::string& name, plog::Severity& out){
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if(lower == "verbose") out = plog::verbose;
    else if(lower == "debug") out = plog::debug;
    else if(lower == "info") out = plog::info;
    else if(lower == "warning" || lower == "warn") out = plog::warning;
    else if(lower == "error") out = plog::error;
    else if(lower == "fatal") out = plog::fatal;
    else if(lower == "none") out = plog::none;
    else return false;
    return true;
}

void initLogging(const ViewerConfig& config){
    plog::Severity severity = plog::info;
    bool known = parseSeverity(config.logLevel, severity);

    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::Logger<PLOG_DEFAULT_INSTANCE_ID>& logger = plog::init(severity, &consoleAppender);
    if(!config.logFile.empty()){
        static plog::RollingFileAppender<plog::TxtFormatter> fileAppender(config.logFile.c_str(), 1024 * 1024, 3);
        logger.addAppender(&fileAppender);
    }
    if(!known) PLOGW << "log:unknown level '" << config.logLevel << "', using info";
    PLOGI << "plog initialized (" << plog::severityToString(severity) << " -> stderr" << (config.logFile.empty() ? std::string() : ", " + config.logFile) << ")";
}

} // namespace GenViewer
