#pragma once
#include <string>
#include <plog/Severity.h>

namespace GenViewer {

struct ViewerConfig;

// Map a config string ("info", "warning", ...) to a plog severity.
// Unknown names return false and leave `out` untouched.
bool parseSeverity(const std::string& name, plog::Severity& out);

// Console appender on stderr plus, when config.logFile is set, a rolling file.
// Safe to call once per process.
void initLogging(const ViewerConfig& config);

} // namespace GenViewer
