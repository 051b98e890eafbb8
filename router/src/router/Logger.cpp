#include "Logger.h"

namespace wayfinder { namespace router {
    void StreamLogger::write(Severity severity, const std::string& msg) {
        std::lock_guard<std::mutex> lock(_mutex);
        _stream << "[" << getSeverityName(severity) << "] " << msg << std::endl;
    }

    const char* StreamLogger::getSeverityName(Severity severity) {
        switch (severity) {
        case Severity::INFO:
            return "info";
        case Severity::WARNING:
            return "warning";
        case Severity::ERROR:
            return "error";
        }
        return "unknown";
    }
} }
