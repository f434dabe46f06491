#ifndef VEIL_LOG_ENTRY_HPP
#define VEIL_LOG_ENTRY_HPP

#include "log_level.hpp"
#include <string>
#include <chrono>
#include <map>
#include <vector>

namespace veil {
    struct LogEntry {
        LogLevel level;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string templateStr;
        std::vector<std::pair<std::string, std::string> > arguments;
        std::map<std::string, std::string> customContext;
    };
} // namespace veil

#endif // VEIL_LOG_ENTRY_HPP
