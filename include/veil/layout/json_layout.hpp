#ifndef VEIL_JSON_LAYOUT_HPP
#define VEIL_JSON_LAYOUT_HPP

#include "layout_interface.hpp"
#include "../core/common.hpp"
#include <nlohmann/json.hpp>

namespace veil {
    /// One JSON object per entry: level, timestamp, message, then the
    /// template arguments as top-level members and the context under
    /// "context".
    class JsonLayout : public ILayout {
    public:
        std::string format(const LogEntry &entry) const override {
            nlohmann::ordered_json j;
            j["level"] = getLevelString(entry.level);
            j["timestamp"] = detail::formatTimestamp(entry.timestamp);
            j["message"] = entry.message;
            for (const auto &arg: entry.arguments) {
                j[arg.first] = arg.second;
            }
            if (!entry.customContext.empty()) {
                nlohmann::ordered_json ctx = nlohmann::ordered_json::object();
                for (const auto &kv : entry.customContext) {
                    ctx[kv.first] = kv.second;
                }
                j["context"] = ctx;
            }
            return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
    };
} // namespace veil

#endif // VEIL_JSON_LAYOUT_HPP
