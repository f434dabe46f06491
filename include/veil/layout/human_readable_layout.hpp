#ifndef VEIL_HUMAN_READABLE_LAYOUT_HPP
#define VEIL_HUMAN_READABLE_LAYOUT_HPP

#include "layout_interface.hpp"
#include "../core/common.hpp"
#include <sstream>

namespace veil {
    /// "2026-01-01 12:00:00.000 [INFO] message {key=value, ...}"
    class HumanReadableLayout : public ILayout {
    public:
        std::string format(const LogEntry &entry) const override {
            std::ostringstream oss;
            oss << detail::formatTimestamp(entry.timestamp) << " "
                << "[" << getLevelString(entry.level) << "] "
                << entry.message;

            if (!entry.customContext.empty()) {
                oss << " {";
                bool first = true;
                for (const auto &ctx : entry.customContext) {
                    if (!first) oss << ", ";
                    first = false;
                    oss << ctx.first << "=" << ctx.second;
                }
                oss << "}";
            }

            return oss.str();
        }
    };
} // namespace veil

#endif // VEIL_HUMAN_READABLE_LAYOUT_HPP
