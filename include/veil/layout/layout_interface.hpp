#ifndef VEIL_LAYOUT_INTERFACE_HPP
#define VEIL_LAYOUT_INTERFACE_HPP

#include "../log/log_entry.hpp"
#include <string>

namespace veil {
    /// Renders a log entry to one line of text.
    class ILayout {
    public:
        virtual ~ILayout() = default;

        virtual std::string format(const LogEntry &entry) const = 0;
    };
} // namespace veil

#endif // VEIL_LAYOUT_INTERFACE_HPP
