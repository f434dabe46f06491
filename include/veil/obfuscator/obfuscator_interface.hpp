#ifndef VEIL_OBFUSCATOR_INTERFACE_HPP
#define VEIL_OBFUSCATOR_INTERFACE_HPP

#include <string>

namespace veil {

    /// Format-agnostic masking strategy.  Must never return an empty
    /// string for a non-empty value.  Only std::exception types may be
    /// thrown; the engine catches those and falls back to the default
    /// obfuscator.
    class IObfuscator {
    public:
        virtual ~IObfuscator() = default;

        virtual std::string obfuscate(const std::string &value) const = 0;

        virtual char maskChar() const { return '*'; }
    };
} // namespace veil

#endif // VEIL_OBFUSCATOR_INTERFACE_HPP
