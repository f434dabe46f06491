#ifndef VEIL_DEFAULT_OBFUSCATOR_HPP
#define VEIL_DEFAULT_OBFUSCATOR_HPP

#include "obfuscator_interface.hpp"
#include "../core/common.hpp"

namespace veil {

    /// Replaces any value with a fixed mask, "***" unless told otherwise.
    class DefaultObfuscator : public IObfuscator {
    public:
        explicit DefaultObfuscator(char maskChar = '*')
            : m_maskChar(maskChar)
            , m_defaultMask(detail::repeat(maskChar, 3)) {}

        DefaultObfuscator(char maskChar, std::string defaultMask)
            : m_maskChar(maskChar)
            , m_defaultMask(defaultMask.empty() ? detail::repeat(maskChar, 3) : std::move(defaultMask)) {}

        std::string obfuscate(const std::string &) const override {
            return m_defaultMask;
        }

        char maskChar() const override { return m_maskChar; }

        const std::string &defaultMask() const { return m_defaultMask; }

    private:
        char m_maskChar;
        std::string m_defaultMask;
    };
} // namespace veil

#endif // VEIL_DEFAULT_OBFUSCATOR_HPP
