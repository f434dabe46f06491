#ifndef VEIL_PARTIAL_OBFUSCATOR_HPP
#define VEIL_PARTIAL_OBFUSCATOR_HPP

#include "obfuscator_interface.hpp"
#include "../core/mask_utils.hpp"

namespace veil {

    /// partialMask() packaged as an obfuscator.
    ///   PartialObfuscator(3, 2).obfuscate("12345678909") -> "123******09"
    class PartialObfuscator : public IObfuscator {
    public:
        explicit PartialObfuscator(unsigned visibleStart = 3, unsigned visibleEnd = 2,
                                   char maskChar = '*', unsigned minMaskLength = kMinMaskLength)
            : m_visibleStart(visibleStart)
            , m_visibleEnd(visibleEnd)
            , m_maskChar(maskChar)
            , m_minMaskLength(minMaskLength < 1 ? 1 : minMaskLength) {}

        std::string obfuscate(const std::string &value) const override {
            if (value.empty()) {
                return detail::repeat(m_maskChar, m_minMaskLength);
            }
            return partialMask(value, m_visibleStart, m_visibleEnd, m_maskChar, m_minMaskLength);
        }

        char maskChar() const override { return m_maskChar; }

        unsigned visibleStart() const { return m_visibleStart; }
        unsigned visibleEnd() const { return m_visibleEnd; }
        unsigned minMaskLength() const { return m_minMaskLength; }

    private:
        unsigned m_visibleStart;
        unsigned m_visibleEnd;
        char m_maskChar;
        unsigned m_minMaskLength;
    };
} // namespace veil

#endif // VEIL_PARTIAL_OBFUSCATOR_HPP
