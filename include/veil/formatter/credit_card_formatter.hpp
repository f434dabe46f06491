#ifndef VEIL_CREDIT_CARD_FORMATTER_HPP
#define VEIL_CREDIT_CARD_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <algorithm>

namespace veil {

    /// Card number (13-19 digits).  At most the last four digits stay visible.
    ///   "4111-1111-1111-1111" -> "************1111"
    ///   formatted, 16 digits  -> "****-****-****-1111"
    class CreditCardFormatter : public IFormatter {
    public:
        explicit CreditCardFormatter(int visibleDigitsEnd = 4, char maskChar = '*', bool formatted = false)
            : m_visibleEnd(static_cast<size_t>(std::max(0, std::min(4, visibleDigitsEnd))))
            , m_maskChar(maskChar)
            , m_formatted(formatted) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 4);
            }
            std::string digits = detail::digitsOnly(value);
            size_t maskLength = digits.size() - m_visibleEnd;
            std::string visible = digits.substr(maskLength);

            if (m_formatted && digits.size() == 16) {
                std::string group = detail::repeat(m_maskChar, 4);
                return group + "-" + group + "-" + group + "-" + visible;
            }
            return detail::repeat(m_maskChar, maskLength) + visible;
        }

        std::string name() const override { return "creditCardFormatter"; }

        DataCategory category() const override { return DataCategory::CREDIT_CARD; }

        bool isValid(const std::string &value) const override {
            if (detail::isBlank(value)) return false;
            size_t n = detail::digitsOnly(value).size();
            return n >= 13 && n <= 19;
        }

    private:
        size_t m_visibleEnd;
        char m_maskChar;
        bool m_formatted;
    };
} // namespace veil

#endif // VEIL_CREDIT_CARD_FORMATTER_HPP
