#ifndef VEIL_MONETARY_FORMATTER_HPP
#define VEIL_MONETARY_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <algorithm>

namespace veil {

    /// Amount of money.  Integer digits are masked one for one; the
    /// decimal part keeps its separator (normalized to '.').
    ///   "1000"      -> "****"
    ///   "56789,98"  -> "*****.**"
    /// showMagnitude keeps the leading digit, showDecimals keeps the cents.
    class MonetaryFormatter : public IFormatter {
    public:
        explicit MonetaryFormatter(bool showMagnitude = false, bool showDecimals = false, char maskChar = '*')
            : m_showMagnitude(showMagnitude)
            , m_showDecimals(showDecimals)
            , m_maskChar(maskChar) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 3);
            }

            std::string normalized(value);
            std::replace(normalized.begin(), normalized.end(), ',', '.');

            std::string integerPart = normalized;
            std::string decimalPart;
            size_t dot = normalized.rfind('.');
            if (dot != std::string::npos && dot > 0) {
                integerPart = normalized.substr(0, dot);
                decimalPart = normalized.substr(dot);
            }
            std::string digits = detail::digitsOnly(integerPart);

            std::string result;
            if (m_showMagnitude && !digits.empty()) {
                result += digits[0];
                result += detail::repeat(m_maskChar, digits.size() - 1);
            } else {
                result += detail::repeat(m_maskChar, std::max<size_t>(1, digits.size()));
            }

            if (!decimalPart.empty()) {
                if (m_showDecimals) {
                    result += decimalPart;
                } else {
                    result += '.';
                    result += detail::repeat(m_maskChar, decimalPart.size() - 1);
                }
            }
            return result;
        }

        std::string name() const override { return "monetaryFormatter"; }

        DataCategory category() const override { return DataCategory::MONETARY; }

        bool isValid(const std::string &value) const override {
            if (detail::isBlank(value)) return false;
            for (char c : value) {
                if ((c >= '0' && c <= '9') || c == '.' || c == ',') return true;
            }
            return false;
        }

    private:
        bool m_showMagnitude;
        bool m_showDecimals;
        char m_maskChar;
    };
} // namespace veil

#endif // VEIL_MONETARY_FORMATTER_HPP
