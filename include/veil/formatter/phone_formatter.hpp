#ifndef VEIL_PHONE_FORMATTER_HPP
#define VEIL_PHONE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <algorithm>

namespace veil {

    /// Phone number with area code (DDD), 10 or 11 digits.
    ///   "11987654321" -> "(11) *****-4321"
    ///   showDdd=false -> "(**) *****-4321"
    class PhoneFormatter : public IFormatter {
    public:
        explicit PhoneFormatter(int visibleDigitsEnd = 4, bool showDdd = true, char maskChar = '*')
            : m_visibleEnd(static_cast<size_t>(std::max(0, visibleDigitsEnd)))
            , m_showDdd(showDdd)
            , m_maskChar(maskChar) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 3);
            }
            std::string digits = detail::digitsOnly(value);

            std::string result;
            if (m_showDdd) {
                result += "(" + digits.substr(0, 2) + ") ";
            } else {
                result += "(**) ";
            }

            std::string number = digits.substr(2);
            size_t visible = std::min(m_visibleEnd, number.size());
            size_t maskLength = number.size() - visible;
            result += detail::repeat(m_maskChar, maskLength);
            if (visible > 0) {
                result += '-';
                result += number.substr(maskLength);
            }
            return result;
        }

        std::string name() const override { return "phoneFormatter"; }

        DataCategory category() const override { return DataCategory::PHONE; }

        bool isValid(const std::string &value) const override {
            if (detail::isBlank(value)) return false;
            size_t n = detail::digitsOnly(value).size();
            return n >= 10 && n <= 11;
        }

    private:
        size_t m_visibleEnd;
        bool m_showDdd;
        char m_maskChar;
    };
} // namespace veil

#endif // VEIL_PHONE_FORMATTER_HPP
