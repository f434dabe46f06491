#ifndef VEIL_CNPJ_FORMATTER_HPP
#define VEIL_CNPJ_FORMATTER_HPP

#include "formatter_interface.hpp"

namespace veil {

    /// Tax id (CNPJ, 14 digits).
    ///   "12345678000190"  -> "**345678****90"
    ///   formatted mode    -> "**.345.678/****-90"
    class CnpjFormatter : public IFormatter {
    public:
        explicit CnpjFormatter(char maskChar = '*', bool formatted = false)
            : m_maskChar(maskChar)
            , m_formatted(formatted) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 3);
            }
            std::string digits = detail::digitsOnly(value);

            std::string result;
            if (m_formatted) {
                result += detail::repeat(m_maskChar, 2);
                result += '.';
                result += digits.substr(2, 3);
                result += '.';
                result += digits.substr(5, 3);
                result += '/';
                result += detail::repeat(m_maskChar, 4);
                result += '-';
                result += digits.substr(12, 2);
            } else {
                result += detail::repeat(m_maskChar, 2);
                result += digits.substr(2, 6);
                result += detail::repeat(m_maskChar, 4);
                result += digits.substr(12, 2);
            }
            return result;
        }

        std::string name() const override { return "cnpjFormatter"; }

        DataCategory category() const override { return DataCategory::CNPJ; }

        bool isValid(const std::string &value) const override {
            return !detail::isBlank(value) && detail::digitsOnly(value).size() == 14;
        }

    private:
        char m_maskChar;
        bool m_formatted;
    };
} // namespace veil

#endif // VEIL_CNPJ_FORMATTER_HPP
