#ifndef VEIL_CPF_FORMATTER_HPP
#define VEIL_CPF_FORMATTER_HPP

#include "formatter_interface.hpp"

namespace veil {

    /// National id (CPF, 11 digits).  Shows the six middle digits:
    ///   "12345678909"     -> "***456789**"
    ///   formatted mode    -> "***.456.789-**"
    /// Punctuation in the input is ignored.
    class CpfFormatter : public IFormatter {
    public:
        explicit CpfFormatter(char maskChar = '*', bool formatted = false)
            : m_maskChar(maskChar)
            , m_formatted(formatted) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 3);
            }
            std::string digits = detail::digitsOnly(value);

            std::string result;
            if (m_formatted) {
                result += detail::repeat(m_maskChar, 3);
                result += '.';
                result += digits.substr(3, 3);
                result += '.';
                result += digits.substr(6, 3);
                result += '-';
                result += detail::repeat(m_maskChar, 2);
            } else {
                result += detail::repeat(m_maskChar, 3);
                result += digits.substr(3, 6);
                result += detail::repeat(m_maskChar, 2);
            }
            return result;
        }

        std::string name() const override { return "cpfFormatter"; }

        DataCategory category() const override { return DataCategory::CPF; }

        bool isValid(const std::string &value) const override {
            return !detail::isBlank(value) && detail::digitsOnly(value).size() == 11;
        }

    private:
        char m_maskChar;
        bool m_formatted;
    };
} // namespace veil

#endif // VEIL_CPF_FORMATTER_HPP
