#ifndef VEIL_EMAIL_FORMATTER_HPP
#define VEIL_EMAIL_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <algorithm>

namespace veil {

    /// E-mail address.  Keeps the first characters of the user and of the
    /// domain name, and the full extension:
    ///   "joao.silva@empresa.com.br" -> "jo***@emp***.br"
    class EmailFormatter : public IFormatter {
    public:
        explicit EmailFormatter(int visibleCharsUser = 2, int visibleCharsDomain = 3, char maskChar = '*')
            : m_visibleUser(static_cast<size_t>(std::max(1, visibleCharsUser)))
            , m_visibleDomain(static_cast<size_t>(std::max(1, visibleCharsDomain)))
            , m_maskChar(maskChar) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 3);
            }

            size_t at = value.find('@');
            std::string user = value.substr(0, at);
            std::string domain = value.substr(at + 1);

            std::string result = maskHead(user, m_visibleUser);
            result += '@';

            size_t lastDot = domain.rfind('.');
            if (lastDot != std::string::npos && lastDot > 0) {
                result += maskHead(domain.substr(0, lastDot), m_visibleDomain);
                result += domain.substr(lastDot);
            } else {
                result += detail::repeat(m_maskChar, 3);
            }
            return result;
        }

        std::string name() const override { return "emailFormatter"; }

        DataCategory category() const override { return DataCategory::EMAIL; }

        bool isValid(const std::string &value) const override {
            if (detail::isBlank(value)) return false;
            size_t at = value.find('@');
            return at != std::string::npos && at > 0 && at < value.size() - 1
                   && value.find('@', at + 1) == std::string::npos;
        }

    private:
        size_t m_visibleUser;
        size_t m_visibleDomain;
        char m_maskChar;

        std::string maskHead(const std::string &part, size_t visible) const {
            std::vector<std::string> cps = detail::utf8Split(part);
            if (cps.size() <= visible) {
                return detail::repeat(m_maskChar, cps.size());
            }
            std::string out;
            for (size_t i = 0; i < visible; ++i) out += cps[i];
            out += detail::repeat(m_maskChar, 3);
            return out;
        }
    };
} // namespace veil

#endif // VEIL_EMAIL_FORMATTER_HPP
