#ifndef VEIL_NAME_FORMATTER_HPP
#define VEIL_NAME_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <algorithm>
#include <sstream>

namespace veil {

    /// Personal name, masked word by word.
    ///   "JOSE DA SILVA" -> "J*** D* S****"
    /// With preserveInitials=false the first visibleCharsPerWord characters
    /// of every word are kept instead.
    class NameFormatter : public IFormatter {
    public:
        explicit NameFormatter(int visibleCharsPerWord = 1, char maskChar = '*', bool preserveInitials = true)
            : m_visiblePerWord(static_cast<size_t>(std::max(0, visibleCharsPerWord)))
            , m_maskChar(maskChar)
            , m_preserveInitials(preserveInitials) {}

        std::string format(const std::string &value) const override {
            if (!isValid(value)) {
                return detail::repeat(m_maskChar, 3);
            }

            std::istringstream words(value);
            std::string word;
            std::string result;
            bool first = true;
            while (words >> word) {
                if (!first) result += ' ';
                first = false;

                std::vector<std::string> cps = detail::utf8Split(word);
                size_t visible = m_preserveInitials ? 1 : std::min(m_visiblePerWord, cps.size());
                for (size_t i = 0; i < visible; ++i) result += cps[i];
                result += detail::repeat(m_maskChar, cps.size() - visible);
            }
            return result;
        }

        std::string name() const override { return "nameFormatter"; }

        DataCategory category() const override { return DataCategory::NAME; }

    private:
        size_t m_visiblePerWord;
        char m_maskChar;
        bool m_preserveInitials;
    };
} // namespace veil

#endif // VEIL_NAME_FORMATTER_HPP
