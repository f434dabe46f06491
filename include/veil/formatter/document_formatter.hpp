#ifndef VEIL_DOCUMENT_FORMATTER_HPP
#define VEIL_DOCUMENT_FORMATTER_HPP

#include "formatter_interface.hpp"

namespace veil {

    /// Generic document number.  Recognises CPF and CNPJ lengths after
    /// dropping '.', '-' and '/'; letters are kept so alphanumeric CNPJs work.
    ///   "23456789020"    -> "234.***.***-20"
    ///   "12345678000190" -> "12.***.***/***/90"
    class DocumentFormatter : public IFormatter {
    public:
        std::string format(const std::string &value) const override {
            if (detail::isBlank(value)) return "***";

            std::string clean;
            clean.reserve(value.size());
            for (char c : value) {
                if (c != '.' && c != '-' && c != '/') clean += c;
            }

            if (clean.size() == 11) {
                return clean.substr(0, 3) + ".***.***-" + clean.substr(9, 2);
            }
            if (clean.size() == 14) {
                return clean.substr(0, 2) + ".***.***/***/" + clean.substr(12, 2);
            }
            return "***";
        }

        std::string name() const override { return "documentFormatter"; }
    };
} // namespace veil

#endif // VEIL_DOCUMENT_FORMATTER_HPP
