#ifndef VEIL_DATA_CATEGORY_HPP
#define VEIL_DATA_CATEGORY_HPP

#include "common.hpp"
#include <string>
#include <vector>

namespace veil {

    /// Classification of a sensitive value's shape.  Used both for
    /// key-less auto-detection and for category-based formatter lookup.
    enum class DataCategory {
        CPF,            // national id, 11 digits
        CNPJ,           // tax id, 14 digits
        RG,
        EMAIL,
        PHONE,
        CREDIT_CARD,
        IP_ADDRESS,
        PASSWORD,
        NAME,
        ADDRESS,
        MONETARY,
        BANK_ACCOUNT,
        BANK_AGENCY,
        GENERIC
    };

    inline const char *getCategoryKey(DataCategory category) {
        switch (category) {
            case DataCategory::CPF: return "cpf";
            case DataCategory::CNPJ: return "cnpj";
            case DataCategory::RG: return "rg";
            case DataCategory::EMAIL: return "email";
            case DataCategory::PHONE: return "phone";
            case DataCategory::CREDIT_CARD: return "creditCard";
            case DataCategory::IP_ADDRESS: return "ipAddress";
            case DataCategory::PASSWORD: return "password";
            case DataCategory::NAME: return "name";
            case DataCategory::ADDRESS: return "address";
            case DataCategory::MONETARY: return "monetary";
            case DataCategory::BANK_ACCOUNT: return "bankAccount";
            case DataCategory::BANK_AGENCY: return "bankAgency";
            case DataCategory::GENERIC: return "generic";
            default: return "generic";
        }
    }

    /// Regex (ECMAScript) matching the bare value shape, with no key context.
    /// Every repetition is bounded so a scan stays linear in the input.
    inline const char *getDefaultPattern(DataCategory category) {
        switch (category) {
            case DataCategory::CPF:
                return R"(\d{11}|\d{3}\.\d{3}\.\d{3}-\d{2})";
            case DataCategory::CNPJ:
                return R"(\d{14}|\d{2}\.\d{3}\.\d{3}/\d{4}-\d{2})";
            case DataCategory::RG:
                return R"(\d{7,9})";
            case DataCategory::EMAIL:
                return R"([\w.-]{1,64}@[\w.-]{1,253}\.\w{1,24})";
            case DataCategory::PHONE:
                return R"(\(?\d{2}\)?\s?\d{4,5}-?\d{4})";
            case DataCategory::CREDIT_CARD:
                return R"(\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4})";
            case DataCategory::IP_ADDRESS:
                return R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})";
            case DataCategory::NAME:
                return R"([A-Za-z\s]{1,128})";
            case DataCategory::MONETARY:
                return R"(\d{1,24}[,.]?\d{0,24})";
            case DataCategory::BANK_ACCOUNT:
                return R"(\d{5,12})";
            case DataCategory::BANK_AGENCY:
                return R"(\d{4,6})";
            case DataCategory::PASSWORD:
            case DataCategory::ADDRESS:
            case DataCategory::GENERIC:
            default:
                return ".{1,256}";
        }
    }

    /// Characters that end a bare value of this category once its default
    /// pattern hit its repetition bound.  Empty when the bound is the
    /// value's natural length.
    inline const char *getDefaultValueStop(DataCategory category) {
        switch (category) {
            case DataCategory::PASSWORD:
            case DataCategory::ADDRESS:
            case DataCategory::GENERIC:
                return "\r\n";
            default:
                return "";
        }
    }

    inline const std::vector<DataCategory> &allCategories() {
        static const std::vector<DataCategory> s_all = {
            DataCategory::CPF, DataCategory::CNPJ, DataCategory::RG,
            DataCategory::EMAIL, DataCategory::PHONE, DataCategory::CREDIT_CARD,
            DataCategory::IP_ADDRESS, DataCategory::PASSWORD, DataCategory::NAME,
            DataCategory::ADDRESS, DataCategory::MONETARY, DataCategory::BANK_ACCOUNT,
            DataCategory::BANK_AGENCY, DataCategory::GENERIC
        };
        return s_all;
    }

    /// Look up a category by key, ignoring case.  Unknown or blank keys
    /// map to GENERIC.
    inline DataCategory categoryFromKey(const std::string &key) {
        std::string wanted = detail::toLower(detail::trim(key));
        if (wanted.empty()) return DataCategory::GENERIC;
        for (DataCategory c : allCategories()) {
            if (detail::toLower(getCategoryKey(c)) == wanted) {
                return c;
            }
        }
        return DataCategory::GENERIC;
    }

    /// Same as categoryFromKey but reports whether the key was recognised.
    inline bool tryCategoryFromKey(const std::string &key, DataCategory &out) {
        std::string wanted = detail::toLower(detail::trim(key));
        for (DataCategory c : allCategories()) {
            if (detail::toLower(getCategoryKey(c)) == wanted) {
                out = c;
                return true;
            }
        }
        return false;
    }

    struct DataCategoryHash {
        size_t operator()(DataCategory c) const {
            return static_cast<size_t>(c);
        }
    };
} // namespace veil

#endif // VEIL_DATA_CATEGORY_HPP
