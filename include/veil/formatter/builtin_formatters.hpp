#ifndef VEIL_BUILTIN_FORMATTERS_HPP
#define VEIL_BUILTIN_FORMATTERS_HPP

#include "cpf_formatter.hpp"
#include "cnpj_formatter.hpp"
#include "email_formatter.hpp"
#include "phone_formatter.hpp"
#include "credit_card_formatter.hpp"
#include "name_formatter.hpp"
#include "monetary_formatter.hpp"
#include "document_formatter.hpp"
#include <vector>
#include <memory>

namespace veil {

    /// One instance of every bundled formatter, configured with maskChar.
    inline std::vector<std::shared_ptr<IFormatter>> builtinFormatters(char maskChar = '*') {
        return {
            std::make_shared<CpfFormatter>(maskChar),
            std::make_shared<CnpjFormatter>(maskChar),
            std::make_shared<EmailFormatter>(2, 3, maskChar),
            std::make_shared<PhoneFormatter>(4, true, maskChar),
            std::make_shared<CreditCardFormatter>(4, maskChar),
            std::make_shared<NameFormatter>(1, maskChar),
            std::make_shared<MonetaryFormatter>(false, false, maskChar),
            std::make_shared<DocumentFormatter>()
        };
    }
} // namespace veil

#endif // VEIL_BUILTIN_FORMATTERS_HPP
