#ifndef VEIL_CONFIGURATION_ERROR_HPP
#define VEIL_CONFIGURATION_ERROR_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace veil {

    /// Raised by MaskingEngine::configure() when one or more sensitive
    /// fields could not be compiled.  The engine is already running with
    /// the remaining fields when this is thrown.
    class ConfigurationError : public std::runtime_error {
    public:
        struct FieldError {
            std::string field;
            std::string reason;
        };

        explicit ConfigurationError(std::vector<FieldError> errors)
            : std::runtime_error(buildMessage(errors))
            , m_errors(std::move(errors)) {}

        const std::vector<FieldError> &errors() const { return m_errors; }

        bool hasField(const std::string &field) const {
            for (const auto &e : m_errors) {
                if (e.field == field) return true;
            }
            return false;
        }

    private:
        std::vector<FieldError> m_errors;

        static std::string buildMessage(const std::vector<FieldError> &errors) {
            std::string msg = "Invalid sensitive field configuration: ";
            for (size_t i = 0; i < errors.size(); ++i) {
                if (i > 0) msg += "; ";
                msg += "'" + errors[i].field + "' (" + errors[i].reason + ")";
            }
            return msg;
        }
    };
} // namespace veil

#endif // VEIL_CONFIGURATION_ERROR_HPP
