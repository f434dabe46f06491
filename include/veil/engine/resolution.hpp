#ifndef VEIL_RESOLUTION_HPP
#define VEIL_RESOLUTION_HPP

#include "../core/sensitive_field.hpp"
#include "../core/mask_utils.hpp"
#include "../registry/formatter_registry.hpp"
#include "../registry/obfuscator_registry.hpp"
#include "../obfuscator/default_obfuscator.hpp"
#include <memory>
#include <string>
#include <exception>

namespace veil {

    /// Turns a matched raw value into its replacement using a frozen copy
    /// of the registries.
    ///
    /// Field values:    override formatter -> category formatter
    ///                  -> partial mask -> default obfuscator
    /// Category values: category formatter -> category obfuscator
    ///                  -> default obfuscator
    ///
    /// When a formatter or obfuscator is found but throws a std::exception
    /// or produces an empty string, the value goes to the default
    /// obfuscator.  The result is never empty.  Exceptions not derived from
    /// std::exception are not caught.
    class Resolver {
    public:
        Resolver(FormatterRegistry::Table formatters,
                 ObfuscatorRegistry::Table obfuscators,
                 char maskChar,
                 const std::string &defaultMask)
            : m_formatters(std::move(formatters))
            , m_obfuscators(std::move(obfuscators))
            , m_maskChar(maskChar) {
            m_fallback = m_obfuscators.defaultObfuscator;
            if (!m_fallback) {
                m_fallback = std::make_shared<DefaultObfuscator>(maskChar, defaultMask);
            }
        }

        std::string resolveField(const std::string &value, const SensitiveFieldConfig &field) const {
            if (field.hasFormatterOverride()) {
                auto formatter = m_formatters.findByName(field.formatterOverrideName);
                if (formatter) return formatOrFallback(*formatter, value);
            }
            if (field.category != DataCategory::GENERIC) {
                auto formatter = m_formatters.findByCategory(field.category);
                if (formatter) return formatOrFallback(*formatter, value);
            }
            if (field.hasPartialMask()) {
                return partialMask(value, field.visibleStart, field.visibleEnd, m_maskChar, kMinMaskLength);
            }
            return fallback(value);
        }

        std::string resolveByCategory(const std::string &value, DataCategory category) const {
            auto formatter = m_formatters.findByCategory(category);
            if (formatter) return formatOrFallback(*formatter, value);

            auto obfuscator = m_obfuscators.findByCategory(category);
            if (obfuscator) {
                std::string out;
                if (tryObfuscate(*obfuscator, value, out)) return out;
            }
            return fallback(value);
        }

        char maskChar() const { return m_maskChar; }

        const FormatterRegistry::Table &formatters() const { return m_formatters; }

    private:
        FormatterRegistry::Table m_formatters;
        ObfuscatorRegistry::Table m_obfuscators;
        std::shared_ptr<IObfuscator> m_fallback;
        char m_maskChar;

        std::string formatOrFallback(const IFormatter &formatter, const std::string &value) const {
            std::string out;
            try {
                out = formatter.format(value);
            } catch (const std::exception &) {
                out.clear();
            }
            return out.empty() ? fallback(value) : out;
        }

        static bool tryObfuscate(const IObfuscator &obfuscator, const std::string &value, std::string &out) {
            try {
                out = obfuscator.obfuscate(value);
            } catch (const std::exception &) {
                return false;
            }
            return !out.empty();
        }

        std::string fallback(const std::string &value) const {
            std::string out;
            if (tryObfuscate(*m_fallback, value, out)) {
                return out;
            }
            return detail::repeat(m_maskChar, 3);
        }
    };
} // namespace veil

#endif // VEIL_RESOLUTION_HPP
