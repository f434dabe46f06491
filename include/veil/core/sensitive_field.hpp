#ifndef VEIL_SENSITIVE_FIELD_HPP
#define VEIL_SENSITIVE_FIELD_HPP

#include "data_category.hpp"
#include "common.hpp"
#include <string>

namespace veil {

    /// Declaration of one named key whose value must be masked wherever it
    /// appears.  Empty customPattern / formatterOverrideName mean "not set".
    struct SensitiveFieldConfig {
        std::string name;
        DataCategory category;
        std::string customPattern;
        std::string formatterOverrideName;
        bool caseSensitive;
        unsigned visibleStart;
        unsigned visibleEnd;

        SensitiveFieldConfig()
            : category(DataCategory::GENERIC)
            , caseSensitive(false)
            , visibleStart(0)
            , visibleEnd(0) {}

        explicit SensitiveFieldConfig(std::string fieldName,
                                      DataCategory fieldCategory = DataCategory::GENERIC)
            : name(std::move(fieldName))
            , category(fieldCategory)
            , caseSensitive(false)
            , visibleStart(0)
            , visibleEnd(0) {}

        bool hasCustomPattern() const { return !detail::isBlank(customPattern); }

        bool hasFormatterOverride() const { return !detail::isBlank(formatterOverrideName); }

        bool hasPartialMask() const { return visibleStart > 0 || visibleEnd > 0; }

        /// Key under which two declarations are considered the same field.
        std::string identity() const {
            return caseSensitive ? name : detail::toLower(name);
        }

        // Chainable setters, e.g.
        //   SensitiveFieldConfig("telefone").visible(2, 3)
        SensitiveFieldConfig &withCategory(DataCategory c) {
            category = c;
            return *this;
        }

        SensitiveFieldConfig &withCustomPattern(const std::string &pattern) {
            customPattern = pattern;
            return *this;
        }

        SensitiveFieldConfig &withFormatter(const std::string &formatterName) {
            formatterOverrideName = formatterName;
            return *this;
        }

        SensitiveFieldConfig &withCaseSensitive(bool enable) {
            caseSensitive = enable;
            return *this;
        }

        SensitiveFieldConfig &visible(unsigned start, unsigned end) {
            visibleStart = start;
            visibleEnd = end;
            return *this;
        }
    };
} // namespace veil

#endif // VEIL_SENSITIVE_FIELD_HPP
