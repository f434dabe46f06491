#ifndef VEIL_ENV_CONFIG_HPP
#define VEIL_ENV_CONFIG_HPP

#include "../core/engine_config.hpp"
#include "../core/data_category.hpp"
#include "../core/common.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace veil {

    namespace detail {
        inline bool getEnv(const std::string &name, std::string &out) {
            const char *value = std::getenv(name.c_str());
            if (value == nullptr) return false;
            out = value;
            return true;
        }

        inline bool parseBool(const std::string &variable, const std::string &raw) {
            std::string v = toLower(trim(raw));
            if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
            if (v == "false" || v == "0" || v == "no" || v == "off") return false;
            throw std::invalid_argument(variable + ": expected a boolean, got \"" + raw + "\"");
        }

        inline DataCategory parseCategory(const std::string &context, const std::string &key) {
            DataCategory category = DataCategory::GENERIC;
            if (!tryCategoryFromKey(key, category)) {
                throw std::invalid_argument(context + ": unknown data type \"" + key + "\"");
            }
            return category;
        }
    } // namespace detail

    /// Overlay settings from environment variables onto config.
    ///
    /// Recognised variables (shown with the default prefix):
    ///   VEIL_ENABLED            true/false
    ///   VEIL_MASK_CHAR          single character
    ///   VEIL_DEFAULT_MASK       string
    ///   VEIL_AUTO_DETECT        true/false
    ///   VEIL_AUTO_DETECT_TYPES  comma list of category keys, replaces the list
    ///   VEIL_SENSITIVE_FIELDS   comma list of name[:category], appended
    ///
    /// Unset variables leave the corresponding setting alone.
    /// @throws std::invalid_argument on a malformed value.
    inline void applyEnvironment(EngineConfig &config, const std::string &prefix = "VEIL_") {
        std::string value;

        if (detail::getEnv(prefix + "ENABLED", value)) {
            config.enabled = detail::parseBool(prefix + "ENABLED", value);
        }
        if (detail::getEnv(prefix + "MASK_CHAR", value)) {
            if (value.size() != 1) {
                throw std::invalid_argument(prefix + "MASK_CHAR: expected a single character, got \""
                                            + value + "\"");
            }
            config.maskChar = value[0];
        }
        if (detail::getEnv(prefix + "DEFAULT_MASK", value)) {
            config.defaultMask = value;
        }
        if (detail::getEnv(prefix + "AUTO_DETECT", value)) {
            config.autoDetect = detail::parseBool(prefix + "AUTO_DETECT", value);
        }
        if (detail::getEnv(prefix + "AUTO_DETECT_TYPES", value)) {
            config.autoDetectCategories.clear();
            for (const auto &item : detail::split(value, ',')) {
                if (detail::isBlank(item)) continue;
                config.addAutoDetectCategory(detail::parseCategory(prefix + "AUTO_DETECT_TYPES", item));
            }
        }
        if (detail::getEnv(prefix + "SENSITIVE_FIELDS", value)) {
            for (const auto &item : detail::split(value, ',')) {
                if (detail::isBlank(item)) continue;
                std::string entry = detail::trim(item);
                size_t colon = entry.find(':');

                SensitiveFieldConfig field(detail::trim(entry.substr(0, colon)));
                if (colon != std::string::npos) {
                    field.category = detail::parseCategory(prefix + "SENSITIVE_FIELDS",
                                                           entry.substr(colon + 1));
                }
                if (detail::isBlank(field.name)) {
                    throw std::invalid_argument(prefix + "SENSITIVE_FIELDS: empty field name in \""
                                                + entry + "\"");
                }
                config.addField(std::move(field));
            }
        }
    }
} // namespace veil

#endif // VEIL_ENV_CONFIG_HPP
