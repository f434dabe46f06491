#ifndef VEIL_JSON_CONFIG_HPP
#define VEIL_JSON_CONFIG_HPP

#include "../core/engine_config.hpp"
#include "../core/data_category.hpp"
#include "../core/common.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace veil {

    namespace detail {
        inline const nlohmann::json &requireType(const nlohmann::json &node, const std::string &key,
                                                 nlohmann::json::value_t type, const char *expected) {
            const nlohmann::json &value = node.at(key);
            bool ok = value.type() == type
                      || (type == nlohmann::json::value_t::number_float && value.is_number())
                      || (type == nlohmann::json::value_t::number_unsigned && value.is_number_integer()
                          && value.get<long long>() >= 0);
            if (!ok) {
                throw std::invalid_argument("config: \"" + key + "\" must be " + expected);
            }
            return value;
        }

        inline DataCategory jsonCategory(const std::string &key) {
            DataCategory category = DataCategory::GENERIC;
            if (!tryCategoryFromKey(key, category)) {
                throw std::invalid_argument("config: unknown data type \"" + key + "\"");
            }
            return category;
        }

        inline SensitiveFieldConfig jsonField(const nlohmann::json &node) {
            using vt = nlohmann::json::value_t;
            if (!node.is_object()) {
                throw std::invalid_argument("config: each entry of \"sensitiveFields\" must be an object");
            }
            if (!node.contains("name")) {
                throw std::invalid_argument("config: sensitive field without \"name\"");
            }

            SensitiveFieldConfig field(requireType(node, "name", vt::string, "a string").get<std::string>());
            if (node.contains("dataType")) {
                field.category = jsonCategory(requireType(node, "dataType", vt::string, "a string").get<std::string>());
            }
            if (node.contains("customPattern")) {
                field.customPattern = requireType(node, "customPattern", vt::string, "a string").get<std::string>();
            }
            if (node.contains("formatterName")) {
                field.formatterOverrideName = requireType(node, "formatterName", vt::string, "a string").get<std::string>();
            }
            if (node.contains("caseSensitive")) {
                field.caseSensitive = requireType(node, "caseSensitive", vt::boolean, "a boolean").get<bool>();
            }
            if (node.contains("visibleCharsStart")) {
                field.visibleStart = requireType(node, "visibleCharsStart", vt::number_unsigned,
                                                 "a non-negative integer").get<unsigned>();
            }
            if (node.contains("visibleCharsEnd")) {
                field.visibleEnd = requireType(node, "visibleCharsEnd", vt::number_unsigned,
                                               "a non-negative integer").get<unsigned>();
            }
            return field;
        }
    } // namespace detail

    /// Build an EngineConfig from a JSON document.
    ///
    /// @code
    ///   {
    ///     "enabled": true,
    ///     "maskChar": "*",
    ///     "defaultMask": "***",
    ///     "autoDetect": true,
    ///     "autoDetectTypes": ["cpf", "email"],
    ///     "alreadyMaskedRatio": 0.5,
    ///     "sensitiveFields": [
    ///       {"name": "cpf", "dataType": "cpf"},
    ///       {"name": "telefone", "visibleCharsStart": 2, "visibleCharsEnd": 2}
    ///     ]
    ///   }
    /// @endcode
    ///
    /// Missing keys keep their defaults; unknown keys are ignored.
    /// @throws std::invalid_argument if a key has the wrong type or value.
    inline EngineConfig configFromJson(const nlohmann::json &doc) {
        using vt = nlohmann::json::value_t;
        if (!doc.is_object()) {
            throw std::invalid_argument("config: top-level value must be an object");
        }

        EngineConfig config;
        if (doc.contains("enabled")) {
            config.enabled = detail::requireType(doc, "enabled", vt::boolean, "a boolean").get<bool>();
        }
        if (doc.contains("maskChar")) {
            std::string mask = detail::requireType(doc, "maskChar", vt::string, "a string").get<std::string>();
            if (mask.size() != 1) {
                throw std::invalid_argument("config: \"maskChar\" must be exactly one character");
            }
            config.maskChar = mask[0];
        }
        if (doc.contains("defaultMask")) {
            config.defaultMask = detail::requireType(doc, "defaultMask", vt::string, "a string").get<std::string>();
        }
        if (doc.contains("autoDetect")) {
            config.autoDetect = detail::requireType(doc, "autoDetect", vt::boolean, "a boolean").get<bool>();
        }
        if (doc.contains("autoDetectTypes")) {
            const auto &types = detail::requireType(doc, "autoDetectTypes", vt::array, "an array");
            config.autoDetectCategories.clear();
            for (const auto &item : types) {
                if (!item.is_string()) {
                    throw std::invalid_argument("config: \"autoDetectTypes\" entries must be strings");
                }
                config.addAutoDetectCategory(detail::jsonCategory(item.get<std::string>()));
            }
        }
        if (doc.contains("alreadyMaskedRatio")) {
            double ratio = detail::requireType(doc, "alreadyMaskedRatio", vt::number_float, "a number").get<double>();
            if (ratio < 0.0 || ratio > 1.0) {
                throw std::invalid_argument("config: \"alreadyMaskedRatio\" must be between 0 and 1");
            }
            config.alreadyMaskedRatio = ratio;
        }
        if (doc.contains("sensitiveFields")) {
            const auto &fields = detail::requireType(doc, "sensitiveFields", vt::array, "an array");
            for (const auto &item : fields) {
                config.addField(detail::jsonField(item));
            }
        }
        return config;
    }

    /// Parse text as JSON and hand it to configFromJson().
    /// @throws std::invalid_argument on syntax errors.
    inline EngineConfig parseConfig(const std::string &text) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error &e) {
            throw std::invalid_argument(std::string("config: ") + e.what());
        }
        return configFromJson(doc);
    }

    /// @throws std::runtime_error if the file cannot be read.
    inline EngineConfig loadConfigFile(const std::string &path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("config: cannot open " + path);
        }
        std::ostringstream content;
        content << in.rdbuf();
        return parseConfig(content.str());
    }
} // namespace veil

#endif // VEIL_JSON_CONFIG_HPP
