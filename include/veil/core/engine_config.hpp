#ifndef VEIL_ENGINE_CONFIG_HPP
#define VEIL_ENGINE_CONFIG_HPP

#include "data_category.hpp"
#include "sensitive_field.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace veil {

    /// Share of mask characters above which a value counts as already
    /// masked and is skipped by the category pass.
    constexpr double kDefaultAlreadyMaskedRatio = 0.5;

    /// Shortest mask run the partial-mask tier will emit.
    constexpr unsigned kMinMaskLength = 3;

    /// Plain configuration record consumed by MaskingEngine::configure().
    ///
    /// Category patterns have no digit boundaries, so the default list
    /// runs the longest digit shapes first.
    struct EngineConfig {
        bool enabled;
        char maskChar;
        std::string defaultMask;
        bool autoDetect;
        std::vector<SensitiveFieldConfig> fields;
        std::vector<DataCategory> autoDetectCategories;
        double alreadyMaskedRatio;

        EngineConfig()
            : enabled(true)
            , maskChar('*')
            , defaultMask("***")
            , autoDetect(true)
            , autoDetectCategories({DataCategory::CREDIT_CARD, DataCategory::CNPJ,
                                    DataCategory::CPF, DataCategory::EMAIL,
                                    DataCategory::IP_ADDRESS})
            , alreadyMaskedRatio(kDefaultAlreadyMaskedRatio) {}

        EngineConfig &addField(SensitiveFieldConfig field) {
            fields.push_back(std::move(field));
            return *this;
        }

        /// Appends the category unless it is already listed.
        EngineConfig &addAutoDetectCategory(DataCategory category) {
            if (std::find(autoDetectCategories.begin(), autoDetectCategories.end(), category)
                == autoDetectCategories.end()) {
                autoDetectCategories.push_back(category);
            }
            return *this;
        }
    };
} // namespace veil

#endif // VEIL_ENGINE_CONFIG_HPP
