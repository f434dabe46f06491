#ifndef VEIL_TYPE_PATTERN_TABLE_HPP
#define VEIL_TYPE_PATTERN_TABLE_HPP

#include "pattern_compiler.hpp"
#include "../core/data_category.hpp"
#include <vector>

namespace veil {

    struct TypePattern {
        DataCategory category;
        CompiledPattern pattern;
    };

    /// One detector per category, in the order given.  The whole match is
    /// the value.  Duplicate categories are compiled once.
    inline std::vector<TypePattern> buildTypePatternTable(const std::vector<DataCategory> &categories) {
        std::vector<TypePattern> table;
        table.reserve(categories.size());
        for (DataCategory category : categories) {
            bool seen = false;
            for (const auto &entry : table) {
                if (entry.category == category) {
                    seen = true;
                    break;
                }
            }
            if (seen) continue;

            CompiledPattern pattern = compileCustom(getDefaultPattern(category), true, PatternShape::CATEGORY);
            pattern.valueGroup = 0;
            pattern.valueStop = getDefaultValueStop(category);
            table.push_back(TypePattern{category, std::move(pattern)});
        }
        return table;
    }
} // namespace veil

#endif // VEIL_TYPE_PATTERN_TABLE_HPP
