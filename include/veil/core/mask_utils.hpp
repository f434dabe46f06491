#ifndef VEIL_MASK_UTILS_HPP
#define VEIL_MASK_UTILS_HPP

#include "common.hpp"
#include "engine_config.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace veil {

    /// Keep visibleStart leading and visibleEnd trailing characters and mask
    /// the middle.  Lengths are counted in UTF-8 code points.
    ///
    /// The mask run is never shorter than minMaskLength, so a short value
    /// can come out longer than it went in ("12345", 2, 2 -> "12***45").
    /// Values no longer than visibleStart + visibleEnd are masked entirely.
    inline std::string partialMask(const std::string &value,
                                   unsigned visibleStart,
                                   unsigned visibleEnd,
                                   char maskChar,
                                   unsigned minMaskLength = kMinMaskLength) {
        std::vector<std::string> cps = detail::utf8Split(value);
        size_t n = cps.size();
        size_t total = static_cast<size_t>(visibleStart) + visibleEnd;

        if (n <= total) {
            return detail::repeat(maskChar, std::max<size_t>(n, minMaskLength));
        }

        std::string result;
        result.reserve(value.size() + minMaskLength);
        for (size_t i = 0; i < visibleStart; ++i) {
            result += cps[i];
        }
        result += detail::repeat(maskChar, std::max<size_t>(n - total, minMaskLength));
        for (size_t i = n - visibleEnd; i < n; ++i) {
            result += cps[i];
        }
        return result;
    }

    /// Heuristic used by the category pass: true when the value is empty or
    /// more than `ratio` of its characters are the mask character.
    ///
    /// Approximate by nature; free text that legitimately contains many mask
    /// characters is misclassified as masked.
    inline bool isAlreadyMasked(const std::string &value,
                                char maskChar,
                                double ratio = kDefaultAlreadyMaskedRatio) {
        if (value.empty()) return true;
        size_t length = detail::utf8CharCount(value);
        size_t maskCount = static_cast<size_t>(std::count(value.begin(), value.end(), maskChar));
        return static_cast<double>(maskCount) > static_cast<double>(length) * ratio;
    }
} // namespace veil

#endif // VEIL_MASK_UTILS_HPP
