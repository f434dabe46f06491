#ifndef VEIL_PATTERN_COMPILER_HPP
#define VEIL_PATTERN_COMPILER_HPP

#include "../core/common.hpp"
#include <regex>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

namespace veil {

    /// Textual shape a compiled pattern recognises.
    enum class PatternShape {
        JSON_QUOTED,        // "key": "value"
        JSON_UNQUOTED,      // "key": 123
        ASSIGN_DOUBLE,      // key="value"
        ASSIGN_SINGLE,      // key='value'
        ASSIGN_BARE,        // key=value
        COLON_QUOTED,       // key: "value"
        COLON_BARE,         // key: value
        QUERY_PARAM,        // ?key=value / &key=value
        PATH_SEGMENT,       // /key/value
        CUSTOM,
        CATEGORY
    };

    inline const char *getShapeName(PatternShape shape) {
        switch (shape) {
            case PatternShape::JSON_QUOTED: return "json-quoted";
            case PatternShape::JSON_UNQUOTED: return "json-unquoted";
            case PatternShape::ASSIGN_DOUBLE: return "assign-double";
            case PatternShape::ASSIGN_SINGLE: return "assign-single";
            case PatternShape::ASSIGN_BARE: return "assign-bare";
            case PatternShape::COLON_QUOTED: return "colon-quoted";
            case PatternShape::COLON_BARE: return "colon-bare";
            case PatternShape::QUERY_PARAM: return "query-param";
            case PatternShape::PATH_SEGMENT: return "path-segment";
            case PatternShape::CUSTOM: return "custom";
            case PatternShape::CATEGORY: return "category";
            default: return "unknown";
        }
    }

    /// Longest value a key-anchored pattern captures in one piece.
    constexpr size_t kMaxValueLength = 256;

    /// A regex together with the index of the group holding the value.
    ///
    /// valueGroup is always the last capture group of the pattern, or 0
    /// (the whole match) when the pattern has no groups.  Only that span
    /// is replaced when the pattern fires.
    ///
    /// valueStop lists the characters that end the value.  When a capture
    /// reaches kMaxValueLength the engine extends it up to the next of
    /// these characters (or the end of the text).  Empty for custom and
    /// category patterns.
    struct CompiledPattern {
        PatternShape shape;
        std::string source;
        std::regex regex;
        size_t valueGroup;
        std::string valueStop;
    };

    namespace detail {
        inline std::regex::flag_type regexFlags(bool caseSensitive) {
            return caseSensitive ? std::regex::ECMAScript
                                 : std::regex::ECMAScript | std::regex::icase;
        }

        inline CompiledPattern makePattern(PatternShape shape, const std::string &source, bool caseSensitive) {
            CompiledPattern p{shape, source, std::regex(source, regexFlags(caseSensitive)), 0, std::string()};
            p.valueGroup = p.regex.mark_count();
            return p;
        }

        inline CompiledPattern makeFieldPattern(PatternShape shape, const std::string &source,
                                                bool caseSensitive, std::string valueStop) {
            CompiledPattern p = makePattern(shape, source, caseSensitive);
            p.valueStop = std::move(valueStop);
            return p;
        }

        /// "{1,N}" / "{0,N}" repetition suffixes for value classes.
        inline std::string upTo(size_t n, size_t min = 1) {
            return "{" + std::to_string(min) + "," + std::to_string(n) + "}";
        }
    } // namespace detail

    /// Compile a caller-supplied pattern.  Throws std::invalid_argument
    /// if it is blank or not a valid ECMAScript regex.
    inline CompiledPattern compileCustom(const std::string &pattern, bool caseSensitive,
                                         PatternShape shape = PatternShape::CUSTOM) {
        if (detail::isBlank(pattern)) {
            throw std::invalid_argument("pattern is empty");
        }
        try {
            return detail::makePattern(shape, pattern, caseSensitive);
        } catch (const std::regex_error &e) {
            throw std::invalid_argument(std::string("invalid regex: ") + e.what());
        }
    }

    /// Build the nine key-anchored patterns for one field name, in the
    /// order the engine applies them.
    ///
    /// Whitespace around separators is bounded to 16 characters and every
    /// value class is a single negated set repeated at most
    /// kMaxValueLength times, so each match attempt is bounded whatever
    /// the input.  Quoted shapes do not require the closing quote.
    /// Unquoted value classes refuse a leading quote; a value an earlier
    /// quoted shape already rewrote is not matched again.
    inline std::vector<CompiledPattern> compileField(const std::string &name, bool caseSensitive) {
        if (detail::isBlank(name)) {
            throw std::invalid_argument("field name is empty");
        }
        const std::string key = detail::escapeRegex(name);
        const std::string ws = R"(\s{0,16})";
        const std::string value = detail::upTo(kMaxValueLength);
        const std::string rest = detail::upTo(kMaxValueLength - 1, 0);
        const std::string space = " \t\n\v\f\r";

        std::vector<CompiledPattern> patterns;
        patterns.reserve(9);
        patterns.push_back(detail::makeFieldPattern(PatternShape::JSON_QUOTED,
            "\"" + key + "\"" + ws + ":" + ws + R"re("([^"])re" + value + ")", caseSensitive, "\""));
        patterns.push_back(detail::makeFieldPattern(PatternShape::JSON_UNQUOTED,
            "\"" + key + "\"" + ws + ":" + ws + R"(([^"\s,}][^,}\s])" + rest + ")", caseSensitive,
            ",}" + space));
        patterns.push_back(detail::makeFieldPattern(PatternShape::ASSIGN_DOUBLE,
            key + ws + "=" + ws + R"re("([^"])re" + value + ")", caseSensitive, "\""));
        patterns.push_back(detail::makeFieldPattern(PatternShape::ASSIGN_SINGLE,
            key + ws + "=" + ws + R"('([^'])" + value + ")", caseSensitive, "'"));
        patterns.push_back(detail::makeFieldPattern(PatternShape::ASSIGN_BARE,
            key + ws + "=" + ws + R"(([^"'\s,\]}&][^\s,\]}&])" + rest + ")", caseSensitive,
            ",]}&" + space));
        patterns.push_back(detail::makeFieldPattern(PatternShape::COLON_QUOTED,
            key + ws + ":" + ws + R"re("([^"])re" + value + ")", caseSensitive, "\""));
        patterns.push_back(detail::makeFieldPattern(PatternShape::COLON_BARE,
            key + ws + ":" + ws + R"(([^"\s,&][^\s,&])" + rest + ")", caseSensitive,
            ",&" + space));
        patterns.push_back(detail::makeFieldPattern(PatternShape::QUERY_PARAM,
            "([?&]" + key + R"(=)([^&\s#])" + value + ")", caseSensitive,
            "&#" + space));
        patterns.push_back(detail::makeFieldPattern(PatternShape::PATH_SEGMENT,
            "(/" + key + R"(/)([^/?#\s])" + value + ")", caseSensitive,
            "/?#" + space));
        return patterns;
    }
} // namespace veil

#endif // VEIL_PATTERN_COMPILER_HPP
