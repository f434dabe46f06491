#ifndef VEIL_MASKING_ENGINE_HPP
#define VEIL_MASKING_ENGINE_HPP

#include "pattern_compiler.hpp"
#include "type_pattern_table.hpp"
#include "resolution.hpp"
#include "../core/engine_config.hpp"
#include "../core/configuration_error.hpp"
#include "../core/mask_utils.hpp"
#include "../registry/formatter_registry.hpp"
#include "../registry/obfuscator_registry.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace veil {

    /// Longest stretch of text one regex search looks at.
    constexpr size_t kScanWindow = 16384;

    /// Finds sensitive values in free-form text and replaces them in place.
    ///
    /// Usage:
    /// @code
    ///   veil::MaskingEngine engine;
    ///   veil::EngineConfig config;
    ///   config.addField(veil::SensitiveFieldConfig("cpf", veil::DataCategory::CPF));
    ///   engine.configure(config);
    ///   engine.sanitize(R"({"cpf": "12345678909"})");   // {"cpf": "***"}
    /// @endcode
    ///
    /// Two passes run over each text.  The field pass applies every
    /// configured field's patterns in declaration order and replaces only
    /// the value span.  The category pass (when auto-detection is on) then
    /// replaces whole matches of each category's bare-value pattern,
    /// skipping anything that already looks masked.
    ///
    /// Thread safety: configure() builds a new immutable snapshot and
    /// publishes it with std::atomic_store; sanitize() takes it with
    /// std::atomic_load and holds no lock while matching.  A sanitize()
    /// call sees either the previous configuration or the new one, never
    /// a mix.  The registries may be written at any time; changes become
    /// visible to sanitize() at the next configure().
    class MaskingEngine {
    public:
        MaskingEngine()
            : m_formatters(std::make_shared<FormatterRegistry>())
            , m_obfuscators(std::make_shared<ObfuscatorRegistry>()) {}

        MaskingEngine(std::shared_ptr<FormatterRegistry> formatters,
                      std::shared_ptr<ObfuscatorRegistry> obfuscators)
            : m_formatters(formatters ? std::move(formatters) : std::make_shared<FormatterRegistry>())
            , m_obfuscators(obfuscators ? std::move(obfuscators) : std::make_shared<ObfuscatorRegistry>()) {}

        MaskingEngine(const MaskingEngine &) = delete;
        MaskingEngine &operator=(const MaskingEngine &) = delete;

        /// Compile config and make it the active configuration.
        ///
        /// A field whose name is empty or whose custom pattern does not
        /// compile is left out.  The remaining fields are published first,
        /// then ConfigurationError is thrown listing the rejected ones.
        /// Declaring the same field twice keeps the later declaration at
        /// the position of the first.
        void configure(const EngineConfig &config) {
            std::vector<ConfigurationError::FieldError> errors;

            std::vector<SensitiveFieldConfig> fields;
            for (const auto &field : config.fields) {
                bool replaced = false;
                for (auto &existing : fields) {
                    if (existing.identity() == field.identity()) {
                        existing = field;
                        replaced = true;
                        break;
                    }
                }
                if (!replaced) fields.push_back(field);
            }

            std::vector<FieldPatterns> compiled;
            compiled.reserve(fields.size());
            for (const auto &field : fields) {
                try {
                    FieldPatterns entry{field, compileField(field.name, field.caseSensitive)};
                    if (field.hasCustomPattern()) {
                        entry.patterns.push_back(compileCustom(field.customPattern, field.caseSensitive));
                    }
                    compiled.push_back(std::move(entry));
                } catch (const std::invalid_argument &e) {
                    std::fprintf(stderr, "[veil][MaskingEngine] WARNING: sensitive field '%s' ignored: %s\n",
                                 field.name.c_str(), e.what());
                    errors.push_back(ConfigurationError::FieldError{field.name, e.what()});
                }
            }

            std::vector<TypePattern> types;
            if (config.autoDetect) {
                types = buildTypePatternTable(config.autoDetectCategories);
            }

            std::shared_ptr<const Snapshot> snapshot = std::make_shared<Snapshot>(
                config, std::move(compiled), std::move(types),
                Resolver(m_formatters->snapshot(), m_obfuscators->snapshot(),
                         config.maskChar, config.defaultMask));
            std::atomic_store(&m_snapshot, snapshot);

            if (!errors.empty()) {
                throw ConfigurationError(std::move(errors));
            }
        }

        /// Returns text with every recognised sensitive value masked.
        /// Unconfigured or disabled engines and empty input return the
        /// input unchanged.
        ///
        /// Does not throw as long as registered formatters and obfuscators
        /// only throw types derived from std::exception.
        std::string sanitize(const std::string &text) const {
            std::shared_ptr<const Snapshot> snapshot = std::atomic_load(&m_snapshot);
            if (!snapshot || !snapshot->config.enabled || text.empty()) {
                return text;
            }

            try {
                std::string buffer = text;
                for (const auto &entry : snapshot->fields) {
                    for (const auto &pattern : entry.patterns) {
                        buffer = substitute(buffer, pattern,
                            [&](const std::string &value, std::string &out) {
                                if (value.empty()) return false;
                                out = snapshot->resolver.resolveField(value, entry.field);
                                return true;
                            });
                    }
                }

                const char maskChar = snapshot->config.maskChar;
                const double ratio = snapshot->config.alreadyMaskedRatio;
                for (const auto &type : snapshot->types) {
                    buffer = substitute(buffer, type.pattern,
                        [&](const std::string &value, std::string &out) {
                            if (isAlreadyMasked(value, maskChar, ratio)) return false;
                            out = snapshot->resolver.resolveByCategory(value, type.category);
                            return true;
                        });
                }
                return buffer;
            } catch (const std::regex_error &e) {
                // Raised by some regex implementations on pathological input.
                std::fprintf(stderr, "[veil][MaskingEngine] WARNING: matching failed, message suppressed: %s\n",
                             e.what());
                return snapshot->config.defaultMask.empty()
                       ? detail::repeat(snapshot->config.maskChar, 3)
                       : snapshot->config.defaultMask;
            }
        }

        /// nullptr is treated as absent input and yields an empty string.
        std::string sanitize(const char *text) const {
            if (text == nullptr) return std::string();
            return sanitize(std::string(text));
        }

        /// Drop the active configuration and empty both registries.
        void reset() {
            std::atomic_store(&m_snapshot, std::shared_ptr<const Snapshot>());
            m_formatters->clear();
            m_obfuscators->clear();
        }

        bool isConfigured() const {
            return std::atomic_load(&m_snapshot) != nullptr;
        }

        bool isEnabled() const {
            auto snapshot = std::atomic_load(&m_snapshot);
            return snapshot && snapshot->config.enabled;
        }

        /// Copy of the active configuration (fields as declared), or a
        /// default-constructed one when unconfigured.
        EngineConfig config() const {
            auto snapshot = std::atomic_load(&m_snapshot);
            return snapshot ? snapshot->config : EngineConfig();
        }

        /// Number of fields that compiled successfully.
        size_t activeFieldCount() const {
            auto snapshot = std::atomic_load(&m_snapshot);
            return snapshot ? snapshot->fields.size() : 0;
        }

        FormatterRegistry &formatters() { return *m_formatters; }
        ObfuscatorRegistry &obfuscators() { return *m_obfuscators; }

        std::shared_ptr<FormatterRegistry> formatterRegistry() const { return m_formatters; }
        std::shared_ptr<ObfuscatorRegistry> obfuscatorRegistry() const { return m_obfuscators; }

    private:
        struct FieldPatterns {
            SensitiveFieldConfig field;
            std::vector<CompiledPattern> patterns;
        };

        struct Snapshot {
            EngineConfig config;
            std::vector<FieldPatterns> fields;
            std::vector<TypePattern> types;
            Resolver resolver;

            Snapshot(EngineConfig cfg, std::vector<FieldPatterns> compiledFields,
                     std::vector<TypePattern> typePatterns, Resolver res)
                : config(std::move(cfg))
                , fields(std::move(compiledFields))
                , types(std::move(typePatterns))
                , resolver(std::move(res)) {}
        };

        std::shared_ptr<FormatterRegistry> m_formatters;
        std::shared_ptr<ObfuscatorRegistry> m_obfuscators;
        std::shared_ptr<const Snapshot> m_snapshot;

        /// Replace the value span of every non-overlapping match.  replace
        /// returns false to leave a match as it is.
        ///
        /// Each search covers at most kScanWindow characters.  A window
        /// without a match moves on by half its size; a match that runs
        /// into the window's end is searched again from its own start so
        /// it is never cut short.  A value capped at kMaxValueLength is
        /// extended to the pattern's next stop character.
        template<typename ReplaceFn>
        static std::string substitute(const std::string &input, const CompiledPattern &pattern,
                                      ReplaceFn replace) {
            namespace rc = std::regex_constants;

            std::string output;
            size_t last = 0;
            bool changed = false;

            const auto begin = input.begin();
            const size_t length = input.size();
            size_t pos = 0;
            while (pos < length) {
                const size_t windowEnd = std::min(length, pos + kScanWindow);
                rc::match_flag_type flags = rc::match_default;
                if (pos > 0) flags |= rc::match_prev_avail;
                if (windowEnd < length) flags |= rc::match_not_eol | rc::match_not_eow;

                std::smatch match;
                if (!std::regex_search(begin + pos, begin + windowEnd, match, pattern.regex, flags)) {
                    if (windowEnd == length) break;
                    pos = windowEnd - kScanWindow / 2;
                    continue;
                }

                const size_t matchStart = static_cast<size_t>(match[0].first - begin);
                const size_t matchEnd = static_cast<size_t>(match[0].second - begin);
                if (matchEnd == windowEnd && windowEnd < length && matchStart > pos) {
                    pos = matchStart;
                    continue;
                }
                if (matchEnd == matchStart || !match[pattern.valueGroup].matched) {
                    pos = std::max(matchEnd, matchStart + 1);
                    continue;
                }

                const size_t valueStart = static_cast<size_t>(match[pattern.valueGroup].first - begin);
                size_t valueEnd = static_cast<size_t>(match[pattern.valueGroup].second - begin);
                if (!pattern.valueStop.empty() && valueEnd - valueStart >= kMaxValueLength) {
                    valueEnd = std::min(length, input.find_first_of(pattern.valueStop, valueEnd));
                }
                pos = std::max(matchEnd, valueEnd);

                std::string replacement;
                if (!replace(input.substr(valueStart, valueEnd - valueStart), replacement)) continue;

                output.append(input, last, valueStart - last);
                output += replacement;
                last = valueEnd;
                changed = true;
            }

            if (!changed) return input;
            output.append(input, last, std::string::npos);
            return output;
        }
    };
} // namespace veil

#endif // VEIL_MASKING_ENGINE_HPP
