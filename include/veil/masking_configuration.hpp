#ifndef VEIL_MASKING_CONFIGURATION_HPP
#define VEIL_MASKING_CONFIGURATION_HPP

#include "engine/masking_engine.hpp"
#include "formatter/builtin_formatters.hpp"
#include "obfuscator/default_obfuscator.hpp"
#include "config/env_config.hpp"
#include "core/engine_config.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace veil {

    /// Fluent builder for a fully configured MaskingEngine.
    ///
    /// Usage:
    /// @code
    ///   auto engine = veil::MaskingConfiguration()
    ///       .withBuiltinFormatters()
    ///       .sensitiveField("cpf", veil::DataCategory::CPF)
    ///       .sensitiveField(veil::SensitiveFieldConfig("telefone").visible(2, 2))
    ///       .formatter("upper", myFormatter, 10)
    ///       .build();
    /// @endcode
    ///
    /// Formatter and obfuscator registrations are collected and applied in
    /// build(), sorted by priority (lower first, ties in call order).  As
    /// registries keep the last write, a higher priority wins a conflict.
    class MaskingConfiguration {
    public:
        /// Priority used by withBuiltinFormatters(), below the default of 0
        /// so that any user registration replaces a built-in.
        static constexpr int kBuiltinPriority = -1000;

        MaskingConfiguration() : m_built(false) {}

        MaskingConfiguration(const MaskingConfiguration&) = delete;
        MaskingConfiguration& operator=(const MaskingConfiguration&) = delete;
        MaskingConfiguration(MaskingConfiguration&&) = default;
        MaskingConfiguration& operator=(MaskingConfiguration&&) = default;

        // ------------------------------------------------------------------
        //  Global settings
        // ------------------------------------------------------------------

        /// Replace every setting collected so far with config, e.g. one
        /// produced by loadConfigFile().
        MaskingConfiguration& useConfig(const EngineConfig& config) {
            m_config = config;
            return *this;
        }

        MaskingConfiguration& enabled(bool enable) {
            m_config.enabled = enable;
            return *this;
        }

        MaskingConfiguration& maskChar(char c) {
            m_config.maskChar = c;
            return *this;
        }

        MaskingConfiguration& defaultMask(const std::string& mask) {
            m_config.defaultMask = mask;
            return *this;
        }

        MaskingConfiguration& autoDetect(bool enable) {
            m_config.autoDetect = enable;
            return *this;
        }

        MaskingConfiguration& autoDetectCategory(DataCategory category) {
            m_config.addAutoDetectCategory(category);
            return *this;
        }

        MaskingConfiguration& clearAutoDetectCategories() {
            m_config.autoDetectCategories.clear();
            return *this;
        }

        /// @throws std::invalid_argument unless 0 <= ratio <= 1.
        MaskingConfiguration& alreadyMaskedRatio(double ratio) {
            if (ratio < 0.0 || ratio > 1.0) {
                throw std::invalid_argument("alreadyMaskedRatio must be between 0 and 1");
            }
            m_config.alreadyMaskedRatio = ratio;
            return *this;
        }

        /// Overlay VEIL_* environment variables (see applyEnvironment()).
        MaskingConfiguration& fromEnvironment(const std::string& prefix = "VEIL_") {
            applyEnvironment(m_config, prefix);
            return *this;
        }

        // ------------------------------------------------------------------
        //  Sensitive fields
        // ------------------------------------------------------------------

        MaskingConfiguration& sensitiveField(const std::string& name,
                                             DataCategory category = DataCategory::GENERIC) {
            m_config.addField(SensitiveFieldConfig(name, category));
            return *this;
        }

        MaskingConfiguration& sensitiveField(SensitiveFieldConfig field) {
            m_config.addField(std::move(field));
            return *this;
        }

        // ------------------------------------------------------------------
        //  Plugins
        // ------------------------------------------------------------------

        MaskingConfiguration& formatter(const std::string& name,
                                        std::shared_ptr<IFormatter> f, int priority = 0) {
            requirePlugin(f.get(), "formatter");
            FormatterRegistration reg;
            reg.byCategory = false;
            reg.name = name;
            reg.formatter = std::move(f);
            pushRegistration(m_formatterRegs, std::move(reg), priority);
            return *this;
        }

        MaskingConfiguration& formatter(DataCategory category,
                                        std::shared_ptr<IFormatter> f, int priority = 0) {
            requirePlugin(f.get(), "formatter");
            FormatterRegistration reg;
            reg.byCategory = true;
            reg.category = category;
            reg.formatter = std::move(f);
            pushRegistration(m_formatterRegs, std::move(reg), priority);
            return *this;
        }

        MaskingConfiguration& obfuscator(const std::string& name,
                                         std::shared_ptr<IObfuscator> o, int priority = 0) {
            requirePlugin(o.get(), "obfuscator");
            ObfuscatorRegistration reg;
            reg.byCategory = false;
            reg.name = name;
            reg.obfuscator = std::move(o);
            pushRegistration(m_obfuscatorRegs, std::move(reg), priority);
            return *this;
        }

        MaskingConfiguration& obfuscator(DataCategory category,
                                         std::shared_ptr<IObfuscator> o, int priority = 0) {
            requirePlugin(o.get(), "obfuscator");
            ObfuscatorRegistration reg;
            reg.byCategory = true;
            reg.category = category;
            reg.obfuscator = std::move(o);
            pushRegistration(m_obfuscatorRegs, std::move(reg), priority);
            return *this;
        }

        MaskingConfiguration& defaultObfuscator(std::shared_ptr<IObfuscator> o) {
            requirePlugin(o.get(), "obfuscator");
            m_defaultObfuscator = std::move(o);
            return *this;
        }

        /// Register every bundled formatter under its own name, using the
        /// mask character configured at build() time.
        MaskingConfiguration& withBuiltinFormatters(bool enable = true) {
            m_withBuiltins = enable;
            return *this;
        }

        const EngineConfig& config() const { return m_config; }

        // ------------------------------------------------------------------
        //  build()
        // ------------------------------------------------------------------

        /// Create the registries and the engine, apply all registrations,
        /// and configure the engine.
        ///
        /// @throws std::logic_error if called more than once.
        /// @throws ConfigurationError if some fields were rejected.
        std::shared_ptr<MaskingEngine> build() {
            if (m_built) {
                throw std::logic_error("MaskingConfiguration::build() called more than once");
            }
            m_built = true;

            auto formatters = std::make_shared<FormatterRegistry>();
            auto obfuscators = std::make_shared<ObfuscatorRegistry>();

            std::vector<FormatterRegistration> formatterRegs;
            if (m_withBuiltins) {
                for (auto& f : builtinFormatters(m_config.maskChar)) {
                    FormatterRegistration reg;
                    reg.byCategory = false;
                    reg.name = f->name();
                    reg.formatter = f;
                    reg.priority = kBuiltinPriority;
                    reg.sequence = formatterRegs.size();
                    formatterRegs.push_back(std::move(reg));
                }
            }
            for (auto& reg : m_formatterRegs) {
                reg.sequence += formatterRegs.size();
            }
            formatterRegs.insert(formatterRegs.end(), m_formatterRegs.begin(), m_formatterRegs.end());
            sortByPriority(formatterRegs);
            for (const auto& reg : formatterRegs) {
                if (reg.byCategory) {
                    formatters->registerByCategory(reg.category, reg.formatter);
                } else {
                    formatters->registerByName(reg.name, reg.formatter);
                }
            }

            sortByPriority(m_obfuscatorRegs);
            for (const auto& reg : m_obfuscatorRegs) {
                if (reg.byCategory) {
                    obfuscators->registerByCategory(reg.category, reg.obfuscator);
                } else {
                    obfuscators->registerByName(reg.name, reg.obfuscator);
                }
            }
            if (m_defaultObfuscator) {
                obfuscators->setDefaultObfuscator(m_defaultObfuscator);
            }

            auto engine = std::make_shared<MaskingEngine>(formatters, obfuscators);
            engine->configure(m_config);
            return engine;
        }

    private:
        struct FormatterRegistration {
            bool byCategory = false;
            std::string name;
            DataCategory category = DataCategory::GENERIC;
            std::shared_ptr<IFormatter> formatter;
            int priority = 0;
            size_t sequence = 0;
        };

        struct ObfuscatorRegistration {
            bool byCategory = false;
            std::string name;
            DataCategory category = DataCategory::GENERIC;
            std::shared_ptr<IObfuscator> obfuscator;
            int priority = 0;
            size_t sequence = 0;
        };

        EngineConfig m_config;
        std::vector<FormatterRegistration> m_formatterRegs;
        std::vector<ObfuscatorRegistration> m_obfuscatorRegs;
        std::shared_ptr<IObfuscator> m_defaultObfuscator;
        bool m_withBuiltins = false;
        bool m_built;

        static void requirePlugin(const void* plugin, const char* what) {
            if (plugin == nullptr) {
                throw std::invalid_argument(std::string(what) + " must not be null");
            }
        }

        template<typename Registration>
        static void pushRegistration(std::vector<Registration>& regs, Registration reg, int priority) {
            reg.priority = priority;
            reg.sequence = regs.size();
            regs.push_back(std::move(reg));
        }

        template<typename Registration>
        static void sortByPriority(std::vector<Registration>& regs) {
            std::stable_sort(regs.begin(), regs.end(),
                [](const Registration& a, const Registration& b) {
                    if (a.priority != b.priority) return a.priority < b.priority;
                    return a.sequence < b.sequence;
                });
        }
    };
} // namespace veil

#endif // VEIL_MASKING_CONFIGURATION_HPP
