#ifndef VEIL_MASKING_LAYOUT_HPP
#define VEIL_MASKING_LAYOUT_HPP

#include "layout_interface.hpp"
#include "human_readable_layout.hpp"
#include "../engine/masking_engine.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>

namespace veil {

    /// Decorator that renders with an inner layout and then sanitizes the
    /// whole rendered line.  Everything the inner layout emits (message,
    /// arguments, context) goes through the engine.
    ///
    /// @code
    ///   sink->setLayout(detail::make_unique<MaskingLayout>(
    ///       detail::make_unique<JsonLayout>(), engine));
    /// @endcode
    class MaskingLayout : public ILayout {
    public:
        MaskingLayout(std::unique_ptr<ILayout> inner, std::shared_ptr<const MaskingEngine> engine)
            : m_inner(inner ? std::move(inner) : detail::make_unique<HumanReadableLayout>())
            , m_engine(std::move(engine))
            , m_enabled(true) {
            if (!m_engine) {
                throw std::invalid_argument("MaskingLayout requires an engine");
            }
        }

        std::string format(const LogEntry &entry) const override {
            std::string line = m_inner->format(entry);
            if (!m_enabled.load(std::memory_order_relaxed)) {
                return line;
            }
            return m_engine->sanitize(line);
        }

        void setEnabled(bool enabled) {
            m_enabled.store(enabled, std::memory_order_relaxed);
        }

        bool isEnabled() const {
            return m_enabled.load(std::memory_order_relaxed);
        }

    private:
        std::unique_ptr<ILayout> m_inner;
        std::shared_ptr<const MaskingEngine> m_engine;
        std::atomic<bool> m_enabled;
    };
} // namespace veil

#endif // VEIL_MASKING_LAYOUT_HPP
