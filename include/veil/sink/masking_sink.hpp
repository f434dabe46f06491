#ifndef VEIL_MASKING_SINK_HPP
#define VEIL_MASKING_SINK_HPP

#include "sink_interface.hpp"
#include "../engine/masking_engine.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

namespace veil {

    /// Decorator sink: sanitizes an entry's message, argument values and
    /// context values, then forwards it to every attached sink.
    ///
    /// Keys and the template are left alone.  An entry in which nothing
    /// changed is forwarded as the original object, without a copy.
    ///
    /// @code
    ///   auto masking = detail::make_unique<MaskingSink>(engine);
    ///   masking->attach(detail::make_unique<ConsoleSink>());
    ///   logger.addSink(std::move(masking));
    /// @endcode
    class MaskingSink : public ISink {
    public:
        explicit MaskingSink(std::shared_ptr<const MaskingEngine> engine)
            : m_engine(std::move(engine))
            , m_enabled(true) {
            if (!m_engine) {
                throw std::invalid_argument("MaskingSink requires an engine");
            }
        }

        void attach(std::unique_ptr<ISink> sink) {
            if (!sink) {
                throw std::invalid_argument("MaskingSink::attach: sink must not be null");
            }
            m_sinks.push_back(std::move(sink));
        }

        size_t sinkCount() const { return m_sinks.size(); }

        void write(const LogEntry &entry) override {
            if (!m_enabled.load(std::memory_order_relaxed)) {
                forward(entry);
                return;
            }

            LogEntry masked = entry;
            bool changed = false;

            changed |= sanitizeInPlace(masked.message);
            for (auto &arg : masked.arguments) {
                changed |= sanitizeInPlace(arg.second);
            }
            for (auto &ctx : masked.customContext) {
                changed |= sanitizeInPlace(ctx.second);
            }

            forward(changed ? masked : entry);
        }

        void flush() override {
            for (const auto &sink : m_sinks) {
                sink->flush();
            }
        }

        void setEnabled(bool enabled) {
            m_enabled.store(enabled, std::memory_order_relaxed);
        }

        bool isEnabled() const {
            return m_enabled.load(std::memory_order_relaxed);
        }

    private:
        std::shared_ptr<const MaskingEngine> m_engine;
        std::vector<std::unique_ptr<ISink> > m_sinks;
        std::atomic<bool> m_enabled;

        bool sanitizeInPlace(std::string &text) const {
            std::string result = m_engine->sanitize(text);
            if (result == text) return false;
            text = std::move(result);
            return true;
        }

        void forward(const LogEntry &entry) {
            for (const auto &sink : m_sinks) {
                sink->write(entry);
            }
        }
    };
} // namespace veil

#endif // VEIL_MASKING_SINK_HPP
