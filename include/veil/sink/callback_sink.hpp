#ifndef VEIL_CALLBACK_SINK_HPP
#define VEIL_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../layout/human_readable_layout.hpp"
#include "../core/common.hpp"
#include <functional>
#include <string>
#include <memory>

namespace veil {

    /// Sink that invokes a user-provided callback for each log entry.
    ///
    /// Two variants:
    ///   1. EntryCallback receives the LogEntry as is.
    ///   2. StringCallback receives the rendered line (HumanReadableLayout
    ///      unless a layout is supplied).
    ///
    /// @note The callback runs on the logging thread without a lock.
    class CallbackSink : public ISink {
    public:
        using EntryCallback  = std::function<void(const LogEntry&)>;
        using StringCallback = std::function<void(const std::string&)>;

        /// Wrap lambdas in the typedef to avoid overload ambiguity:
        /// @code
        ///   CallbackSink(CallbackSink::EntryCallback([](const LogEntry& e) { ... }))
        /// @endcode
        explicit CallbackSink(EntryCallback cb)
            : m_entryCallback(std::move(cb))
            , m_mode(Mode::Entry) {}

        explicit CallbackSink(StringCallback cb, std::unique_ptr<ILayout> layout = nullptr)
            : m_stringCallback(std::move(cb))
            , m_mode(Mode::String) {
            if (layout) {
                setLayout(std::move(layout));
            } else {
                setLayout(detail::make_unique<HumanReadableLayout>());
            }
        }

        void write(const LogEntry& entry) override {
            if (m_mode == Mode::Entry) {
                if (m_entryCallback) {
                    m_entryCallback(entry);
                }
            } else if (m_stringCallback && m_layout) {
                m_stringCallback(m_layout->format(entry));
            }
        }

    private:
        enum class Mode { Entry, String };

        EntryCallback  m_entryCallback;
        StringCallback m_stringCallback;
        Mode           m_mode;
    };

} // namespace veil

#endif // VEIL_CALLBACK_SINK_HPP
