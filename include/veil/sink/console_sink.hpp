#ifndef VEIL_CONSOLE_SINK_HPP
#define VEIL_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../layout/human_readable_layout.hpp"
#include "../transport/stdout_transport.hpp"
#include "../core/common.hpp"

namespace veil {
    enum class ConsoleStream {
        StdOut,
        StdErr
    };

    class ConsoleSink : public ISink {
    public:
        explicit ConsoleSink(ConsoleStream stream = ConsoleStream::StdOut) {
            setLayout(detail::make_unique<HumanReadableLayout>());
            if (stream == ConsoleStream::StdErr) {
                setTransport(detail::make_unique<StderrTransport>());
            } else {
                setTransport(detail::make_unique<StdoutTransport>());
            }
        }

        void write(const LogEntry &entry) override {
            if (m_layout && m_transport) {
                m_transport->write(m_layout->format(entry));
            }
        }
    };
} // namespace veil

#endif // VEIL_CONSOLE_SINK_HPP
