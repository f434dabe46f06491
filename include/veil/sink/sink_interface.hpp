#ifndef VEIL_SINK_INTERFACE_HPP
#define VEIL_SINK_INTERFACE_HPP

#include "../log/log_entry.hpp"
#include "../layout/layout_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace veil {
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const LogEntry &entry) = 0;

        virtual void flush() {}

        void setLayout(std::unique_ptr<ILayout> layout) {
            m_layout = std::move(layout);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

    protected:
        ILayout *layout() const { return m_layout.get(); }

        std::unique_ptr<ILayout> m_layout;
        std::unique_ptr<ITransport> m_transport;
    };
} // namespace veil

#endif // VEIL_SINK_INTERFACE_HPP
