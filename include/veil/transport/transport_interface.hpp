#ifndef VEIL_TRANSPORT_INTERFACE_HPP
#define VEIL_TRANSPORT_INTERFACE_HPP

#include <string>

namespace veil {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
    };

} // namespace veil

#endif // VEIL_TRANSPORT_INTERFACE_HPP
