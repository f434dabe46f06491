#ifndef VEIL_STDOUT_TRANSPORT_HPP
#define VEIL_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>

namespace veil {
    /// @note All StdoutTransport instances share one mutex, so lines from
    ///       different sinks never interleave on stdout.
    class StdoutTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cout << formattedEntry << '\n' << std::flush;
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    /// Same as StdoutTransport, for stderr.  The two mutexes are
    /// independent.
    class StderrTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cerr << formattedEntry << '\n' << std::flush;
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace veil

#endif // VEIL_STDOUT_TRANSPORT_HPP
