#ifndef VEIL_LOGGER_HPP
#define VEIL_LOGGER_HPP

#include "log_entry.hpp"
#include "../sink/sink_interface.hpp"
#include "../sink/masking_sink.hpp"
#include "../core/common.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace veil {

    namespace detail {
        template<typename T>
        std::string toString(const T &value) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        inline std::string toString(const std::string &value) {
            return value;
        }

        inline std::string toString(const char *value) {
            return value ? std::string(value) : std::string();
        }

        inline std::string toString(bool value) {
            return value ? "true" : "false";
        }

        /// Render a message template.  Values fill "{name}" placeholders
        /// left to right; "{{" and "}}" produce literal braces.  Each
        /// filled placeholder is recorded as a (name, value) pair.
        /// Placeholders beyond the supplied values stay in the text.
        inline void renderTemplate(const std::string &messageTemplate,
                                   const std::vector<std::string> &values,
                                   std::string &message,
                                   std::vector<std::pair<std::string, std::string> > &arguments) {
            message.clear();
            message.reserve(messageTemplate.size());
            size_t valueIndex = 0;

            for (size_t i = 0; i < messageTemplate.size(); ++i) {
                char c = messageTemplate[i];
                if (c == '{') {
                    if (i + 1 < messageTemplate.size() && messageTemplate[i + 1] == '{') {
                        message += '{';
                        ++i;
                        continue;
                    }
                    size_t endPos = messageTemplate.find('}', i);
                    if (endPos == std::string::npos) {
                        message += c;
                        continue;
                    }
                    std::string name = messageTemplate.substr(i + 1, endPos - i - 1);
                    if (valueIndex < values.size()) {
                        message += values[valueIndex];
                        arguments.emplace_back(name, values[valueIndex]);
                        ++valueIndex;
                    } else {
                        message += messageTemplate.substr(i, endPos - i + 1);
                    }
                    i = endPos;
                } else if (c == '}') {
                    if (i + 1 < messageTemplate.size() && messageTemplate[i + 1] == '}') {
                        ++i;
                    }
                    message += '}';
                } else {
                    message += c;
                }
            }
        }
    } // namespace detail

    /// Minimal synchronous logger.  Entries are built on the calling
    /// thread and written to every sink before log() returns; sink writes
    /// are serialized by one mutex.
    ///
    /// @code
    ///   veil::Logger log(veil::LogLevel::DEBUG);
    ///   log.addMaskedSink(engine, veil::detail::make_unique<veil::ConsoleSink>());
    ///   log.info("Customer {cpf} created order {id}", "12345678909", 42);
    /// @endcode
    class Logger {
    public:
        explicit Logger(LogLevel minLevel = LogLevel::INFO)
            : m_minLevel(minLevel) {}

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        void setMinLevel(LogLevel level) {
            m_minLevel.store(level);
        }

        LogLevel getMinLevel() const {
            return m_minLevel.load();
        }

        void addSink(std::unique_ptr<ISink> sink) {
            if (!sink) {
                throw std::invalid_argument("Logger::addSink: sink must not be null");
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sinks.push_back(std::move(sink));
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value>::type
        addSink(Args &&... args) {
            addSink(std::unique_ptr<ISink>(detail::make_unique<SinkType>(std::forward<Args>(args)...)));
        }

        /// Wrap target in a MaskingSink bound to engine and add it.
        void addMaskedSink(std::shared_ptr<const MaskingEngine> engine, std::unique_ptr<ISink> target) {
            auto masking = detail::make_unique<MaskingSink>(std::move(engine));
            masking->attach(std::move(target));
            addSink(std::move(masking));
        }

        /// Context attached to every following entry.
        void setContext(const std::string &key, const std::string &value) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_context[key] = value;
        }

        void removeContext(const std::string &key) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_context.erase(key);
        }

        void clearContext() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_context.clear();
        }

        template<typename... Args>
        void log(LogLevel level, const std::string &messageTemplate, const Args &... args) {
            if (level < m_minLevel.load()) return;

            std::vector<std::string> values{detail::toString(args)...};
            LogEntry entry;
            entry.level = level;
            entry.timestamp = std::chrono::system_clock::now();
            entry.templateStr = messageTemplate;
            detail::renderTemplate(messageTemplate, values, entry.message, entry.arguments);

            std::lock_guard<std::mutex> lock(m_mutex);
            entry.customContext = m_context;
            for (const auto &sink : m_sinks) {
                sink->write(entry);
            }
        }

        template<typename... Args>
        void trace(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::TRACE, messageTemplate, args...);
        }

        template<typename... Args>
        void debug(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::DEBUG, messageTemplate, args...);
        }

        template<typename... Args>
        void info(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::INFO, messageTemplate, args...);
        }

        template<typename... Args>
        void warn(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::WARN, messageTemplate, args...);
        }

        template<typename... Args>
        void error(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::ERROR, messageTemplate, args...);
        }

        template<typename... Args>
        void fatal(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::FATAL, messageTemplate, args...);
        }

        void flush() {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto &sink : m_sinks) {
                sink->flush();
            }
        }

    private:
        std::atomic<LogLevel> m_minLevel;
        std::mutex m_mutex;
        std::vector<std::unique_ptr<ISink> > m_sinks;
        std::map<std::string, std::string> m_context;
    };
} // namespace veil

#endif // VEIL_LOGGER_HPP
