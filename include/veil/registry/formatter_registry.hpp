#ifndef VEIL_FORMATTER_REGISTRY_HPP
#define VEIL_FORMATTER_REGISTRY_HPP

#include "../formatter/formatter_interface.hpp"
#include "../core/data_category.hpp"
#include "../core/common.hpp"
#include <unordered_map>
#include <memory>
#include <mutex>
#include <string>
#include <stdexcept>

namespace veil {

    /// Lookup of value formatters by name and by category.
    ///
    /// Names are matched case-insensitively.  Registering by name also
    /// indexes the formatter under its own category (unless GENERIC), and
    /// registering by category also indexes it under its own name, so a
    /// formatter is reachable both ways whichever call added it.
    ///
    /// Thread safety: every method takes the registry mutex.  The engine
    /// never reads a registry while masking; it works from the frozen
    /// Table returned by snapshot().
    class FormatterRegistry {
    public:
        using FormatterPtr = std::shared_ptr<IFormatter>;

        struct Table {
            std::unordered_map<std::string, FormatterPtr> byName;
            std::unordered_map<DataCategory, FormatterPtr, DataCategoryHash> byCategory;

            FormatterPtr findByName(const std::string &name) const {
                if (detail::isBlank(name)) return nullptr;
                auto it = byName.find(detail::toLower(name));
                return it != byName.end() ? it->second : nullptr;
            }

            FormatterPtr findByCategory(DataCategory category) const {
                auto it = byCategory.find(category);
                return it != byCategory.end() ? it->second : nullptr;
            }
        };

        void registerByName(const std::string &name, FormatterPtr formatter) {
            if (detail::isBlank(name)) {
                throw std::invalid_argument("Formatter name must not be empty");
            }
            if (!formatter) {
                throw std::invalid_argument("Formatter must not be null");
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            DataCategory category = formatter->category();
            if (category != DataCategory::GENERIC) {
                m_table.byCategory[category] = formatter;
            }
            m_table.byName[detail::toLower(name)] = std::move(formatter);
        }

        void registerByCategory(DataCategory category, FormatterPtr formatter) {
            if (!formatter) {
                throw std::invalid_argument("Formatter must not be null");
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            std::string ownName = formatter->name();
            if (!detail::isBlank(ownName)) {
                m_table.byName[detail::toLower(ownName)] = formatter;
            }
            m_table.byCategory[category] = std::move(formatter);
        }

        FormatterPtr findByName(const std::string &name) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table.findByName(name);
        }

        FormatterPtr findByCategory(DataCategory category) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table.findByCategory(category);
        }

        /// Removes the named formatter and, if it is the one registered for
        /// its own category, that category entry too.
        void unregister(const std::string &name) {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_table.byName.find(detail::toLower(name));
            if (it == m_table.byName.end()) return;
            FormatterPtr removed = it->second;
            m_table.byName.erase(it);

            auto cat = m_table.byCategory.find(removed->category());
            if (cat != m_table.byCategory.end() && cat->second == removed) {
                m_table.byCategory.erase(cat);
            }
        }

        void unregister(DataCategory category) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byCategory.erase(category);
        }

        void clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byName.clear();
            m_table.byCategory.clear();
        }

        /// Number of name entries.
        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table.byName.size();
        }

        Table snapshot() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table;
        }

    private:
        mutable std::mutex m_mutex;
        Table m_table;
    };
} // namespace veil

#endif // VEIL_FORMATTER_REGISTRY_HPP
