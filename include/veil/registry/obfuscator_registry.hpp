#ifndef VEIL_OBFUSCATOR_REGISTRY_HPP
#define VEIL_OBFUSCATOR_REGISTRY_HPP

#include "../obfuscator/obfuscator_interface.hpp"
#include "../core/data_category.hpp"
#include "../core/common.hpp"
#include <unordered_map>
#include <memory>
#include <mutex>
#include <string>
#include <stdexcept>

namespace veil {

    /// Lookup of obfuscators by name and by category, plus an optional
    /// default.  Unlike formatters there is no cross-indexing: an
    /// obfuscator has no name or category of its own.
    class ObfuscatorRegistry {
    public:
        using ObfuscatorPtr = std::shared_ptr<IObfuscator>;

        struct Table {
            std::unordered_map<std::string, ObfuscatorPtr> byName;
            std::unordered_map<DataCategory, ObfuscatorPtr, DataCategoryHash> byCategory;
            ObfuscatorPtr defaultObfuscator;

            ObfuscatorPtr findByName(const std::string &name) const {
                if (detail::isBlank(name)) return nullptr;
                auto it = byName.find(detail::toLower(name));
                return it != byName.end() ? it->second : nullptr;
            }

            ObfuscatorPtr findByCategory(DataCategory category) const {
                auto it = byCategory.find(category);
                return it != byCategory.end() ? it->second : nullptr;
            }
        };

        void registerByName(const std::string &name, ObfuscatorPtr obfuscator) {
            if (detail::isBlank(name)) {
                throw std::invalid_argument("Obfuscator name must not be empty");
            }
            if (!obfuscator) {
                throw std::invalid_argument("Obfuscator must not be null");
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byName[detail::toLower(name)] = std::move(obfuscator);
        }

        void registerByCategory(DataCategory category, ObfuscatorPtr obfuscator) {
            if (!obfuscator) {
                throw std::invalid_argument("Obfuscator must not be null");
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byCategory[category] = std::move(obfuscator);
        }

        /// Passing nullptr removes the default.
        void setDefaultObfuscator(ObfuscatorPtr obfuscator) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.defaultObfuscator = std::move(obfuscator);
        }

        ObfuscatorPtr defaultObfuscator() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table.defaultObfuscator;
        }

        ObfuscatorPtr findByName(const std::string &name) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table.findByName(name);
        }

        ObfuscatorPtr findByCategory(DataCategory category) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_table.findByCategory(category);
        }

        void unregister(const std::string &name) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byName.erase(detail::toLower(name));
        }

        void unregister(DataCategory category) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byCategory.erase(category);
        }

        void clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_table.byName.clear();
            m_table.byCategory.clear();
            m_table.defaultObfuscator.reset();
        }

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

#endif // VEIL_OBFUSCATOR_REGISTRY_HPP
