#ifndef VEIL_FORMATTER_INTERFACE_HPP
#define VEIL_FORMATTER_INTERFACE_HPP

#include "../core/data_category.hpp"
#include "../core/common.hpp"
#include <string>
#include <functional>
#include <memory>

namespace veil {

    /// Format-aware value transform, e.g. "12345678909" -> "***456789**".
    ///
    /// format() may throw std::exception or return an empty string; the
    /// engine then uses the default obfuscator.  Exceptions of any other
    /// type reach the caller of MaskingEngine::sanitize().
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const std::string &value) const = 0;

        virtual std::string name() const = 0;

        virtual DataCategory category() const { return DataCategory::GENERIC; }

        virtual bool isValid(const std::string &value) const {
            return !detail::isBlank(value);
        }
    };

    /// Adapts a plain function to IFormatter.
    class FunctionFormatter : public IFormatter {
    public:
        using FormatFn = std::function<std::string(const std::string &)>;

        FunctionFormatter(std::string formatterName, FormatFn fn,
                          DataCategory formatterCategory = DataCategory::GENERIC)
            : m_name(std::move(formatterName))
            , m_fn(std::move(fn))
            , m_category(formatterCategory) {}

        std::string format(const std::string &value) const override {
            return m_fn ? m_fn(value) : std::string();
        }

        std::string name() const override { return m_name; }

        DataCategory category() const override { return m_category; }

    private:
        std::string m_name;
        FormatFn m_fn;
        DataCategory m_category;
    };

    inline std::shared_ptr<IFormatter> makeFormatter(const std::string &name,
                                                     FunctionFormatter::FormatFn fn,
                                                     DataCategory category = DataCategory::GENERIC) {
        return std::make_shared<FunctionFormatter>(name, std::move(fn), category);
    }
} // namespace veil

#endif // VEIL_FORMATTER_INTERFACE_HPP
