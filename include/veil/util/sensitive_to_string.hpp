#ifndef VEIL_SENSITIVE_TO_STRING_HPP
#define VEIL_SENSITIVE_TO_STRING_HPP

#include "../core/data_category.hpp"
#include "../core/mask_utils.hpp"
#include "../core/common.hpp"
#include "../registry/formatter_registry.hpp"
#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace veil {

    /// How one sensitive member is rendered.  Resolution order:
    /// formatter by name, formatter by category (unless GENERIC), partial
    /// mask when a visible count is set, and finally the fixed mask.
    struct SensitiveSpec {
        DataCategory category = DataCategory::GENERIC;
        std::string formatterName;
        unsigned visibleStart = 0;
        unsigned visibleEnd = 0;
        char maskChar = '*';
        std::string mask = "***";

        static SensitiveSpec of(DataCategory c) {
            SensitiveSpec spec;
            spec.category = c;
            return spec;
        }

        static SensitiveSpec formatter(const std::string &name) {
            SensitiveSpec spec;
            spec.formatterName = name;
            return spec;
        }

        static SensitiveSpec partial(unsigned start, unsigned end, char c = '*') {
            SensitiveSpec spec;
            spec.visibleStart = start;
            spec.visibleEnd = end;
            spec.maskChar = c;
            return spec;
        }

        static SensitiveSpec masked(const std::string &fixedMask) {
            SensitiveSpec spec;
            spec.mask = fixedMask;
            return spec;
        }
    };

    /// A member value reduced to text, with the two facts rendering needs.
    struct FieldValue {
        bool isNull = false;
        bool isNumber = false;
        std::string text;
    };

    namespace detail {
        inline std::string escapeJsonString(const std::string &input) {
            std::string result;
            result.reserve(input.size());
            for (char c : input) {
                switch (c) {
                    case '"': result += R"(\")"; break;
                    case '\\': result += R"(\\)"; break;
                    case '\b': result += R"(\b)"; break;
                    case '\f': result += R"(\f)"; break;
                    case '\n': result += R"(\n)"; break;
                    case '\r': result += R"(\r)"; break;
                    case '\t': result += R"(\t)"; break;
                    default:
                        if ('\x00' <= c && c <= '\x1f') {
                            char buf[8];
                            std::snprintf(buf, sizeof(buf), "\\u%04x",
                                          static_cast<unsigned char>(c));
                            result += buf;
                        } else {
                            result += c;
                        }
                }
            }
            return result;
        }

        inline FieldValue toFieldValue(const std::string &value) {
            FieldValue v;
            v.text = value;
            return v;
        }

        inline FieldValue toFieldValue(const char *value) {
            FieldValue v;
            if (value == nullptr) {
                v.isNull = true;
            } else {
                v.text = value;
            }
            return v;
        }

        inline FieldValue toFieldValue(bool value) {
            FieldValue v;
            v.text = value ? "true" : "false";
            return v;
        }

        inline FieldValue toFieldValue(char value) {
            FieldValue v;
            v.text = std::string(1, value);
            return v;
        }

        template<typename T>
        typename std::enable_if<std::is_arithmetic<T>::value, FieldValue>::type
        toFieldValue(T value) {
            std::ostringstream oss;
            oss << value;
            FieldValue v;
            v.isNumber = true;
            v.text = oss.str();
            return v;
        }

        template<typename T>
        FieldValue toFieldValue(const std::shared_ptr<T> &value) {
            if (!value) {
                FieldValue v;
                v.isNull = true;
                return v;
            }
            return toFieldValue(*value);
        }

        template<typename T>
        FieldValue toFieldValue(const std::unique_ptr<T> &value) {
            if (!value) {
                FieldValue v;
                v.isNull = true;
                return v;
            }
            return toFieldValue(*value);
        }

        inline bool tryFormat(const std::shared_ptr<IFormatter> &formatter,
                              const std::string &value, std::string &out) {
            if (!formatter) return false;
            try {
                out = formatter->format(value);
            } catch (const std::exception &) {
                return false;
            }
            return !out.empty();
        }

        inline std::string applySpec(const std::string &value, const SensitiveSpec &spec,
                                      const FormatterRegistry::Table &formatters) {
            if (value.empty()) return spec.mask;

            std::string out;
            if (!spec.formatterName.empty()
                && tryFormat(formatters.findByName(spec.formatterName), value, out)) {
                return out;
            }
            if (spec.category != DataCategory::GENERIC
                && tryFormat(formatters.findByCategory(spec.category), value, out)) {
                return out;
            }
            if (spec.visibleStart > 0 || spec.visibleEnd > 0) {
                return partialMask(value, spec.visibleStart, spec.visibleEnd, spec.maskChar, kMinMaskLength);
            }
            return spec.mask;
        }

        /// Collects "name=value" or "\"name\": value" members.
        class MemberWriter {
        public:
            explicit MemberWriter(bool json) : m_json(json), m_first(true) {}

            void write(const std::string &name, const std::string &text, bool quoted) {
                if (!m_first) m_out += ", ";
                m_first = false;
                if (m_json) {
                    m_out += "\"" + escapeJsonString(name) + "\": ";
                    if (quoted) {
                        m_out += "\"" + escapeJsonString(text) + "\"";
                    } else {
                        m_out += text;
                    }
                } else {
                    m_out += name + "=" + text;
                }
            }

            std::string finish(const std::string &typeName) const {
                if (m_json) return "{" + m_out + "}";
                return typeName + "[" + m_out + "]";
            }

        private:
            bool m_json;
            bool m_first;
            std::string m_out;
        };
    } // namespace detail

    /// Declarative description of how to print a T with its sensitive
    /// members masked.
    ///
    /// @code
    ///   veil::ObjectDescriptor<Customer> desc("Customer");
    ///   desc.field("id", [](const Customer& c) { return c.id; })
    ///       .sensitive("cpf", [](const Customer& c) { return c.cpf; },
    ///                  veil::SensitiveSpec::of(veil::DataCategory::CPF))
    ///       .sensitive("phone", [](const Customer& c) { return c.phone; },
    ///                  veil::SensitiveSpec::partial(2, 2));
    ///   desc.render(customer, registry);   // Customer[id=7, cpf=***456789**, phone=11*******21]
    /// @endcode
    ///
    /// Getters may return strings, C strings, numbers, bool, or a
    /// shared_ptr / unique_ptr to one of those (an empty pointer is null).
    /// Null members are skipped unless includeNulls(true); when printed
    /// they read "null" whether sensitive or not.
    template<typename T>
    class ObjectDescriptor {
    public:
        using Getter = std::function<FieldValue(const T &)>;

        explicit ObjectDescriptor(std::string typeName)
            : m_typeName(std::move(typeName))
            , m_json(false)
            , m_includeNulls(false) {}

        template<typename Fn>
        ObjectDescriptor &field(const std::string &name, Fn getter) {
            m_members.push_back(Member{name, wrap(getter), false, SensitiveSpec()});
            return *this;
        }

        template<typename Fn>
        ObjectDescriptor &sensitive(const std::string &name, Fn getter, SensitiveSpec spec = SensitiveSpec()) {
            m_members.push_back(Member{name, wrap(getter), true, std::move(spec)});
            return *this;
        }

        /// Copy every member of a base-class descriptor, ahead of the
        /// members declared so far.
        template<typename Base>
        ObjectDescriptor &inherit(const ObjectDescriptor<Base> &base) {
            static_assert(std::is_base_of<Base, T>::value, "inherit() needs a base class of T");
            std::vector<Member> merged;
            for (const auto &m : base.members()) {
                typename ObjectDescriptor<Base>::Getter g = m.getter;
                merged.push_back(Member{m.name, [g](const T &obj) { return g(obj); }, m.isSensitive, m.spec});
            }
            merged.insert(merged.end(), m_members.begin(), m_members.end());
            m_members.swap(merged);
            return *this;
        }

        ObjectDescriptor &exclude(const std::string &name) {
            m_excluded.insert(name);
            return *this;
        }

        ObjectDescriptor &jsonFormat(bool enable) {
            m_json = enable;
            return *this;
        }

        ObjectDescriptor &includeNulls(bool enable) {
            m_includeNulls = enable;
            return *this;
        }

        std::string render(const T &obj) const {
            return render(obj, FormatterRegistry::Table());
        }

        std::string render(const T &obj, const FormatterRegistry &formatters) const {
            return render(obj, formatters.snapshot());
        }

        std::string render(const T &obj, const FormatterRegistry::Table &formatters) const {
            detail::MemberWriter writer(m_json);
            for (const auto &member : m_members) {
                if (m_excluded.count(member.name)) continue;

                FieldValue value = member.getter(obj);
                if (value.isNull) {
                    if (!m_includeNulls) continue;
                    writer.write(member.name, "null", false);
                    continue;
                }

                if (member.isSensitive) {
                    std::string masked = detail::applySpec(value.text, member.spec, formatters);
                    writer.write(member.name, masked, true);
                } else {
                    writer.write(member.name, value.text, !value.isNumber);
                }
            }
            return writer.finish(m_typeName);
        }

        /// A null object renders as "null".
        std::string render(const T *obj, const FormatterRegistry &formatters) const {
            if (obj == nullptr) return "null";
            return render(*obj, formatters);
        }

        struct Member {
            std::string name;
            Getter getter;
            bool isSensitive;
            SensitiveSpec spec;
        };

        const std::vector<Member> &members() const { return m_members; }

        const std::string &typeName() const { return m_typeName; }

    private:
        std::string m_typeName;
        std::vector<Member> m_members;
        std::set<std::string> m_excluded;
        bool m_json;
        bool m_includeNulls;

        template<typename Fn>
        static Getter wrap(Fn getter) {
            return [getter](const T &obj) { return detail::toFieldValue(getter(obj)); };
        }
    };

    /// Imperative counterpart of ObjectDescriptor for hand-written
    /// toString() functions.
    ///
    /// @code
    ///   return veil::SensitiveToStringBuilder("Payment", &registry)
    ///       .append("amount", 10.5)
    ///       .appendSensitive("card", card, veil::DataCategory::CREDIT_CARD)
    ///       .appendMasked("cvv", cvv, "***")
    ///       .build();
    /// @endcode
    class SensitiveToStringBuilder {
    public:
        explicit SensitiveToStringBuilder(std::string typeName, const FormatterRegistry *formatters = nullptr)
            : m_typeName(std::move(typeName))
            , m_json(false) {
            if (formatters) {
                m_formatters = formatters->snapshot();
            }
        }

        SensitiveToStringBuilder &jsonFormat(bool enable) {
            m_json = enable;
            return *this;
        }

        template<typename V>
        SensitiveToStringBuilder &append(const std::string &name, const V &value) {
            m_members.push_back(Pending{name, detail::toFieldValue(value)});
            return *this;
        }

        /// Category formatter if one is registered, "***" otherwise.
        template<typename V>
        SensitiveToStringBuilder &appendSensitive(const std::string &name, const V &value, DataCategory category) {
            FieldValue v = detail::toFieldValue(value);
            std::string out = "***";
            if (!v.isNull) {
                std::string formatted;
                if (detail::tryFormat(m_formatters.findByCategory(category), v.text, formatted)) {
                    out = formatted;
                }
            }
            FieldValue masked;
            masked.text = out;
            m_members.push_back(Pending{name, masked});
            return *this;
        }

        template<typename V>
        SensitiveToStringBuilder &appendSensitive(const std::string &name, const V &value, const SensitiveSpec &spec) {
            FieldValue v = detail::toFieldValue(value);
            FieldValue masked;
            masked.text = v.isNull ? spec.mask : detail::applySpec(v.text, spec, m_formatters);
            m_members.push_back(Pending{name, masked});
            return *this;
        }

        /// Prints mask, or "null" for a null value.
        template<typename V>
        SensitiveToStringBuilder &appendMasked(const std::string &name, const V &value, const std::string &mask) {
            FieldValue masked;
            masked.isNull = detail::toFieldValue(value).isNull;
            masked.text = mask;
            m_members.push_back(Pending{name, masked});
            return *this;
        }

        std::string build() const {
            detail::MemberWriter writer(m_json);
            for (const auto &member : m_members) {
                if (member.value.isNull) {
                    writer.write(member.name, "null", false);
                } else {
                    writer.write(member.name, member.value.text, !member.value.isNumber);
                }
            }
            return writer.finish(m_typeName);
        }

    private:
        struct Pending {
            std::string name;
            FieldValue value;
        };

        std::string m_typeName;
        FormatterRegistry::Table m_formatters;
        std::vector<Pending> m_members;
        bool m_json;
    };
} // namespace veil

#endif // VEIL_SENSITIVE_TO_STRING_HPP
