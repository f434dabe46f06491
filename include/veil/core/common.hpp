#ifndef VEIL_COMMON_HPP
#define VEIL_COMMON_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <memory>
#include <vector>

namespace veil {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::string repeat(char c, size_t count) {
        return std::string(count, c);
    }

    inline std::string toLower(const std::string &s) {
        std::string out(s);
        for (auto &c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    inline std::string trim(const std::string &s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(start, end - start);
    }

    inline bool isBlank(const std::string &s) {
        for (char c : s) {
            if (!std::isspace(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    /// Keep only ASCII digits.
    inline std::string digitsOnly(const std::string &s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            if (c >= '0' && c <= '9') out += c;
        }
        return out;
    }

    inline std::vector<std::string> split(const std::string &s, char sep) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : s) {
            if (c == sep) {
                parts.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        parts.push_back(current);
        return parts;
    }

    /// Escape every ECMAScript regex metacharacter so the input is matched
    /// literally when embedded in a larger pattern.
    inline std::string escapeRegex(const std::string &literal) {
        static const std::string kSpecial = "\\^$.|?*+()[]{}";
        std::string out;
        out.reserve(literal.size() * 2);
        for (char c : literal) {
            if (kSpecial.find(c) != std::string::npos) {
                out += '\\';
            }
            out += c;
        }
        return out;
    }

    // --- UTF-8 helpers ---

    /// Byte length of the UTF-8 sequence starting with lead byte c.
    /// Stray continuation bytes count as one byte so malformed input
    /// never stalls the scan.
    inline size_t utf8SeqLen(unsigned char c) {
        if (c < 0x80) return 1;
        if ((c & 0xE0) == 0xC0) return 2;
        if ((c & 0xF0) == 0xE0) return 3;
        if ((c & 0xF8) == 0xF0) return 4;
        return 1;
    }

    /// Split a UTF-8 string into code points (each kept as its byte sequence).
    inline std::vector<std::string> utf8Split(const std::string &s) {
        std::vector<std::string> cps;
        cps.reserve(s.size());
        for (size_t i = 0; i < s.size(); ) {
            size_t len = utf8SeqLen(static_cast<unsigned char>(s[i]));
            if (i + len > s.size()) len = s.size() - i;
            cps.push_back(s.substr(i, len));
            i += len;
        }
        return cps;
    }

    inline size_t utf8CharCount(const std::string &s) {
        size_t count = 0;
        for (size_t i = 0; i < s.size(); ) {
            i += utf8SeqLen(static_cast<unsigned char>(s[i]));
            ++count;
        }
        return count;
    }

    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto nowTime = std::chrono::system_clock::to_time_t(time);
        auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;

        std::tm tmBuf;
#ifdef _WIN32
        localtime_s(&tmBuf, &nowTime);
#else
        localtime_r(&nowTime, &tmBuf);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
        return oss.str();
    }
} // namespace detail
} // namespace veil

#endif // VEIL_COMMON_HPP
