#pragma once
/// @file textFormatUtil.hpp
/// @brief Tokenizer for `Type { "key": value, ... }` statement lines (schema files)

#include <cctype>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace FwFile::util {

/// @brief key -> {isString, value}
using KvMap = std::unordered_map<std::string, std::pair<bool, std::string>>;

/// @brief Ordered key/value list used when formatting
using KvList = std::vector<std::pair<std::string, std::pair<bool, std::string>>>;

/// @brief One parsed statement with its 1-based source line
struct Statement {
    std::string type;
    KvMap kv;
    size_t line = 0;
};

// 숫자 문자열을 long으로 엄격하게 변환한다. 문자열 전체를 소비하지 못하면 실패다.
inline bool parseLongStrict(const std::string& s, long& out, std::error_code& ec) {
    ec.clear();
    const char* p = s.c_str();
    const char* end = p + s.size();
    bool negative = false;
    if (p < end && (*p == '+' || *p == '-')) {
        negative = (*p == '-');
        ++p;
    }
    if (p == end) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    // 음수 쪽 범위가 1 더 크므로 절대값은 unsigned long으로 누적한다.
    const unsigned long limit = negative
                                    ? static_cast<unsigned long>(std::numeric_limits<long>::max()) + 1
                                    : static_cast<unsigned long>(std::numeric_limits<long>::max());
    unsigned long acc = 0;
    for (; p < end; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        unsigned long digit = static_cast<unsigned long>(*p - '0');
        if (acc > (limit - digit) / 10) {
            ec = std::make_error_code(std::errc::result_out_of_range);
            return false;
        }
        acc = acc * 10 + digit;
    }
    out = negative ? static_cast<long>(0UL - acc) : static_cast<long>(acc);
    return true;
}

inline void skipWs(const char*& p, const char* end) {
    while (p < end && std::isspace(static_cast<unsigned char>(*p)))
        ++p;
}

inline bool parseIdent(const char*& p, const char* end, std::string& out) {
    skipWs(p, end);
    if (p >= end || !(std::isalpha(static_cast<unsigned char>(*p)) || *p == '_'))
        return false;
    const char* s = p++;
    while (p < end && (std::isalnum(static_cast<unsigned char>(*p)) || *p == '_'))
        ++p;
    out.assign(s, p);
    return true;
}

inline bool parseQuotedString(const char*& p, const char* end, std::string& out) {
    // 허용 escape는 \" , \\ , \n , \t 로 제한한다.
    skipWs(p, end);
    if (p >= end || *p != '"')
        return false;
    ++p;

    std::string s;
    while (p < end) {
        char c = *p++;
        if (c == '"') {
            out = std::move(s);
            return true;
        }
        if (c == '\\') {
            if (p >= end)
                return false;
            char e = *p++;
            if (e == '"' || e == '\\')
                s.push_back(e);
            else if (e == 'n')
                s.push_back('\n');
            else if (e == 't')
                s.push_back('\t');
            else
                return false;
        } else {
            s.push_back(c);
        }
    }
    return false;
}

inline bool parseIntToken(const char*& p, const char* end, std::string& out) {
    skipWs(p, end);
    const char* s = p;
    if (p < end && (*p == '-' || *p == '+'))
        ++p;
    const char* digits = p;
    while (p < end && std::isdigit(static_cast<unsigned char>(*p)))
        ++p;
    if (p == digits)
        return false;
    out.assign(s, p);
    return true;
}

inline std::string escapeString(const std::string& in) {
    std::string o;
    o.reserve(in.size() + 4);
    for (char c : in) {
        if (c == '"' || c == '\\') {
            o.push_back('\\');
            o.push_back(c);
        } else if (c == '\n')
            o += "\\n";
        else if (c == '\t')
            o += "\\t";
        else
            o.push_back(c);
    }
    return o;
}

/// @brief True for empty/whitespace lines and lines whose first non-space char is '#'
inline bool isBlankOrComment(std::string_view line) {
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        return c == '#';
    }
    return true;
}

/// @brief Parses one statement line: Type { "k": "v", "n": 123 }
/// @details Fails fast with ec=invalid_argument on any deviation, including duplicate keys.
inline bool parseLine(std::string_view line, std::string& type, KvMap& kv, std::error_code& ec) {
    ec.clear();
    kv.clear();

    const char* p = line.data();
    const char* end = p + line.size();

    if (!parseIdent(p, end, type)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    skipWs(p, end);
    if (p >= end || *p != '{') {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    ++p;

    skipWs(p, end);
    if (p < end && *p == '}') {
        ++p;
        skipWs(p, end);
        if (p != end) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        return true;
    }

    while (true) {
        std::string key;
        if (!parseQuotedString(p, end, key)) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        skipWs(p, end);
        if (p >= end || *p != ':') {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        ++p;

        skipWs(p, end);
        bool isStr = false;
        std::string val;

        if (p < end && *p == '"') {
            isStr = true;
            if (!parseQuotedString(p, end, val)) {
                ec = std::make_error_code(std::errc::invalid_argument);
                return false;
            }
        } else if (!parseIntToken(p, end, val)) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        if (kv.find(key) != kv.end()) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        kv.emplace(std::move(key), std::make_pair(isStr, std::move(val)));

        skipWs(p, end);
        if (p >= end) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        if (*p == ',') {
            ++p;
            continue;
        }
        if (*p == '}') {
            ++p;
            break;
        }
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    skipWs(p, end);
    if (p != end) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    return true;
}

/// @brief Splits text into statements, skipping blank and comment lines
/// @param errorLine Set to the failing 1-based line when false is returned
inline bool parseStatements(std::string_view text, std::vector<Statement>& out, size_t& errorLine,
                            std::error_code& ec) {
    ec.clear();
    out.clear();
    errorLine = 0;

    size_t lineNo = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string_view line =
            text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (!isBlankOrComment(line)) {
            Statement st;
            st.line = lineNo;
            if (!parseLine(line, st.type, st.kv, ec)) {
                errorLine = lineNo;
                return false;
            }
            out.push_back(std::move(st));
        }
        if (nl == std::string_view::npos)
            break;
        pos = nl + 1;
    }
    return true;
}

/// @brief Formats a statement line that parseLine reads back unchanged (with '\n')
inline std::string formatLine(const std::string& type, const KvList& fields) {
    std::string out;
    out += type;
    out += " { ";
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& k = fields[i].first;
        const bool isStr = fields[i].second.first;
        const auto& v = fields[i].second.second;

        out += '"';
        out += escapeString(k);
        out += "\": ";
        if (isStr) {
            out += '"';
            out += escapeString(v);
            out += '"';
        } else {
            out += v;
        }
        if (i + 1 < fields.size())
            out += ", ";
    }
    out += " }\n";
    return out;
}

/// @brief Splits "a,b,c" on commas; empty input gives an empty list
inline std::vector<std::string> splitList(std::string_view text, char sep = ',') {
    std::vector<std::string> out;
    if (text.empty())
        return out;
    size_t pos = 0;
    while (true) {
        size_t next = text.find(sep, pos);
        out.emplace_back(text.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                          : next - pos));
        if (next == std::string_view::npos)
            break;
        pos = next + 1;
    }
    return out;
}

/// @brief Joins items with sep
inline std::string joinList(const std::vector<std::string>& items, char sep = ',') {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i)
            out.push_back(sep);
        out += items[i];
    }
    return out;
}

} // namespace FwFile::util
