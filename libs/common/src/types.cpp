#include "copyddl/common/types.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace copyddl {

String to_upper(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

String to_lower(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

String trim(StringView str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == StringView::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return String(str.substr(start, end - start + 1));
}

String trim_left(StringView str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    return start == StringView::npos ? "" : String(str.substr(start));
}

String trim_right(StringView str) {
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return end == StringView::npos ? "" : String(str.substr(0, end + 1));
}

std::vector<String> split(StringView str, char delimiter) {
    std::vector<String> result;
    Size start = 0, end = 0;
    while ((end = str.find(delimiter, start)) != StringView::npos) {
        result.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    result.emplace_back(str.substr(start));
    return result;
}

String join(const std::vector<String>& strings, StringView delimiter) {
    if (strings.empty()) return "";
    String result = strings[0];
    for (Size i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

bool starts_with(StringView str, StringView prefix) {
    return str.starts_with(prefix);
}

bool contains(StringView str, StringView substr) {
    return str.find(substr) != StringView::npos;
}

String replace_all(StringView str, StringView from, StringView to) {
    if (from.empty()) return String(str);
    String result;
    Size start = 0, pos = 0;
    while ((pos = str.find(from, start)) != StringView::npos) {
        result += str.substr(start, pos - start);
        result += to;
        start = pos + from.length();
    }
    result += str.substr(start);
    return result;
}

String pad_right(StringView str, Size width, char pad) {
    if (str.length() >= width) return String(str);
    return String(str) + String(width - str.length(), pad);
}

String json_quote(StringView str) {
    std::ostringstream oss;
    oss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

} // namespace copyddl
