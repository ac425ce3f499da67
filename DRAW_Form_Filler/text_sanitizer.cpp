#include "text_sanitizer.h"

#include <cctype>

namespace DrawForm {
namespace TextUtil {

static bool isKeptByte(unsigned char c) {
    if (c >= 0x20 && c <= 0x7E) return true;
    return c == '\n' || c == '\r' || c == '\t';
}

std::string sanitize(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        if (isKeptByte(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
        }
    }
    return out;
}

std::string sanitize(const std::optional<std::string>& value) {
    if (!value) return "";
    return sanitize(*value);
}

std::string stripNonDigits(const std::string& value) {
    std::string out;
    for (char ch : value) {
        if (ch >= '0' && ch <= '9') out.push_back(ch);
    }
    return out;
}

std::string toUpperAscii(const std::string& value) {
    std::string out = value;
    for (auto& ch : out) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

std::string trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace TextUtil
} // namespace DrawForm
