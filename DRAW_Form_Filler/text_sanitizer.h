#ifndef DRAWFORM_TEXT_SANITIZER_H
#define DRAWFORM_TEXT_SANITIZER_H

#include <optional>
#include <string>
#include <vector>

namespace DrawForm {

// Text clean-up applied to every value before it is injected into a template
namespace TextUtil {
    // Keep printable ASCII (0x20-0x7E) plus \n, \r and \t. Everything else,
    // including every byte of a multi-byte UTF-8 sequence (zero-width space,
    // Adobe NBSP, en/em space), is dropped.
    std::string sanitize(const std::string& value);
    std::string sanitize(const std::optional<std::string>& value);

    // "2025-03-14" -> "20250314"
    std::string stripNonDigits(const std::string& value);

    std::string toUpperAscii(const std::string& value);

    // Join statements with '\n', preserving input order
    std::string joinLines(const std::vector<std::string>& lines);

    std::string trim(const std::string& value);
}

} // namespace DrawForm

#endif // DRAWFORM_TEXT_SANITIZER_H
