#include "fill_common.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace DrawForm {
namespace FileUtil {

std::string temporarySiblingPath(const std::string& finalPath) {
    return finalPath + ".partial";
}

bool commitTemporaryFile(const std::string& tmpPath, const std::string& finalPath,
                         std::string& error) {
    std::error_code ec;
    fs::rename(tmpPath, finalPath, ec);
    if (!ec) {
        return true;
    }

    // rename() fails across filesystems; copy onto the destination's
    // filesystem first, then rename there
    bool moved = copyIntoPlace(tmpPath, finalPath, error);
    discardTemporaryFile(tmpPath);
    return moved;
}

bool copyIntoPlace(const std::string& sourcePath, const std::string& finalPath,
                   std::string& error) {
    std::string staged = finalPath + ".staged";
    std::error_code ec;
    fs::copy_file(sourcePath, staged, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "Failed to copy " + sourcePath + " to " + staged + ": " + ec.message();
        discardTemporaryFile(staged);
        return false;
    }

    fs::rename(staged, finalPath, ec);
    if (ec) {
        error = "Failed to move " + staged + " to " + finalPath + ": " + ec.message();
        discardTemporaryFile(staged);
        return false;
    }
    return true;
}

void discardTemporaryFile(const std::string& tmpPath) {
    std::error_code ec;
    fs::remove(tmpPath, ec);
}

bool samePath(const std::string& a, const std::string& b) {
    std::error_code ec;
    if (!fs::exists(a, ec) || !fs::exists(b, ec)) {
        return false;
    }
    bool same = fs::equivalent(a, b, ec);
    return !ec && same;
}

bool readFile(const std::string& path, std::string& out, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "Failed to open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "Failed to read file: " + path;
        return false;
    }
    out = buffer.str();
    return true;
}

} // namespace FileUtil
} // namespace DrawForm
