#include "office_converter.h"
#include "fill_common.h"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace DrawForm {

#if defined(_WIN32)
static const char* const DISCARD_OUTPUT = " >nul 2>&1";
#else
static const char* const DISCARD_OUTPUT = " >/dev/null 2>&1";
#endif

const char* conversionStatusName(ConversionStatus status) {
    switch (status) {
        case ConversionStatus::Converted:            return "converted";
        case ConversionStatus::ConverterUnavailable: return "converter unavailable";
        case ConversionStatus::ConverterFailed:      return "converter failed";
        case ConversionStatus::OutputMissing:        return "converter produced no output";
        case ConversionStatus::FillFailed:           return "template fill failed";
    }
    return "unknown";
}

OfficeConverter::OfficeConverter(const std::string& executable)
    : executable_(executable) {
}

std::string OfficeConverter::quote(const std::string& arg) {
    return "\"" + arg + "\"";
}

bool OfficeConverter::respondsToVersion(const std::string& candidate) {
    std::string cmd = quote(candidate) + " --version" + DISCARD_OUTPUT;
    return std::system(cmd.c_str()) == 0;
}

std::string OfficeConverter::findExecutable() const {
    if (!executable_.empty()) {
        return respondsToVersion(executable_) ? executable_ : "";
    }

    std::vector<std::string> candidates = {
        "soffice",
        "libreoffice",
#if defined(_WIN32)
        "C:\\Program Files\\LibreOffice\\program\\soffice.exe",
#elif defined(__APPLE__)
        "/Applications/LibreOffice.app/Contents/MacOS/soffice",
#endif
    };

    for (const auto& candidate : candidates) {
        if (respondsToVersion(candidate)) return candidate;
    }
    return "";
}

ConversionResult OfficeConverter::convertToPdf(const std::string& docxPath,
                                               const std::string& pdfPath,
                                               bool keepIntermediate) const {
    ConversionResult result;
    result.intermediatePath = docxPath;

    std::string exe = findExecutable();
    if (exe.empty()) {
        result.status = ConversionStatus::ConverterUnavailable;
        result.message = "LibreOffice (soffice) is not installed or not on PATH";
        return result;
    }

    fs::path input(docxPath);
    fs::path outDir = input.parent_path().empty() ? fs::path(".") : input.parent_path();
    fs::path produced = outDir / input.stem();
    produced += ".pdf";

    // A stale PDF from an earlier run would be mistaken for fresh output
    std::error_code ec;
    if (!FileUtil::samePath(produced.string(), pdfPath)) {
        fs::remove(produced, ec);
    }

    std::string cmd = quote(exe) + " --headless --convert-to pdf --outdir " +
                      quote(outDir.string()) + " " + quote(docxPath) + DISCARD_OUTPUT;
    int rc = std::system(cmd.c_str());
    if (rc != 0) {
        result.status = ConversionStatus::ConverterFailed;
        result.message = "LibreOffice exited with status " + std::to_string(rc);
        return result;
    }

    if (!fs::exists(produced, ec)) {
        result.status = ConversionStatus::OutputMissing;
        result.message = "LibreOffice did not produce " + produced.string();
        return result;
    }

    if (produced != fs::path(pdfPath)) {
        std::string error;
        if (!FileUtil::commitTemporaryFile(produced.string(), pdfPath, error)) {
            result.status = ConversionStatus::OutputMissing;
            result.message = error;
            return result;
        }
    }

    result.status = ConversionStatus::Converted;
    result.outputPath = pdfPath;
    if (!keepIntermediate) {
        fs::remove(docxPath, ec);
        result.intermediatePath.clear();
    }
    return result;
}

} // namespace DrawForm
