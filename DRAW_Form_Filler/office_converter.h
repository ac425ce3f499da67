#ifndef DRAWFORM_OFFICE_CONVERTER_H
#define DRAWFORM_OFFICE_CONVERTER_H

#include <string>

namespace DrawForm {

enum class ConversionStatus {
    Converted,
    ConverterUnavailable,   // soffice / libreoffice not found
    ConverterFailed,        // Non-zero exit
    OutputMissing,          // Exit 0 but no PDF produced
    FillFailed              // DOCX template could not be filled; converter not run
};

const char* conversionStatusName(ConversionStatus status);

struct ConversionResult {
    ConversionStatus status = ConversionStatus::ConverterUnavailable;
    std::string outputPath;         // Final PDF (valid when Converted)
    std::string intermediatePath;   // DOCX handed to the converter; kept on failure
    std::string message;

    bool ok() const { return status == ConversionStatus::Converted; }
};

// DOCX -> PDF through LibreOffice in headless mode:
//   soffice --headless --convert-to pdf --outdir <dir> <file.docx>
class OfficeConverter {
public:
    // Empty executable: try "soffice" then "libreoffice" on PATH
    explicit OfficeConverter(const std::string& executable = "");

    // Path or command name of a working converter, "" if none answers --version
    std::string findExecutable() const;

    // Produces pdfPath from docxPath. The DOCX is removed after a successful
    // conversion unless keepIntermediate is set; after a failure it is left
    // in place for the caller.
    ConversionResult convertToPdf(const std::string& docxPath, const std::string& pdfPath,
                                  bool keepIntermediate) const;

private:
    std::string executable_;

    static bool respondsToVersion(const std::string& candidate);
    static std::string quote(const std::string& arg);
};

} // namespace DrawForm

#endif // DRAWFORM_OFFICE_CONVERTER_H
