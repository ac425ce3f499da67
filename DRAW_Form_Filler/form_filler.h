#ifndef DRAWFORM_FORM_FILLER_H
#define DRAWFORM_FORM_FILLER_H

#include <string>

#include "docx_assembler.h"
#include "draw_record.h"
#include "fill_common.h"
#include "office_converter.h"
#include "xfa_assembler.h"

namespace DrawForm {

// Per-call settings. Nothing here is global; two fills with different
// configs may run side by side against the same read-only templates.
struct FillConfig {
    std::string templateAssetPath;   // DD2977 PDF with XFA datasets
    std::string outputPath;          // Filled PDF
    std::string docxTemplatePath;    // Optional Word rendition of the form
    std::string previewPath;         // Optional preview PDF
    std::string converterPath;       // Optional soffice override
    bool keepIntermediate = false;   // Keep the filled DOCX after conversion
    bool verbose = false;
};

// One fill per method call: open template -> assemble -> write. Library
// exceptions stop at this boundary; callers get false and getLastError().
class FormFiller {
public:
    FormFiller();

    void setSchema(const XfaFieldSchema& schema) { schema_ = schema; }
    void setLayout(const DocxGridLayout& layout) { layout_ = layout; }

    // Tree target: fill the XFA datasets and write config.outputPath
    bool fillPdf(const NormalizedRecord& record, const FillConfig& config, AssemblyReport& report);

    // Tabular target without conversion: fill the DOCX template into docxOutput
    bool fillDocx(const NormalizedRecord& record, const std::string& docxTemplate,
                  const std::string& docxOutput, AssemblyReport& report, bool verbose = false);

    // Preview: DOCX fill + external conversion when a DOCX template is set.
    // Falls back to copying the filled PDF. A conversion failure is reported
    // in conversion and is not fatal; false only when no preview could be
    // produced at all.
    bool renderPreview(const NormalizedRecord& record, const FillConfig& config,
                       AssemblyReport& report, ConversionResult& conversion);

    const std::string& getLastError() const { return lastError_; }

private:
    XfaFieldSchema schema_;
    DocxGridLayout layout_;
    std::string lastError_;

    bool copyFallbackPreview(const FillConfig& config);
    static void printMisses(const char* target, const AssemblyReport& report);
};

} // namespace DrawForm

#endif // DRAWFORM_FORM_FILLER_H
