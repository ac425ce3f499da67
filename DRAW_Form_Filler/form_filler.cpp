#include "form_filler.h"
#include "docx_table.h"
#include "xfa_pdf_template.h"

#include <exception>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace DrawForm {

FormFiller::FormFiller()
    : schema_(XfaFieldSchema::dd2977()), layout_(DocxGridLayout::dd2977()) {
}

void FormFiller::printMisses(const char* target, const AssemblyReport& report) {
    for (const auto& field : report.missingFields) {
        std::cerr << "  WARNING: " << target << " template has no field " << field << " (skipped)\n";
    }
}

bool FormFiller::fillPdf(const NormalizedRecord& record, const FillConfig& config,
                         AssemblyReport& report) {
    lastError_.clear();

    if (config.templateAssetPath.empty() || config.outputPath.empty()) {
        lastError_ = "Template and output paths are required";
        return false;
    }
    if (FileUtil::samePath(config.templateAssetPath, config.outputPath)) {
        lastError_ = "Output path must differ from the template: " + config.outputPath;
        return false;
    }

    try {
        XfaPdfTemplate pdf;
        pdf.open(config.templateAssetPath);
        if (config.verbose) {
            std::cout << "  XFA packets:      " << pdf.packetCount() / 2 << "\n";
        }

        XfaAssembler assembler(schema_);
        assembler.assemble(record, pdf.datasets(), report);
        if (config.verbose) {
            std::cout << "  Hazard rows:      " << report.entriesWritten << "\n";
            printMisses("PDF", report);
        }

        pdf.save(config.outputPath);
    } catch (TemplateStructureError& e) {
        lastError_ = e.what();
        return false;
    } catch (std::exception& e) {
        lastError_ = std::string("PDF fill failed: ") + e.what();
        return false;
    }
    return true;
}

bool FormFiller::fillDocx(const NormalizedRecord& record, const std::string& docxTemplate,
                          const std::string& docxOutput, AssemblyReport& report, bool verbose) {
    lastError_.clear();

    if (FileUtil::samePath(docxTemplate, docxOutput)) {
        lastError_ = "Output path must differ from the template: " + docxOutput;
        return false;
    }

    try {
        DocxTemplate docx;
        docx.open(docxTemplate);

        DocxAssembler assembler(layout_);
        assembler.assemble(record, docx, report);
        if (verbose) {
            std::cout << "  Table rows:       " << docx.table().rowCount()
                      << " (overall risk at row " << report.trailerRow << ")\n";
            printMisses("DOCX", report);
        }

        docx.save(docxOutput);
    } catch (TemplateStructureError& e) {
        lastError_ = e.what();
        return false;
    } catch (std::exception& e) {
        lastError_ = std::string("DOCX fill failed: ") + e.what();
        return false;
    }
    return true;
}

bool FormFiller::copyFallbackPreview(const FillConfig& config) {
    std::string error;
    if (!FileUtil::copyIntoPlace(config.outputPath, config.previewPath, error)) {
        lastError_ = error;
        return false;
    }
    return true;
}

bool FormFiller::renderPreview(const NormalizedRecord& record, const FillConfig& config,
                               AssemblyReport& report, ConversionResult& conversion) {
    lastError_.clear();
    conversion = ConversionResult();

    if (config.previewPath.empty()) {
        lastError_ = "No preview path configured";
        return false;
    }

    if (!config.docxTemplatePath.empty()) {
        fs::path intermediate(config.previewPath);
        intermediate.replace_extension(".temp.docx");
        conversion.intermediatePath = intermediate.string();

        if (fillDocx(record, config.docxTemplatePath, intermediate.string(), report, config.verbose)) {
            OfficeConverter converter(config.converterPath);
            conversion = converter.convertToPdf(intermediate.string(), config.previewPath,
                                                config.keepIntermediate);
            if (conversion.ok()) {
                return true;
            }
            std::cerr << "  WARNING: DOCX conversion failed (" << conversionStatusName(conversion.status)
                      << "): " << conversion.message << "\n";
            std::cerr << "           Filled DOCX kept at " << conversion.intermediatePath << "\n";
        } else {
            conversion.status = ConversionStatus::FillFailed;
            conversion.intermediatePath.clear();
            conversion.message = lastError_;
            std::cerr << "  WARNING: DOCX template filling failed: " << lastError_ << "\n";
        }
    }

    if (config.outputPath.empty()) {
        lastError_ = "No filled PDF available for the fallback preview";
        return false;
    }
    return copyFallbackPreview(config);
}

} // namespace DrawForm
