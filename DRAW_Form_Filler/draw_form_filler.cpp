// draw_form_filler.cpp - Fill the DD2977 Deliberate Risk Assessment Worksheet
//
// Takes the DRAW JSON produced upstream and writes it into:
//   1. the XFA datasets packet of the fillable DD2977 PDF (--template/--output)
//   2. optionally, the Word rendition of the form, converted to a preview PDF
//      through LibreOffice (--docx-template/--preview)
//
// Build with CMake (see the top-level CMakeLists.txt); links qpdf, miniz,
// pugixml and nlohmann_json.

#include <iostream>
#include <string>

#include "draw_record.h"
#include "form_filler.h"

using namespace DrawForm;

static const char* const TOOL_VERSION = "1.0";

static void printUsage(const char* progName) {
    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "DRAW Form Filler v" << TOOL_VERSION << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Fill a DD2977 risk assessment worksheet from DRAW JSON\n";
    std::cout << "\n";
    std::cout << "Usage:\n";
    std::cout << "  " << progName << " --input <draw.json> --template <dd2977.pdf> --output <filled.pdf> [options]\n";
    std::cout << "\n";
    std::cout << "Required:\n";
    std::cout << "  --input <file>          DRAW record (JSON)\n";
    std::cout << "  --template <file>       Fillable DD2977 PDF (XFA form)\n";
    std::cout << "  --output <file>         Filled PDF to write\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --docx-template <file>  Word version of the form, used for the preview\n";
    std::cout << "  --preview <file>        Preview PDF to write. Without --docx-template, or\n";
    std::cout << "                          when conversion fails, the filled PDF is copied.\n";
    std::cout << "  --soffice <path>        LibreOffice executable (default: soffice on PATH)\n";
    std::cout << "  --keep-intermediate     Keep the filled .temp.docx next to the preview\n";
    std::cout << "  --verbose, -v           Show template details and skipped fields\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --input draw.json --template dd2977.pdf --output dd2977_filled.pdf\n";
    std::cout << "\n";
    std::cout << "  " << progName << " --input draw.json --template dd2977.pdf --output dd2977_filled.pdf \\\n";
    std::cout << "      --docx-template dd2977.docx --preview dd2977_preview.pdf\n";
    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "\n";
}

static void printError(const std::string& message) {
    std::cerr << "\n";
    std::cerr << "=============================================================================\n";
    std::cerr << "ERROR\n";
    std::cerr << "=============================================================================\n";
    std::cerr << message << "\n";
    std::cerr << "=============================================================================\n";
    std::cerr << "\n";
}

static void printAiAssessment(const AiAssessment& ai) {
    if (!ai.present) return;

    std::cout << "AI assessment:\n";
    if (ai.confidenceScore >= 0) {
        std::cout << "  Confidence:       " << ai.confidenceScore << "/100\n";
    }
    for (const auto& area : ai.areasForReview) {
        std::cout << "  Review:           " << area << "\n";
    }
    if (!ai.rationale.empty()) {
        std::cout << "  Rationale:        " << ai.rationale << "\n";
    }
    std::cout << "\n";
}

static bool takeValue(int argc, char* argv[], int& i, const std::string& flag, std::string& out) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires an argument\n";
        return false;
    }
    out = argv[++i];
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    FillConfig config;
    std::string inputPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--input") {
            if (!takeValue(argc, argv, i, arg, inputPath)) return 1;
        }
        else if (arg == "--template") {
            if (!takeValue(argc, argv, i, arg, config.templateAssetPath)) return 1;
        }
        else if (arg == "--output") {
            if (!takeValue(argc, argv, i, arg, config.outputPath)) return 1;
        }
        else if (arg == "--docx-template") {
            if (!takeValue(argc, argv, i, arg, config.docxTemplatePath)) return 1;
        }
        else if (arg == "--preview") {
            if (!takeValue(argc, argv, i, arg, config.previewPath)) return 1;
        }
        else if (arg == "--soffice") {
            if (!takeValue(argc, argv, i, arg, config.converterPath)) return 1;
        }
        else if (arg == "--keep-intermediate") {
            config.keepIntermediate = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (inputPath.empty() || config.templateAssetPath.empty() || config.outputPath.empty()) {
        std::cerr << "Error: --input, --template and --output are required\n";
        printUsage(argv[0]);
        return 1;
    }
    if (!config.docxTemplatePath.empty() && config.previewPath.empty()) {
        std::cerr << "Error: --docx-template requires --preview\n";
        return 1;
    }

    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "DRAW Form Filler\n";
    std::cout << "=============================================================================\n";
    std::cout << "Input record:     " << inputPath << "\n";
    std::cout << "PDF template:     " << config.templateAssetPath << "\n";
    std::cout << "Output PDF:       " << config.outputPath << "\n";
    if (!config.previewPath.empty()) {
        std::cout << "DOCX template:    " << (config.docxTemplatePath.empty() ? "(none, copy PDF)"
                                                                          : config.docxTemplatePath) << "\n";
        std::cout << "Preview PDF:      " << config.previewPath << "\n";
    }
    std::cout << "=============================================================================\n";
    std::cout << "\n";

    // Load record
    std::cout << "Loading DRAW record...\n";
    NormalizedRecord record;
    RecordLoader loader;
    if (!loader.loadFile(inputPath, record)) {
        printError("Failed to load DRAW record: " + loader.getLastError());
        return 1;
    }
    for (const auto& warning : loader.getWarnings()) {
        std::cerr << "  WARNING: " << warning << "\n";
    }
    std::cout << "  Subtasks:         " << record.subtasks.size() << "\n";
    std::cout << "  Overall risk:     "
              << (record.overallRiskLevel ? riskLevelLabel(*record.overallRiskLevel) : "(not set)") << "\n";
    std::cout << "\n";
    printAiAssessment(record.aiAssessment);

    FormFiller filler;

    // Tree target
    std::cout << "Filling XFA form data...\n";
    AssemblyReport pdfReport;
    if (!filler.fillPdf(record, config, pdfReport)) {
        printError("Failed to fill PDF: " + filler.getLastError());
        return 1;
    }
    if (!pdfReport.complete() && !config.verbose) {
        std::cerr << "  WARNING: " << pdfReport.missingFields.size()
                  << " field(s) not present in template (use --verbose to list)\n";
    }

    // Tabular target / preview
    bool previewDegraded = false;
    if (!config.previewPath.empty()) {
        std::cout << "Rendering preview...\n";
        AssemblyReport docxReport;
        ConversionResult conversion;
        if (!filler.renderPreview(record, config, docxReport, conversion)) {
            printError("Failed to render preview: " + filler.getLastError());
            return 1;
        }
        previewDegraded = !config.docxTemplatePath.empty() && !conversion.ok();
    }

    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "SUCCESS\n";
    std::cout << "=============================================================================\n";
    std::cout << "Filled PDF:       " << config.outputPath << "\n";
    std::cout << "Hazard rows:      " << pdfReport.entriesWritten << "\n";
    if (!config.previewPath.empty()) {
        std::cout << "Preview PDF:      " << config.previewPath
                  << (previewDegraded ? " (copy of filled PDF)" : "") << "\n";
    }
    std::cout << "=============================================================================\n";
    std::cout << "\n";
    return 0;
}
