#include "test_harness.h"
#include "test_fixtures.h"
#include "test_runner_util.h"

#include <filesystem>

#include <qpdf/QPDF.hh>

#include "xfa_assembler.h"
#include "xfa_pdf_template.h"

using namespace DrawForm;
using namespace DrawFormTest;

namespace fs = std::filesystem;

static bool filled_datasets_written_back() {
    std::string dir = scratchDir("xfa_fill");
    std::string templatePath = dir + "/dd2977.pdf";
    std::string outputPath = dir + "/filled.pdf";
    TEST_CHECK(writeXfaPdf(templatePath, xfaDatasetsXml()));

    XfaPdfTemplate pdf;
    pdf.open(templatePath);
    TEST_CHECK_EQ(pdf.packetCount(), 4);

    AssemblyReport report;
    XfaAssembler().assemble(sampleRecord(2), pdf.datasets(), report);
    pdf.save(outputPath);
    TEST_CHECK(!fs::exists(outputPath + ".partial"));

    QPDF filled;
    filled.processFile(outputPath.c_str());
    std::string datasets = XfaPdfTemplate::readPacket(filled, "datasets");
    TEST_CHECK(datasets.find("<One>Convoy live fire</One>") != std::string::npos);
    TEST_CHECK(datasets.find("<Subtask-Substep>Subtask 2</Subtask-Substep>") != std::string::npos);
    TEST_CHECK(datasets.find("<?xml") == std::string::npos);

    // Other packets are carried over untouched
    std::string templ = XfaPdfTemplate::readPacket(filled, "template");
    TEST_CHECK(templ.find("xfa-template") != std::string::npos);

    // The source asset is never modified
    QPDF source;
    source.processFile(templatePath.c_str());
    TEST_CHECK(XfaPdfTemplate::readPacket(source, "datasets").find("old mission") != std::string::npos);
    return true;
}

static bool missing_datasets_packet_rejected() {
    std::string dir = scratchDir("xfa_missing");
    std::string templatePath = dir + "/no_datasets.pdf";
    TEST_CHECK(writeXfaPdf(templatePath, "", false));

    bool threw = false;
    try {
        XfaPdfTemplate pdf;
        pdf.open(templatePath);
    } catch (const TemplateStructureError& e) {
        threw = std::string(e.what()).find("datasets") != std::string::npos;
    }
    TEST_CHECK(threw);
    return true;
}

static bool missing_data_node_rejected() {
    std::string dir = scratchDir("xfa_no_data");
    std::string templatePath = dir + "/no_data.pdf";
    TEST_CHECK(writeXfaPdf(templatePath, xfaDatasetsXml({"data"})));

    bool threw = false;
    try {
        XfaPdfTemplate pdf;
        pdf.open(templatePath);
    } catch (const TemplateStructureError&) {
        threw = true;
    }
    TEST_CHECK(threw);
    return true;
}

static bool unreadable_file_rejected() {
    std::string dir = scratchDir("xfa_unreadable");
    std::string bogus = dir + "/not_a.pdf";
    TEST_CHECK(writeBytes(bogus, std::vector<uint8_t>(32, 'x')));

    int failures = 0;
    const std::string paths[] = {bogus, dir + "/absent.pdf"};
    for (const auto& path : paths) {
        try {
            XfaPdfTemplate pdf;
            pdf.open(path);
        } catch (const TemplateStructureError&) {
            failures++;
        }
    }
    TEST_CHECK_EQ(failures, 2);
    return true;
}

bool test_xfa_pdf_template() {
    static const DrawFormTest::Case cases[] = {
        {"filled_datasets_written_back", filled_datasets_written_back},
        {"missing_datasets_packet_rejected", missing_datasets_packet_rejected},
        {"missing_data_node_rejected", missing_data_node_rejected},
        {"unreadable_file_rejected", unreadable_file_rejected},
    };
    return DrawFormTest::runCases(cases);
}
