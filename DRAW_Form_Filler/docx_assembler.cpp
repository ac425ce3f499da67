#include "docx_assembler.h"
#include "text_sanitizer.h"

#include <stdexcept>

namespace DrawForm {

// ============================================================================
// DocxGridLayout
// ============================================================================

DocxGridLayout DocxGridLayout::dd2977() {
    DocxGridLayout layout;
    layout.missionTask              = {1, 0};
    layout.date                     = {1, 13};
    layout.preparerName             = {3, 0};
    layout.preparerRank             = {3, 7};
    layout.preparerDutyTitle        = {3, 11};
    layout.preparerUnit             = {4, 0};
    layout.preparerEmail            = {4, 2};
    layout.preparerTelephone        = {4, 9};
    layout.preparerUicCin           = {5, 0};
    layout.preparerSupportReference = {5, 2};

    layout.reservedFirstRow  = 8;
    layout.reservedSecondRow = 9;

    layout.nameColumn         = 1;
    layout.hazardColumn       = 3;
    layout.initialRiskColumn  = 5;
    layout.controlColumn      = 8;
    layout.howColumn          = 12;
    layout.whoColumn          = 12;
    layout.residualRiskColumn = 14;

    layout.trailerColumn = 0;
    return layout;
}

// ============================================================================
// DocxAssembler Implementation
// ============================================================================

DocxAssembler::DocxAssembler(const DocxGridLayout& layout)
    : layout_(layout) {
}

void DocxAssembler::assemble(const NormalizedRecord& record, DocxTemplate& docx,
                             AssemblyReport& report) {
    DocxTable& table = docx.table();
    if (!docx.claimForAssembly()) {
        throw std::logic_error("DOCX template handle has already been assembled");
    }
    if (layout_.reservedSecondRow != layout_.reservedFirstRow + 1 ||
        !table.row(layout_.reservedFirstRow) || !table.row(layout_.reservedSecondRow)) {
        throw TemplateStructureError("DOCX table has no reserved hazard rows at " +
                                     std::to_string(layout_.reservedFirstRow) + "/" +
                                     std::to_string(layout_.reservedSecondRow));
    }

    // Header block
    const Preparer& prep = record.preparedBy;
    writeLabel(table, layout_.missionTask, TextUtil::sanitize(record.missionTask), "mission_task", report);
    writeLabel(table, layout_.date, TextUtil::sanitize(record.date), "date", report);
    writeLabel(table, layout_.preparerName, TextUtil::sanitize(prep.name), "name", report);
    writeLabel(table, layout_.preparerRank, TextUtil::sanitize(prep.rankGrade), "rank_grade", report);
    writeLabel(table, layout_.preparerDutyTitle, TextUtil::sanitize(prep.dutyTitle), "duty_title", report);
    writeLabel(table, layout_.preparerUnit, TextUtil::sanitize(prep.unit), "unit", report);
    writeLabel(table, layout_.preparerEmail, TextUtil::sanitize(prep.workEmail), "work_email", report);
    writeLabel(table, layout_.preparerTelephone, TextUtil::sanitize(prep.telephone), "telephone", report);
    writeLabel(table, layout_.preparerUicCin, TextUtil::sanitize(prep.uicCin), "uic_cin", report);
    writeLabel(table, layout_.preparerSupportReference, TextUtil::sanitize(prep.supportReference),
               "training_support", report);

    // Snapshot the reserved pair before entry 0 overwrites it; every inserted
    // pair is copied from these, never from a populated row
    pugi::xml_document firstSnapshot;
    pugi::xml_document secondSnapshot;
    pugi::xml_node firstPrototype = firstSnapshot.append_copy(table.row(layout_.reservedFirstRow));
    pugi::xml_node secondPrototype = secondSnapshot.append_copy(table.row(layout_.reservedSecondRow));

    int lastSecondRow = layout_.reservedSecondRow;

    if (record.subtasks.empty()) {
        fillEntry(table, layout_.reservedFirstRow, layout_.reservedSecondRow, SubtaskEntry(), report);
    }

    for (size_t i = 0; i < record.subtasks.size(); ++i) {
        int firstRow = layout_.reservedFirstRow;
        int secondRow = layout_.reservedSecondRow;

        if (i > 0) {
            // Both copies go in after the same anchor: the second row first,
            // then the first row ahead of it, giving (first, second)
            if (!table.insertRowCopyAfter(lastSecondRow, secondPrototype) ||
                !table.insertRowCopyAfter(lastSecondRow, firstPrototype)) {
                throw TemplateStructureError("DOCX table row " + std::to_string(lastSecondRow) +
                                             " vanished while inserting hazard rows");
            }

            firstRow = lastSecondRow + 1;
            secondRow = lastSecondRow + 2;
            lastSecondRow += 2;
        }

        fillEntry(table, firstRow, secondRow, record.subtasks[i], report);
        report.entriesWritten++;
    }

    // Overall residual risk sits one row below the last "Who" row
    int trailerRow = lastSecondRow + 1;
    report.trailerRow = trailerRow;
    std::string overall = TextUtil::toUpperAscii(TextUtil::sanitize(record.overallRiskText));
    writeLabel(table, CellAddress{trailerRow, layout_.trailerColumn}, "  " + overall,
               "overall_residual_risk_level", report);
}

void DocxAssembler::writeLabel(DocxTable& table, const CellAddress& at, const std::string& value,
                               const char* name, AssemblyReport& report) {
    if (!table.appendCellLabel(at.row, at.column, value)) {
        report.noteMissing(std::string(name) + " (" + std::to_string(at.row) + "," +
                           std::to_string(at.column) + ")");
    }
}

void DocxAssembler::writeCell(DocxTable& table, int row, int column, const std::string& value,
                              const char* name, AssemblyReport& report) {
    if (!table.setCellText(row, column, value)) {
        report.noteMissing(std::string(name) + " (" + std::to_string(row) + "," +
                           std::to_string(column) + ")");
    }
}

void DocxAssembler::fillEntry(DocxTable& table, int firstRow, int secondRow,
                              const SubtaskEntry& entry, AssemblyReport& report) {
    writeCell(table, firstRow, layout_.nameColumn, TextUtil::sanitize(entry.name), "subtask", report);
    writeCell(table, firstRow, layout_.hazardColumn, TextUtil::sanitize(entry.hazard), "hazard", report);
    writeCell(table, firstRow, layout_.initialRiskColumn, TextUtil::sanitize(entry.initialRiskLevel),
              "initial_risk_level", report);
    writeCell(table, firstRow, layout_.controlColumn,
              TextUtil::sanitize(TextUtil::joinLines(entry.controls)), "control", report);
    writeCell(table, firstRow, layout_.howColumn,
              TextUtil::sanitize(TextUtil::joinLines(entry.how)), "how", report);
    writeCell(table, secondRow, layout_.whoColumn,
              TextUtil::sanitize(TextUtil::joinLines(entry.who)), "who", report);
    writeCell(table, firstRow, layout_.residualRiskColumn, TextUtil::sanitize(entry.residualRiskLevel),
              "residual_risk_level", report);
}

} // namespace DrawForm
