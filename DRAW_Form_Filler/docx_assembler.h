#ifndef DRAWFORM_DOCX_ASSEMBLER_H
#define DRAWFORM_DOCX_ASSEMBLER_H

#include <string>

#include "docx_table.h"
#include "draw_record.h"
#include "fill_common.h"

namespace DrawForm {

// Grid address: row index and grid column index in the form table
struct CellAddress {
    int row;
    int column;
};

// Fixed geometry of the DD2977 Word table. Header cells carry printed labels
// and receive the value appended; hazard rows come in pairs.
struct DocxGridLayout {
    CellAddress missionTask;
    CellAddress date;
    CellAddress preparerName;
    CellAddress preparerRank;
    CellAddress preparerDutyTitle;
    CellAddress preparerUnit;
    CellAddress preparerEmail;
    CellAddress preparerTelephone;
    CellAddress preparerUicCin;
    CellAddress preparerSupportReference;

    int reservedFirstRow;       // Subtask / hazard / controls row of entry 0
    int reservedSecondRow;      // "Who" row of entry 0

    // Columns in the first row of a pair, except whoColumn (second row)
    int nameColumn;
    int hazardColumn;
    int initialRiskColumn;
    int controlColumn;
    int howColumn;
    int whoColumn;
    int residualRiskColumn;

    int trailerColumn;          // Overall residual risk, row below the last pair

    static DocxGridLayout dd2977();
};

// Table assembler: fills the DD2977 Word table, replicating the reserved row
// pair once per additional subtask
class DocxAssembler {
public:
    explicit DocxAssembler(const DocxGridLayout& layout = DocxGridLayout::dd2977());

    // Throws std::logic_error if the handle was already assembled and
    // TemplateStructureError if the reserved rows are not in the table.
    // report.trailerRow receives the final overall-risk row index.
    void assemble(const NormalizedRecord& record, DocxTemplate& docx, AssemblyReport& report);

private:
    DocxGridLayout layout_;

    void writeLabel(DocxTable& table, const CellAddress& at, const std::string& value,
                    const char* name, AssemblyReport& report);
    void writeCell(DocxTable& table, int row, int column, const std::string& value,
                   const char* name, AssemblyReport& report);
    void fillEntry(DocxTable& table, int firstRow, int secondRow, const SubtaskEntry& entry,
                   AssemblyReport& report);
};

} // namespace DrawForm

#endif // DRAWFORM_DOCX_ASSEMBLER_H
