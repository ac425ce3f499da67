#ifndef DRAWFORM_XFA_ASSEMBLER_H
#define DRAWFORM_XFA_ASSEMBLER_H

#include <string>
#include <vector>

#include <pugixml.hpp>

#include "draw_record.h"
#include "fill_common.h"
#include "xfa_datasets.h"

namespace DrawForm {

// Single-instance form fields
enum class XfaField {
    MissionTask,
    Date,
    PreparerName,
    PreparerRank,
    PreparerDutyTitle,
    PreparerUnit,
    PreparerEmail,
    PreparerTelephone,
    PreparerUicCin,
    PreparerSupportReference,
    SupervisionPlan,
    RiskExtremelyHigh,
    RiskHigh,
    RiskMedium,
    RiskLow,
    Approve,
    Disapprove,
    HazardTable
};

// Cells inside one repeated hazard row, relative to the row element
enum class XfaRowField {
    SubtaskName,
    Hazard,
    InitialRiskLevel,
    Control,
    How,
    Who,
    ResidualRiskLevel
};

// Logical field -> element path below xfa:data. Plain value; callers with a
// revised form layout can edit the paths before assembling.
struct XfaFieldSchema {
    struct FieldPath {
        XfaField field;
        std::string path;
    };
    struct RowFieldPath {
        XfaRowField field;
        std::string path;
    };

    std::vector<FieldPath> fields;
    std::string rowTag;                 // Repeated element under HazardTable
    std::vector<RowFieldPath> rowFields;

    const std::string* pathFor(XfaField field) const;
    const std::string* pathFor(XfaRowField field) const;

    // DD Form 2977 (form1/Page1 layout)
    static XfaFieldSchema dd2977();
};

// Fields of one template instance, resolved once against its data node
class XfaFieldMap {
public:
    XfaFieldMap(const XfaFieldSchema& schema, const pugi::xml_node& dataNode);

    // Empty handle when the template instance does not carry the field
    pugi::xml_node find(XfaField field) const;
    const std::string& pathOf(XfaField field) const;

private:
    struct Slot {
        XfaField field;
        std::string path;
        pugi::xml_node element;
    };
    std::vector<Slot> slots_;
};

// Four risk indicators of which at most one is "1"
class OneHotGroup {
public:
    void add(const pugi::xml_node& indicator);  // Empty slots are kept, never written
    void clear();
    void select(size_t index);                  // clear() first, then set one
    int activeCount() const;

private:
    std::vector<pugi::xml_node> indicators_;
};

// Tree assembler: fills the XFA data tree of DD Form 2977
class XfaAssembler {
public:
    explicit XfaAssembler(const XfaFieldSchema& schema = XfaFieldSchema::dd2977());

    // Mutates datasets in place. Throws std::logic_error if the handle has
    // already been assembled. Absent fields are listed in report.
    void assemble(const NormalizedRecord& record, XfaDatasets& datasets, AssemblyReport& report);

private:
    XfaFieldSchema schema_;

    void writeField(const XfaFieldMap& map, XfaField field, const std::string& value,
                    AssemblyReport& report);
    void applyOverallRisk(const XfaFieldMap& map, const NormalizedRecord& record,
                          AssemblyReport& report);
    void applyApproval(const XfaFieldMap& map, const ApprovalDecision& approval,
                       AssemblyReport& report);
    void expandHazardTable(const XfaFieldMap& map, const std::vector<SubtaskEntry>& subtasks,
                           AssemblyReport& report);
    void fillHazardRow(pugi::xml_node row, const SubtaskEntry& entry);
};

} // namespace DrawForm

#endif // DRAWFORM_XFA_ASSEMBLER_H
