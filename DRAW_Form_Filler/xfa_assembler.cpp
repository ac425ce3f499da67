#include "xfa_assembler.h"
#include "text_sanitizer.h"

#include <stdexcept>

namespace DrawForm {

// ============================================================================
// XfaFieldSchema Implementation
// ============================================================================

const std::string* XfaFieldSchema::pathFor(XfaField field) const {
    for (const auto& entry : fields) {
        if (entry.field == field) return &entry.path;
    }
    return nullptr;
}

const std::string* XfaFieldSchema::pathFor(XfaRowField field) const {
    for (const auto& entry : rowFields) {
        if (entry.field == field) return &entry.path;
    }
    return nullptr;
}

XfaFieldSchema XfaFieldSchema::dd2977() {
    XfaFieldSchema schema;
    schema.fields = {
        {XfaField::MissionTask,              "form1/Page1/One"},
        {XfaField::Date,                     "form1/Page1/Two"},
        {XfaField::PreparerName,             "form1/Page1/A"},
        {XfaField::PreparerRank,             "form1/Page1/B"},
        {XfaField::PreparerDutyTitle,        "form1/Page1/C"},
        {XfaField::PreparerUnit,             "form1/Page1/D"},
        {XfaField::PreparerEmail,            "form1/Page1/E"},
        {XfaField::PreparerTelephone,        "form1/Page1/F"},
        {XfaField::PreparerUicCin,           "form1/Page1/G"},
        {XfaField::PreparerSupportReference, "form1/Page1/H"},
        {XfaField::SupervisionPlan,          "form1/Page1/Eleven"},
        {XfaField::RiskExtremelyHigh,        "form1/Page1/Ten/EHigh"},
        {XfaField::RiskHigh,                 "form1/Page1/Ten/High"},
        {XfaField::RiskMedium,               "form1/Page1/Ten/Med"},
        {XfaField::RiskLow,                  "form1/Page1/Ten/Low"},
        {XfaField::Approve,                  "form1/Page1/Twelve/Approve"},
        {XfaField::Disapprove,               "form1/Page1/Twelve/Disapprove"},
        {XfaField::HazardTable,              "form1/Page1/Part4thru9"},
    };
    schema.rowTag = "Row1";
    schema.rowFields = {
        {XfaRowField::SubtaskName,       "Subtask-Substep"},
        {XfaRowField::Hazard,            "Hazard"},
        {XfaRowField::InitialRiskLevel,  "InitialRiskLevel"},
        {XfaRowField::Control,           "Control"},
        {XfaRowField::How,               "Table2/Row1/TextField1"},
        {XfaRowField::Who,               "Table2/Row2/TextField2"},
        {XfaRowField::ResidualRiskLevel, "RRL"},
    };
    return schema;
}

// ============================================================================
// XfaFieldMap Implementation
// ============================================================================

XfaFieldMap::XfaFieldMap(const XfaFieldSchema& schema, const pugi::xml_node& dataNode) {
    for (const auto& entry : schema.fields) {
        Slot slot{entry.field, entry.path, XmlUtil::findPath(dataNode, entry.path)};
        slots_.push_back(slot);
    }
}

pugi::xml_node XfaFieldMap::find(XfaField field) const {
    for (const auto& slot : slots_) {
        if (slot.field == field) return slot.element;
    }
    return pugi::xml_node();
}

const std::string& XfaFieldMap::pathOf(XfaField field) const {
    static const std::string unmapped = "(unmapped)";
    for (const auto& slot : slots_) {
        if (slot.field == field) return slot.path;
    }
    return unmapped;
}

// ============================================================================
// OneHotGroup Implementation
// ============================================================================

void OneHotGroup::add(const pugi::xml_node& indicator) {
    indicators_.push_back(indicator);
}

void OneHotGroup::clear() {
    for (auto& node : indicators_) {
        if (node) node.text().set("0");
    }
}

void OneHotGroup::select(size_t index) {
    clear();
    if (index < indicators_.size() && indicators_[index]) {
        indicators_[index].text().set("1");
    }
}

int OneHotGroup::activeCount() const {
    int active = 0;
    for (const auto& node : indicators_) {
        if (node && XmlUtil::elementText(node) == "1") ++active;
    }
    return active;
}

// ============================================================================
// XfaAssembler Implementation
// ============================================================================

XfaAssembler::XfaAssembler(const XfaFieldSchema& schema)
    : schema_(schema) {
}

void XfaAssembler::assemble(const NormalizedRecord& record, XfaDatasets& datasets,
                            AssemblyReport& report) {
    if (!datasets.isLoaded()) {
        throw TemplateStructureError("XFA datasets packet not loaded");
    }
    if (!datasets.claimForAssembly()) {
        throw std::logic_error("XFA datasets handle has already been assembled");
    }

    XfaFieldMap map(schema_, datasets.dataNode());
    const Preparer& prep = record.preparedBy;

    // Block 1-5: single-instance fields
    writeField(map, XfaField::MissionTask, TextUtil::sanitize(record.missionTask), report);
    writeField(map, XfaField::Date, TextUtil::stripNonDigits(TextUtil::sanitize(record.date)), report);
    writeField(map, XfaField::PreparerName, TextUtil::sanitize(prep.name), report);
    writeField(map, XfaField::PreparerRank, TextUtil::sanitize(prep.rankGrade), report);
    writeField(map, XfaField::PreparerDutyTitle, TextUtil::sanitize(prep.dutyTitle), report);
    writeField(map, XfaField::PreparerUnit, TextUtil::sanitize(prep.unit), report);
    writeField(map, XfaField::PreparerEmail, TextUtil::sanitize(prep.workEmail), report);
    writeField(map, XfaField::PreparerTelephone, TextUtil::sanitize(prep.telephone), report);
    writeField(map, XfaField::PreparerUicCin, TextUtil::sanitize(prep.uicCin), report);
    writeField(map, XfaField::PreparerSupportReference, TextUtil::sanitize(prep.supportReference), report);
    writeField(map, XfaField::SupervisionPlan, TextUtil::sanitize(record.supervisionPlan), report);

    // Block 10 and 12
    applyOverallRisk(map, record, report);
    applyApproval(map, record.approval, report);

    // Part 4 through 9
    expandHazardTable(map, record.subtasks, report);
}

void XfaAssembler::writeField(const XfaFieldMap& map, XfaField field, const std::string& value,
                              AssemblyReport& report) {
    pugi::xml_node node = map.find(field);
    if (!node) {
        report.noteMissing(map.pathOf(field));
        return;
    }
    node.text().set(value.c_str());
}

void XfaAssembler::applyOverallRisk(const XfaFieldMap& map, const NormalizedRecord& record,
                                    AssemblyReport& report) {
    // Same order as RiskLevel
    const XfaField indicators[] = {
        XfaField::RiskExtremelyHigh, XfaField::RiskHigh, XfaField::RiskMedium, XfaField::RiskLow
    };

    OneHotGroup group;
    for (XfaField field : indicators) {
        pugi::xml_node node = map.find(field);
        if (!node) report.noteMissing(map.pathOf(field));
        group.add(node);
    }

    std::optional<RiskLevel> level = record.overallRiskLevel;
    if (!level) {
        level = parseRiskLevel(TextUtil::sanitize(record.overallRiskText));
    }

    if (level) {
        group.select(static_cast<size_t>(*level));
    } else {
        group.clear();
    }
}

void XfaAssembler::applyApproval(const XfaFieldMap& map, const ApprovalDecision& approval,
                                 AssemblyReport& report) {
    // Written independently; a record may carry both
    writeField(map, XfaField::Approve, approval.approve ? "1" : "0", report);
    writeField(map, XfaField::Disapprove, approval.disapprove ? "1" : "0", report);
}

void XfaAssembler::expandHazardTable(const XfaFieldMap& map,
                                     const std::vector<SubtaskEntry>& subtasks,
                                     AssemblyReport& report) {
    pugi::xml_node table = map.find(XfaField::HazardTable);
    if (!table) {
        report.noteMissing(map.pathOf(XfaField::HazardTable));
        return;
    }

    const std::string tablePath = map.pathOf(XfaField::HazardTable);
    pugi::xml_node firstRow = table.child(schema_.rowTag.c_str());
    if (!firstRow) {
        report.noteMissing(tablePath + "/" + schema_.rowTag);
        return;
    }

    // Detached copy held in its own document; only ever cloned from
    pugi::xml_document holder;
    pugi::xml_node prototype = holder.append_copy(firstRow);

    for (const auto& rowField : schema_.rowFields) {
        if (!XmlUtil::findPath(prototype, rowField.path)) {
            report.noteMissing(tablePath + "/" + schema_.rowTag + "/" + rowField.path);
        }
    }

    // Drop every existing instance, including the one the prototype came from
    pugi::xml_node row = table.child(schema_.rowTag.c_str());
    while (row) {
        pugi::xml_node next = row.next_sibling(schema_.rowTag.c_str());
        table.remove_child(row);
        row = next;
    }

    for (const auto& entry : subtasks) {
        pugi::xml_node clone = table.append_copy(prototype);
        fillHazardRow(clone, entry);
        report.entriesWritten++;
    }
}

void XfaAssembler::fillHazardRow(pugi::xml_node row, const SubtaskEntry& entry) {
    auto put = [&](XfaRowField field, const std::string& value) {
        const std::string* path = schema_.pathFor(field);
        if (!path) return;
        pugi::xml_node cell = XmlUtil::findPath(row, *path);
        if (cell) cell.text().set(value.c_str());
    };

    put(XfaRowField::SubtaskName, TextUtil::sanitize(entry.name));
    put(XfaRowField::Hazard, TextUtil::sanitize(entry.hazard));
    put(XfaRowField::InitialRiskLevel, TextUtil::toUpperAscii(TextUtil::sanitize(entry.initialRiskLevel)));
    put(XfaRowField::Control, TextUtil::sanitize(TextUtil::joinLines(entry.controls)));
    put(XfaRowField::How, TextUtil::sanitize(TextUtil::joinLines(entry.how)));
    put(XfaRowField::Who, TextUtil::sanitize(TextUtil::joinLines(entry.who)));
    put(XfaRowField::ResidualRiskLevel, TextUtil::toUpperAscii(TextUtil::sanitize(entry.residualRiskLevel)));
}

} // namespace DrawForm
