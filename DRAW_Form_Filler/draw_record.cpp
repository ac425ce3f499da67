#include "draw_record.h"
#include "fill_common.h"
#include "text_sanitizer.h"

#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace DrawForm {

// ============================================================================
// Risk levels
// ============================================================================

std::optional<RiskLevel> parseRiskLevel(const std::string& text) {
    std::string key = TextUtil::toUpperAscii(TextUtil::trim(text));
    for (auto& ch : key) {
        if (ch == '-' || ch == '_') ch = ' ';
    }

    if (key == "EH" || key == "EXTREMELY HIGH") return RiskLevel::ExtremelyHigh;
    if (key == "H" || key == "HIGH") return RiskLevel::High;
    if (key == "M" || key == "MED" || key == "MEDIUM") return RiskLevel::Medium;
    if (key == "L" || key == "LOW") return RiskLevel::Low;
    return std::nullopt;
}

const char* riskLevelCode(RiskLevel level) {
    switch (level) {
        case RiskLevel::ExtremelyHigh: return "EH";
        case RiskLevel::High:          return "H";
        case RiskLevel::Medium:        return "M";
        case RiskLevel::Low:           return "L";
    }
    return "";
}

const char* riskLevelLabel(RiskLevel level) {
    switch (level) {
        case RiskLevel::ExtremelyHigh: return "EXTREMELY HIGH";
        case RiskLevel::High:          return "HIGH";
        case RiskLevel::Medium:        return "MEDIUM";
        case RiskLevel::Low:           return "LOW";
    }
    return "";
}

// ============================================================================
// Tolerant member access
// ============================================================================

namespace {

class MemberReader {
public:
    explicit MemberReader(std::vector<std::string>& warnings) : warnings_(warnings) {}

    // Object member, or nullptr when missing/null. Wrong types are noted.
    const json* object(const json& parent, const char* key, const std::string& where) {
        const json* value = member(parent, key);
        if (!value) return nullptr;
        if (!value->is_object()) {
            warn(where + key, "expected an object");
            return nullptr;
        }
        return value;
    }

    // Scalars are rendered as text (telephone numbers often arrive as numbers)
    std::string text(const json& parent, const char* key, const std::string& where) {
        const json* value = member(parent, key);
        if (!value) return "";
        if (value->is_string()) return value->get<std::string>();
        if (value->is_number() || value->is_boolean()) return value->dump();
        warn(where + key, "expected a string");
        return "";
    }

    bool flag(const json& parent, const char* key, const std::string& where) {
        const json* value = member(parent, key);
        if (!value) return false;
        if (value->is_boolean()) return value->get<bool>();
        warn(where + key, "expected a boolean, treated as false");
        return false;
    }

    // {"values": [...]} statement list. A bare string counts as one statement.
    std::vector<std::string> statements(const json& parent, const char* key,
                                        const std::string& where) {
        std::vector<std::string> out;
        const json* holder = object(parent, key, where);
        if (!holder) return out;

        std::string path = where + key + ".values";
        const json* values = member(*holder, "values");
        if (!values) return out;
        if (values->is_string()) {
            out.push_back(values->get<std::string>());
            return out;
        }
        if (!values->is_array()) {
            warn(path, "expected an array of strings");
            return out;
        }
        for (size_t i = 0; i < values->size(); ++i) {
            const json& item = (*values)[i];
            if (item.is_string()) {
                out.push_back(item.get<std::string>());
            } else if (!item.is_null()) {
                warn(path + "[" + std::to_string(i) + "]", "non-string statement skipped");
            }
        }
        return out;
    }

    void warn(const std::string& path, const std::string& message) {
        warnings_.push_back(path + ": " + message);
    }

private:
    static const json* member(const json& parent, const char* key) {
        auto it = parent.find(key);
        if (it == parent.end() || it->is_null()) return nullptr;
        return &(*it);
    }

    std::vector<std::string>& warnings_;
};

void readPreparer(MemberReader& reader, const json& root, Preparer& prep) {
    const json* node = reader.object(root, "prepared_by", "");
    if (!node) return;
    const std::string where = "prepared_by.";
    prep.name = reader.text(*node, "name_last_first_middle_initial", where);
    prep.rankGrade = reader.text(*node, "rank_grade", where);
    prep.dutyTitle = reader.text(*node, "duty_title_position", where);
    prep.unit = reader.text(*node, "unit", where);
    prep.workEmail = reader.text(*node, "work_email", where);
    prep.telephone = reader.text(*node, "telephone", where);
    prep.uicCin = reader.text(*node, "uic_cin", where);
    prep.supportReference = reader.text(*node, "training_support_or_lesson_plan_or_opord", where);
}

void readSubtasks(MemberReader& reader, const json& root, std::vector<SubtaskEntry>& out) {
    auto it = root.find("subtasks");
    if (it == root.end() || it->is_null()) return;
    if (!it->is_array()) {
        reader.warn("subtasks", "expected an array, no hazard rows written");
        return;
    }

    for (size_t i = 0; i < it->size(); ++i) {
        const json& item = (*it)[i];
        std::string where = "subtasks[" + std::to_string(i) + "].";
        if (!item.is_object()) {
            reader.warn("subtasks[" + std::to_string(i) + "]", "expected an object, entry skipped");
            continue;
        }

        SubtaskEntry entry;
        if (const json* sub = reader.object(item, "subtask", where)) {
            entry.name = reader.text(*sub, "name", where + "subtask.");
        }
        entry.hazard = reader.text(item, "hazard", where);
        entry.initialRiskLevel = reader.text(item, "initial_risk_level", where);
        entry.controls = reader.statements(item, "control", where);
        if (const json* impl = reader.object(item, "how_to_implement", where)) {
            entry.how = reader.statements(*impl, "how", where + "how_to_implement.");
            entry.who = reader.statements(*impl, "who", where + "how_to_implement.");
        }
        entry.residualRiskLevel = reader.text(item, "residual_risk_level", where);
        out.push_back(entry);
    }
}

void readAiAssessment(MemberReader& reader, const json& root, AiAssessment& ai) {
    const json* node = reader.object(root, "ai_assessment", "");
    if (!node) return;
    ai.present = true;

    auto score = node->find("confidence_score");
    if (score != node->end() && !score->is_null()) {
        if (score->is_number()) {
            double value = score->get<double>();
            if (value < 0.0 || value > 100.0) {
                reader.warn("ai_assessment.confidence_score", "outside 0-100, ignored");
            } else {
                ai.confidenceScore = static_cast<int>(value + 0.5);
            }
        } else {
            reader.warn("ai_assessment.confidence_score", "expected a number");
        }
    }

    auto areas = node->find("areas_for_review");
    if (areas != node->end() && areas->is_array()) {
        for (const auto& item : *areas) {
            if (item.is_string()) ai.areasForReview.push_back(item.get<std::string>());
        }
    } else if (areas != node->end() && !areas->is_null()) {
        reader.warn("ai_assessment.areas_for_review", "expected an array of strings");
    }

    ai.rationale = reader.text(*node, "rationale", "ai_assessment.");
}

} // namespace

// ============================================================================
// RecordLoader Implementation
// ============================================================================

RecordLoader::RecordLoader() {
}

bool RecordLoader::loadFile(const std::string& path, NormalizedRecord& record) {
    std::string content;
    if (!FileUtil::readFile(path, content, lastError_)) {
        return false;
    }
    return parse(content, record);
}

bool RecordLoader::parse(const std::string& jsonText, NormalizedRecord& record) {
    warnings_.clear();
    lastError_.clear();

    json root = json::parse(jsonText, nullptr, false);
    if (root.is_discarded()) {
        lastError_ = "Record is not valid JSON";
        return false;
    }
    if (!root.is_object()) {
        lastError_ = "Record must be a JSON object";
        return false;
    }

    NormalizedRecord result;
    MemberReader reader(warnings_);

    result.missionTask = reader.text(root, "mission_task_and_description", "");
    result.date = reader.text(root, "date", "");
    readPreparer(reader, root, result.preparedBy);
    result.supervisionPlan = reader.text(root, "overall_supervision_plan", "");

    result.overallRiskText = reader.text(root, "overall_residual_risk_level", "");
    result.overallRiskLevel = parseRiskLevel(result.overallRiskText);
    if (!result.overallRiskLevel && !TextUtil::trim(result.overallRiskText).empty()) {
        reader.warn("overall_residual_risk_level",
                    "unrecognized level '" + result.overallRiskText + "', no indicator set");
    }

    if (const json* appr = reader.object(root, "approval_or_disapproval_of_mission_or_task", "")) {
        const std::string where = "approval_or_disapproval_of_mission_or_task.";
        result.approval.approve = reader.flag(*appr, "approve", where);
        result.approval.disapprove = reader.flag(*appr, "disapprove", where);
    }

    readSubtasks(reader, root, result.subtasks);
    readAiAssessment(reader, root, result.aiAssessment);

    record = std::move(result);
    return true;
}

} // namespace DrawForm
