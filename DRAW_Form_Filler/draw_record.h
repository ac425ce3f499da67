#ifndef DRAWFORM_DRAW_RECORD_H
#define DRAWFORM_DRAW_RECORD_H

#include <optional>
#include <string>
#include <vector>

namespace DrawForm {

// ============================================================================
// Risk levels
// ============================================================================

enum class RiskLevel {
    ExtremelyHigh,
    High,
    Medium,
    Low
};

// Accepts codes (EH, H, M, L) and labels (EXTREMELY HIGH, HIGH, MEDIUM, LOW),
// case-insensitive, surrounding whitespace ignored. Anything else is nullopt.
std::optional<RiskLevel> parseRiskLevel(const std::string& text);

const char* riskLevelCode(RiskLevel level);    // "EH", "H", "M", "L"
const char* riskLevelLabel(RiskLevel level);   // "EXTREMELY HIGH", ...

// ============================================================================
// Record structure (one DRAW, DD Form 2977)
// ============================================================================

struct Preparer {
    std::string name;              // Last, First, Middle initial
    std::string rankGrade;
    std::string dutyTitle;
    std::string unit;
    std::string workEmail;
    std::string telephone;
    std::string uicCin;
    std::string supportReference;  // Training support / lesson plan / OPORD
};

struct ApprovalDecision {
    bool approve = false;
    bool disapprove = false;       // Independent of approve; both may be set
};

struct SubtaskEntry {
    std::string name;
    std::string hazard;
    std::string initialRiskLevel;
    std::vector<std::string> controls;
    std::vector<std::string> how;
    std::vector<std::string> who;
    std::string residualRiskLevel;
};

// Self-assessment attached by the upstream generator. Reported, never filled.
struct AiAssessment {
    bool present = false;
    int confidenceScore = -1;      // 0-100, -1 when absent
    std::vector<std::string> areasForReview;
    std::string rationale;
};

struct NormalizedRecord {
    std::string missionTask;
    std::string date;
    Preparer preparedBy;
    std::string supervisionPlan;
    std::string overallRiskText;               // As received
    std::optional<RiskLevel> overallRiskLevel; // Resolved from overallRiskText
    ApprovalDecision approval;
    std::vector<SubtaskEntry> subtasks;
    AiAssessment aiAssessment;
};

// ============================================================================
// JSON loader
// ============================================================================

// Reads the generator's JSON. Missing or null members yield empty values;
// members of the wrong type are replaced by empty values and noted in
// getWarnings(). Only unreadable files, invalid JSON and a non-object top
// level fail the load.
class RecordLoader {
public:
    RecordLoader();

    bool loadFile(const std::string& path, NormalizedRecord& record);
    bool parse(const std::string& jsonText, NormalizedRecord& record);

    const std::vector<std::string>& getWarnings() const { return warnings_; }
    const std::string& getLastError() const { return lastError_; }

private:
    std::vector<std::string> warnings_;
    std::string lastError_;
};

} // namespace DrawForm

#endif // DRAWFORM_DRAW_RECORD_H
