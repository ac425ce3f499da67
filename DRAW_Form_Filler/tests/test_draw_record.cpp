#include "test_harness.h"
#include "test_runner_util.h"

#include "draw_record.h"

using namespace DrawForm;

static const char* const FULL_RECORD = R"({
  "mission_task_and_description": "Convoy live fire",
  "date": "2025-03-14",
  "prepared_by": {
    "name_last_first_middle_initial": "Doe, John A",
    "rank_grade": "CPT/O-3",
    "duty_title_position": "Company Commander",
    "unit": "A Co 1-1 IN",
    "work_email": "john.doe@example.mil",
    "telephone": 5550100,
    "uic_cin": "WABCD0",
    "training_support_or_lesson_plan_or_opord": "OPORD 25-01"
  },
  "subtasks": [
    {
      "subtask": {"name": "Move to range"},
      "hazard": "Vehicle rollover",
      "initial_risk_level": "H",
      "control": {"values": ["Ground guides", "Speed limit 25 mph"]},
      "how_to_implement": {
        "how": {"values": ["Convoy brief"]},
        "who": {"values": ["Convoy commander", "Drivers"]}
      },
      "residual_risk_level": "L"
    },
    {
      "subtask": {"name": "Live fire"},
      "hazard": "Ricochet",
      "initial_risk_level": "EH",
      "control": {"values": "Surface danger zone"},
      "how_to_implement": {"how": null, "who": {"values": []}},
      "residual_risk_level": "M"
    }
  ],
  "overall_supervision_plan": "Leaders present at all iterations",
  "overall_residual_risk_level": "medium",
  "approval_or_disapproval_of_mission_or_task": {"approve": true, "disapprove": false},
  "ai_assessment": {
    "confidence_score": 82,
    "areas_for_review": ["Night iteration controls"],
    "rationale": "Most hazards covered"
  }
})";

static bool risk_level_codes_and_labels() {
    TEST_CHECK(parseRiskLevel("EH") == RiskLevel::ExtremelyHigh);
    TEST_CHECK(parseRiskLevel(" extremely high ") == RiskLevel::ExtremelyHigh);
    TEST_CHECK(parseRiskLevel("Extremely-High") == RiskLevel::ExtremelyHigh);
    TEST_CHECK(parseRiskLevel("h") == RiskLevel::High);
    TEST_CHECK(parseRiskLevel("Medium") == RiskLevel::Medium);
    TEST_CHECK(parseRiskLevel("MED") == RiskLevel::Medium);
    TEST_CHECK(parseRiskLevel("low") == RiskLevel::Low);
    TEST_CHECK(!parseRiskLevel("moderate"));
    TEST_CHECK(!parseRiskLevel(""));
    TEST_CHECK_EQ(std::string(riskLevelCode(RiskLevel::ExtremelyHigh)), "EH");
    TEST_CHECK_EQ(std::string(riskLevelLabel(RiskLevel::Medium)), "MEDIUM");
    return true;
}

static bool full_record_parsed() {
    RecordLoader loader;
    NormalizedRecord record;
    TEST_CHECK(loader.parse(FULL_RECORD, record));
    TEST_CHECK(loader.getWarnings().empty());

    TEST_CHECK_EQ(record.missionTask, "Convoy live fire");
    TEST_CHECK_EQ(record.date, "2025-03-14");
    TEST_CHECK_EQ(record.preparedBy.name, "Doe, John A");
    TEST_CHECK_EQ(record.preparedBy.telephone, "5550100");
    TEST_CHECK_EQ(record.preparedBy.supportReference, "OPORD 25-01");
    TEST_CHECK_EQ(record.supervisionPlan, "Leaders present at all iterations");
    TEST_CHECK(record.overallRiskLevel == RiskLevel::Medium);
    TEST_CHECK(record.approval.approve);
    TEST_CHECK(!record.approval.disapprove);

    TEST_CHECK_EQ(record.subtasks.size(), static_cast<size_t>(2));
    const SubtaskEntry& first = record.subtasks[0];
    TEST_CHECK_EQ(first.name, "Move to range");
    TEST_CHECK_EQ(first.controls.size(), static_cast<size_t>(2));
    TEST_CHECK_EQ(first.controls[1], "Speed limit 25 mph");
    TEST_CHECK_EQ(first.who.size(), static_cast<size_t>(2));
    TEST_CHECK_EQ(first.residualRiskLevel, "L");

    const SubtaskEntry& second = record.subtasks[1];
    TEST_CHECK_EQ(second.controls.size(), static_cast<size_t>(1));
    TEST_CHECK_EQ(second.controls[0], "Surface danger zone");
    TEST_CHECK(second.how.empty());
    TEST_CHECK(second.who.empty());

    TEST_CHECK(record.aiAssessment.present);
    TEST_CHECK_EQ(record.aiAssessment.confidenceScore, 82);
    TEST_CHECK_EQ(record.aiAssessment.areasForReview.size(), static_cast<size_t>(1));
    return true;
}

static bool missing_members_are_empty() {
    RecordLoader loader;
    NormalizedRecord record;
    TEST_CHECK(loader.parse("{}", record));
    TEST_CHECK(loader.getWarnings().empty());
    TEST_CHECK(record.missionTask.empty());
    TEST_CHECK(record.subtasks.empty());
    TEST_CHECK(!record.overallRiskLevel);
    TEST_CHECK(!record.approval.approve);
    TEST_CHECK(!record.aiAssessment.present);
    return true;
}

static bool wrong_types_become_warnings() {
    RecordLoader loader;
    NormalizedRecord record;
    const char* json = R"({
      "mission_task_and_description": ["not", "text"],
      "prepared_by": "Doe",
      "overall_residual_risk_level": "moderate",
      "approval_or_disapproval_of_mission_or_task": {"approve": "yes", "disapprove": true},
      "subtasks": [ 7, {"hazard": "Heat", "control": {"values": ["Water", 3]}} ]
    })";
    TEST_CHECK(loader.parse(json, record));
    TEST_CHECK(record.missionTask.empty());
    TEST_CHECK(record.preparedBy.name.empty());
    TEST_CHECK(!record.overallRiskLevel);
    TEST_CHECK_EQ(record.overallRiskText, "moderate");
    TEST_CHECK(!record.approval.approve);
    TEST_CHECK(record.approval.disapprove);
    TEST_CHECK_EQ(record.subtasks.size(), static_cast<size_t>(1));
    TEST_CHECK_EQ(record.subtasks[0].hazard, "Heat");
    TEST_CHECK_EQ(record.subtasks[0].controls.size(), static_cast<size_t>(1));
    // text, object, level, flag, array item, statement item
    TEST_CHECK_EQ(loader.getWarnings().size(), static_cast<size_t>(6));
    return true;
}

static bool invalid_json_rejected() {
    RecordLoader loader;
    NormalizedRecord record;
    record.missionTask = "untouched";
    TEST_CHECK(!loader.parse("{\"date\": ", record));
    TEST_CHECK(!loader.getLastError().empty());
    TEST_CHECK_EQ(record.missionTask, "untouched");

    TEST_CHECK(!loader.parse("[1, 2]", record));
    TEST_CHECK(!loader.loadFile("/nonexistent/draw.json", record));
    return true;
}

bool test_draw_record() {
    static const DrawFormTest::Case cases[] = {
        {"risk_level_codes_and_labels", risk_level_codes_and_labels},
        {"full_record_parsed", full_record_parsed},
        {"missing_members_are_empty", missing_members_are_empty},
        {"wrong_types_become_warnings", wrong_types_become_warnings},
        {"invalid_json_rejected", invalid_json_rejected},
    };
    return DrawFormTest::runCases(cases);
}
