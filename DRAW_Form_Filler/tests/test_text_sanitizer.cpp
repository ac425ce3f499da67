#include "test_harness.h"
#include "test_runner_util.h"

#include "text_sanitizer.h"

using namespace DrawForm;

static bool printable_ascii_unchanged() {
    std::string plain = "Convoy live fire, Range 14 (Day/Night) #2\tlane A\nlane B";
    TEST_CHECK_EQ(TextUtil::sanitize(plain), plain);
    return true;
}

static bool invisible_characters_dropped() {
    // U+200B zero-width space, U+00A0 no-break space, U+2003 em space
    std::string dirty = "Doe,\xE2\x80\x8B John\xC2\xA0" "A\xE2\x80\x83.";
    TEST_CHECK_EQ(TextUtil::sanitize(dirty), "Doe, JohnA.");
    TEST_CHECK_EQ(TextUtil::sanitize(std::string("caf\xC3\xA9")), "caf");
    TEST_CHECK_EQ(TextUtil::sanitize(std::string("bell\x07" "del\x7F")), "belldel");
    return true;
}

static bool absent_value_is_empty() {
    std::optional<std::string> none;
    TEST_CHECK_EQ(TextUtil::sanitize(none), "");
    TEST_CHECK_EQ(TextUtil::sanitize(std::optional<std::string>("ok\xE2\x80\x8B")), "ok");
    return true;
}

static bool date_digits_only() {
    TEST_CHECK_EQ(TextUtil::stripNonDigits("2025-03-14"), "20250314");
    TEST_CHECK_EQ(TextUtil::stripNonDigits("14 MAR 2025"), "142025");
    TEST_CHECK_EQ(TextUtil::stripNonDigits(""), "");
    return true;
}

static bool join_and_case_helpers() {
    TEST_CHECK_EQ(TextUtil::joinLines({"first", "second", "third"}), "first\nsecond\nthird");
    TEST_CHECK_EQ(TextUtil::joinLines({}), "");
    TEST_CHECK_EQ(TextUtil::joinLines({"only"}), "only");
    TEST_CHECK_EQ(TextUtil::toUpperAscii("medium risk"), "MEDIUM RISK");
    TEST_CHECK_EQ(TextUtil::trim("  \t low \n"), "low");
    return true;
}

bool test_text_sanitizer() {
    static const DrawFormTest::Case cases[] = {
        {"printable_ascii_unchanged", printable_ascii_unchanged},
        {"invisible_characters_dropped", invisible_characters_dropped},
        {"absent_value_is_empty", absent_value_is_empty},
        {"date_digits_only", date_digits_only},
        {"join_and_case_helpers", join_and_case_helpers},
    };
    return DrawFormTest::runCases(cases);
}
