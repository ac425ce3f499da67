#include "test_harness.h"
#include "test_fixtures.h"
#include "test_runner_util.h"

#include "fill_common.h"

#include <filesystem>

using namespace DrawForm;
using namespace DrawFormTest;

namespace fs = std::filesystem;

static bool writeText(const std::string& path, const std::string& text) {
    return writeBytes(path, std::vector<uint8_t>(text.begin(), text.end()));
}

static std::string fileText(const std::string& path) {
    std::string content;
    std::string error;
    if (!FileUtil::readFile(path, content, error)) return "<unreadable>";
    return content;
}

static bool temporary_file_committed() {
    std::string dir = scratchDir("fill_common_commit");
    std::string finalPath = dir + "/DRAW.pdf";
    std::string tmpPath = FileUtil::temporarySiblingPath(finalPath);
    TEST_CHECK_EQ(tmpPath, finalPath + ".partial");

    TEST_CHECK(writeText(finalPath, "old"));
    TEST_CHECK(writeText(tmpPath, "new"));
    std::string error;
    TEST_CHECK(FileUtil::commitTemporaryFile(tmpPath, finalPath, error));
    TEST_CHECK_EQ(fileText(finalPath), "new");
    TEST_CHECK(!fs::exists(tmpPath));

    // A missing temporary leaves the committed output alone
    TEST_CHECK(!FileUtil::commitTemporaryFile(tmpPath, finalPath, error));
    TEST_CHECK(!error.empty());
    TEST_CHECK_EQ(fileText(finalPath), "new");
    TEST_CHECK(!fs::exists(finalPath + ".staged"));
    return true;
}

static bool copy_replaces_through_staged_file() {
    std::string dir = scratchDir("fill_common_copy");
    std::string source = dir + "/filled.pdf";
    std::string preview = dir + "/preview.pdf";
    TEST_CHECK(writeText(source, "%PDF-1.7 filled"));
    TEST_CHECK(writeText(preview, "%PDF-1.7 stale preview"));

    std::string error;
    TEST_CHECK(FileUtil::copyIntoPlace(source, preview, error));
    TEST_CHECK_EQ(fileText(preview), "%PDF-1.7 filled");
    TEST_CHECK_EQ(fileText(source), "%PDF-1.7 filled");
    TEST_CHECK(!fs::exists(preview + ".staged"));
    return true;
}

static bool failed_copy_keeps_destination() {
    std::string dir = scratchDir("fill_common_copy_fail");
    std::string preview = dir + "/preview.pdf";
    TEST_CHECK(writeText(preview, "previous preview"));

    std::string error;
    TEST_CHECK(!FileUtil::copyIntoPlace(dir + "/missing.pdf", preview, error));
    TEST_CHECK(error.find("missing.pdf") != std::string::npos);
    TEST_CHECK_EQ(fileText(preview), "previous preview");
    TEST_CHECK(!fs::exists(preview + ".staged"));

    // Destination directory does not exist
    std::string source = dir + "/filled.pdf";
    TEST_CHECK(writeText(source, "filled"));
    error.clear();
    TEST_CHECK(!FileUtil::copyIntoPlace(source, dir + "/absent/preview.pdf", error));
    TEST_CHECK(!error.empty());
    return true;
}

static bool same_path_detected() {
    std::string dir = scratchDir("fill_common_same");
    std::string path = dir + "/DRAW.pdf";
    TEST_CHECK(writeText(path, "x"));
    TEST_CHECK(writeText(dir + "/other.pdf", "x"));

    TEST_CHECK(FileUtil::samePath(path, dir + "/./DRAW.pdf"));
    TEST_CHECK(!FileUtil::samePath(path, dir + "/other.pdf"));
    TEST_CHECK(!FileUtil::samePath(path, dir + "/missing.pdf"));
    return true;
}

bool test_fill_common() {
    static const DrawFormTest::Case cases[] = {
        {"temporary_file_committed", temporary_file_committed},
        {"copy_replaces_through_staged_file", copy_replaces_through_staged_file},
        {"failed_copy_keeps_destination", failed_copy_keeps_destination},
        {"same_path_detected", same_path_detected},
    };
    return DrawFormTest::runCases(cases);
}
