/**
 * run_drawform_tests.cpp - DRAW form filler self-test suite
 *
 * One test_xxx() entry point per module; each runs its cases and prints
 * the failing ones. Exit status is the number of failed modules.
 */

#include <cstdio>
#include <exception>

bool test_text_sanitizer();
bool test_fill_common();
bool test_draw_record();
bool test_xfa_assembler();
bool test_zip_archive();
bool test_docx_table();
bool test_docx_assembler();
bool test_xfa_pdf_template();
bool test_office_converter();
bool test_form_filler();

struct TestResult {
    const char* name;
    bool (*fn)();
};

int main() {
    std::printf("============================================\n");
    std::printf("   DRAW Form Filler Self-Test Suite\n");
    std::printf("============================================\n\n");

    TestResult tests[] = {
        {"text_sanitizer  ", test_text_sanitizer},
        {"fill_common     ", test_fill_common},
        {"draw_record     ", test_draw_record},
        {"xfa_assembler   ", test_xfa_assembler},
        {"zip_archive     ", test_zip_archive},
        {"docx_table      ", test_docx_table},
        {"docx_assembler  ", test_docx_assembler},
        {"xfa_pdf_template", test_xfa_pdf_template},
        {"office_converter", test_office_converter},
        {"form_filler     ", test_form_filler},
    };

    int total = sizeof(tests) / sizeof(tests[0]);
    int passed = 0;
    int failed = 0;

    for (int i = 0; i < total; i++) {
        bool ok = false;
        try {
            ok = tests[i].fn();
        } catch (const std::exception& e) {
            std::printf("    unexpected exception: %s\n", e.what());
        }
        std::printf("[%s] %s\n", ok ? "PASS" : "FAIL", tests[i].name);
        if (ok)
            passed++;
        else
            failed++;
    }

    std::printf("\n============================================\n");
    std::printf("   %d/%d passed", passed, total);
    if (failed > 0)
        std::printf(", %d FAILED", failed);
    std::printf("\n============================================\n");

    return failed;
}
