#ifndef DRAWFORM_TEST_RUNNER_UTIL_H
#define DRAWFORM_TEST_RUNNER_UTIL_H

#include <cstddef>
#include <cstdio>

namespace DrawFormTest {

struct Case {
    const char* name;
    bool (*fn)();
};

// Runs every case of one module, printing the failing ones
template <size_t N>
bool runCases(const Case (&cases)[N]) {
    bool ok = true;
    for (size_t i = 0; i < N; i++) {
        if (!cases[i].fn()) {
            std::printf("  [FAIL] %s\n", cases[i].name);
            ok = false;
        }
    }
    return ok;
}

} // namespace DrawFormTest

#endif // DRAWFORM_TEST_RUNNER_UTIL_H
