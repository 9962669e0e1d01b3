#ifndef MARKSMANAGER_TESTUTIL_H
#define MARKSMANAGER_TESTUTIL_H

#include <cmath>
#include <cstdio>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

static inline bool nearly(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

#endif // MARKSMANAGER_TESTUTIL_H
