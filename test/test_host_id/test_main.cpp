#include <unity.h>
#include <string.h>

#include "Core/HostId.h"

void setUp() {}
void tearDown() {}

static void expectSanitized(const char* in, const char* expected)
{
    char out[40];
    HostId::sanitize(in, out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING(expected, out);
}

void test_separators_collapse_and_trim()
{
    expectSanitized("My-Host.local", "my_host_local");
    expectSanitized("__a__b__", "a_b");
    expectSanitized("  gate pi  ", "gate_pi");
    expectSanitized("pi", "pi");
    expectSanitized("RPI4", "rpi4");
}

void test_empty_results_fall_back()
{
    expectSanitized("", "monitor");
    expectSanitized("!!!", "monitor");
    expectSanitized("___", "monitor");
    expectSanitized(nullptr, "monitor");
}

void test_truncation_never_ends_on_separator()
{
    char out[4];
    HostId::sanitize("abcdef", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("abc", out);

    HostId::sanitize("ab-cd", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("ab", out);
}

void test_resolve_prefers_configured_value()
{
    char out[40];
    HostId::resolve("Garage.Pi", out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING("garage_pi", out);

    HostId::resolve("", out, sizeof(out));
    TEST_ASSERT_TRUE(strlen(out) > 0);
    for (const char* p = out; *p; ++p) {
        const bool ok = (*p >= 'a' && *p <= 'z') || (*p >= '0' && *p <= '9') || *p == '_';
        TEST_ASSERT_TRUE(ok);
    }
    TEST_ASSERT_TRUE(out[0] != '_');
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_separators_collapse_and_trim);
    RUN_TEST(test_empty_results_fall_back);
    RUN_TEST(test_truncation_never_ends_on_separator);
    RUN_TEST(test_resolve_prefers_configured_value);
    return UNITY_END();
}
