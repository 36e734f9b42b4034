#include <unity.h>
#include <string>

#include "UUIDDecoder.h"
#include "UUIDTimestamp.h"

void setUp() {}
void tearDown() {}

static void assert_no_version_fields(const UUIDAnalysis& a) {
    TEST_ASSERT_FALSE(a.hasTimestamp());
    TEST_ASSERT_FALSE(a.hasClockSequence());
    TEST_ASSERT_FALSE(a.hasNode());
    TEST_ASSERT_FALSE(a.hasRandomBits());
}

void test_v4_scenario() {
    UUIDAnalysis a = UUIDDecoder::analyze("82a7a5a1-c77c-4288-87e3-d2c3c3fbc339");
    TEST_ASSERT_TRUE(a.isValid);
    TEST_ASSERT_TRUE(a.hasVersion);
    TEST_ASSERT_EQUAL_UINT8(4, a.version);
    TEST_ASSERT_EQUAL_STRING("RFC 4122", a.variantName());
    TEST_ASSERT_EQUAL_STRING("82a7a5a1c77c428887e3d2c3c3fbc339", a.randomBits.c_str());
    TEST_ASSERT_EQUAL_STRING("82a7a5a1c77c428887e3d2c3c3fbc339", a.hexString.c_str());
    TEST_ASSERT_FALSE(a.hasTimestamp());
    TEST_ASSERT_FALSE(a.hasClockSequence());
    TEST_ASSERT_FALSE(a.hasNode());
}

void test_v1_fields() {
    UUIDAnalysis a = UUIDDecoder::analyze("4a784000-4bc4-11eb-8001-030304050607");
    TEST_ASSERT_TRUE(a.isValid);
    TEST_ASSERT_EQUAL_UINT8(1, a.version);
    TEST_ASSERT_TRUE(a.variant == UUID_VARIANT_RFC4122);
    TEST_ASSERT_EQUAL_STRING("4a784000-4bc4-11eb", a.timestampRaw.c_str());
    TEST_ASSERT_EQUAL_STRING("8001", a.clockSequence.c_str());
    TEST_ASSERT_EQUAL_STRING("030304050607", a.node.c_str());
    TEST_ASSERT_FALSE(a.hasRandomBits());

    TEST_ASSERT_EQUAL_STRING("2021-01-01T00:00:00.000Z",
                             UUIDTimestamp::format(a.timestampRaw, a.version).c_str());
}

void test_v1_node_is_last_twelve_digits() {
    UUIDAnalysis a = UUIDDecoder::analyze("c232ab00-9414-11ec-b3c8-9e6bdeced846");
    TEST_ASSERT_TRUE(a.isValid);
    TEST_ASSERT_EQUAL_UINT8(1, a.version);
    TEST_ASSERT_EQUAL_STRING("RFC 4122", a.variantName());
    TEST_ASSERT_EQUAL_STRING("9e6bdeced846", a.node.c_str());
    TEST_ASSERT_EQUAL_STRING("b3c8", a.clockSequence.c_str());
    TEST_ASSERT_EQUAL_STRING("c232ab00-9414-11ec", a.timestampRaw.c_str());
}

void test_v7_fields() {
    UUIDAnalysis a = UUIDDecoder::analyze("01856e83-f300-7607-8809-0a0b0c0d0e0f");
    TEST_ASSERT_TRUE(a.isValid);
    TEST_ASSERT_EQUAL_UINT8(7, a.version);
    TEST_ASSERT_TRUE(a.variant == UUID_VARIANT_RFC4122);
    TEST_ASSERT_EQUAL_STRING("01856e83f300", a.timestampRaw.c_str());
    TEST_ASSERT_EQUAL_STRING("760788090a0b0c0d0e0f", a.randomBits.c_str());
    TEST_ASSERT_FALSE(a.hasClockSequence());
    TEST_ASSERT_FALSE(a.hasNode());

    TEST_ASSERT_EQUAL_STRING("2023-01-01T18:06:59.328Z",
                             UUIDTimestamp::format(a.timestampRaw, a.version).c_str());
}

void test_variant_classification() {
    struct { char nibble; UUIDVariant expected; const char* name; } cases[] = {
        { '0', UUID_VARIANT_NCS, "Reserved (NCS)" },
        { '7', UUID_VARIANT_NCS, "Reserved (NCS)" },
        { '8', UUID_VARIANT_RFC4122, "RFC 4122" },
        { '9', UUID_VARIANT_RFC4122, "RFC 4122" },
        { 'a', UUID_VARIANT_RFC4122, "RFC 4122" },
        { 'B', UUID_VARIANT_RFC4122, "RFC 4122" },
        { 'c', UUID_VARIANT_MICROSOFT, "Microsoft" },
        { 'd', UUID_VARIANT_MICROSOFT, "Microsoft" },
        { 'e', UUID_VARIANT_FUTURE, "Reserved (Future)" },
        { 'F', UUID_VARIANT_FUTURE, "Reserved (Future)" },
    };
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); i++) {
        std::string input = "82a7a5a1-c77c-4288-87e3-d2c3c3fbc339";
        input[19] = cases[i].nibble;
        UUIDAnalysis a = UUIDDecoder::analyze(input);
        TEST_ASSERT_TRUE(a.isValid);
        TEST_ASSERT_TRUE(a.variant == cases[i].expected);
        TEST_ASSERT_EQUAL_STRING(cases[i].name, a.variantName());
    }
}

void test_invalid_scenario() {
    UUIDAnalysis a = UUIDDecoder::analyze("not-a-uuid");
    TEST_ASSERT_FALSE(a.isValid);
    TEST_ASSERT_FALSE(a.hasVersion);
    TEST_ASSERT_TRUE(a.variant == UUID_VARIANT_NONE);
    TEST_ASSERT_EQUAL_STRING("", a.variantName());
    TEST_ASSERT_EQUAL_STRING("not-a-uuid", a.hexString.c_str());
    assert_no_version_fields(a);
}

void test_invalid_keeps_original_text() {
    // Hyphens are stripped only on the valid path
    UUIDAnalysis a = UUIDDecoder::analyze("82a7a5a1-c77c-4288-87e3-d2c3c3fbc33");
    TEST_ASSERT_FALSE(a.isValid);
    TEST_ASSERT_EQUAL_STRING("82a7a5a1-c77c-4288-87e3-d2c3c3fbc33", a.hexString.c_str());

    UUIDAnalysis dashes = UUIDDecoder::analyze("----");
    TEST_ASSERT_FALSE(dashes.isValid);
    TEST_ASSERT_EQUAL_STRING("----", dashes.hexString.c_str());

    UUIDAnalysis empty = UUIDDecoder::analyze("");
    TEST_ASSERT_FALSE(empty.isValid);
    TEST_ASSERT_EQUAL_STRING("", empty.hexString.c_str());
}

void test_length_boundaries() {
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("82a7a5a1c77c428887e3d2c3c3fbc33").isValid);   // 31
    TEST_ASSERT_TRUE(UUIDDecoder::analyze("82a7a5a1c77c428887e3d2c3c3fbc339").isValid);   // 32
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("82a7a5a1c77c428887e3d2c3c3fbc3390").isValid); // 33
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("82a7a5a1-c77c-4288-87e3-d2c3c3fbc3390").isValid);
}

void test_non_hex_characters() {
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("82a7a5a1-c77c-4288-87e3-d2c3c3fbc33g").isValid);
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("82a7a5a1 c77c 4288 87e3 d2c3c3fbc339").isValid);
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("{82a7a5a1-c77c-4288-87e3-d2c3c3fbc339}").isValid);
    TEST_ASSERT_FALSE(UUIDDecoder::analyze("82a7a5a1_c77c_4288_87e3_d2c3c3fbc339").isValid);
}

void test_hyphens_anywhere() {
    UUIDAnalysis a = UUIDDecoder::analyze("-82a7-a5a1c77c4288--87e3d2c3c3fbc339-");
    TEST_ASSERT_TRUE(a.isValid);
    TEST_ASSERT_EQUAL_UINT8(4, a.version);
    TEST_ASSERT_EQUAL_STRING("82a7a5a1c77c428887e3d2c3c3fbc339", a.hexString.c_str());
}

void test_uppercase_input() {
    UUIDAnalysis a = UUIDDecoder::analyze("01856E83-F300-7607-8809-0A0B0C0D0E0F");
    TEST_ASSERT_TRUE(a.isValid);
    TEST_ASSERT_EQUAL_UINT8(7, a.version);
    TEST_ASSERT_EQUAL_STRING("01856E83F300760788090A0B0C0D0E0F", a.hexString.c_str());
    TEST_ASSERT_EQUAL_STRING("01856E83F300", a.timestampRaw.c_str());
    TEST_ASSERT_EQUAL_STRING("2023-01-01T18:06:59.328Z",
                             UUIDTimestamp::format(a.timestampRaw, a.version).c_str());
}

void test_unsupported_versions_are_generic() {
    // v3, v5, v8, v9 and v0: valid, version reported, no layout-specific fields
    const char* inputs[] = {
        "6fa459ea-ee8a-3ca4-894e-db77e160355e",
        "886313e1-3b8a-5372-9b90-0c9aee199e5d",
        "320c3d4d-cc00-875b-8ec9-32d5f69181c0",
        "82a7a5a1-c77c-9288-87e3-d2c3c3fbc339",
        "00000000-0000-0000-0000-000000000000",
    };
    const uint8_t versions[] = { 3, 5, 8, 9, 0 };
    for (size_t i = 0; i < 5; i++) {
        UUIDAnalysis a = UUIDDecoder::analyze(inputs[i]);
        TEST_ASSERT_TRUE(a.isValid);
        TEST_ASSERT_TRUE(a.hasVersion);
        TEST_ASSERT_EQUAL_UINT8(versions[i], a.version);
        assert_no_version_fields(a);
    }

    UUIDAnalysis nil = UUIDDecoder::analyze("00000000-0000-0000-0000-000000000000");
    TEST_ASSERT_TRUE(nil.variant == UUID_VARIANT_NCS);

    UUIDAnalysis max = UUIDDecoder::analyze("ffffffff-ffff-ffff-ffff-ffffffffffff");
    TEST_ASSERT_EQUAL_UINT8(15, max.version);
    TEST_ASSERT_TRUE(max.variant == UUID_VARIANT_FUTURE);
}

void test_idempotence() {
    const char* inputs[] = {
        "82a7a5a1-c77c-4288-87e3-d2c3c3fbc339",
        "4a784000-4bc4-11eb-8001-030304050607",
        "01856e83-f300-7607-8809-0a0b0c0d0e0f",
        "not-a-uuid",
        "",
    };
    for (size_t i = 0; i < 5; i++) {
        UUIDAnalysis first = UUIDDecoder::analyze(inputs[i]);
        UUIDAnalysis second = UUIDDecoder::analyze(inputs[i]);
        TEST_ASSERT_TRUE(first == second);
    }
    TEST_ASSERT_TRUE(UUIDDecoder::analyze(inputs[0]) != UUIDDecoder::analyze(inputs[1]));
}

int run_tests() {
    UNITY_BEGIN();
    RUN_TEST(test_v4_scenario);
    RUN_TEST(test_v1_fields);
    RUN_TEST(test_v1_node_is_last_twelve_digits);
    RUN_TEST(test_v7_fields);
    RUN_TEST(test_variant_classification);
    RUN_TEST(test_invalid_scenario);
    RUN_TEST(test_invalid_keeps_original_text);
    RUN_TEST(test_length_boundaries);
    RUN_TEST(test_non_hex_characters);
    RUN_TEST(test_hyphens_anywhere);
    RUN_TEST(test_uppercase_input);
    RUN_TEST(test_unsupported_versions_are_generic);
    RUN_TEST(test_idempotence);
    return UNITY_END();
}

int main(int argc, char **argv) {
    (void)argc; (void)argv;
    return run_tests();
}
