// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "indexlens/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace indexlens::platform::test {

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    std::filesystem::path p = path_from_utf8("reports/prod-eu.csv");

    EXPECT_EQ(p.filename(), "prod-eu.csv");
}

TEST(PlatformTest, PathConversion_Roundtrip) {
    std::filesystem::path original = "reports/prod-eu.csv";

    std::filesystem::path roundtrip = path_from_utf8(path_to_utf8(original));

    EXPECT_EQ(roundtrip.filename(), original.filename());
}

TEST(PlatformTest, PathConversion_Empty) {
    EXPECT_TRUE(path_to_utf8(std::filesystem::path{}).empty());
    EXPECT_TRUE(path_from_utf8("").empty());
}

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    // "отчёт.csv" в UTF-8
    std::string utf8 = "\xd0\xbe\xd1\x82\xd1\x87\xd1\x91\xd1\x82.csv";

    std::filesystem::path p = path_from_utf8(utf8);

    EXPECT_EQ(path_to_utf8(p), utf8);
}

// ==============================================================================
// TTY detection
// ==============================================================================

TEST(PlatformTest, IsTty_DoesNotThrow) {
    EXPECT_NO_THROW({
        (void)is_tty_stdout();
        (void)is_tty_stderr();
    });
}

// ==============================================================================
// Окружение
// ==============================================================================

#ifndef _WIN32
TEST(PlatformTest, GetEnv_SetAndEmpty) {
    // Arrange
    ::setenv("INDEXLENS_TEST_VAR", "index-metadata", 1);
    ::setenv("INDEXLENS_TEST_EMPTY", "", 1);

    // Act & Assert
    EXPECT_EQ(get_env("INDEXLENS_TEST_VAR"), "index-metadata");
    EXPECT_FALSE(get_env("INDEXLENS_TEST_EMPTY").has_value());

    ::unsetenv("INDEXLENS_TEST_VAR");
    ::unsetenv("INDEXLENS_TEST_EMPTY");
}
#endif

TEST(PlatformTest, GetEnv_Unset_Nullopt) {
    EXPECT_FALSE(get_env("INDEXLENS_SURELY_UNSET_VARIABLE").has_value());
}

}  // namespace indexlens::platform::test
