// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенных функций (GoogleTest)
// ==============================================================================

#include "warden/platform.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <string>

namespace warden::platform::test {

TEST(PlatformTest, PathRoundTrip_Utf8) {
    const std::string name = "политики/репозиторий.yml";
    EXPECT_EQ(path_to_utf8(path_from_utf8(name)), name);
}

TEST(PlatformTest, RandomString_LengthAndAlphabet) {
    const std::string s = random_string(32);
    ASSERT_EQ(s.size(), 32u);
    EXPECT_EQ(s.find_first_not_of(ID_ALPHABET), std::string::npos);

    EXPECT_EQ(random_string(8, "x"), "xxxxxxxx");
    EXPECT_TRUE(random_string(0).empty());
}

TEST(PlatformTest, RandomString_Distinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(random_string(16));
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(PlatformTest, MakeTempFile_CreatesEmptyFile) {
    auto a = make_temp_file("warden-test");
    auto b = make_temp_file("warden-test");
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::filesystem::exists(a));
    EXPECT_EQ(std::filesystem::file_size(a), 0u);
    EXPECT_NE(a.filename().string().find("warden-test"), std::string::npos);

    std::filesystem::remove(a);
    std::filesystem::remove(b);
}

}  // namespace warden::platform::test
