#include <gtest/gtest.h>
#include <core/instance_paths.hpp>
#include <core/utils.hpp>

// ── parse_int_strict ────────────────────────────────────────

TEST(Utils, ParseIntStrictAcceptsWholeNumbers) {
    EXPECT_EQ(parse_int_strict("42"), std::optional<long>(42));
    EXPECT_EQ(parse_int_strict(" 42\n"), std::optional<long>(42));
    EXPECT_EQ(parse_int_strict("-7"), std::optional<long>(-7));
}

TEST(Utils, ParseIntStrictRejectsJunk) {
    EXPECT_FALSE(parse_int_strict("").has_value());
    EXPECT_FALSE(parse_int_strict("   ").has_value());
    EXPECT_FALSE(parse_int_strict("12ab").has_value());
    EXPECT_FALSE(parse_int_strict("1.5").has_value());
    EXPECT_FALSE(parse_int_strict("+").has_value());
    EXPECT_FALSE(parse_int_strict("99999999999999999999999").has_value());
}

TEST(Utils, Trim) {
    std::string s = "\t activate \r\n";
    trim(s);
    EXPECT_EQ(s, "activate");
    EXPECT_EQ(trimmed("   "), "");
    EXPECT_EQ(trimmed("ok"), "ok");
}

// ── instance paths ──────────────────────────────────────────

TEST(InstancePaths, FileNamesDeriveFromAppId) {
    fs::path dir = "/run/solo";
    EXPECT_EQ(lock_file_path(dir, "work-stack"), fs::path("/run/solo/work-stack.lock"));
    EXPECT_EQ(port_file_path(dir, "work-stack"), fs::path("/run/solo/work-stack.port"));
}

TEST(InstancePaths, AppIdValidation) {
    EXPECT_TRUE(is_valid_app_id("work-stack"));
    EXPECT_TRUE(is_valid_app_id("demo"));
    EXPECT_TRUE(is_valid_app_id("my.app_2"));

    EXPECT_FALSE(is_valid_app_id(""));
    EXPECT_FALSE(is_valid_app_id("."));
    EXPECT_FALSE(is_valid_app_id(".."));
    EXPECT_FALSE(is_valid_app_id("../x"));
    EXPECT_FALSE(is_valid_app_id("a/b"));
    EXPECT_FALSE(is_valid_app_id("a\\b"));
    EXPECT_FALSE(is_valid_app_id("c:app"));
}
