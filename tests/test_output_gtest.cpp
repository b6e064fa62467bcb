// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================

#include "warden/output.hpp"
#include "warden/platform.hpp"
#include "warden/value.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace warden::output::test {

// ==============================================================================
// Префиксы сообщений
// ==============================================================================

TEST(OutputTest, FormatInfo_PlusPrefix) {
    EXPECT_EQ(format_info("Loaded 3 policies"), "[+] Loaded 3 policies\n");
}

TEST(OutputTest, FormatError_CrossPrefix) {
    EXPECT_EQ(format_error("audit log is sealed: acme"), "[x] audit log is sealed: acme\n");
}

TEST(OutputTest, FormatWarning_BangPrefix) {
    EXPECT_EQ(format_warning("evidence source decision_trace is not available"),
              "[!] evidence source decision_trace is not available\n");
}

TEST(OutputTest, FormatDebug_StarPrefix) {
    EXPECT_EQ(format_debug("compiled 4 rules"), "[*] compiled 4 rules\n");
}

// ==============================================================================
// Writer
// ==============================================================================

TEST(OutputTest, Writer_QuietMode_DoesNotThrow) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);
    EXPECT_NO_THROW({
        writer.info("suppressed");
        writer.warn("suppressed");
        writer.error("not suppressed");
    });
}

TEST(OutputTest, Writer_VerboseLevels_DoesNotThrow) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);
    EXPECT_NO_THROW({
        writer.debug("debug line");
        writer.trace("trace line");
    });
}

TEST(OutputTest, Writer_OutputFile_WriteValueAsJsonLine) {
    auto path = platform::make_temp_file("warden-output");
    {
        OutputConfig config;
        config.format = Format::Jsonl;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());

        Value v = Value::make_object();
        v.set("allowed", Value(false));
        v.set("effect", Value("deny"));
        writer.write_value(v);
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    Value parsed = parse_json(line);
    EXPECT_EQ(parsed.get("effect")->as_string(), "deny");
    EXPECT_FALSE(parsed.get("allowed")->as_bool());

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTest, Table_ToString_BoxDrawingAndData) {
    Table table;
    table.set_headers({"Seq", "Action"});
    table.add_row({"0", "auth.login.success"});
    table.add_row({"1", "git.push.force"});

    std::string result = table.to_string();
    EXPECT_NE(result.find("\xe2\x94\x8c"), std::string::npos);  // ┌
    EXPECT_NE(result.find("\xe2\x94\x82"), std::string::npos);  // │
    EXPECT_NE(result.find("\xe2\x94\x98"), std::string::npos);  // ┘
    EXPECT_NE(result.find("auth.login.success"), std::string::npos);
    EXPECT_NE(result.find("git.push.force"), std::string::npos);
    EXPECT_EQ(table.row_count(), 2u);
}

TEST(OutputTest, Table_ColumnsPaddedToWidestCell) {
    Table table;
    table.set_headers({"Id"});
    table.add_row({"abcdef"});

    std::istringstream lines(table.to_string());
    std::string top, header;
    std::getline(lines, top);
    std::getline(lines, header);
    // "│ Id     │": заголовок дополнен до ширины самой длинной ячейки
    EXPECT_NE(header.find(" Id     "), std::string::npos);
}

// ==============================================================================
// format_field
// ==============================================================================

TEST(OutputTest, FormatField_CollapsesWhitespace) {
    EXPECT_EQ(format_field("Force\n  push\tto main", 0), "Force push to main");
}

TEST(OutputTest, FormatField_TruncatesWithEllipsis) {
    EXPECT_EQ(format_field("abcdefghij", 6), "abc...");
    EXPECT_EQ(format_field("short", 10), "short");
}

}  // namespace warden::output::test
