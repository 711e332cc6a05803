#include <coderun/config_file.hh>
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

using std::pair;
using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(config_file, is_string_literal) {
    // (input, output)
    vector<pair<string, bool>> cases{
        {"", false},
        {"foo-bar", true},
        {"line: 1\nab d E\n", false},
        {R"===(\\\\\\)===", true},
        {" foo", false},
        {"foo ", false},
        {"''", false},
        {"this isn't a single-quoted string", true},
        {"a'a", true},
        {R"===("a a")===", false},
        {"[aaaa", false},
        {"aaaa]", false},
        {"aa,aa", false},
        {"aa#aa", false},
        {"aaaa[", true},
        {"gcc {file} -o {out}", true},
    };

    for (auto const& [input, output] : cases) {
        EXPECT_EQ(ConfigFile::is_string_literal(input), output) << "input: " << input;
    }
}

// NOLINTNEXTLINE
TEST(config_file, escape_string) {
    EXPECT_EQ(ConfigFile::escape_string(""), "''");
    EXPECT_EQ(ConfigFile::escape_string("gcc -O2"), "gcc -O2");
    EXPECT_EQ(ConfigFile::escape_string(" x"), "' x'");
    EXPECT_EQ(ConfigFile::escape_string("a\nb"), R"("a\nb")");
    EXPECT_EQ(ConfigFile::escape_string("it's"), R"("it's")");
    EXPECT_EQ(ConfigFile::escape_string("[x]"), "'[x]'");
    EXPECT_EQ(ConfigFile::escape_to_single_quoted_string("a'b"), "'a''b'");
    EXPECT_EQ(ConfigFile::escape_to_double_quoted_string("\x01\"\\"), R"("\x01\"\\")");
}

// NOLINTNEXTLINE
TEST(config_file, escaped_strings_are_loaded_back) {
    for (string str : {"", " a b ", "it's", "\"quoted\"", "tab\tand\nnewline", "[1, 2]", "#x"}) {
        ConfigFile cf;
        cf.add_vars("var");
        cf.load_config_from_string("var: " + ConfigFile::escape_string(str));
        EXPECT_EQ(cf["var"].as_string(), str);
    }
}

// NOLINTNEXTLINE
TEST(config_file, load_config_from_string) {
    ConfigFile cf;
    cf.add_vars("a", "b", "c", "d", "e", "f", "arr", "unset");
    cf.load_config_from_string(R"===(
# comment
a: bare value with spaces   # trailing comment
b = 'single ''quoted'' # not a comment'
c: "double\tquoted\x41\n"
d:
e: 42
arr: [
    first, 'second, still second'
    "third" # comment
]
ignored: xyz
f: [x=1, y=2]
)===");

    EXPECT_EQ(cf["a"].as_string(), "bare value with spaces");
    EXPECT_EQ(cf["b"].as_string(), "single 'quoted' # not a comment");
    EXPECT_EQ(cf["c"].as_string(), "double\tquotedA\n");
    EXPECT_TRUE(cf["d"].is_set());
    EXPECT_EQ(cf["d"].as_string(), "");
    EXPECT_EQ(cf["e"].as<int>(), 42);
    EXPECT_EQ(cf["a"].as<int>(), std::nullopt);
    EXPECT_TRUE(cf["arr"].is_array());
    EXPECT_EQ(cf["arr"].as_array(), (vector<string>{"first", "second, still second", "third"}));
    EXPECT_EQ(cf["f"].as_array(), (vector<string>{"x=1", "y=2"}));
    EXPECT_FALSE(cf["unset"].is_set());
    EXPECT_FALSE(cf["ignored"].is_set());
    EXPECT_EQ(cf.get_vars().count("ignored"), 0U);
}

// NOLINTNEXTLINE
TEST(config_file, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("x: 1\ny: [a]\nx: 2", true);
    EXPECT_EQ(cf.get_vars().size(), 2U);
    EXPECT_EQ(cf["x"].as_string(), "2");
    EXPECT_EQ(cf["y"].as_array(), vector<string>{"a"});
}

// NOLINTNEXTLINE
TEST(config_file, reload_resets_variables) {
    ConfigFile cf;
    cf.add_vars("x");
    cf.load_config_from_string("x: 1");
    EXPECT_TRUE(cf["x"].is_set());
    cf.load_config_from_string("");
    EXPECT_FALSE(cf["x"].is_set());
    EXPECT_EQ(cf["x"].as_string(), "");
}

// NOLINTNEXTLINE
TEST(config_file, parse_errors) {
    // (input, message)
    vector<pair<string, string>> cases{
        {"a b", "line 1:3: Invalid assignment operator: `b`"},
        {"\nabc", "line 2:4: Incomplete directive: `abc`"},
        {"x: 'abc", "line 1:8: Missing terminating ' character"},
        {"x: \"abc", "line 1:8: Missing terminating \" character"},
        {"x: \"\\q\"", "line 1:6: Unknown escape sequence: `\\q`"},
        {"x: \"\\x4g\"", "line 1:8: Invalid hexadecimal digit: `g`"},
        {"x: [a, b", "line 1:9: Missing terminating ] character at the end of an array"},
        {"x: 'a' b", "line 1:8: Unknown sequence after the value: `b`"},
        {": a", "line 1:1: Invalid or missing variable's name"},
    };

    for (auto const& [input, message] : cases) {
        ConfigFile cf;
        try {
            cf.load_config_from_string(input);
            ADD_FAILURE() << "input: " << input;
        } catch (const ConfigFile::ParseError& pe) {
            EXPECT_EQ(pe.what(), message) << "input: " << input;
        }
    }
}

// NOLINTNEXTLINE
TEST(config_file, parse_error_diagnostics) {
    ConfigFile cf;
    try {
        cf.load_config_from_string("x: 1\ny: 'abc' def");
        ADD_FAILURE();
    } catch (const ConfigFile::ParseError& pe) {
        EXPECT_EQ(pe.diagnostics(), "y: 'abc' def\n" + string(9, ' ') + '^');
    }
}
