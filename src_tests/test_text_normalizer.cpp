/**
 * @file test_text_normalizer.cpp
 * @brief Tests for text canonicalisation and first-difference reporting
 *
 * Covers:
 *  - Line endings, blank-line capping, whitespace folding, case folding
 *  - Smart punctuation and \uXXXX decoding (surrogate pairs included)
 *  - Embedded JSON canonicalisation with optional array sorting
 *  - UTF-8 validation and first_difference excerpts
 */

#include <catch2/catch.hpp>

#include "grader_harness/text_normalizer.hpp"

using grader::harness::NormalizeOptions;

TEST_CASE("Line endings and blank lines are unified", "[normalize][lines]") {
    REQUIRE(grader::harness::normalize_text("  Hello\r\n\r\n\r\nWorld  \t ") == "hello\n\nworld");
    REQUIRE(grader::harness::normalize_text("a\rb") == "a\nb");
    REQUIRE(grader::harness::normalize_text("GET /books/1\n") == "get /books/1");
}

TEST_CASE("Whitespace variants collapse to one space", "[normalize][spaces]") {
    REQUIRE(grader::harness::normalize_text("Book:\tDune\xC2\xA0\xC2\xA0(1965)") == "book: dune (1965)");
    REQUIRE(grader::harness::normalize_text(" \t \r\n ").empty());
}

TEST_CASE("Case folding can be disabled", "[normalize][case]") {
    const NormalizeOptions keep_case{false, false};
    REQUIRE(grader::harness::normalize_text("Hello World", keep_case) == "Hello World");
    REQUIRE(grader::harness::normalize_text("Hello World") == "hello world");
}

TEST_CASE("Smart punctuation folds to ASCII", "[normalize][punctuation]") {
    const auto text = grader::harness::normalize_text("\xE2\x80\x9CHi\xE2\x80\x9D \xE2\x80\x94 it\xE2\x80\x99s ok");
    REQUIRE(text == "\"hi\" - it's ok");
}

TEST_CASE("Unicode escapes decode to UTF-8", "[normalize][unicode]") {
    REQUIRE(grader::harness::unescape_unicode("caf\\u00e9") == "caf\xC3\xA9");
    REQUIRE(grader::harness::unescape_unicode("\\ud83d\\ude00") == "\xF0\x9F\x98\x80");
    REQUIRE(grader::harness::unescape_unicode("lone \\udc00") == "lone \xEF\xBF\xBD");
    REQUIRE(grader::harness::unescape_unicode("\\u12") == "\\u12");
}

TEST_CASE("Embedded JSON is re-serialised canonically", "[normalize][json]") {
    REQUIRE(grader::harness::normalize_text(R"({ "b": 1, "a": [2, 1] })") == R"({"a":[2,1],"b":1})");

    const NormalizeOptions sorted{true, true};
    REQUIRE(grader::harness::normalize_text(R"({ "b": 1, "a": [2, 1] })", sorted) == R"({"a":[1,2],"b":1})");

    REQUIRE(grader::harness::canonical_json("[3, 1, 2]", true) == std::optional<std::string>{"[1,2,3]"});
    REQUIRE_FALSE(grader::harness::canonical_json("not json", false).has_value());
    // Invalid JSON-looking text falls through to plain normalisation.
    REQUIRE(grader::harness::normalize_text("{ broken") == "{ broken");
}

TEST_CASE("Aggressive stripping removes whitespace and light punctuation", "[normalize][aggressive]") {
    REQUIRE(grader::harness::strip_aggressive("a, b. c: d; e\n") == "abcde");
    REQUIRE(grader::harness::strip_aggressive("x-y!") == "x-y!");
}

TEST_CASE("UTF-8 validation rejects malformed sequences", "[normalize][utf8]") {
    REQUIRE(grader::harness::is_valid_utf8("plain ascii"));
    REQUIRE(grader::harness::is_valid_utf8("caf\xC3\xA9"));
    REQUIRE(grader::harness::is_valid_utf8("\xF0\x9F\x98\x80"));
    REQUIRE_FALSE(grader::harness::is_valid_utf8("\xC3"));
    REQUIRE_FALSE(grader::harness::is_valid_utf8("\xC0\x80"));
    REQUIRE_FALSE(grader::harness::is_valid_utf8("\xED\xA0\x80"));
    REQUIRE_FALSE(grader::harness::is_valid_utf8("\xFF"));
}

TEST_CASE("first_difference locates the divergence", "[normalize][diff]") {
    const auto diff = grader::harness::first_difference("abcdef", "abcXef", 2);
    REQUIRE(diff.index == 3);
    REQUIRE(diff.expected_excerpt == "bcde");
    REQUIRE(diff.actual_excerpt == "bcXe");

    REQUIRE(grader::harness::first_difference("abc", "abcd").index == 3);
    REQUIRE(grader::harness::first_difference("same", "same").index == -1);
}
