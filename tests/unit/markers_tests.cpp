#include <doctest/doctest.h>
#include <salvage/markers.hpp>
#include <salvage/text_utils.hpp>

using namespace salvage;

TEST_CASE("scan_markers finds file and block delimiters") {
    std::string text =
        "<!-- PLAN -->\ncreate: a.ts\n<!-- /PLAN -->\n"
        "<!-- FILE:src/a.ts -->\nx\n<!-- /FILE:src/a.ts -->";
    auto tokens = scan_markers(text);
    REQUIRE(tokens.size() == 4);

    CHECK(tokens[0].name == "PLAN");
    CHECK(tokens[0].kind == MarkerKind::Open);
    CHECK(tokens[1].name == "PLAN");
    CHECK(tokens[1].kind == MarkerKind::Close);

    CHECK(tokens[2].name == "FILE");
    CHECK(tokens[2].path == "src/a.ts");
    CHECK(tokens[2].kind == MarkerKind::Open);
    CHECK(tokens[3].path == "src/a.ts");
    CHECK(tokens[3].kind == MarkerKind::Close);

    CHECK(text.substr(tokens[2].begin, tokens[2].end - tokens[2].begin) ==
          "<!-- FILE:src/a.ts -->");
}

TEST_CASE("whitespace inside delimiters is not significant") {
    auto tight = scan_markers("<!--FILE:a.ts-->x<!--/FILE:a.ts-->");
    auto loose = scan_markers("<!--   FILE: a.ts   -->x<!--  / FILE:a.ts -->");
    REQUIRE(tight.size() == 2);
    REQUIRE(loose.size() == 2);
    CHECK(loose[0].path == "a.ts");
    CHECK(loose[1].kind == MarkerKind::Close);
    CHECK(loose[1].path == "a.ts");
}

TEST_CASE("ordinary HTML comments are skipped") {
    auto tokens = scan_markers("<!-- just a note --><!-- META -->");
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].name == "META");
}

TEST_CASE("unterminated comment does not swallow the next delimiter") {
    auto tokens = scan_markers("<!-- broken <!-- FILE:b.ts -->");
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].path == "b.ts");
}

TEST_CASE("invalid file paths are rejected") {
    CHECK(scan_markers("<!-- FILE: -->").empty());
    CHECK(scan_markers("<!-- FILE:a b.ts -->").empty());
    CHECK(scan_markers("<!-- FILE:\"a.ts\" -->").empty());
}

TEST_CASE("bare closing FILE delimiter") {
    auto tokens = scan_markers("<!-- /FILE -->");
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].kind == MarkerKind::Close);
    CHECK(tokens[0].path.empty());
}

TEST_CASE("has_file_opening sees unterminated openings") {
    CHECK(has_file_opening("text <!-- FILE:src/App.ts"));
    CHECK(has_file_opening("<!--FILE:a.ts -->"));
    CHECK_FALSE(has_file_opening("<!-- /FILE:a.ts -->"));
    CHECK_FALSE(has_file_opening("no markers"));
}

TEST_CASE("block_body") {
    std::string text = "<!-- EXPLANATION -->\nHello\n<!-- /EXPLANATION -->";
    auto tokens = scan_markers(text);
    auto body = block_body(text, tokens, "EXPLANATION");
    REQUIRE(body.has_value());
    CHECK(trim(*body) == "Hello");

    CHECK_FALSE(block_body(text, tokens, "PLAN").has_value());

    std::string open_only = "<!-- BATCH -->\ncurrent: 1";
    CHECK_FALSE(block_body(open_only, scan_markers(open_only), "BATCH").has_value());
}

TEST_CASE("text helpers") {
    SUBCASE("split_list trims and drops empties") {
        auto parts = split_list(" a.ts , ,b.ts,", ',');
        REQUIRE(parts.size() == 2);
        CHECK(parts[0] == "a.ts");
        CHECK(parts[1] == "b.ts");
    }

    SUBCASE("split_lines drops carriage returns") {
        auto lines = split_lines("a\r\nb\n");
        REQUIRE(lines.size() == 3);
        CHECK(lines[0] == "a");
        CHECK(lines[1] == "b");
        CHECK(lines[2].empty());
    }

    SUBCASE("strip_invisible") {
        CHECK(strip_invisible("\xEF\xBB\xBF  {\"a\":1}\xE2\x80\x8B ") == "{\"a\":1}");
        CHECK(strip_invisible("a\xC2\xA0" "b") == "a b");
    }

    SUBCASE("unwrap_leading_fence") {
        CHECK(unwrap_leading_fence("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
        CHECK(unwrap_leading_fence("```\n{\"a\": 1") == "{\"a\": 1");
        CHECK(unwrap_leading_fence("{\"a\": 1}") == "{\"a\": 1}");
    }

    SUBCASE("strip_plan_comment") {
        std::string plan;
        std::string rest =
            strip_plan_comment("// PLAN: {\"create\": [\"a}.ts\"]}\n{\"files\": {}}", &plan);
        CHECK(plan == "{\"create\": [\"a}.ts\"]}");
        CHECK(rest == "{\"files\": {}}");

        CHECK(strip_plan_comment("{\"a\": 1}") == "{\"a\": 1}");
    }
}
