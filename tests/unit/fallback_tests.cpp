#include <doctest/doctest.h>
#include <salvage/extractors.hpp>

using namespace salvage;

namespace {

const char* const fallback_warning = "Using fallback parser - response format not recognized";

} // namespace

TEST_CASE("path label above a fence names the file") {
    std::string text =
        "Here is the code:\n\n"
        "**src/App.tsx**\n"
        "```tsx\nexport default function App() {\n  return null;\n}\n```\n\n"
        "### `src/styles.css`\n"
        "```css\nbody { margin: 0; }\n```";
    ParseResult r;
    extract_fallback(text, r);

    CHECK(r.files.size() == 2);
    CHECK(r.files["src/App.tsx"] == "export default function App() {\n  return null;\n}");
    CHECK(r.files["src/styles.css"] == "body { margin: 0; }");
    CHECK(r.recovered_files == std::vector<std::string>{"src/App.tsx", "src/styles.css"});
    REQUIRE_FALSE(r.warnings.empty());
    CHECK(r.warnings[0] == fallback_warning);
}

TEST_CASE("File: line inside a fence names the file") {
    std::string text = "```tsx\nFile: src/Button.tsx\nexport const Button = () => null;\n```";
    ParseResult r;
    extract_fallback(text, r);
    CHECK(r.files.size() == 1);
    CHECK(r.files["src/Button.tsx"] == "export const Button = () => null;");
}

TEST_CASE("source fences get synthetic names") {
    std::string text =
        "```tsx\nimport React from 'react';\nexport default function A() { return null; }\n```\n"
        "```js\nx\n```\n"
        "```js\nconsole.log('hello world');\n```\n"
        "```ts\nexport const x = 1;\n```\n"
        "```css\n.a { color: red; }\n```";
    ParseResult r;
    extract_fallback(text, r);

    CHECK(r.files.size() == 3);
    CHECK(r.files.count("component1.tsx") == 1);
    CHECK(r.files.count("code2.js") == 1);
    CHECK(r.files.count("module3.ts") == 1);
}

TEST_CASE("labelled blocks take precedence over synthetic names") {
    std::string text =
        "src/a.ts\n```ts\nexport const a = 1;\n```\n"
        "```ts\nexport const b = 2;\n```";
    ParseResult r;
    extract_fallback(text, r);
    CHECK(r.files.size() == 1);
    CHECK(r.files.count("src/a.ts") == 1);
}

TEST_CASE("nothing recoverable") {
    SUBCASE("unterminated fence") {
        ParseResult r;
        extract_fallback("```tsx\nexport const a = 1;", r);
        CHECK(r.files.empty());
        CHECK(r.warnings == std::vector<std::string>{fallback_warning});
    }

    SUBCASE("label with an unknown extension") {
        ParseResult r;
        extract_fallback("notes.txt\n```\nsome plain notes here\n```", r);
        CHECK(r.files.empty());
    }
}
