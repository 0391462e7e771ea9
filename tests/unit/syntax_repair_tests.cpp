#include <doctest/doctest.h>
#include <salvage/syntax_repair.hpp>

#include <algorithm>

using namespace salvage;

// ============================================================================
// Arrow functions
// ============================================================================

TEST_CASE("missing arrow after assignment") {
    CHECK(fix_arrow_functions("const onClick = () { doThing(); }") ==
          "const onClick = () => { doThing(); }");
}

TEST_CASE("apply_all inserts a missing arrow") {
    auto r = apply_all("const onClick = () { doThing(); }");
    CHECK(r.code == "const onClick = () => { doThing(); }");
    REQUIRE_FALSE(r.fixes_applied.empty());
    CHECK(r.fixes_applied.front() == "arrow-functions");
}

TEST_CASE("arrow repair variants") {
    SUBCASE("spaced arrow") {
        CHECK(fix_arrow_functions("const f = (a) = > a + 1;") == "const f = (a) => a + 1;");
    }

    SUBCASE("function declaration with stray arrow") {
        CHECK(fix_arrow_functions("function App() => {\n  return null;\n}") ==
              "function App() {\n  return null;\n}");
    }

    SUBCASE("callback argument") {
        CHECK(fix_arrow_functions("items.map((item) { return item.id; })") ==
              "items.map((item) => { return item.id; })");
    }

    SUBCASE("async callback") {
        CHECK(fix_arrow_functions("const load = async () { await get(); }") ==
              "const load = async () => { await get(); }");
    }

    SUBCASE("empty parameter list") {
        CHECK(fix_arrow_functions("const f = ( ) => 1;") == "const f = () => 1;");
    }

    SUBCASE("control flow is left alone") {
        std::string code = "if (x) { y(); } while (z) { w(); }";
        CHECK(fix_arrow_functions(code) == code);
    }

    SUBCASE("method call followed by a block is left alone") {
        std::string code = "function go(a) { return a; }";
        CHECK(fix_arrow_functions(code) == code);
    }

    SUBCASE("comparison is not an arrow") {
        std::string code = "if (a >= b) { c(); }";
        CHECK(fix_arrow_functions(code) == code);
    }
}

// ============================================================================
// Attributes
// ============================================================================

TEST_CASE("attribute quoting") {
    SUBCASE("missing equals sign") {
        CHECK(fix_attribute_quoting("<div className\"box\">x</div>") ==
              "<div className=\"box\">x</div>");
    }

    SUBCASE("event handler in quotes") {
        CHECK(fix_attribute_quoting("<button onClick\"handleClick\">Go</button>") ==
              "<button onClick={handleClick}>Go</button>");
    }

    SUBCASE("style string") {
        CHECK(fix_attribute_quoting("<div style\"color: red\" />") ==
              "<div style={{color: red}} />");
    }

    SUBCASE("doubled equals inside a tag") {
        CHECK(fix_attribute_quoting("<input value==\"x\" />") == "<input value=\"x\" />");
    }

    SUBCASE("comparison outside a tag is untouched") {
        std::string code = "if (value == \"x\") { go(); }";
        CHECK(fix_attribute_quoting(code) == code);
    }

    SUBCASE("text inside strings is untouched") {
        std::string code = "const s = 'className\"box\"';";
        CHECK(fix_attribute_quoting(code) == code);
    }
}

// ============================================================================
// Conditionals and declarations
// ============================================================================

TEST_CASE("ternary without a false branch gets null") {
    CHECK(fix_conditional_expressions("return (<div>{show ? <Modal /> }</div>);") ==
          "return (<div>{show ? <Modal /> : null }</div>);");
}

TEST_CASE("logical false branch is parenthesised") {
    CHECK(fix_conditional_expressions("<div>{a ? <A /> : b && <B />}</div>") ==
          "<div>{a ? <A /> : (b && <B />)}</div>");
}

TEST_CASE("complete ternary is untouched") {
    std::string code = "<div>{a ? <A /> : <B />}</div>";
    CHECK(fix_conditional_expressions(code) == code);
}

TEST_CASE("declaration repair") {
    CHECK(fix_declarations("const x: : number = 1;") == "const x: number = 1;");
    CHECK(fix_declarations("const o = {a: 1,}") == "const o = {a: 1}");
    CHECK(fix_declarations("const s = ': :';") == "const s = ': :';");
}

// ============================================================================
// Brackets and tags
// ============================================================================

TEST_CASE("bracket balance appends closers") {
    CHECK(fix_bracket_balance("function f() {\n  if (x) {\n    go(") ==
          "function f() {\n  if (x) {\n    go()}}");

    SUBCASE("ends inside a string") {
        std::string code = "const s = \"abc";
        CHECK(fix_bracket_balance(code) == code);
    }

    SUBCASE("ends inside a line comment") {
        CHECK(fix_bracket_balance("f(() => { // note") == "f(() => { // note\n})");
    }
}

TEST_CASE("scan_tags") {
    auto tags = scan_tags("const a = b < c; return (<div className=\"x\"><br /><Foo bar={1 > 0} /></div>);");
    REQUIRE(tags.size() == 4);
    CHECK(tags[0].kind == TagKind::Open);
    CHECK(tags[0].name == "div");
    CHECK(tags[1].kind == TagKind::SelfClosing);
    CHECK(tags[1].name == "br");
    CHECK(tags[2].kind == TagKind::SelfClosing);
    CHECK(tags[2].name == "Foo");
    CHECK(tags[3].kind == TagKind::Close);
    CHECK(tags[3].name == "div");
}

TEST_CASE("generics are not tags") {
    CHECK(scan_tags("const xs: Array<string> = [];").empty());
    CHECK(scan_tags("const id = <T>(x: T) => x;").empty());
}

TEST_CASE("tag balance closes nested elements") {
    SUBCASE("inner element closed at the outer closing tag") {
        CHECK(fix_tag_balance("return (<div><span>hi</div>);") ==
              "return (<div><span>hi</span></div>);");
    }

    SUBCASE("open elements closed before the enclosing paren") {
        CHECK(fix_tag_balance("const A = () => (\n  <div>\n    <p>text\n);") ==
              "const A = () => (\n  <div>\n    <p>text\n</p></div>);");
    }

    SUBCASE("balanced markup is untouched") {
        std::string code = "return (<ul><li>a</li><li>b</li></ul>);";
        CHECK(fix_tag_balance(code) == code);
    }
}

TEST_CASE("find_element_end") {
    std::string code = "x = <a><b /></a>;";
    size_t open = code.find('<');
    CHECK(find_element_end(code, open) == code.find(';'));
    CHECK(find_element_end("x = <a><b />", 4) == std::string::npos);
}

// ============================================================================
// Imports
// ============================================================================

TEST_CASE("duplicate imports are merged") {
    std::string code =
        "import { useState } from 'react';\n"
        "import { useEffect, useState } from 'react';\n"
        "import x from './x';\n";
    CHECK(merge_duplicate_imports(code) ==
          "import { useState, useEffect } from 'react';\n"
          "import x from './x';\n");
}

TEST_CASE("default and named imports merge") {
    std::string code = "import React from \"react\"\nimport { useMemo } from \"react\"";
    CHECK(merge_duplicate_imports(code) == "import React, { useMemo } from \"react\"");
}

TEST_CASE("namespace imports are not merged") {
    std::string code = "import * as R from 'react';\nimport { useMemo } from 'react';";
    CHECK(merge_duplicate_imports(code) == code);
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_CASE("quick_validate") {
    CHECK(quick_validate("const f = () => { go(); };"));
    CHECK_FALSE(quick_validate("const f = () => { go();"));
    CHECK_FALSE(quick_validate("const f = (a) = > a;"));
    CHECK_FALSE(quick_validate("let x: : number;"));
    CHECK_FALSE(quick_validate("<div className\"a\" />"));
    CHECK_FALSE(quick_validate("return (<div>{ok ? <A /> }</div>);"));
    CHECK(quick_validate("const s = \"= > : : className\\\"\";"));
}

TEST_CASE("apply_all is stable on clean code") {
    std::string code = "export default function App() {\n  return <div>Hello</div>;\n}";
    auto r = apply_all(code);
    CHECK(r.code == code);
    CHECK(r.fixes_applied.empty());
}

TEST_CASE("apply_all runs several passes") {
    auto r = apply_all("const App = () {\n  return (<div className\"app\"><p>Hi</div>);\n");
    CHECK(r.code == "const App = () => {\n  return (<div className=\"app\"><p>Hi</p></div>);\n}");
    CHECK(quick_validate(r.code));
    CHECK(std::find(r.fixes_applied.begin(), r.fixes_applied.end(), "attributes") !=
          r.fixes_applied.end());
    CHECK(std::find(r.fixes_applied.begin(), r.fixes_applied.end(), "brackets") !=
          r.fixes_applied.end());
}

TEST_CASE("safe_apply keeps the original when the repair cannot validate") {
    SUBCASE("nothing matched") {
        std::string code = "const s = \"unterminated";
        CHECK_FALSE(quick_validate(code));
        CHECK(safe_apply(code) == code);
    }

    SUBCASE("repairs applied but the result still fails") {
        std::string code = "const f = (a) { return a; }\nconst s = \"oops";
        CHECK(apply_all(code).code != code);
        CHECK(safe_apply(code) == code);
    }

    SUBCASE("valid repair is committed") {
        CHECK(safe_apply("const onClick = () { doThing(); }") ==
              "const onClick = () => { doThing(); }");
    }
}

TEST_CASE("regex literals survive repair") {
    std::string code = "const re = /\\{/;\nexport default re;";
    CHECK(quick_validate(code));
    CHECK(fix_bracket_balance(code) == code);
    CHECK(safe_apply(code) == code);

    std::string split = "export const parts = (p) => p.split(/[\\/(]/);";
    CHECK(apply_all(split).fixes_applied.empty());
    CHECK(safe_apply(split) == split);
}

TEST_CASE("RepairSession") {
    RepairSession session("const f = () { go(); }");
    CHECK_FALSE(session.changed());
    session.run();
    CHECK(session.changed());
    CHECK(session.validate());
    CHECK(session.commit() == "const f = () => { go(); }");
    CHECK(session.discard() == "const f = () { go(); }");
    CHECK(session.original() == "const f = () { go(); }");
}
