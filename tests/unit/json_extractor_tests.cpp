#include <doctest/doctest.h>
#include <salvage/extractors.hpp>

#include <algorithm>
#include <limits>

using namespace salvage;

namespace {

bool has_warning(const ParseResult& r, const std::string& w) {
    return std::find(r.warnings.begin(), r.warnings.end(), w) != r.warnings.end();
}

} // namespace

// ============================================================================
// JSON v1
// ============================================================================

TEST_CASE("truncated v1 response is repaired") {
    ParseResult r;
    extract_json_v1(
        R"({"explanation":"Added header","files":{"src/App.tsx":"export default function App(){return null})",
        r);
    REQUIRE(r.files.count("src/App.tsx") == 1);
    CHECK(r.files["src/App.tsx"] == "export default function App(){return null}");
    CHECK(r.explanation == "Added header");
    CHECK(r.truncated);
    CHECK(has_warning(r, "JSON was repaired from truncated response"));
    CHECK(r.errors.empty());
}

TEST_CASE("complete v1 response") {
    ParseResult r;
    extract_json_v1(R"({
        "explanation": "Two files",
        "files": {
            "src/a.ts": "export const a = 1;",
            "src/b.ts": {"content": "export const b = 2;"},
            "src/c.ts": {"code": "export const c = 3;"},
            "README": "not a file path at all"
        }
    })",
                    r);
    CHECK_FALSE(r.truncated);
    CHECK(r.warnings.empty());
    CHECK(r.files.size() == 3);
    CHECK(r.files["src/a.ts"] == "export const a = 1;");
    CHECK(r.files["src/b.ts"] == "export const b = 2;");
    CHECK(r.files["src/c.ts"] == "export const c = 3;");
}

TEST_CASE("fileChanges object and diff bodies") {
    ParseResult r;
    extract_json_v1(
        R"({"fileChanges": {"docs/notes.md": {"diff": "--- a/notes.md\n+++ b/notes.md"}}})", r);
    REQUIRE(r.files.count("docs/notes.md") == 1);
    CHECK(r.files["docs/notes.md"] == "--- a/notes.md\n+++ b/notes.md");
}

TEST_CASE("short and ignored files are dropped") {
    ParseResult r;
    extract_json_v1(R"({"files": {
        "src/a.ts": "x",
        "node_modules/pkg/index.js": "module.exports = {};",
        "src/ok.ts": "export const ok = true;"
    }})",
                    r);
    CHECK(r.files.size() == 1);
    CHECK(r.files.count("src/ok.ts") == 1);

    ParserOptions options;
    options.min_file_length = 1;
    ParseResult loose;
    extract_json_v1(R"({"files": {"src/a.ts": "x;"}})", loose, options);
    CHECK(loose.files.count("src/a.ts") == 1);
}

TEST_CASE("file paths as root keys") {
    ParseResult r;
    extract_json_v1(R"({"src/App.tsx": "export default function App() {}", "name": "demo"})", r);
    CHECK(r.files.size() == 1);
    CHECK(r.files["src/App.tsx"] == "export default function App() {}");
}

TEST_CASE("plan comment and deleted files") {
    SUBCASE("plan supplies deleted files") {
        ParseResult r;
        extract_json_v1("// PLAN: {\"create\": [\"src/a.ts\"], \"delete\": [\"src/old.ts\"]}\n"
                        "{\"files\": {\"src/a.ts\": \"export const a = 1;\"}}",
                        r);
        REQUIRE(r.plan.has_value());
        CHECK(r.plan->create == std::vector<std::string>{"src/a.ts"});
        CHECK(r.deleted_files == std::vector<std::string>{"src/old.ts"});
        CHECK(r.files.count("src/a.ts") == 1);
    }

    SUBCASE("deletedFiles key wins") {
        ParseResult r;
        extract_json_v1("// PLAN: {\"delete\": [\"x.ts\"]}\n"
                        "{\"files\": {}, \"deletedFiles\": [\"y.ts\"]}",
                        r);
        CHECK(r.deleted_files == std::vector<std::string>{"y.ts"});
    }
}

TEST_CASE("fenced JSON is unwrapped") {
    ParseResult r;
    extract_json_v1("```json\n{\"files\": {\"src/a.ts\": \"export const a = 1;\"}}\n```", r);
    CHECK(r.files.count("src/a.ts") == 1);
}

TEST_CASE("JSON errors are reported, not thrown") {
    SUBCASE("no object") {
        ParseResult r;
        extract_json_v1("no braces here", r);
        CHECK(r.errors == std::vector<std::string>{"No JSON object found"});
    }

    SUBCASE("malformed balanced object") {
        ParseResult r;
        extract_json_v1(R"({"a" 1})", r);
        REQUIRE(r.errors.size() == 1);
        CHECK(r.errors[0].rfind("JSON parse error: ", 0) == 0);
        CHECK(r.files.empty());
        CHECK_FALSE(r.truncated);
    }
}

TEST_CASE("json_region") {
    CHECK(json_region(R"(text {"a": {"b": 1}} tail)") == R"({"a": {"b": 1}})");
    CHECK(json_region(R"({"a": [1)") == R"({"a": [1)");
    CHECK(json_region("none").empty());
}

// ============================================================================
// JSON v2
// ============================================================================

TEST_CASE("v2 response with every section") {
    ParseResult r;
    extract_json_v2(R"({
        "meta": {"format": "json", "version": "2.0", "timestamp": "2024-01-01T00:00:00Z"},
        "plan": {"create": ["src/App.tsx", "src/Footer.tsx"], "delete": ["src/old.ts"]},
        "manifest": [
            {"path": "src/App.tsx", "action": "create", "lines": 10, "tokens": 120, "status": "included"},
            {"path": "src/Footer.tsx", "action": "create", "lines": 5, "tokens": 40, "status": "pending"},
            {"action": "create"}
        ],
        "batch": {"current": 1, "total": 2, "isComplete": false,
                  "completed": ["src/App.tsx"], "remaining": ["src/Footer.tsx"],
                  "nextBatchHint": "footer next"},
        "explanation": "First batch",
        "files": {"src/App.tsx": {"content": "export default function App() {}"}}
    })",
                    r);

    REQUIRE(r.meta.has_value());
    CHECK(r.meta->version == "2.0");
    CHECK(r.meta->timestamp == "2024-01-01T00:00:00Z");

    REQUIRE(r.plan.has_value());
    CHECK(r.plan->create.size() == 2);
    CHECK(r.deleted_files == std::vector<std::string>{"src/old.ts"});

    REQUIRE(r.manifest.has_value());
    REQUIRE(r.manifest->size() == 2);
    CHECK((*r.manifest)[0].tokens == 120);
    CHECK((*r.manifest)[1].status == FileStatus::Pending);

    REQUIRE(r.batch.has_value());
    CHECK(r.batch->current == 1);
    CHECK(r.batch->total == 2);
    CHECK_FALSE(r.batch->is_complete);
    CHECK(r.batch->remaining == std::vector<std::string>{"src/Footer.tsx"});
    CHECK(r.batch->next_batch_hint == "footer next");
    CHECK(r.truncated);

    CHECK(r.explanation == "First batch");
    CHECK(r.files.count("src/App.tsx") == 1);

    REQUIRE(r.validation.has_value());
    CHECK(r.validation->is_valid);
    CHECK(r.validation->expected == std::vector<std::string>{"src/App.tsx"});
}

TEST_CASE("v2 defaults") {
    ParseResult r;
    extract_json_v2(R"({"meta": {}, "batch": {"current": 2, "total": 2}, "files": {}})", r);
    REQUIRE(r.meta.has_value());
    CHECK(r.meta->format == "json");
    CHECK(r.meta->version == "2.0");
    REQUIRE(r.batch.has_value());
    CHECK(r.batch->is_complete);
    CHECK_FALSE(r.truncated);
    CHECK_FALSE(r.validation.has_value());
}

TEST_CASE("v2 manifest reports missing files") {
    ParseResult r;
    extract_json_v2(R"({
        "manifest": [
            {"path": "src/App.tsx", "status": "included"},
            {"path": "src/Footer.tsx", "status": "included"}
        ],
        "files": {"src/App.tsx": "export default function App() {}"}
    })",
                    r);
    REQUIRE(r.validation.has_value());
    CHECK(r.validation->missing == std::vector<std::string>{"src/Footer.tsx"});
    CHECK_FALSE(r.validation->is_valid);
    CHECK(r.files.count("src/App.tsx") == 1);
    CHECK(has_warning(r, "Manifest validation: missing files: src/Footer.tsx"));
}

TEST_CASE("v2 numbers outside the int range are clamped") {
    ParseResult r;
    extract_json_v2(R"({
        "manifest": [
            {"path": "src/a.ts", "lines": 1e20, "tokens": -1e30, "status": "pending"},
            {"path": "src/b.ts", "lines": 9000000000, "tokens": -9000000000, "status": "pending"},
            {"path": "src/c.ts", "lines": 12.7, "tokens": "many", "status": "pending"}
        ],
        "batch": {"current": 18446744073709551615, "total": -5e300},
        "files": {}
    })",
                    r);

    REQUIRE(r.manifest.has_value());
    REQUIRE(r.manifest->size() == 3);
    CHECK((*r.manifest)[0].lines == std::numeric_limits<int>::max());
    CHECK((*r.manifest)[0].tokens == std::numeric_limits<int>::min());
    CHECK((*r.manifest)[1].lines == std::numeric_limits<int>::max());
    CHECK((*r.manifest)[1].tokens == std::numeric_limits<int>::min());
    CHECK((*r.manifest)[2].lines == 12);
    CHECK((*r.manifest)[2].tokens == 0);

    REQUIRE(r.batch.has_value());
    CHECK(r.batch->current == std::numeric_limits<int>::max());
    CHECK(r.batch->total == std::numeric_limits<int>::min());
}
