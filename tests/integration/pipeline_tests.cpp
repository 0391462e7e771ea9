/**
 * Integration tests for the full response pipeline
 *
 * Each test drives a realistic response through configuration, parsing,
 * JSON rendering and extraction to disk.
 */

#include <salvage/salvage.hpp>
#include <salvage/fs.hpp>
#include <doctest/doctest.h>
#include <cstdlib>
#include <ctime>
#include <filesystem>

using namespace salvage;

namespace {

class TempTestDir {
public:
    TempTestDir() {
        std::string temp_base = std::filesystem::temp_directory_path().string();
        std::srand(static_cast<unsigned>(std::time(nullptr)));
        std::string unique_name = "salvage_it_" + std::to_string(std::time(nullptr)) + "_" +
                                  std::to_string(std::rand());
        path = temp_base + "/" + unique_name;
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    std::string path;
};

const std::string batched_response =
    "Sure, here is the first batch.\n\n"
    "<!-- META -->\nformat: marker\nversion: 2.0\n<!-- /META -->\n"
    "<!-- PLAN -->\ncreate: src/App.tsx, src/Header.tsx, src/Footer.tsx\n<!-- /PLAN -->\n"
    "<!-- MANIFEST -->\n"
    "| File | Action | Lines | Tokens | Status |\n"
    "|------|--------|-------|--------|--------|\n"
    "| src/App.tsx | create | 9 | ~90 | included |\n"
    "| src/Header.tsx | create | 3 | ~30 | included |\n"
    "| src/Footer.tsx | create | 3 | ~30 | pending |\n"
    "<!-- /MANIFEST -->\n"
    "<!-- BATCH -->\ncurrent: 1\ntotal: 2\nisComplete: false\n"
    "completed: src/App.tsx, src/Header.tsx\nremaining: src/Footer.tsx\n<!-- /BATCH -->\n"
    "<!-- FILE:src/App.tsx -->\n"
    "```tsx\n"
    "import Header from 'components/Header';\n"
    "const App = () {\n"
    "  return (<main className\"app\"><Header /></main>);\n"
    "};\n"
    "export default App;\n"
    "```\n"
    "<!-- /FILE:src/App.tsx -->\n"
    "<!-- FILE:src/Header.tsx -->\n"
    "export default function Header() {\n"
    "  return <h1>Title</h1>;\n"
    "}\n"
    "<!-- /FILE:src/Header.tsx -->\n"
    "<!-- FILE:../escape.ts -->\n"
    "export const bad = true;\n"
    "<!-- /FILE:../escape.ts -->\n"
    "<!-- EXPLANATION -->\nFooter follows in batch 2.\n<!-- /EXPLANATION -->";

} // namespace

TEST_CASE("batched marker response end to end") {
    auto r = parse(batched_response);

    CHECK(r.format == ResponseFormat::MarkerV2);
    CHECK(r.truncated);
    CHECK(r.errors.empty());
    REQUIRE(r.files.count("src/App.tsx") == 1);
    CHECK(r.files.at("src/App.tsx") ==
          "import Header from '/components/Header';\n"
          "const App = () => {\n"
          "  return (<main className=\"app\"><Header /></main>);\n"
          "};\n"
          "export default App;");
    CHECK(r.files.count("src/Header.tsx") == 1);

    REQUIRE(r.validation.has_value());
    CHECK(r.validation->is_valid);
    CHECK(r.validation->extra == std::vector<std::string>{"../escape.ts"});

    SUBCASE("continuation prompt names the remaining file") {
        auto prompt = batch_continuation_prompt(r);
        REQUIRE(prompt.has_value());
        CHECK(prompt->find("- src/Footer.tsx") != std::string::npos);
        CHECK(prompt->find("This is batch 2 of 2.") != std::string::npos);
    }

    SUBCASE("status lists the pending batch file") {
        auto status = streaming_status(r);
        CHECK(status.pending == std::vector<std::string>{"src/Footer.tsx"});
        CHECK(status.streaming.empty());
    }

    SUBCASE("JSON view") {
        auto j = result_to_json(r, false);
        CHECK(j["format"] == "marker-v2");
        CHECK(j["batch"]["remaining"][0] == "src/Footer.tsx");
        CHECK(j["files"].size() == 3);
        CHECK(j["explanation"] == "Footer follows in batch 2.");
    }
}

TEST_CASE("extracting files under an output root") {
    TempTestDir temp_dir;
    auto r = parse(batched_response);

    std::vector<std::string> written;
    std::vector<std::string> rejected;
    for (const auto& file : r.files) {
        auto target = normalize_under_root(temp_dir.path, file.first);
        if (!target.ok) {
            rejected.push_back(file.first);
            continue;
        }
        REQUIRE(fs::write_file(target.path, file.second));
        written.push_back(target.path);
    }

    CHECK(written.size() == 2);
    CHECK(rejected == std::vector<std::string>{"../escape.ts"});
    auto header = fs::read_file(temp_dir.path + "/src/Header.tsx");
    REQUIRE(header.has_value());
    CHECK(header->find("export default function Header()") == 0);
    CHECK_FALSE(fs::exists(std::filesystem::path(temp_dir.path).parent_path().string() +
                           "/escape.ts"));
}

TEST_CASE("configuration file drives parsing") {
    TempTestDir temp_dir;
    std::string config_path = temp_dir.path + "/salvage.json";
    REQUIRE(fs::write_file(config_path, R"({
        "$schema": "salvage.config.v1",
        "limits": {"min_file_length": 1},
        "recovery": {"include_raw": true},
        "repair": {"enabled": false}
    })"));

    auto text = fs::read_file(config_path);
    REQUIRE(text.has_value());
    auto config = parse_parser_config(*text, config_path);
    REQUIRE(config.ok);

    std::string response = R"({"files": {"src/f.ts": "const f = () { go(); }", "src/x.ts": "x"}})";
    auto r = parse(response, config.options);
    CHECK(r.format == ResponseFormat::JsonV1);
    CHECK(r.files.at("src/f.ts") == "const f = () { go(); }");
    CHECK(r.files.at("src/x.ts") == "x");
    REQUIRE(r.raw_response.has_value());
    CHECK(*r.raw_response == response);
}

TEST_CASE("truncated JSON stream recovers as chunks arrive") {
    const std::string full =
        R"({"explanation": "Counter", "files": {"src/Counter.tsx": "export default function Counter() {\n  return <button>+</button>;\n}", "src/index.ts": "export * from './Counter';"}})";

    StreamSession session;
    session.append(full.substr(0, 40));
    CHECK(session.result().format == ResponseFormat::JsonV1);
    CHECK(session.result().truncated);

    session.append(full.substr(40));
    CHECK_FALSE(session.result().truncated);
    CHECK(session.result().files.size() == 2);
    CHECK(session.result().explanation == "Counter");
}
