#include <doctest/doctest.h>
#include <salvage/result_json.hpp>

using namespace salvage;

TEST_CASE("result_to_json with content") {
    ParseResult r;
    r.format = ResponseFormat::MarkerV2;
    r.files["src/a.ts"] = "export const a = 1;";
    r.explanation = "done";
    r.truncated = true;
    r.incomplete_files = {"src/b.ts"};

    auto j = result_to_json(r);
    CHECK(j["format"] == "marker-v2");
    CHECK(j["files"]["src/a.ts"] == "export const a = 1;");
    CHECK(j["explanation"] == "done");
    CHECK(j["truncated"] == true);
    CHECK(j["incomplete_files"].size() == 1);
    CHECK(j["errors"].is_array());
    CHECK_FALSE(j.contains("plan"));
    CHECK_FALSE(j.contains("batch"));
    CHECK_FALSE(j.contains("raw_response"));
}

TEST_CASE("result_to_json without content reports sizes") {
    ParseResult r;
    r.files["src/a.ts"] = "export const a = 1;";
    auto j = result_to_json(r, false);
    CHECK(j["files"]["src/a.ts"] == 19);
}

TEST_CASE("nested views use snake_case keys") {
    ParseResult r;
    BatchInfo batch;
    batch.is_complete = false;
    batch.next_batch_hint = "next";
    r.batch = batch;

    ManifestValidation v;
    v.missing = {"x.ts"};
    v.is_valid = false;
    r.validation = v;

    ManifestEntry entry;
    entry.path = "x.ts";
    entry.action = FileAction::Update;
    entry.status = FileStatus::Skipped;
    r.manifest = std::vector<ManifestEntry>{entry};

    auto j = result_to_json(r);
    CHECK(j["batch"]["is_complete"] == false);
    CHECK(j["batch"]["next_batch_hint"] == "next");
    CHECK(j["validation"]["is_valid"] == false);
    CHECK(j["validation"]["missing"][0] == "x.ts");
    CHECK(j["manifest"][0]["action"] == "update");
    CHECK(j["manifest"][0]["status"] == "skipped");
}

TEST_CASE("plan sizes are only present when declared") {
    PlanInfo plan;
    plan.create = {"a.ts"};
    CHECK_FALSE(plan_to_json(plan).contains("sizes"));
    plan.sizes["a.ts"] = 40;
    CHECK(plan_to_json(plan)["sizes"]["a.ts"] == 40);
}

TEST_CASE("status and repair views") {
    StreamingStatus status;
    status.pending = {"c.ts"};
    auto s = status_to_json(status);
    CHECK(s["pending"][0] == "c.ts");
    CHECK(s["streaming"].empty());

    JsonRepairResult repair;
    repair.json = "{}";
    repair.was_repaired = true;
    repair.repairs = {"Closed 1 unclosed bracket(s)"};
    auto rj = repair_to_json(repair);
    CHECK(rj["was_repaired"] == true);
    CHECK(rj["repairs"].size() == 1);
}
