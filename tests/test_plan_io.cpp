#include "panel_promote/core/errors.hpp"
#include "panel_promote/io/plan_io.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <fstream>

using panel_promote::IOError;
using panel_promote::PromotionPlan;
using panel_promote::ValidationError;
using panel_promote::testing::TempDir;
using json = nlohmann::json;
namespace io = panel_promote::io;

namespace {

json sample_plan_json() {
  return {
      {"master_grid_path", "grid.png"},
      {"output_directory", "out"},
      {"grid_specification", "3x3"},
      {"global_seed", 42},
      {"global_style_anchor", "watercolor storybook"},
      {"panels",
       {{{"panel_id", "panel_01"}, {"grid_position", {0, 0}}, {"prompt_extension", "a fox"}},
        {{"panel_id", "panel_05"}, {"grid_position", {{"row", 1}, {"col", 1}}}}}}};
}

} // namespace

TEST_CASE("plan_from_json_reads_all_fields") {
  PromotionPlan plan = io::plan_from_json(sample_plan_json());
  REQUIRE(plan.master_grid_path.string() == "grid.png");
  REQUIRE(plan.output_directory.string() == "out");
  REQUIRE(plan.grid_specification == "3x3");
  REQUIRE(plan.global_seed == 42);
  REQUIRE(plan.global_style_anchor.has_value());
  REQUIRE(*plan.global_style_anchor == "watercolor storybook");
  REQUIRE_FALSE(plan.target_aspect_ratio.has_value());

  REQUIRE(plan.panels.size() == 2);
  REQUIRE(plan.panels[0].panel_id == "panel_01");
  REQUIRE(plan.panels[0].grid_position.row == 0);
  REQUIRE(plan.panels[0].grid_position.col == 0);
  REQUIRE(plan.panels[0].prompt_extension == "a fox");
  REQUIRE(plan.panels[1].grid_position.row == 1);
  REQUIRE(plan.panels[1].grid_position.col == 1);
  REQUIRE(plan.panels[1].prompt_extension.empty());
}

TEST_CASE("plan_from_json_accepts_target_ratio_override") {
  json j = sample_plan_json();
  j["target_aspect_ratio"] = 1.5;
  PromotionPlan plan = io::plan_from_json(j);
  REQUIRE(plan.target_aspect_ratio.has_value());
  REQUIRE(*plan.target_aspect_ratio == Catch::Approx(1.5));
}

TEST_CASE("plan_from_json_rejects_bad_fields") {
  SECTION("missing field") {
    json j = sample_plan_json();
    j.erase("grid_specification");
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("non-integer seed") {
    json j = sample_plan_json();
    j["global_seed"] = "42";
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("three-element position") {
    json j = sample_plan_json();
    j["panels"][0]["grid_position"] = {0, 0, 0};
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("fractional position") {
    json j = sample_plan_json();
    j["panels"][0]["grid_position"] = {0.5, 0};
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("row beyond int range") {
    json j = sample_plan_json();
    j["panels"][0]["grid_position"] = json::parse("[4294967296, 0]");
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("col beyond int range in object form") {
    json j = sample_plan_json();
    j["panels"][0]["grid_position"] = json::parse(R"({"row": 0, "col": 4294967297})");
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("negative row beyond int range") {
    json j = sample_plan_json();
    j["panels"][0]["grid_position"] = json::parse("[-4294967296, 0]");
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("seed above int64 range") {
    json j = sample_plan_json();
    j["global_seed"] = json::parse("18446744073709551615");
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("panels not an array") {
    json j = sample_plan_json();
    j["panels"] = "panel_01";
    REQUIRE_THROWS_AS(io::plan_from_json(j), ValidationError);
  }
  SECTION("not an object") {
    REQUIRE_THROWS_AS(io::plan_from_json(json::array()), ValidationError);
  }
}

TEST_CASE("plan_from_json_keeps_full_int64_seed_range") {
  json j = sample_plan_json();
  j["global_seed"] = json::parse("9223372036854775807");
  REQUIRE(io::plan_from_json(j).global_seed == INT64_MAX);

  j["global_seed"] = -7;
  REQUIRE(io::plan_from_json(j).global_seed == -7);
}

TEST_CASE("load_plan_resolves_relative_paths_against_plan_file") {
  TempDir dir("plan");
  const auto path = dir.path() / "plan.json";
  {
    std::ofstream out(path);
    out << sample_plan_json().dump(2);
  }

  PromotionPlan plan = io::load_plan(path);
  REQUIRE(plan.master_grid_path.string() == (dir.path() / "grid.png").string());
  REQUIRE(plan.output_directory.string() == (dir.path() / "out").string());
}

TEST_CASE("load_plan_reports_parse_and_io_errors") {
  TempDir dir("plan_bad");
  REQUIRE_THROWS_AS(io::load_plan(dir.path() / "missing.json"), IOError);

  const auto bad = dir.path() / "bad.json";
  {
    std::ofstream out(bad);
    out << "{\"master_grid_path\": ";
  }
  REQUIRE_THROWS_AS(io::load_plan(bad), ValidationError);
}

TEST_CASE("plan_to_json_is_readable_by_plan_from_json") {
  PromotionPlan plan = io::plan_from_json(sample_plan_json());
  PromotionPlan again = io::plan_from_json(io::plan_to_json(plan));
  REQUIRE(again.panels.size() == plan.panels.size());
  REQUIRE(again.panels[1].grid_position.row == 1);
  REQUIRE(again.global_style_anchor == plan.global_style_anchor);
}
