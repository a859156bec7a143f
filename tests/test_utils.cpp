#include "panel_promote/core/events.hpp"
#include "panel_promote/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using panel_promote::Phase;
namespace core = panel_promote::core;

TEST_CASE("sha256_bytes_matches_known_digest") {
  const std::vector<uint8_t> abc = {'a', 'b', 'c'};
  REQUIRE(core::sha256_bytes(abc) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("base64_encode_pads_output") {
  REQUIRE(core::base64_encode({'h', 'e', 'l', 'l', 'o'}) == "aGVsbG8=");
  REQUIRE(core::base64_encode({'h', 'i'}) == "aGk=");
  REQUIRE(core::base64_encode({'a', 'b', 'c'}) == "YWJj");
  REQUIRE(core::base64_encode({}).empty());
}

TEST_CASE("split_keeps_empty_parts") {
  REQUIRE(core::split("3x", 'x') == std::vector<std::string>{"3", ""});
  REQUIRE(core::split("3x3", 'x') == std::vector<std::string>{"3", "3"});
  REQUIRE(core::split("", 'x') == std::vector<std::string>{""});
}

TEST_CASE("string_helpers") {
  REQUIRE(core::trim("  a b \t\n") == "a b");
  REQUIRE(core::trim("   ").empty());
  REQUIRE(core::to_lower("ComfyUI") == "comfyui");
  REQUIRE(core::zero_pad(5, 2) == "05");
  REQUIRE(core::zero_pad(12, 2) == "12");
}

TEST_CASE("utf8_validation") {
  REQUIRE(core::is_valid_utf8("panel_01"));
  REQUIRE(core::is_valid_utf8(""));
  REQUIRE(core::is_valid_utf8("p\xc3\xa4nel"));             // U+00E4
  REQUIRE(core::is_valid_utf8("\xe2\x82\xac"));             // U+20AC
  REQUIRE(core::is_valid_utf8("\xf0\x9f\x8e\xa8"));         // U+1F3A8

  REQUIRE_FALSE(core::is_valid_utf8("panel_\xff\xfe"));
  REQUIRE_FALSE(core::is_valid_utf8("\xc3"));                 // truncated
  REQUIRE_FALSE(core::is_valid_utf8("\xc0\xaf"));             // overlong '/'
  REQUIRE_FALSE(core::is_valid_utf8("\xed\xa0\x80"));         // surrogate
  REQUIRE_FALSE(core::is_valid_utf8("\xf4\x90\x80\x80"));     // above U+10FFFF
  REQUIRE_FALSE(core::is_valid_utf8("a\x80"));                // stray continuation
}

TEST_CASE("event_emitter_writes_json_lines") {
  std::ostringstream out;
  core::EventEmitter emitter;
  emitter.run_start("run_1", {{"panels", 3}}, out);
  emitter.phase_start("run_1", Phase::PROCESSING_PANELS, out);
  emitter.run_end("run_1", true, "PASSED", out);

  std::istringstream in(out.str());
  std::string line;
  std::vector<nlohmann::json> events;
  while (std::getline(in, line)) {
    events.push_back(nlohmann::json::parse(line));
  }

  REQUIRE(events.size() == 3);
  REQUIRE(events[0]["type"] == "run_start");
  REQUIRE(events[0]["panels"] == 3);
  REQUIRE(events[1]["phase"] == 1);
  REQUIRE(events[1]["phase_name"] == "PROCESSING_PANELS");
  REQUIRE(events[2]["success"] == true);
  for (const auto &e : events) {
    REQUIRE(e["run_id"] == "run_1");
    REQUIRE(e.contains("ts"));
  }
}
