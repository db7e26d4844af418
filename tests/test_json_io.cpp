#include "defense/engine_config.hpp"
#include "defense/run_results.hpp"
#include "defense/scenario_parser.hpp"
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include "util/log.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace skyshield;
using namespace skyshield::defense;

// ── JsonReader ──

TEST(JsonReader, ParsesNestedDocument) {
    auto root = JsonReader::parse(R"({
        "name": "salvo",
        "count": 3,
        "enabled": true,
        "position": [100, 250.5, -3],
        "nested": { "list": ["a", "b"] }
    })");

    EXPECT_EQ(root["name"].as_string(), "salvo");
    EXPECT_EQ(root["count"].as_int(), 3);
    EXPECT_TRUE(root["enabled"].as_bool());
    Vec3 p = root["position"].get_vec3();
    EXPECT_DOUBLE_EQ(p.x, 100.0);
    EXPECT_DOUBLE_EQ(p.y, 250.5);
    EXPECT_DOUBLE_EQ(p.z, -3.0);
    EXPECT_EQ(root["nested"]["list"].size(), 2u);
    EXPECT_EQ(root["nested"]["list"][1].as_string(), "b");
}

TEST(JsonReader, LenientAccessorsFallBack) {
    auto root = JsonReader::parse(R"({"speed": "fast", "pair": [1, 2]})");
    EXPECT_DOUBLE_EQ(root["speed"].get_number(250.0), 250.0);
    EXPECT_DOUBLE_EQ(root["missing"].get_number(7.0), 7.0);
    Vec3 def{1, 1, 1};
    EXPECT_DOUBLE_EQ(root["pair"].get_vec3(def).x, 1.0);
    EXPECT_DOUBLE_EQ(root["pair"].get_vec3(def).z, 1.0);
}

TEST(JsonReader, RequireNamesMissingKey) {
    auto root = JsonReader::parse(R"({"id": "T1"})");
    EXPECT_EQ(root.require("id").as_string(), "T1");
    try {
        root.require("velocity");
        FAIL() << "expected a missing-key error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("velocity"), std::string::npos);
    }
}

TEST(JsonReader, ErrorReportsLineAndColumn) {
    try {
        JsonReader::parse("{\n  \"a\": 1,\n  \"b\": ?\n}");
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("at 3:"), std::string::npos) << e.what();
    }
}

TEST(JsonReader, RejectsTrailingCharacters) {
    EXPECT_THROW(JsonReader::parse(R"({"a": 1} x)"), std::runtime_error);
}

// ── JsonWriter ──

TEST(JsonWriter, OutputParsesBack) {
    std::ostringstream out;
    JsonWriter w(out);
    w.begin_object();
    w.kv("seed", 42);
    w.kv("ratio", 0.25);
    w.kv("label", "north \"battery\"");
    w.kv("impact", Vec3{10, 0, -3});
    w.key("empty").begin_array();
    w.end_array();
    w.key("ids").begin_array();
    w.value("I1");
    w.value("I2");
    w.end_array();
    w.key("error").null_value();
    w.end_object();

    auto root = JsonReader::parse(out.str());
    EXPECT_EQ(root["seed"].as_int(), 42);
    EXPECT_DOUBLE_EQ(root["ratio"].as_number(), 0.25);
    EXPECT_EQ(root["label"].as_string(), "north \"battery\"");
    EXPECT_DOUBLE_EQ(root["impact"].get_vec3().z, -3.0);
    EXPECT_EQ(root["empty"].size(), 0u);
    EXPECT_EQ(root["ids"][0].as_string(), "I1");
    EXPECT_TRUE(root["error"].is_null());
}

TEST(JsonWriter, NonFiniteNumbersBecomeNull) {
    std::ostringstream out;
    JsonWriter w(out);
    w.begin_object();
    w.kv("tti", std::numeric_limits<double>::infinity());
    w.end_object();
    EXPECT_TRUE(JsonReader::parse(out.str())["tti"].is_null());
}

// ── EngineConfig ──

TEST(EngineConfig, DefaultsAreValid) {
    EngineConfig c;
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.guidance_mode, GuidanceMode::AUGMENTED_PN);
    EXPECT_EQ(c.max_in_flight, 8);
    EXPECT_DOUBLE_EQ(c.solution_ttl, 0.1);
}

TEST(EngineConfig, OverlaysScenarioValues) {
    auto doc = JsonReader::parse(R"({
        "guidanceMode": "true",
        "navigationConstant": 4.5,
        "maxInFlight": 3,
        "cacheCapacity": 50,
        "blast": { "directHitPk": 1.0, "pkJitter": 0 },
        "fuse": { "armingDistance": 5 }
    })");
    EngineConfig c = EngineConfig::from_json(doc);
    EXPECT_EQ(c.guidance_mode, GuidanceMode::TRUE_PN);
    EXPECT_DOUBLE_EQ(c.navigation_constant, 4.5);
    EXPECT_EQ(c.max_in_flight, 3);
    EXPECT_EQ(c.cache_capacity, 50u);
    EXPECT_DOUBLE_EQ(c.blast.direct_hit_pk, 1.0);
    EXPECT_DOUBLE_EQ(c.blast.pk_jitter, 0.0);
    EXPECT_DOUBLE_EQ(c.fuse.arming_distance, 5.0);
    // Untouched fields keep their defaults
    EXPECT_DOUBLE_EQ(c.assessment_delay, 2.0);
}

TEST(EngineConfig, RejectsOutOfRangeValues) {
    EXPECT_THROW(EngineConfig::from_json(JsonReader::parse(R"({"navigationConstant": 7})")),
                 std::runtime_error);
    EXPECT_THROW(EngineConfig::from_json(JsonReader::parse(R"({"guidanceMode": "pure"})")),
                 std::runtime_error);
    EXPECT_THROW(EngineConfig::from_json(JsonReader::parse(R"({"blast": {"severeRadius": 2}})")),
                 std::runtime_error);
    EXPECT_THROW(EngineConfig::from_json(JsonReader::parse(R"({"cacheCapacity": -1})")),
                 std::runtime_error);
}

// ── ScenarioParser ──

TEST(ScenarioParser, ParsesBatteriesAndSortsThreatsBySpawn) {
    auto doc = JsonReader::parse(R"({
        "batteries": [
            { "id": "B1", "position": [0, 0, 0], "maxRange": 3000, "interceptors": 5,
              "maxInterceptors": 10 },
            { "id": "L1", "kind": "laser", "position": [50, 0, 0] }
        ],
        "threats": [
            { "id": "T2", "category": "rocket", "position": [900, 400, 0],
              "velocity": [-50, 0, 0], "spawnTime": 3 },
            { "id": "T1", "category": "ballistic", "position": [1000, 500, 0],
              "velocity": [-100, -50, 0] }
        ]
    })");
    Scenario s = ScenarioParser::parse(doc);

    ASSERT_EQ(s.batteries.size(), 2u);
    EXPECT_EQ(s.batteries[0].interceptors, 5);
    EXPECT_EQ(s.batteries[0].max_interceptors, 10);
    EXPECT_EQ(s.batteries[1].kind, BatteryKind::LASER);

    ASSERT_EQ(s.threats.size(), 2u);
    EXPECT_EQ(s.threats[0].threat.id, "T1");
    EXPECT_EQ(s.threats[0].threat.category, ThreatCategory::BALLISTIC_MISSILE);
    EXPECT_NEAR(s.threats[0].threat.time_to_impact, 6.21, 0.01);
    EXPECT_EQ(s.threats[1].threat.id, "T2");
    EXPECT_DOUBLE_EQ(s.threats[1].spawn_time, 3.0);

    DefenseWorld world = ScenarioParser::build_world(s);
    ASSERT_EQ(world.batteries().size(), 2u);
    EXPECT_TRUE(world.get_battery("B1")->can_fire_interceptors());
    EXPECT_FALSE(world.get_battery("L1")->can_fire_interceptors());
    EXPECT_TRUE(world.threats().empty());
}

TEST(ScenarioParser, RejectsInvalidEntries) {
    EXPECT_THROW(ScenarioParser::parse(JsonReader::parse(
        R"({"batteries": [{"id": "B1"}, {"id": "B1"}]})")), std::runtime_error);
    EXPECT_THROW(ScenarioParser::parse(JsonReader::parse(
        R"({"batteries": [{"id": "B1", "kind": "railgun"}]})")), std::runtime_error);
    EXPECT_THROW(ScenarioParser::parse(JsonReader::parse(
        R"({"threats": [{"category": "rocket", "position": [0, 10, 0]}]})")), std::runtime_error);
    EXPECT_THROW(ScenarioParser::parse(JsonReader::parse(
        R"({"threats": [{"id": "T1", "position": [0, 0, 0]}]})")), std::runtime_error);
}

TEST(ScenarioParser, LoadsBundledScenario) {
    Scenario s = ScenarioParser::parse(
        JsonReader::parse_file(std::string(SKYSHIELD_SCENARIO_DIR) + "/mixed_salvo.json"));
    EXPECT_EQ(s.batteries.size(), 3u);
    EXPECT_EQ(s.threats.size(), 5u);
    EXPECT_DOUBLE_EQ(s.engine.navigation_constant, 4.0);
}

// ── Run report ──

TEST(RunResults, ReportSummarizesSuccessfulRuns) {
    RunResult ok;
    ok.run_index = 0;
    ok.seed = 42;
    ok.threats_total = 4;
    ok.kills = 3;
    ok.leaked = 1;
    ok.interceptors_fired = 6;
    ok.engagement_log.push_back(EngagementRecord{0.5, "B1", "B1-I1", "T1", "LAUNCH"});

    RunResult failed;
    failed.run_index = 1;
    failed.seed = 43;
    failed.error = "Run error: boom";

    RunConfig config;
    config.num_runs = 2;

    std::ostringstream out;
    write_results_json({ok, failed}, config, out);
    auto root = JsonReader::parse(out.str());

    EXPECT_EQ(root["config"]["numRuns"].as_int(), 2);
    EXPECT_EQ(root["summary"]["completedRuns"].as_int(), 1);
    EXPECT_EQ(root["summary"]["erroredRuns"].as_int(), 1);
    EXPECT_DOUBLE_EQ(root["summary"]["killRatio"].as_number(), 0.75);
    EXPECT_DOUBLE_EQ(root["summary"]["interceptorsPerKill"].as_number(), 2.0);
    EXPECT_TRUE(root["runs"][0]["error"].is_null());
    EXPECT_EQ(root["runs"][0]["engagementLog"][0]["result"].as_string(), "LAUNCH");
    EXPECT_EQ(root["runs"][1]["error"].as_string(), "Run error: boom");
}

// ── Logging ──

TEST(Log, ParsesLevelNames) {
    EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
    EXPECT_EQ(log::parse_level("off"), log::Level::Off);
    EXPECT_THROW(log::parse_level("verbose"), std::runtime_error);
}

TEST(Log, SinkReceivesLinesAtOrAboveLevel) {
    std::vector<std::pair<log::Level, std::string>> lines;
    log::Level saved = log::level();
    log::set_sink([&](log::Level l, const std::string& msg) { lines.emplace_back(l, msg); });
    log::set_level(log::Level::Warn);

    log::info("ignored");
    log::warn("Threat T1 leaked");
    log::error("bad");

    log::set_sink(nullptr);
    log::set_level(saved);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, log::Level::Warn);
    EXPECT_EQ(lines[0].second, "Threat T1 leaked");
    EXPECT_EQ(lines[1].first, log::Level::Error);
}
