#include "StepFixture.hpp"
#include "TestHeaders.hpp"

using namespace sg;

TEST_CASE("Fixtures parse into typed steps", "[StepFixture]") {
  SECTION("test_services object") {
    auto steps = parseFixture(R"({
      "test_services": [
        {"step_id": 0, "wait_seconds": 5.0},
        {"step_id": 1, "wait_seconds": 6, "interval_seconds": 0.5,
         "payload": "hello", "comment": "ignored"}
      ]
    })");
    REQUIRE(steps.size() == 2);
    REQUIRE(steps[0].record.step_id() == 0);
    REQUIRE(steps[0].record.wait_seconds() == 5.0);
    REQUIRE(steps[0].intervalSeconds == 5.0);
    REQUIRE_FALSE(steps[0].record.has_payload());
    REQUIRE(steps[1].record.wait_seconds() == 6.0);
    REQUIRE(steps[1].intervalSeconds == 0.5);
    REQUIRE(steps[1].record.payload() == "hello");
  }

  SECTION("Bare array with legacy keys") {
    auto steps = parseFixture(
        R"([{"step_id": 1, "timeout": 5, "interval": 1}])");
    REQUIRE(steps.size() == 1);
    REQUIRE(steps[0].record.step_id() == 1);
    REQUIRE(steps[0].record.wait_seconds() == 5.0);
    REQUIRE(steps[0].intervalSeconds == 1.0);
  }

  SECTION("Empty list") { REQUIRE(parseFixture("[]").empty()); }
}

TEST_CASE("Malformed fixtures fail fast", "[StepFixture]") {
  REQUIRE_THROWS_AS(parseFixture("{not json"), FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"({"steps": []})"), FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"({"test_services": 3})"), FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"([1, 2])"), FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"([{"wait_seconds": 5}])"), FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"([{"step_id": 1}])"), FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"([{"step_id": "1", "wait_seconds": 5}])"),
                    FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"([{"step_id": 1.5, "wait_seconds": 5}])"),
                    FixtureError);
  REQUIRE_THROWS_AS(parseFixture(R"([{"step_id": -1, "wait_seconds": 5}])"),
                    FixtureError);
  REQUIRE_THROWS_AS(
      parseFixture(R"([{"step_id": 1, "wait_seconds": "five"}])"),
      FixtureError);
  REQUIRE_THROWS_AS(
      parseFixture(
          R"([{"step_id": 1, "wait_seconds": 5, "interval_seconds": -2}])"),
      FixtureError);
  REQUIRE_THROWS_AS(
      parseFixture(R"([{"step_id": 1, "wait_seconds": 5, "payload": 7}])"),
      FixtureError);
}

TEST_CASE("Fixture files are loaded by data set", "[StepFixture]") {
  string dirPattern = GetTempDirectory() + string("sg_fixture_XXXXXXXX");
  string fixtureDir = string(mkdtemp(&dirPattern[0]));

  REQUIRE(fixturePathForDataSet(fixtureDir, "success") ==
          fixtureDir + "/success_data.json");
  REQUIRE(fixturePathForDataSet(fixtureDir, "failure") ==
          fixtureDir + "/failure_data.json");
  REQUIRE(isKnownDataSet("success"));
  REQUIRE(isKnownDataSet("failure"));
  REQUIRE_FALSE(isKnownDataSet("bogus"));
  REQUIRE_FALSE(isKnownDataSet("Success"));
  REQUIRE_FALSE(isKnownDataSet(""));
  REQUIRE_THROWS_AS(fixturePathForDataSet(fixtureDir, "bogus"),
                    std::invalid_argument);

  string path = fixturePathForDataSet(fixtureDir, "failure");
  REQUIRE_THROWS_AS(loadFixtureFile(path), FixtureError);

  {
    ofstream out(path);
    out << R"({"test_services": [{"step_id": 0, "wait_seconds": 5.0},)"
        << R"( {"step_id": 2, "wait_seconds": 5.0}]})";
  }
  auto steps = loadFixtureFile(path);
  REQUIRE(steps.size() == 2);
  REQUIRE(steps[1].record.step_id() == 2);

  fs::remove_all(fixtureDir);
}
