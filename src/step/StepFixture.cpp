#include "StepFixture.hpp"

#include "JsonLib.hpp"

namespace sg {
namespace {
const json* findField(const json& step, const char* name, const char* alias) {
  auto it = step.find(name);
  if (it != step.end()) {
    return &(*it);
  }
  if (alias != NULL) {
    it = step.find(alias);
    if (it != step.end()) {
      return &(*it);
    }
  }
  return NULL;
}

FixtureStep parseStep(const json& step, size_t index) {
  string where = "Fixture step #" + to_string(index);
  if (!step.is_object()) {
    throw FixtureError(where + " is not an object");
  }

  FixtureStep fixtureStep;
  const json* stepId = findField(step, "step_id", NULL);
  if (stepId == NULL) {
    throw FixtureError(where + " is missing step_id");
  }
  if (!stepId->is_number_integer()) {
    throw FixtureError(where + " has a non-integer step_id");
  }
  if (stepId->is_number_unsigned()) {
    uint64_t value = stepId->get<uint64_t>();
    if (value > uint64_t(std::numeric_limits<int64_t>::max())) {
      throw FixtureError(where + " has a step_id that is out of range");
    }
    fixtureStep.record.set_step_id(int64_t(value));
  } else {
    int64_t value = stepId->get<int64_t>();
    if (value < 0) {
      throw FixtureError(where + " has a negative step_id");
    }
    fixtureStep.record.set_step_id(value);
  }

  const json* wait = findField(step, "wait_seconds", "timeout");
  if (wait == NULL) {
    throw FixtureError(where + " is missing wait_seconds");
  }
  if (!wait->is_number()) {
    throw FixtureError(where + " has a non-numeric wait_seconds");
  }
  fixtureStep.record.set_wait_seconds(wait->get<double>());

  fixtureStep.intervalSeconds = fixtureStep.record.wait_seconds();
  const json* interval = findField(step, "interval_seconds", "interval");
  if (interval != NULL) {
    if (!interval->is_number() || interval->get<double>() < 0) {
      throw FixtureError(where +
                         " has an interval_seconds that is not a "
                         "non-negative number");
    }
    fixtureStep.intervalSeconds = interval->get<double>();
  }
  if (fixtureStep.intervalSeconds < 0) {
    fixtureStep.intervalSeconds = 0;
  }

  const json* payload = findField(step, "payload", NULL);
  if (payload != NULL && !payload->is_null()) {
    if (!payload->is_string()) {
      throw FixtureError(where + " has a non-string payload");
    }
    fixtureStep.record.set_payload(payload->get<string>());
  }
  return fixtureStep;
}
}  // namespace

vector<FixtureStep> parseFixture(const string& text) {
  json document = json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    throw FixtureError("Fixture is not valid JSON");
  }

  const json* steps = &document;
  if (document.is_object()) {
    auto it = document.find("test_services");
    if (it == document.end()) {
      throw FixtureError("Fixture object has no test_services array");
    }
    steps = &(*it);
  }
  if (!steps->is_array()) {
    throw FixtureError("Fixture steps must be an array");
  }

  vector<FixtureStep> fixtureSteps;
  for (size_t a = 0; a < steps->size(); a++) {
    fixtureSteps.push_back(parseStep((*steps)[a], a));
  }
  return fixtureSteps;
}

vector<FixtureStep> loadFixtureFile(const string& path) {
  ifstream input(path);
  if (!input.is_open()) {
    throw FixtureError("Cannot open fixture file " + path);
  }
  stringstream contents;
  contents << input.rdbuf();
  try {
    return parseFixture(contents.str());
  } catch (const FixtureError& fe) {
    throw FixtureError(path + ": " + fe.what());
  }
}

bool isKnownDataSet(const string& dataSet) {
  return dataSet == "success" || dataSet == "failure";
}

string fixturePathForDataSet(const string& fixtureDir, const string& dataSet) {
  if (!isKnownDataSet(dataSet)) {
    throw std::invalid_argument("Unknown data set '" + dataSet +
                                "', expected success or failure");
  }
  return fixtureDir + "/" + dataSet + "_data.json";
}
}  // namespace sg
