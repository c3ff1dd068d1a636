#ifndef __SG_STEP_FIXTURE__
#define __SG_STEP_FIXTURE__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Raised when a fixture file is missing, is not valid JSON, or has a
 * step with a missing or mistyped field.
 */
class FixtureError : public std::runtime_error {
 public:
  explicit FixtureError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief One step the client will send, plus how long to pause before it.
 */
struct FixtureStep {
  StepRecord record;
  double intervalSeconds;
};

/**
 * @brief Parses fixture JSON text.
 *
 * Accepts either `{"test_services": [...]}` or a bare array. Every step needs
 * a non-negative integer `step_id` and a numeric `wait_seconds` (or the
 * legacy `timeout`); `interval_seconds` (or `interval`) and a string
 * `payload` are optional. The pause defaults to the step's wait.
 */
vector<FixtureStep> parseFixture(const string& text);

/** @brief Reads and parses a fixture file. */
vector<FixtureStep> loadFixtureFile(const string& path);

/** @brief True for the `--data` values stepclient understands. */
bool isKnownDataSet(const string& dataSet);

/**
 * @brief Path of the fixture selected by `--data` (success or failure).
 * @throws std::invalid_argument for any other data set.
 */
string fixturePathForDataSet(const string& fixtureDir, const string& dataSet);
}  // namespace sg

#endif  // __SG_STEP_FIXTURE__
