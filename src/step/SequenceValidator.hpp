#ifndef __SG_SEQUENCE_VALIDATOR__
#define __SG_SEQUENCE_VALIDATOR__

#include "Headers.hpp"

namespace sg {
/** @brief Sentinel for "any first step id is acceptable". */
static const int64_t ANY_FIRST_STEP = -1;

/**
 * @brief Validation state of one session. Owned by exactly one StepSession.
 */
struct SessionState {
  bool hasLastStep = false;
  int64_t lastStepId = 0;
};

enum class ValidationResult {
  ACCEPTED,
  SEQUENCE_ERROR,
  TIMEOUT_ERROR,
};

/** @brief Maps a validation result to the code sent back on the wire. */
ResponseCode toResponseCode(ValidationResult result);

const char* validationResultName(ValidationResult result);

/**
 * @brief Checks step records against the ordering and minimum-wait rules.
 *
 * The ordering rule is checked first: a record that is both out of order and
 * below the threshold is a SEQUENCE_ERROR. The first record of a session only
 * has to satisfy the threshold, unless a required first step id was given.
 * A rejected record never modifies the state.
 */
class SequenceValidator {
 public:
  explicit SequenceValidator(double _timeoutThreshold,
                             int64_t _requiredFirstStep = ANY_FIRST_STEP);

  ValidationResult validate(SessionState* state,
                            const StepRecord& record) const;

  double getTimeoutThreshold() const { return timeoutThreshold; }

  int64_t getRequiredFirstStep() const { return requiredFirstStep; }

 protected:
  bool isInSequence(const SessionState& state, int64_t stepId) const;

  double timeoutThreshold;
  int64_t requiredFirstStep;
};
}  // namespace sg

#endif  // __SG_SEQUENCE_VALIDATOR__
