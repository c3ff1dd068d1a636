#include "SequenceValidator.hpp"

namespace sg {
ResponseCode toResponseCode(ValidationResult result) {
  switch (result) {
    case ValidationResult::ACCEPTED:
      return ACK;
    case ValidationResult::SEQUENCE_ERROR:
      return ERR_SEQUENCE;
    case ValidationResult::TIMEOUT_ERROR:
      return ERR_TIMEOUT;
  }
  STFATAL << "Invalid validation result: " << int(result);
  return ERR_UNEXPECTED;
}

const char* validationResultName(ValidationResult result) {
  switch (result) {
    case ValidationResult::ACCEPTED:
      return "ACCEPTED";
    case ValidationResult::SEQUENCE_ERROR:
      return "SEQUENCE_ERROR";
    case ValidationResult::TIMEOUT_ERROR:
      return "TIMEOUT_ERROR";
  }
  return "UNKNOWN";
}

SequenceValidator::SequenceValidator(double _timeoutThreshold,
                                     int64_t _requiredFirstStep)
    : timeoutThreshold(_timeoutThreshold),
      requiredFirstStep(_requiredFirstStep) {}

ValidationResult SequenceValidator::validate(SessionState* state,
                                             const StepRecord& record) const {
  if (!isInSequence(*state, record.step_id())) {
    VLOG(1) << "Step " << record.step_id() << " out of sequence (last: "
            << (state->hasLastStep ? to_string(state->lastStepId) : "none")
            << ")";
    return ValidationResult::SEQUENCE_ERROR;
  }
  // Written so that a NaN wait never passes.
  if (!(record.wait_seconds() >= timeoutThreshold)) {
    VLOG(1) << "Step " << record.step_id() << " waited "
            << record.wait_seconds() << "s, below the threshold of "
            << timeoutThreshold << "s";
    return ValidationResult::TIMEOUT_ERROR;
  }
  state->hasLastStep = true;
  state->lastStepId = record.step_id();
  return ValidationResult::ACCEPTED;
}

bool SequenceValidator::isInSequence(const SessionState& state,
                                     int64_t stepId) const {
  if (stepId < 0) {
    return false;
  }
  if (!state.hasLastStep) {
    return requiredFirstStep == ANY_FIRST_STEP || stepId == requiredFirstStep;
  }
  // stepId >= 0, so stepId - 1 cannot overflow.
  return stepId - 1 == state.lastStepId;
}
}  // namespace sg
