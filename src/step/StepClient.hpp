#ifndef __SG_STEP_CLIENT__
#define __SG_STEP_CLIENT__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "StepFixture.hpp"

namespace sg {
enum class ClientStatus {
  SUCCESS,
  REJECTED,
  CONNECTION_ERROR,
};

/**
 * @brief Outcome of one client run. For a rejection, `failedStepId`,
 * `code` and `error` repeat what the server answered.
 */
struct ClientResult {
  ClientStatus status = ClientStatus::SUCCESS;
  int64_t stepsAcknowledged = 0;
  int64_t failedStepId = -1;
  ResponseCode code = ACK;
  string error;

  /** @brief 0 on success, 1 on a rejection, 2 on a connection failure. */
  int exitCode() const;
};

/** @brief Short human-readable description of a response code. */
string describeResponseCode(ResponseCode code);

/**
 * @brief Sends fixture steps over a single connection, one at a time, and
 * stops at the first rejection. Never retries and never reconnects.
 */
class StepClient {
 public:
  StepClient(shared_ptr<SocketHandler> _socketHandler,
             const SocketEndpoint& _serverEndpoint,
             const vector<FixtureStep>& _steps);

  ClientResult run();

 protected:
  /** @brief Sends one step and reads its response. Throws on socket errors. */
  StepResponse sendStep(int socketFd, const FixtureStep& step);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  vector<FixtureStep> steps;
};
}  // namespace sg

#endif  // __SG_STEP_CLIENT__
