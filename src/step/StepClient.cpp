#include "StepClient.hpp"

namespace sg {
int ClientResult::exitCode() const {
  switch (status) {
    case ClientStatus::SUCCESS:
      return 0;
    case ClientStatus::REJECTED:
      return 1;
    case ClientStatus::CONNECTION_ERROR:
      return 2;
  }
  return 2;
}

string describeResponseCode(ResponseCode code) {
  switch (code) {
    case ACK:
      return "Success";
    case ERR_TIMEOUT:
      return "Client wait below the server timeout threshold";
    case ERR_SEQUENCE:
      return "Non-sequential step_id";
    case ERR_UNEXPECTED:
      return "Unexpected server error";
  }
  return "Unknown error code " + to_string(int(code));
}

StepClient::StepClient(shared_ptr<SocketHandler> _socketHandler,
                       const SocketEndpoint& _serverEndpoint,
                       const vector<FixtureStep>& _steps)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      steps(_steps) {}

ClientResult StepClient::run() {
  ClientResult result;
  int socketFd = socketHandler->connect(serverEndpoint);
  if (socketFd < 0) {
    result.status = ClientStatus::CONNECTION_ERROR;
    result.error = "Could not connect to " + serverEndpoint.name();
    if (serverEndpoint.has_port()) {
      result.error += ":" + to_string(serverEndpoint.port());
    }
    LOG(ERROR) << result.error;
    return result;
  }

  for (const auto& step : steps) {
    int64_t stepId = step.record.step_id();
    StepResponse response;
    try {
      response = sendStep(socketFd, step);
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Step " << stepId << " failed - connection error: "
                 << re.what();
      result.status = ClientStatus::CONNECTION_ERROR;
      result.failedStepId = stepId;
      result.error = re.what();
      socketHandler->close(socketFd);
      return result;
    }

    if (response.code() != ACK) {
      LOG(ERROR) << "Step " << stepId << " - "
                 << describeResponseCode(response.code()) << ": "
                 << response.error();
      result.status = ClientStatus::REJECTED;
      result.failedStepId = stepId;
      result.code = response.code();
      result.error = response.error();
      socketHandler->close(socketFd);
      return result;
    }
    if (response.step_id() != stepId) {
      LOG(WARNING) << "Server acknowledged step " << response.step_id()
                   << " while step " << stepId << " was sent";
    }
    result.stepsAcknowledged++;
    LOG(INFO) << "Step " << stepId << " succeeded";
  }

  socketHandler->close(socketFd);
  return result;
}

StepResponse StepClient::sendStep(int socketFd, const FixtureStep& step) {
  if (step.intervalSeconds > 0) {
    VLOG(1) << "Waiting " << step.intervalSeconds << "s before step "
            << step.record.step_id();
    std::this_thread::sleep_for(
        std::chrono::duration<double>(step.intervalSeconds));
  }
  LOG(INFO) << "Sending step " << step.record.step_id() << " to server";
  socketHandler->writeProto(socketFd, step.record, true);
  return socketHandler->readProto<StepResponse>(socketFd, true);
}
}  // namespace sg
