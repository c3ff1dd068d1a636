#include "StepSession.hpp"

#define BUF_SIZE (16 * 1024)
// How long one wait for data may block before halt and idle time are rechecked.
#define POLL_INTERVAL_USEC (10 * 1000)

namespace sg {
const char* closeReasonName(CloseReason reason) {
  switch (reason) {
    case CloseReason::NONE:
      return "NONE";
    case CloseReason::CLIENT_DISCONNECTED:
      return "CLIENT_DISCONNECTED";
    case CloseReason::SEQUENCE_ERROR:
      return "SEQUENCE_ERROR";
    case CloseReason::TIMEOUT_ERROR:
      return "TIMEOUT_ERROR";
    case CloseReason::IDLE_TIMEOUT:
      return "IDLE_TIMEOUT";
    case CloseReason::FRAME_ERROR:
      return "FRAME_ERROR";
    case CloseReason::CONNECTION_ERROR:
      return "CONNECTION_ERROR";
    case CloseReason::SHUTDOWN:
      return "SHUTDOWN";
  }
  return "UNKNOWN";
}

StepSession::StepSession(shared_ptr<SocketHandler> _socketHandler,
                         int _socketFd, const SessionConfig& _config,
                         const std::atomic<bool>* _halt)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      config(_config),
      validator(_config.timeoutThreshold, _config.requiredFirstStep),
      halt(_halt),
      phase(SessionPhase::AWAITING_FIRST),
      closeReason(CloseReason::NONE),
      closed(false),
      stepsAccepted(0) {}

StepSession::~StepSession() {
  if (!closed) {
    closeSession(CloseReason::SHUTDOWN);
  }
}

CloseReason StepSession::run() {
  lastFrameTime = std::chrono::steady_clock::now();
  char buf[BUF_SIZE];
  while (phase != SessionPhase::CLOSED) {
    if (halt != NULL && halt->load()) {
      closeSession(CloseReason::SHUTDOWN);
      break;
    }

    // Trickling bytes without completing a frame does not reset the clock.
    auto idleMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - lastFrameTime)
                      .count();
    if (idleMs >= config.idleTimeoutMs) {
      closeIdleSession(idleMs);
      break;
    }

    if (!socketHandler->waitForData(socketFd, 0, POLL_INTERVAL_USEC)) {
      continue;
    }

    ssize_t bytesRead = socketHandler->read(socketFd, buf, BUF_SIZE);
    if (bytesRead == 0) {
      if (frameBuffer.hasPartialFrame()) {
        LOG(WARNING) << "Client disconnected in the middle of a frame ("
                     << frameBuffer.size() << " bytes pending)";
        closeSession(CloseReason::FRAME_ERROR);
      } else {
        closeSession(CloseReason::CLIENT_DISCONNECTED);
      }
      break;
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        continue;
      }
      LOG(WARNING) << "Error reading from client: " << strerror(localErrno);
      closeSession(CloseReason::CONNECTION_ERROR);
      break;
    }

    frameBuffer.append(buf, bytesRead);
    processBuffered();
  }
  return closeReason;
}

void StepSession::closeIdleSession(int64_t idleMs) {
  LOG(INFO) << "No complete frame for " << idleMs
            << "ms, closing idle session on fd " << socketFd;
  StepResponse response;
  if (state.hasLastStep) {
    response.set_step_id(state.lastStepId);
  }
  response.set_code(ERR_TIMEOUT);
  response.set_idle(true);
  response.set_error("Idle read timeout of " + to_string(config.idleTimeoutMs) +
                     "ms exceeded");
  // Best effort: the peer may already be gone.
  string frame = encodeFrame(response);
  if (socketHandler->writeAllOrReturn(socketFd, &frame[0], frame.length()) !=
      int(frame.length())) {
    VLOG(1) << "Could not deliver idle timeout response";
  }
  closeSession(CloseReason::IDLE_TIMEOUT);
}

void StepSession::processBuffered() {
  try {
    StepRecord record;
    while (phase != SessionPhase::CLOSED && frameBuffer.tryDecode(&record)) {
      lastFrameTime = std::chrono::steady_clock::now();
      handleRecord(record);
    }
  } catch (const FrameError& fe) {
    LOG(WARNING) << "Malformed frame from client: " << fe.what();
    StepResponse response;
    response.set_code(ERR_UNEXPECTED);
    response.set_error(fe.what());
    sendResponse(response);
    closeSession(CloseReason::FRAME_ERROR);
  }
}

void StepSession::handleRecord(const StepRecord& record) {
  VLOG(1) << "Got step " << record.step_id() << " wait "
          << record.wait_seconds() << "s payload " << record.payload().size()
          << " bytes";
  ValidationResult result = validator.validate(&state, record);

  StepResponse response;
  response.set_step_id(record.step_id());
  response.set_code(toResponseCode(result));

  if (result == ValidationResult::ACCEPTED) {
    if (!sendResponse(response)) {
      return;
    }
    stepsAccepted++;
    if (phase == SessionPhase::AWAITING_FIRST) {
      VLOG(1) << "Session baseline is step " << record.step_id();
      phase = SessionPhase::VALIDATING;
    }
    return;
  }

  std::ostringstream errorStream;
  if (result == ValidationResult::SEQUENCE_ERROR) {
    errorStream << "Step " << record.step_id() << " is out of sequence";
    if (state.hasLastStep) {
      errorStream << ", expected " << state.lastStepId + 1;
    } else if (validator.getRequiredFirstStep() != ANY_FIRST_STEP) {
      errorStream << ", expected " << validator.getRequiredFirstStep();
    }
  } else {
    errorStream << "Step " << record.step_id() << " waited "
                << record.wait_seconds() << "s, below the threshold of "
                << validator.getTimeoutThreshold() << "s";
  }
  response.set_error(errorStream.str());
  LOG(INFO) << "Rejecting session: " << response.error();
  if (!sendResponse(response)) {
    return;
  }
  closeSession(result == ValidationResult::SEQUENCE_ERROR
                   ? CloseReason::SEQUENCE_ERROR
                   : CloseReason::TIMEOUT_ERROR);
}

bool StepSession::sendResponse(const StepResponse& response) {
  try {
    socketHandler->writeProto(socketFd, response, true);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Error writing response: " << re.what();
    closeSession(CloseReason::CONNECTION_ERROR);
    return false;
  }
  return true;
}

void StepSession::closeSession(CloseReason reason) {
  if (phase == SessionPhase::CLOSED) {
    return;
  }
  phase = SessionPhase::CLOSED;
  closeReason = reason;
  if (frameBuffer.size()) {
    VLOG(1) << "Discarding " << frameBuffer.size() << " unprocessed bytes";
    frameBuffer.clear();
  }
  LOG(INFO) << "Session on fd " << socketFd << " closed ("
            << closeReasonName(reason) << ") after " << stepsAccepted
            << " accepted steps";
  socketHandler->close(socketFd);
  closed = true;
}
}  // namespace sg
