#ifndef __SG_STEP_SESSION__
#define __SG_STEP_SESSION__

#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "SequenceValidator.hpp"
#include "SocketHandler.hpp"

namespace sg {
/**
 * @brief Per-session settings. Shared read-only by every session of a server.
 */
struct SessionConfig {
  double timeoutThreshold = 5.0;
  int64_t idleTimeoutMs = 30 * 1000;
  int64_t requiredFirstStep = ANY_FIRST_STEP;
};

enum class SessionPhase {
  AWAITING_FIRST,
  VALIDATING,
  CLOSED,
};

/** @brief Why a session ended. */
enum class CloseReason {
  NONE,
  CLIENT_DISCONNECTED,
  SEQUENCE_ERROR,
  TIMEOUT_ERROR,
  IDLE_TIMEOUT,
  FRAME_ERROR,
  CONNECTION_ERROR,
  SHUTDOWN,
};

const char* closeReasonName(CloseReason reason);

/**
 * @brief Drives one accepted connection: reassembles StepRecord frames,
 * validates each one and answers it, and closes the socket on the first
 * rejection, on EOF, on an idle read timeout or on a socket failure.
 *
 * The session owns its validation state; nothing in it is shared with other
 * sessions. `run()` blocks the calling thread until the session is closed.
 */
class StepSession {
 public:
  StepSession(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
              const SessionConfig& _config, const std::atomic<bool>* _halt);
  ~StepSession();

  /**
   * @brief Runs the session to completion and closes the socket.
   * @return The reason the session ended.
   */
  CloseReason run();

  SessionPhase getPhase() const { return phase; }
  CloseReason getCloseReason() const { return closeReason; }
  bool isClosed() const { return closed; }
  int64_t getStepsAccepted() const { return stepsAccepted; }
  const SessionState& getState() const { return state; }

 protected:
  /** @brief Feeds freshly read bytes and handles every complete frame. */
  void processBuffered();
  void handleRecord(const StepRecord& record);
  /** @brief Sends an idle ERR_TIMEOUT (best effort) and closes. */
  void closeIdleSession(int64_t idleMs);
  /**
   * @brief Writes one response frame.
   * @return false when the write failed; the session is then closed.
   */
  bool sendResponse(const StepResponse& response);
  void closeSession(CloseReason reason);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  SessionConfig config;
  SequenceValidator validator;
  const std::atomic<bool>* halt;
  SessionState state;
  SessionPhase phase;
  CloseReason closeReason;
  FrameBuffer frameBuffer;
  std::chrono::steady_clock::time_point lastFrameTime;
  std::atomic<bool> closed;
  int64_t stepsAccepted;
};
}  // namespace sg

#endif  // __SG_STEP_SESSION__
