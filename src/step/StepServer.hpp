#ifndef __SG_STEP_SERVER__
#define __SG_STEP_SERVER__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "StepSession.hpp"

namespace sg {
/**
 * @brief Accepts connections on an endpoint and runs every one of them as an
 * independent StepSession on its own thread.
 *
 * The listener never validates anything itself. Sessions only share the
 * read-only SessionConfig and the halt flag used by shutdown().
 */
class StepServer {
 public:
  /**
   * @brief Starts listening right away.
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  StepServer(shared_ptr<SocketHandler> _socketHandler,
             const SocketEndpoint& _serverEndpoint,
             const SessionConfig& _sessionConfig);
  ~StepServer();

  /** @brief Accept loop. Returns once shutdown() has been called. */
  void run();

  /**
   * @brief Accepts one pending connection and starts its session thread.
   * @return false when nothing could be accepted.
   */
  bool acceptNewConnection(int fd);

  /**
   * @brief Stops the accept loop, closes all sessions and joins their
   * threads. Safe to call more than once.
   */
  void shutdown();

  inline shared_ptr<SocketHandler> getSocketHandler() { return socketHandler; }

  const SessionConfig& getSessionConfig() const { return sessionConfig; }

  int64_t getSessionsAccepted() const { return sessionsAccepted; }

  /** @brief Number of session threads that have not been reaped yet. */
  size_t getActiveSessionCount();

 protected:
  struct SessionThread {
    shared_ptr<StepSession> session;
    shared_ptr<thread> sessionThread;
  };

  /** @brief Joins the threads of sessions that have already closed. */
  void reapFinishedSessions();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  const SessionConfig sessionConfig;
  std::atomic<bool> halt;
  std::atomic<bool> listening;
  std::atomic<int64_t> sessionsAccepted;
  vector<SessionThread> sessionThreads;
  /** @brief Guards sessionThreads. */
  mutex sessionMutex;
};
}  // namespace sg

#endif  // __SG_STEP_SERVER__
