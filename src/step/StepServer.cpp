#include "StepServer.hpp"

namespace sg {
StepServer::StepServer(shared_ptr<SocketHandler> _socketHandler,
                       const SocketEndpoint& _serverEndpoint,
                       const SessionConfig& _sessionConfig)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      sessionConfig(_sessionConfig),
      halt(false),
      listening(false),
      sessionsAccepted(0) {
  socketHandler->listen(serverEndpoint);
  listening = true;
}

StepServer::~StepServer() { shutdown(); }

void StepServer::run() {
  LOG(INFO) << "Accepting sessions on " << serverEndpoint
            << " (threshold: " << sessionConfig.timeoutThreshold
            << "s, idle timeout: " << sessionConfig.idleTimeoutMs << "ms)";
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);
  for (int i : serverPortFds) {
    if (i >= FD_SETSIZE) {
      STFATAL << "Listen fd " << i << " is too large for select()";
    }
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!halt) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0) {
      // shutdown() may close the listen fds while we are selecting on them.
      if (GetErrno() == EINTR || halt) {
        continue;
      }
      FATAL_FAIL(numFdsSet);
    }
    reapFinishedSessions();
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : serverPortFds) {
      if (!halt && FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }
  LOG(INFO) << "Accept loop on " << serverEndpoint << " stopped";
}

bool StepServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return false;
  }
  int64_t sessionNumber = ++sessionsAccepted;
  LOG(INFO) << "Accepted session #" << sessionNumber << " on fd "
            << clientSocketFd;

  SessionThread st;
  st.session.reset(
      new StepSession(socketHandler, clientSocketFd, sessionConfig, &halt));
  shared_ptr<StepSession> session = st.session;
  st.sessionThread.reset(new thread([session, sessionNumber]() {
    el::Helpers::setThreadName("session-" + to_string(sessionNumber));
    session->run();
  }));

  lock_guard<mutex> guard(sessionMutex);
  sessionThreads.push_back(st);
  return true;
}

void StepServer::shutdown() {
  halt = true;
  if (listening.exchange(false)) {
    socketHandler->stopListening(serverEndpoint);
  }
  vector<SessionThread> toJoin;
  {
    lock_guard<mutex> guard(sessionMutex);
    toJoin.swap(sessionThreads);
  }
  for (auto& it : toJoin) {
    it.sessionThread->join();
  }
}

size_t StepServer::getActiveSessionCount() {
  lock_guard<mutex> guard(sessionMutex);
  return sessionThreads.size();
}

void StepServer::reapFinishedSessions() {
  vector<SessionThread> finished;
  {
    lock_guard<mutex> guard(sessionMutex);
    auto it = sessionThreads.begin();
    while (it != sessionThreads.end()) {
      if (it->session->isClosed()) {
        finished.push_back(*it);
        it = sessionThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& st : finished) {
    st.sessionThread->join();
    VLOG(1) << "Reaped session ("
            << closeReasonName(st.session->getCloseReason()) << ")";
  }
}
}  // namespace sg
