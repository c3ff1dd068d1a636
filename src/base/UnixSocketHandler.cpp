#include "UnixSocketHandler.hpp"

namespace sg {
UnixSocketHandler::UnixSocketHandler() {}

UnixSocketHandler::~UnixSocketHandler() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  for (const auto& it : socketLocks) {
    VLOG(1) << "Closing leftover socket " << it.first;
    ::close(it.first);
  }
  for (const auto& it : listeners) {
    for (int fd : it.second) {
      ::close(fd);
    }
  }
}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  // poll() instead of select(): session fds may exceed FD_SETSIZE.
  pollfd input;
  input.fd = fd;
  input.events = POLLIN;
  input.revents = 0;
  int timeoutMs = int(sec * 1000 + usec / 1000);
  int n = ::poll(&input, 1, timeoutMs);
  if (n < 0) {
    // EINTR, or the fd was closed underneath us.
    VLOG(4) << "poll on " << fd << " failed: " << strerror(GetErrno());
    return false;
  }
  return n > 0 && (input.revents & (POLLIN | POLLHUP | POLLERR));
}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketLock(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = socketLocks.find(fd);
  if (it == socketLocks.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void* buf, size_t count) {
  auto socketLock = getSocketLock(fd);
  if (socketLock.get() == NULL) {
    VLOG(1) << "Read on a closed socket: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketLock);
  ssize_t bytesRead = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (bytesRead < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(localErrno);
  }
  SetErrno(localErrno);
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void* buf, size_t count) {
  auto socketLock = getSocketLock(fd);
  if (socketLock.get() == NULL) {
    VLOG(1) << "Write on a closed socket: " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketLock);
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

int UnixSocketHandler::accept(int listenFd) {
  sockaddr_storage client;
  socklen_t clientLen = sizeof(client);
  int clientFd = ::accept(listenFd, (sockaddr*)&client, &clientLen);
  if (clientFd < 0) {
    auto localErrno = GetErrno();
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
      LOG(WARNING) << "Error accepting on " << listenFd << ": "
                   << strerror(localErrno);
    }
    SetErrno(localErrno);
    return -1;
  }
  VLOG(3) << "Listen socket " << listenFd << " accepted fd " << clientFd;
  initSocket(clientFd);
  addToActiveSockets(clientFd);
  return clientFd;
}

void UnixSocketHandler::close(int fd) {
  auto socketLock = getSocketLock(fd);
  if (socketLock.get() == NULL) {
    STERROR << "Tried to close a socket that is not open: " << fd;
    return;
  }
  lock_guard<recursive_mutex> guard(*socketLock);
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  VLOG(1) << "Closing socket " << fd;
  FATAL_FAIL(::close(fd));
  socketLocks.erase(fd);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (const auto& it : socketLocks) {
    fds.push_back(it.first);
  }
  return fds;
}

set<int> UnixSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = listeners.find(listenerKey(endpoint));
  if (it == listeners.end()) {
    STFATAL << "Not listening on " << endpoint;
  }
  return it->second;
}

void UnixSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = listeners.find(listenerKey(endpoint));
  if (it == listeners.end()) {
    STERROR << "Not listening on " << endpoint;
    return;
  }
  for (int fd : it->second) {
    FATAL_FAIL(::close(fd));
  }
  listeners.erase(it);
  LOG(INFO) << "Stopped listening on " << endpoint;
}

void UnixSocketHandler::addListener(const SocketEndpoint& endpoint,
                                    const set<int>& fds) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  string key = listenerKey(endpoint);
  if (listeners.find(key) != listeners.end()) {
    throw std::runtime_error("Already listening on " + key);
  }
  listeners[key] = fds;
}

int UnixSocketHandler::connectWithTimeout(int sockFd, const sockaddr* addr,
                                          socklen_t addrLen,
                                          const SocketEndpoint& endpoint) {
  if (::connect(sockFd, addr, addrLen) < 0 && GetErrno() != EINPROGRESS) {
    LOG(INFO) << "Error connecting to " << endpoint << ": "
              << strerror(GetErrno());
    FATAL_FAIL(::close(sockFd));
    return -1;
  }

  pollfd writable;
  writable.fd = sockFd;
  writable.events = POLLOUT;
  writable.revents = 0;
  if (::poll(&writable, 1, CONNECT_TIMEOUT_SECONDS * 1000) <= 0) {
    LOG(INFO) << "Timed out connecting to " << endpoint;
    FATAL_FAIL(::close(sockFd));
    return -1;
  }

  int soError = 0;
  socklen_t len = sizeof(soError);
  FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &soError, &len));
  if (soError != 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": "
              << strerror(soError);
    FATAL_FAIL(::close(sockFd));
    return -1;
  }

  addToActiveSockets(sockFd);
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  return sockFd;
}

void UnixSocketHandler::bindAndListen(int sockFd, const sockaddr* addr,
                                      socklen_t addrLen,
                                      const SocketEndpoint& endpoint) {
  if (::bind(sockFd, addr, addrLen) < 0) {
    // Usually the address is already in use.
    auto localErrno = GetErrno();
    ::close(sockFd);
    throw std::runtime_error("Error binding " + endpoint.name() + ": " +
                             strerror(localErrno));
  }
  FATAL_FAIL(::listen(sockFd, 32));
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (socketLocks.find(fd) != socketLocks.end()) {
    STFATAL << "Socket is already tracked: " << fd;
  }
  socketLocks[fd] = shared_ptr<recursive_mutex>(new recursive_mutex());
}

void UnixSocketHandler::initSocket(int fd) {
#ifndef MSG_NOSIGNAL
  int noSigPipe = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &noSigPipe,
                 sizeof(noSigPipe)) < 0) {
    ::signal(SIGPIPE, SIG_IGN);
  }
#endif
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int reuse = 1;
  FATAL_FAIL(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)));
}
}  // namespace sg
