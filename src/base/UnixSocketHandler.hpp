#ifndef __SG_UNIX_SOCKET_HANDLER__
#define __SG_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace sg {
/** @brief Seconds a non-blocking connect() may take. */
static const int CONNECT_TIMEOUT_SECONDS = 3;

/**
 * @brief POSIX plumbing shared by the TCP and UNIX-domain handlers.
 *
 * Every connected socket is non-blocking and tracked with its own lock, so a
 * session thread and a closing thread never touch the same fd at once.
 * Listening sockets are kept apart, keyed by listenerKey().
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler();

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /** @brief Closes every listening socket of the endpoint. */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Identifies an endpoint among the listening sockets. */
  virtual string listenerKey(const SocketEndpoint& endpoint) = 0;

  /** @brief Records the listening sockets created for an endpoint. */
  void addListener(const SocketEndpoint& endpoint, const set<int>& fds);

  /**
   * @brief Connects an initialized socket, waiting at most
   * CONNECT_TIMEOUT_SECONDS.
   * @return sockFd, now tracked, or -1 after closing it.
   */
  int connectWithTimeout(int sockFd, const sockaddr* addr, socklen_t addrLen,
                         const SocketEndpoint& endpoint);

  /**
   * @brief Binds an initialized socket and starts listening on it.
   * @throws std::runtime_error after closing sockFd when bind() fails.
   */
  void bindAndListen(int sockFd, const sockaddr* addr, socklen_t addrLen,
                     const SocketEndpoint& endpoint);

  void addToActiveSockets(int fd);
  /** @return The lock of a tracked socket, or null once it is closed. */
  shared_ptr<recursive_mutex> getSocketLock(int fd);

  /** @brief Makes the fd non-blocking and keeps SIGPIPE away. */
  virtual void initSocket(int fd);
  /** @brief initSocket() plus SO_REUSEADDR. */
  virtual void initServerSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> socketLocks;
  map<string, set<int>> listeners;
  /** @brief Guards socketLocks and listeners. */
  recursive_mutex globalMutex;
};
}  // namespace sg

#endif  // __SG_UNIX_SOCKET_HANDLER__
