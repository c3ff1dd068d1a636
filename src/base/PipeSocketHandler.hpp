#ifndef __SG_PIPE_SOCKET_HANDLER__
#define __SG_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace sg {
/**
 * @brief UNIX-domain stream sockets. The endpoint name is the socket path and
 * the port is ignored.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Replaces any stale socket file at the path. The socket is only
   * accessible to the current user.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /** @brief Also removes the socket file. */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  virtual string listenerKey(const SocketEndpoint& endpoint);
};
}  // namespace sg

#endif  // __SG_PIPE_SOCKET_HANDLER__
