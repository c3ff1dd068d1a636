#ifndef __SG_TCP_SOCKET_HANDLER__
#define __SG_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace sg {
/**
 * @brief IPv4/IPv6 transport. The endpoint name is a host name or address;
 * the port is required.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /** @brief Tries every address the host resolves to, in order. */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Listens on every address the endpoint name resolves to, or on all
   * interfaces when the name is empty.
   * @throws std::runtime_error when the name cannot be resolved or an address
   * cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);

 protected:
  virtual string listenerKey(const SocketEndpoint& endpoint);
  /** @brief Also sets TCP_NODELAY. */
  virtual void initSocket(int fd);
};
}  // namespace sg

#endif  // __SG_TCP_SOCKET_HANDLER__
