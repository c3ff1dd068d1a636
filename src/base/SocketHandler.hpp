#ifndef __SG_SOCKET_HANDLER__
#define __SG_SOCKET_HANDLER__

#include "FrameCodec.hpp"
#include "Headers.hpp"

namespace sg {
/** @brief Seconds a blocking transfer may go without progress. */
static const int SOCKET_DATA_TRANSFER_TIMEOUT = 10;

/**
 * @brief Transport used by both stepserver and stepclient. Concrete handlers
 * decide what an endpoint is (a TCP host/port or a UNIX socket path); the
 * framing helpers on top are shared.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks for at most the given time until fd is readable.
   * @return true when data (or EOF) is ready to be read.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /** @brief One read() on a tracked socket. Sets errno on failure. */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /** @brief One write() on a tracked socket. Sets errno on failure. */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes.
   * @param timeout Give up after SOCKET_DATA_TRANSFER_TIMEOUT seconds without
   * progress.
   * @throws std::runtime_error on EOF, on a socket error or on timeout.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Writes the whole buffer.
   * @return count, or -1 when the socket failed or stalled.
   */
  int writeAllOrReturn(int fd, const void* buf, size_t count);
  /**
   * @brief Writes the whole buffer.
   * @throws std::runtime_error when the socket fails or stalls.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads one length-prefixed protobuf frame from the socket.
   * @throws FrameError on invalid length or parse failure, std::runtime_error
   * when the socket fails or times out.
   */
  template <typename T>
  inline T readProto(int fd, bool timeout) {
    int64_t length;
    readAll(fd, &length, FRAME_PREFIX_SIZE, timeout);
    checkFrameLength(length);
    string body(length, '\0');
    if (length > 0) {
      readAll(fd, &body[0], length, timeout);
    }
    return decodeFrameBody<T>(body);
  }

  /** @brief Writes one length-prefixed protobuf frame. */
  template <typename T>
  inline void writeProto(int fd, const T& t, bool timeout) {
    string frame = encodeFrame(t);
    writeAllOrThrow(fd, &frame[0], frame.length(), timeout);
  }

  /**
   * @brief Opens a connection to the endpoint.
   * @return The connected fd, or -1 on failure.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint.
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /** @brief Listening fds of an endpoint previously passed to listen(). */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @return The accepted fd, or -1 when nothing could be accepted. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
  /** @brief Connected sockets that have not been closed yet. */
  virtual vector<int> getActiveSockets() = 0;

 protected:
  /**
   * @brief Write loop shared by the writeAll variants.
   * @return count, or -1 with `*error` set to an errno value.
   */
  int writeUntilDone(int fd, const void* buf, size_t count, bool timeout,
                     int* error);
};
}  // namespace sg

#endif  // __SG_SOCKET_HANDLER__
