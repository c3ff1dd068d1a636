#include "SocketHandler.hpp"

namespace sg {
namespace {
bool stalled(time_t lastProgress) {
  return time(NULL) > lastProgress + SOCKET_DATA_TRANSFER_TIMEOUT;
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = (char*)buf;
  size_t pos = 0;
  time_t lastProgress = time(NULL);
  while (pos < count) {
    if (!waitForData(fd, 1, 0)) {
      if (timeout && stalled(lastProgress)) {
        throw std::runtime_error("Timed out reading from socket");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, out + pos, count - pos);
    if (bytesRead == 0) {
      throw std::runtime_error("Connection closed by peer");
    }
    if (bytesRead < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        continue;
      }
      VLOG(1) << "readAll failed on fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Error reading from socket: ") +
                               strerror(localErrno));
    }
    pos += bytesRead;
    lastProgress = time(NULL);
  }
}

int SocketHandler::writeUntilDone(int fd, const void* buf, size_t count,
                                  bool timeout, int* error) {
  const char* in = (const char*)buf;
  size_t pos = 0;
  time_t lastProgress = time(NULL);
  while (pos < count) {
    if (timeout && stalled(lastProgress)) {
      *error = ETIMEDOUT;
      return -1;
    }
    ssize_t bytesWritten = write(fd, in + pos, count - pos);
    if (bytesWritten == 0) {
      *error = EPIPE;
      return -1;
    }
    if (bytesWritten < 0) {
      auto localErrno = GetErrno();
      if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
        *error = localErrno;
        return -1;
      }
      // Peer is not draining its receive buffer yet.
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    pos += bytesWritten;
    lastProgress = time(NULL);
  }
  return int(count);
}

int SocketHandler::writeAllOrReturn(int fd, const void* buf, size_t count) {
  int error = 0;
  int written = writeUntilDone(fd, buf, count, true, &error);
  if (written < 0) {
    VLOG(1) << "writeAll failed on fd " << fd << ": " << strerror(error);
  }
  return written;
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  int error = 0;
  if (writeUntilDone(fd, buf, count, timeout, &error) < 0) {
    LOG(WARNING) << "writeAll failed on fd " << fd << ": " << strerror(error);
    throw std::runtime_error(string("Error writing to socket: ") +
                             strerror(error));
  }
}
}  // namespace sg
