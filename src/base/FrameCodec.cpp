#include "FrameCodec.hpp"

namespace sg {
void checkFrameLength(int64_t length) {
  if (length < 0 || length > MAX_FRAME_LENGTH) {
    throw FrameError(string("Invalid frame size (<0 or >1 MB): ") +
                     to_string(length));
  }
}

bool FrameBuffer::nextFrameBody(string* body) {
  if (buffer.size() < FRAME_PREFIX_SIZE) {
    return false;
  }
  int64_t length;
  memcpy(&length, buffer.data(), FRAME_PREFIX_SIZE);
  checkFrameLength(length);
  if (buffer.size() < FRAME_PREFIX_SIZE + size_t(length)) {
    VLOG(3) << "Waiting for the rest of a frame: have "
            << buffer.size() - FRAME_PREFIX_SIZE << " of " << length;
    return false;
  }
  *body = buffer.substr(FRAME_PREFIX_SIZE, length);
  buffer.erase(0, FRAME_PREFIX_SIZE + length);
  return true;
}
}  // namespace sg
