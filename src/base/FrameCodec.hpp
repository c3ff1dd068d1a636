#ifndef __SG_FRAME_CODEC__
#define __SG_FRAME_CODEC__

#include "Headers.hpp"

namespace sg {
/** @brief Largest body a frame may carry. */
static const int64_t MAX_FRAME_LENGTH = 1024 * 1024;
/** @brief Size of the int64 length prefix in front of every frame body. */
static const size_t FRAME_PREFIX_SIZE = sizeof(int64_t);

/**
 * @brief Raised when wire data cannot form a valid frame (bad length prefix,
 * unparseable body, or a frame cut short by the peer).
 */
class FrameError : public std::runtime_error {
 public:
  explicit FrameError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Throws FrameError unless the length prefix is within bounds.
 */
void checkFrameLength(int64_t length);

/**
 * @brief Serializes a protobuf message into a length-prefixed frame.
 */
template <typename T>
inline string encodeFrame(const T& t) {
  string body;
  if (!t.SerializeToString(&body)) {
    STFATAL << "Serialization of " << t.GetTypeName() << " failed!";
  }
  int64_t length = body.length();
  if (length > MAX_FRAME_LENGTH) {
    STFATAL << "Invalid frame length: " << length << " For proto "
            << t.GetTypeName();
  }
  string frame(FRAME_PREFIX_SIZE, '\0');
  memcpy(&frame[0], &length, FRAME_PREFIX_SIZE);
  frame.append(body);
  return frame;
}

/**
 * @brief Parses a frame body (without its prefix).
 * @throws FrameError when the bytes are not a valid message.
 */
template <typename T>
inline T decodeFrameBody(const string& body) {
  T t;
  if (!body.empty() && !t.ParseFromString(body)) {
    throw FrameError("Invalid proto in frame body");
  }
  return t;
}

/**
 * @brief Decodes exactly one complete frame.
 * @throws FrameError on a truncated, oversized or malformed frame, or when
 * bytes follow the frame.
 */
template <typename T>
inline T decodeFrame(const string& frame) {
  if (frame.length() < FRAME_PREFIX_SIZE) {
    throw FrameError("Truncated frame prefix");
  }
  int64_t length;
  memcpy(&length, frame.data(), FRAME_PREFIX_SIZE);
  checkFrameLength(length);
  if (int64_t(frame.length() - FRAME_PREFIX_SIZE) != length) {
    throw FrameError("Frame length " + to_string(length) +
                     " does not match body size " +
                     to_string(frame.length() - FRAME_PREFIX_SIZE));
  }
  return decodeFrameBody<T>(frame.substr(FRAME_PREFIX_SIZE));
}

/**
 * @brief Reassembles frames out of a byte stream that arrives in arbitrary
 * pieces.
 */
class FrameBuffer {
 public:
  FrameBuffer() {}

  /** @brief Appends freshly read bytes. */
  void append(const char* buf, size_t count) { buffer.append(buf, count); }

  /**
   * @brief Pops the next complete frame body, if there is one.
   * @return false when more bytes are needed.
   * @throws FrameError when the pending length prefix is invalid.
   */
  bool nextFrameBody(string* body);

  /**
   * @brief Decodes and consumes one frame if it is complete.
   */
  template <typename T>
  inline bool tryDecode(T* t) {
    string body;
    if (!nextFrameBody(&body)) {
      return false;
    }
    *t = decodeFrameBody<T>(body);
    return true;
  }

  /** @brief True when some bytes are buffered but do not form a frame. */
  bool hasPartialFrame() const { return !buffer.empty(); }

  size_t size() const { return buffer.size(); }

  void clear() { buffer.clear(); }

 protected:
  string buffer;
};
}  // namespace sg

#endif  // __SG_FRAME_CODEC__
