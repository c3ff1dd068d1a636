#include "FrameCodec.hpp"
#include "TestHeaders.hpp"

using namespace sg;

namespace {
StepRecord makeRecord(int64_t stepId, double waitSeconds) {
  StepRecord record;
  record.set_step_id(stepId);
  record.set_wait_seconds(waitSeconds);
  return record;
}

string lengthPrefix(int64_t length) {
  string s(sizeof(int64_t), '\0');
  memcpy(&s[0], &length, sizeof(int64_t));
  return s;
}
}  // namespace

TEST_CASE("Frames round trip step records", "[FrameCodec]") {
  StepRecord record = makeRecord(42, 5.25);
  record.set_payload(string("\0binary\xff", 8));

  string frame = encodeFrame(record);
  REQUIRE(frame.length() > FRAME_PREFIX_SIZE);

  StepRecord decoded = decodeFrame<StepRecord>(frame);
  REQUIRE(decoded.step_id() == 42);
  REQUIRE(decoded.wait_seconds() == 5.25);
  REQUIRE(decoded.payload() == record.payload());
}

TEST_CASE("Frame decoding rejects bad input", "[FrameCodec]") {
  string frame = encodeFrame(makeRecord(1, 6.0));

  SECTION("Truncated body") {
    REQUIRE_THROWS_AS(
        decodeFrame<StepRecord>(frame.substr(0, frame.length() - 1)),
        FrameError);
  }

  SECTION("Truncated prefix") {
    REQUIRE_THROWS_AS(decodeFrame<StepRecord>(frame.substr(0, 3)),
                      FrameError);
  }

  SECTION("Trailing bytes") {
    REQUIRE_THROWS_AS(decodeFrame<StepRecord>(frame + "x"), FrameError);
  }

  SECTION("Negative length") {
    REQUIRE_THROWS_AS(decodeFrame<StepRecord>(lengthPrefix(-5)), FrameError);
  }

  SECTION("Oversized length") {
    REQUIRE_THROWS_AS(
        decodeFrame<StepRecord>(lengthPrefix(MAX_FRAME_LENGTH + 1)),
        FrameError);
  }

  SECTION("Garbage body") {
    string garbage = "\xff\xff\xff\xff";
    REQUIRE_THROWS_AS(
        decodeFrame<StepRecord>(lengthPrefix(garbage.length()) + garbage),
        FrameError);
  }
}

TEST_CASE("FrameBuffer reassembles split frames", "[FrameCodec]") {
  FrameBuffer buffer;
  string stream = encodeFrame(makeRecord(7, 5.0)) +
                  encodeFrame(makeRecord(8, 9.5));
  vector<StepRecord> decoded;

  SECTION("One byte at a time") {
    for (char c : stream) {
      buffer.append(&c, 1);
      StepRecord record;
      while (buffer.tryDecode(&record)) {
        decoded.push_back(record);
      }
    }
  }

  SECTION("Everything at once") {
    buffer.append(stream.data(), stream.length());
    StepRecord record;
    while (buffer.tryDecode(&record)) {
      decoded.push_back(record);
    }
  }

  REQUIRE(decoded.size() == 2);
  REQUIRE(decoded[0].step_id() == 7);
  REQUIRE(decoded[1].step_id() == 8);
  REQUIRE(decoded[1].wait_seconds() == 9.5);
  REQUIRE_FALSE(buffer.hasPartialFrame());
}

TEST_CASE("FrameBuffer holds partial frames", "[FrameCodec]") {
  FrameBuffer buffer;
  string frame = encodeFrame(makeRecord(3, 5.0));
  buffer.append(frame.data(), frame.length() - 2);

  StepRecord record;
  REQUIRE_FALSE(buffer.tryDecode(&record));
  REQUIRE(buffer.hasPartialFrame());
  REQUIRE(buffer.size() == frame.length() - 2);

  buffer.append(frame.data() + frame.length() - 2, 2);
  REQUIRE(buffer.tryDecode(&record));
  REQUIRE(record.step_id() == 3);
  REQUIRE_FALSE(buffer.hasPartialFrame());
}

TEST_CASE("FrameBuffer throws on a bad length prefix", "[FrameCodec]") {
  FrameBuffer buffer;
  string prefix = lengthPrefix(-1);
  buffer.append(prefix.data(), prefix.length());
  StepRecord record;
  REQUIRE_THROWS_AS(buffer.tryDecode(&record), FrameError);
}

TEST_CASE("Empty frames decode to a default message", "[FrameCodec]") {
  FrameBuffer buffer;
  string frame = encodeFrame(StepResponse());
  REQUIRE(frame.length() == FRAME_PREFIX_SIZE);
  buffer.append(frame.data(), frame.length());

  StepResponse response;
  response.set_code(ERR_SEQUENCE);
  REQUIRE(buffer.tryDecode(&response));
  REQUIRE(response.code() == ACK);
  REQUIRE_FALSE(response.has_error());
}
