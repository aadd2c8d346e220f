#ifndef __SWAYIPC_RECEIVE_BUFFER__
#define __SWAYIPC_RECEIVE_BUFFER__

#include "FrameCodec.hpp"
#include "Headers.hpp"

namespace swayipc {
/**
 * @brief Accumulates bytes read from one connection and hands out complete
 * frames from the front.
 *
 * Reads do not line up with frame boundaries: one read may end in the middle
 * of a header, another may contain several frames.  Bytes past the last
 * complete frame stay here until the rest of that frame arrives.
 */
class ReceiveBuffer {
 public:
  ReceiveBuffer() {}

  /** @brief Appends freshly read bytes to the tail. */
  void append(const char* data, size_t count) { buffer.append(data, count); }

  void append(const string& data) { buffer.append(data); }

  /**
   * @brief Removes the first complete frame from the buffer.
   * @return false (leaving the buffer untouched) if no complete frame is
   * buffered yet.
   * @throws ProtocolError if the buffer does not start with a frame header.
   */
  bool extractFrame(Frame* frame) {
    size_t consumed = FrameCodec::decode(buffer, frame);
    if (consumed == 0) {
      return false;
    }
    buffer.erase(0, consumed);
    return true;
  }

  /** @brief Returns the number of buffered bytes not yet part of a frame. */
  size_t size() const { return buffer.size(); }

  bool empty() const { return buffer.empty(); }

  /** @brief Drops everything, e.g. when the connection is torn down. */
  void clear() { buffer.clear(); }

 private:
  string buffer;
};
}  // namespace swayipc

#endif  // __SWAYIPC_RECEIVE_BUFFER__
