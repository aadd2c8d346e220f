#ifndef __SWAYIPC_FRAME_CODEC__
#define __SWAYIPC_FRAME_CODEC__

#include "Frame.hpp"
#include "Headers.hpp"
#include "IpcErrors.hpp"

namespace swayipc {
/**
 * @brief Converts frames to and from the wire format:
 *
 *   offset 0   6 bytes   "i3-ipc"
 *   offset 6   4 bytes   payload length, little-endian
 *   offset 10  4 bytes   message type, little-endian
 *   offset 14  length    payload
 */
class FrameCodec {
 public:
  /**
   * @brief Serializes a frame.
   * @throws EncodingError if the payload does not fit in 32 bits.
   */
  static string encode(uint32_t type, const string& payload);

  static string encode(const Frame& frame) {
    return encode(frame.getType(), frame.getPayload());
  }

  /**
   * @brief Decodes the frame at the start of `data`, if it is complete.
   *
   * Frames arrive in arbitrary chunks, so a short buffer is not an error.
   * Whatever bytes of the magic marker are present must match though: once
   * the marker is wrong we have lost alignment with the peer.
   *
   * @return Number of bytes the frame occupies, or 0 if it is incomplete (in
   * which case `frame` is untouched).
   * @throws ProtocolError on a magic mismatch.
   */
  static size_t decode(const char* data, size_t length, Frame* frame);

  static size_t decode(const string& buffer, Frame* frame) {
    return decode(buffer.data(), buffer.length(), frame);
  }
};
}  // namespace swayipc

#endif  // __SWAYIPC_FRAME_CODEC__
