#include "FrameCodec.hpp"

namespace swayipc {
namespace {
void appendUint32(string* out, uint32_t value) {
  for (int i = 0; i < 4; i++) {
    out->push_back(char((value >> (8 * i)) & 0xff));
  }
}

uint32_t readUint32(const char* data) {
  const unsigned char* bytes = (const unsigned char*)data;
  return uint32_t(bytes[0]) | (uint32_t(bytes[1]) << 8) |
         (uint32_t(bytes[2]) << 16) | (uint32_t(bytes[3]) << 24);
}
}  // namespace

string FrameCodec::encode(uint32_t type, const string& payload) {
  if (uint64_t(payload.length()) > uint64_t(UINT32_MAX)) {
    throw EncodingError("Payload too large to frame: " +
                        to_string(payload.length()) + " bytes");
  }
  string s;
  s.reserve(IPC_HEADER_SIZE + payload.length());
  s.append(IPC_MAGIC, IPC_MAGIC_LENGTH);
  appendUint32(&s, uint32_t(payload.length()));
  appendUint32(&s, type);
  s.append(payload);
  return s;
}

size_t FrameCodec::decode(const char* data, size_t length, Frame* frame) {
  size_t magicBytes = std::min(length, IPC_MAGIC_LENGTH);
  if (memcmp(data, IPC_MAGIC, magicBytes) != 0) {
    throw ProtocolError("Frame does not begin with the i3-ipc magic string");
  }
  if (length < IPC_HEADER_SIZE) {
    return 0;
  }
  uint64_t payloadLength = readUint32(data + IPC_MAGIC_LENGTH);
  uint32_t type = readUint32(data + IPC_MAGIC_LENGTH + 4);
  if (uint64_t(length) < IPC_HEADER_SIZE + payloadLength) {
    VLOG(4) << "Incomplete frame: have " << length << " of "
            << IPC_HEADER_SIZE + payloadLength << " bytes";
    return 0;
  }
  *frame = Frame(type, string(data + IPC_HEADER_SIZE, size_t(payloadLength)));
  return IPC_HEADER_SIZE + size_t(payloadLength);
}
}  // namespace swayipc
