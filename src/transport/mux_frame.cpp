#include "transport/mux_frame.hpp"

namespace qbeecli::transport {

std::string EncodeMuxFrame(const MuxFrame &frame) {
  std::string out;
  out.reserve(kMuxHeaderSize + frame.payload.size());
  out.push_back(static_cast<char>(frame.kind));
  out.push_back(static_cast<char>((frame.stream_id >> 24) & 0xff));
  out.push_back(static_cast<char>((frame.stream_id >> 16) & 0xff));
  out.push_back(static_cast<char>((frame.stream_id >> 8) & 0xff));
  out.push_back(static_cast<char>(frame.stream_id & 0xff));
  out += frame.payload;
  return out;
}

std::optional<MuxFrame> DecodeMuxFrame(std::string_view bytes) {
  if (bytes.size() < kMuxHeaderSize) {
    return std::nullopt;
  }
  const auto kind = static_cast<std::uint8_t>(bytes[0]);
  if (kind < static_cast<std::uint8_t>(MuxFrameKind::open) ||
      kind > static_cast<std::uint8_t>(MuxFrameKind::close)) {
    return std::nullopt;
  }
  MuxFrame frame;
  frame.kind = static_cast<MuxFrameKind>(kind);
  frame.stream_id =
      (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[1])) << 24) |
      (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[2])) << 16) |
      (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[3])) << 8) |
      static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[4]));
  frame.payload.assign(bytes.substr(kMuxHeaderSize));
  return frame;
}

} // namespace qbeecli::transport
