#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qbeecli::transport {

// One WebSocket binary message of the session multiplexer:
// [kind u8][stream id u32 big-endian][payload].
enum class MuxFrameKind : std::uint8_t { open = 1, data = 2, close = 3 };

struct MuxFrame {
  MuxFrameKind kind{MuxFrameKind::data};
  std::uint32_t stream_id{0};
  std::string payload;
};

inline constexpr std::size_t kMuxHeaderSize = 5;

std::string EncodeMuxFrame(const MuxFrame &frame);

// Empty optional for truncated input or an unknown kind.
std::optional<MuxFrame> DecodeMuxFrame(std::string_view bytes);

}  // namespace qbeecli::transport
