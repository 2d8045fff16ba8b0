#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "transport/transport.hpp"

namespace qbeecli::transport {

// Typed messages on a plain stream: one type byte, a 4 byte big-endian
// payload length, then the payload.
inline constexpr std::size_t kMessageHeaderSize = 5;
inline constexpr std::uint32_t kMaxMessagePayload = 1024 * 1024;

std::string EncodeMessage(MessageType type, const std::string &payload);

using WriteMessageHandler = std::function<void(boost::system::error_code)>;
using ReadMessageHandler = std::function<void(boost::system::error_code,
                                              MessageType, std::string)>;
using ReadExactlyHandler =
    std::function<void(boost::system::error_code, std::string)>;
using ExpectOkHandler =
    std::function<void(boost::system::error_code, std::string)>;

void async_write_message(StreamPtr stream, MessageType type,
                         std::string payload, WriteMessageHandler handler);

// Reads exactly size bytes. A stream ending early completes with eof.
void async_read_exactly(StreamPtr stream, std::size_t size,
                        ReadExactlyHandler done);

void async_read_message(StreamPtr stream, ReadMessageHandler handler);

// Reads one message and requires it to be ok. An error message completes
// with TRANSPORT::REJECTED and the peer's text, anything else with
// TRANSPORT::PROTOCOL_ERROR.
void async_expect_ok(StreamPtr stream, ExpectOkHandler handler);

// Plain stream, typed message, expect OK. Shared by ISession
// implementations for async_open_stream.
void async_open_typed_stream(const SessionPtr &session, MessageType type,
                             std::string payload,
                             ISession::OpenHandler handler);

}  // namespace qbeecli::transport
