#pragma once

#include "core/result.hpp"
#include "protocol/message.hpp"

#include <QByteArray>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace duet::protocol {

/**
 * Frame layout:
 * - Length (4 bytes, big-endian, unsigned): size N of the body
 * - Body (N bytes): UTF-8 JSON {"type": "<wire name>", "content": "<text>"}
 */
inline constexpr size_t kLengthPrefixSize = 4;
inline constexpr uint32_t kDefaultMaxFrameBytes = 16u * 1024u * 1024u;

/**
 * Outcome of a successful decode attempt. `message` is empty (and
 * `consumed` is 0) when the buffer does not yet hold a complete frame.
 */
struct DecodedFrame {
    std::optional<Message> message;
    qsizetype consumed = 0;
};

/**
 * A malformed frame. `consumed` bytes must be dropped from the front of
 * the buffer; when `recoverable` is false the stream cannot be resynced.
 */
struct FrameError {
    Error error;
    qsizetype consumed = 0;
    bool recoverable = true;
};

/**
 * Encode a message into one length-prefixed frame.
 */
[[nodiscard]] QByteArray encode_frame(const Message& message);

/**
 * Try to extract one complete message from the front of `buffer`.
 */
[[nodiscard]] Result<DecodedFrame, FrameError> decode_frame(
    const QByteArray& buffer,
    uint32_t max_frame_bytes = kDefaultMaxFrameBytes);

void write_length_prefix(QByteArray& out, uint32_t length);

/**
 * Read the big-endian length at the front of `buffer`; nullopt if fewer
 * than four bytes are available.
 */
[[nodiscard]] std::optional<uint32_t> read_length_prefix(const QByteArray& buffer);

} // namespace duet::protocol
