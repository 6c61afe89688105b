#include "protocol/frame_codec.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace duet::protocol {

namespace {

constexpr const char* kTypeKey = "type";
constexpr const char* kContentKey = "content";

Result<DecodedFrame, FrameError> malformed(std::string message, qsizetype consumed) {
    return Result<DecodedFrame, FrameError>::err(
        FrameError{Error{std::move(message), ErrorKind::FramingError}, consumed, true});
}

} // namespace

void write_length_prefix(QByteArray& out, uint32_t length) {
    out.append(static_cast<char>((length >> 24) & 0xFF));
    out.append(static_cast<char>((length >> 16) & 0xFF));
    out.append(static_cast<char>((length >> 8) & 0xFF));
    out.append(static_cast<char>(length & 0xFF));
}

std::optional<uint32_t> read_length_prefix(const QByteArray& buffer) {
    if (buffer.size() < static_cast<qsizetype>(kLengthPrefixSize)) {
        return std::nullopt;
    }
    const auto* data = reinterpret_cast<const uint8_t*>(buffer.constData());
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

QByteArray encode_frame(const Message& message) {
    QJsonObject obj;
    obj[QLatin1String(kTypeKey)] = wire_name(message.kind);
    obj[QLatin1String(kContentKey)] = message.isControl() ? QString{} : message.content;
    const auto body = QJsonDocument(obj).toJson(QJsonDocument::Compact);

    QByteArray frame;
    frame.reserve(static_cast<qsizetype>(kLengthPrefixSize) + body.size());
    write_length_prefix(frame, static_cast<uint32_t>(body.size()));
    frame.append(body);
    return frame;
}

Result<DecodedFrame, FrameError> decode_frame(const QByteArray& buffer,
                                              uint32_t max_frame_bytes) {
    const auto length = read_length_prefix(buffer);
    if (!length) {
        return Result<DecodedFrame, FrameError>::ok(DecodedFrame{});
    }

    if (*length > max_frame_bytes) {
        // The prefix itself is untrustworthy, so there is no frame boundary to skip to.
        return Result<DecodedFrame, FrameError>::err(FrameError{
            Error{"Frame length " + std::to_string(*length) + " exceeds limit " +
                      std::to_string(max_frame_bytes),
                  ErrorKind::FramingError},
            buffer.size(),
            false});
    }

    const auto total = static_cast<qsizetype>(kLengthPrefixSize) + static_cast<qsizetype>(*length);
    if (buffer.size() < total) {
        return Result<DecodedFrame, FrameError>::ok(DecodedFrame{});
    }

    const auto body = buffer.mid(static_cast<qsizetype>(kLengthPrefixSize),
                                 static_cast<qsizetype>(*length));
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return malformed("Invalid JSON body: " + parse_error.errorString().toStdString(), total);
    }
    if (!doc.isObject()) {
        return malformed("Frame body is not a JSON object", total);
    }

    const auto obj = doc.object();
    const auto type_value = obj.value(QLatin1String(kTypeKey));
    if (!type_value.isString()) {
        return malformed("Frame is missing a string 'type'", total);
    }
    const auto kind = parse_wire_name(type_value.toString());
    if (!kind) {
        return malformed("Unknown message type '" + type_value.toString().toStdString() + "'", total);
    }

    Message message = Message::control(*kind);
    if (*kind == MessageKind::TextUpdate) {
        const auto content = obj.value(QLatin1String(kContentKey));
        if (!content.isString()) {
            return malformed("TEXT_UPDATE without string 'content'", total);
        }
        message.content = content.toString();
    }

    return Result<DecodedFrame, FrameError>::ok(DecodedFrame{std::move(message), total});
}

} // namespace duet::protocol
