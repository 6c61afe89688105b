#include <catch2/catch_test_macros.hpp>
#include "protocol/frame_codec.hpp"

#include <QJsonDocument>
#include <QJsonObject>

using namespace duet;
using namespace duet::protocol;

namespace {

QByteArray frame_from_body(const QByteArray& body) {
    QByteArray frame;
    write_length_prefix(frame, static_cast<uint32_t>(body.size()));
    frame.append(body);
    return frame;
}

} // namespace

TEST_CASE("Wire names match the protocol spelling", "[codec]") {
    REQUIRE(wire_name(MessageKind::TextUpdate) == QStringLiteral("TEXT_UPDATE"));
    REQUIRE(wire_name(MessageKind::RequestControl) == QStringLiteral("REQ_CONTROL"));
    REQUIRE(wire_name(MessageKind::GrantControl) == QStringLiteral("GRANT_CONTROL"));
    REQUIRE(wire_name(MessageKind::RevokeControl) == QStringLiteral("REVOKE_CONTROL"));
    REQUIRE(wire_name(MessageKind::DeclineControl) == QStringLiteral("DECLINE_CONTROL"));

    REQUIRE(parse_wire_name(QStringLiteral("GRANT_CONTROL")) == MessageKind::GrantControl);
    REQUIRE_FALSE(parse_wire_name(QStringLiteral("grant_control")).has_value());
    REQUIRE_FALSE(parse_wire_name(QStringLiteral("PING")).has_value());
}

TEST_CASE("Length prefix is big-endian", "[codec]") {
    QByteArray out;
    write_length_prefix(out, 0x01020304u);

    REQUIRE(out.size() == 4);
    REQUIRE(static_cast<uint8_t>(out[0]) == 0x01);
    REQUIRE(static_cast<uint8_t>(out[3]) == 0x04);
    REQUIRE(read_length_prefix(out) == 0x01020304u);
    REQUIRE_FALSE(read_length_prefix(out.left(3)).has_value());
}

TEST_CASE("encode_frame writes the JSON envelope", "[codec]") {
    const auto frame = encode_frame(Message::textUpdate(QStringLiteral("print(1)")));
    const auto length = read_length_prefix(frame);

    REQUIRE(length.has_value());
    REQUIRE(static_cast<qsizetype>(*length) == frame.size() - 4);

    const auto doc = QJsonDocument::fromJson(frame.mid(4));
    REQUIRE(doc.isObject());
    REQUIRE(doc.object().value(QStringLiteral("type")).toString() == QStringLiteral("TEXT_UPDATE"));
    REQUIRE(doc.object().value(QStringLiteral("content")).toString() == QStringLiteral("print(1)"));
}

TEST_CASE("Control messages always carry empty content", "[codec]") {
    Message odd{MessageKind::GrantControl, QStringLiteral("ignored")};
    const auto frame = encode_frame(odd);

    const auto doc = QJsonDocument::fromJson(frame.mid(4));
    REQUIRE(doc.object().value(QStringLiteral("content")).toString().isEmpty());

    auto inbound = frame_from_body(R"({"type":"REVOKE_CONTROL","content":"stray"})");
    auto decoded = decode_frame(inbound);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().message == Message::control(MessageKind::RevokeControl));
}

TEST_CASE("decode_frame returns a complete message and its size", "[codec]") {
    const auto msg = Message::textUpdate(QStringLiteral("héllo\nwörld"));
    const auto frame = encode_frame(msg);

    auto decoded = decode_frame(frame);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().message == msg);
    REQUIRE(decoded.unwrap().consumed == frame.size());
}

TEST_CASE("decode_frame accepts an empty document", "[codec]") {
    const auto frame = encode_frame(Message::textUpdate(QString{}));

    auto decoded = decode_frame(frame);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().message.has_value());
    REQUIRE(decoded.unwrap().message->content.isEmpty());
}

TEST_CASE("decode_frame waits for incomplete frames", "[codec]") {
    const auto frame = encode_frame(Message::textUpdate(QStringLiteral("abc")));

    for (qsizetype n : {qsizetype{0}, qsizetype{2}, qsizetype{4}, frame.size() - 1}) {
        auto decoded = decode_frame(frame.left(n));
        REQUIRE(decoded.is_ok());
        REQUIRE_FALSE(decoded.unwrap().message.has_value());
        REQUIRE(decoded.unwrap().consumed == 0);
    }
}

TEST_CASE("decode_frame takes only the first of two frames", "[codec]") {
    const auto first = encode_frame(Message::control(MessageKind::RequestControl));
    const auto second = encode_frame(Message::textUpdate(QStringLiteral("x")));

    auto decoded = decode_frame(first + second);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().message->kind == MessageKind::RequestControl);
    REQUIRE(decoded.unwrap().consumed == first.size());
}

TEST_CASE("Malformed bodies are recoverable and skip the whole frame", "[codec]") {
    const QByteArray bodies[] = {
        "not json",
        "[1,2,3]",
        R"({"content":"x"})",
        R"({"type":"PING","content":""})",
        R"({"type":"TEXT_UPDATE"})",
        R"({"type":"TEXT_UPDATE","content":5})",
    };

    for (const auto& body : bodies) {
        const auto frame = frame_from_body(body);
        auto decoded = decode_frame(frame + encode_frame(Message::textUpdate(QStringLiteral("next"))));

        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().recoverable);
        REQUIRE(decoded.unwrap_err().consumed == frame.size());
        REQUIRE(decoded.unwrap_err().error.kind == ErrorKind::FramingError);
    }
}

TEST_CASE("Oversized length is unrecoverable", "[codec]") {
    QByteArray buffer;
    write_length_prefix(buffer, 1000);
    buffer.append("{}");

    auto decoded = decode_frame(buffer, 64);
    REQUIRE(decoded.is_err());
    REQUIRE_FALSE(decoded.unwrap_err().recoverable);
    REQUIRE(decoded.unwrap_err().consumed == buffer.size());
}
