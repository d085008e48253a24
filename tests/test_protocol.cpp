#include <gtest/gtest.h>

#include "protocol.hpp"

#include <vector>

using namespace adatp;

namespace
{
Packet sample_packet()
{
    Packet p;
    p.header.flags          = kFlagEncrypted | kFlagEcho;
    p.header.sequence       = 0x0102030405060708ULL;
    p.header.type           = PacketType::TextMessage;
    p.header.timestamp      = 1700000000123ULL;
    p.header.session_id     = generate_session_id();
    p.payload               = {'H', 'e', 'l', 'l', 'o'};
    p.header.payload_length = static_cast<uint32_t>(p.payload.size());
    return p;
}
}  // namespace

TEST(Codec, HeaderLayoutIsBigEndian)
{
    Packet p = sample_packet();
    auto   wire = encode_packet(p);

    ASSERT_EQ(wire.size(), kHeaderSize + 5);
    EXPECT_EQ(std::vector<uint8_t>(wire.begin(), wire.begin() + 5), std::vector<uint8_t>({'A', 'D', 'A', 'T', 'P'}));
    EXPECT_EQ(wire[5], kProtocolVersion);
    EXPECT_EQ(wire[6], kFlagEncrypted | kFlagEcho);
    // payload length
    EXPECT_EQ(wire[7], 0);
    EXPECT_EQ(wire[10], 5);
    // sequence
    EXPECT_EQ(wire[11], 0x01);
    EXPECT_EQ(wire[18], 0x08);
    // type
    EXPECT_EQ(wire[19], 0x00);
    EXPECT_EQ(wire[20], 0x40);
    EXPECT_EQ(wire[29], p.header.session_id[0]);
    EXPECT_EQ(wire[44], p.header.session_id[15]);
}

TEST(Codec, DecodeReturnsEncodedPacket)
{
    Packet p    = sample_packet();
    auto   wire = encode_packet(p);

    auto result = decode_packet(wire);
    ASSERT_EQ(result.status, DecodeStatus::Ok);
    EXPECT_EQ(result.consumed, wire.size());
    ASSERT_TRUE(result.packet.has_value());
    EXPECT_EQ(*result.packet, p);
}

TEST(Codec, EmptyPayloadIsValid)
{
    Packet p = make_packet(PacketType::Disconnect, generate_session_id(), {});
    auto   wire = encode_packet(p);
    ASSERT_EQ(wire.size(), kHeaderSize);

    auto result = decode_packet(wire);
    ASSERT_EQ(result.status, DecodeStatus::Ok);
    EXPECT_TRUE(result.packet->payload.empty());
}

TEST(Codec, TruncatedInputNeedsMoreData)
{
    auto wire = encode_packet(sample_packet());
    for (std::size_t len : {std::size_t{0}, std::size_t{3}, std::size_t{10}, kHeaderSize, wire.size() - 1})
    {
        auto result = decode_packet(wire.data(), len);
        EXPECT_EQ(result.status, DecodeStatus::NeedMoreData) << "len=" << len;
        EXPECT_EQ(result.consumed, 0u);
    }
}

TEST(Codec, BadMagicDetectedFromFirstBytes)
{
    const uint8_t garbage[] = {'G', 'E', 'T', ' '};
    EXPECT_EQ(decode_packet(garbage, sizeof(garbage)).status, DecodeStatus::BadMagic);

    auto wire = encode_packet(sample_packet());
    wire[2]   = 'X';
    EXPECT_EQ(decode_packet(wire).status, DecodeStatus::BadMagic);
}

TEST(Codec, UnsupportedVersion)
{
    auto wire = encode_packet(sample_packet());
    wire[5]   = 2;
    EXPECT_EQ(decode_packet(wire).status, DecodeStatus::UnsupportedVersion);
}

TEST(Codec, OversizedPayloadRejectedBeforeBody)
{
    Packet p = sample_packet();
    auto   header = encode_header(p.header, 2048);
    std::vector<uint8_t> wire(header.begin(), header.end());

    EXPECT_EQ(decode_packet(wire, 1024).status, DecodeStatus::PayloadTooLarge);
    EXPECT_EQ(decode_packet(wire, 4096).status, DecodeStatus::NeedMoreData);
}

TEST(Codec, EncodeRefusesPayloadAboveCeiling)
{
    Packet p = sample_packet();
    p.payload.resize(kMaxPayloadCeiling + 1);
    EXPECT_THROW(encode_packet(p), std::exception);
}

TEST(FrameReader, ReassemblesByteByByte)
{
    Packet a = sample_packet();
    Packet b = make_packet(PacketType::JoinRoom, a.header.session_id, {3, 'f', 'o', 'o'});
    auto   wa = encode_packet(a);
    auto   wb = encode_packet(b);
    std::vector<uint8_t> stream(wa);
    stream.insert(stream.end(), wb.begin(), wb.end());

    FrameReader          reader;
    std::vector<Packet>  got;
    for (uint8_t byte : stream)
    {
        reader.feed(&byte, 1);
        for (;;)
        {
            auto r = reader.next();
            if (r.status != DecodeStatus::Ok)
            {
                ASSERT_EQ(r.status, DecodeStatus::NeedMoreData);
                break;
            }
            got.push_back(*r.packet);
        }
    }

    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0], a);
    EXPECT_EQ(got[1].header.type, PacketType::JoinRoom);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameReader, StaysPoisonedAfterMalformedFrame)
{
    FrameReader reader;
    auto        good = encode_packet(sample_packet());
    const uint8_t junk[] = {'N', 'O', 'P', 'E', '!', 1};

    reader.feed(junk, sizeof(junk));
    reader.feed(good.data(), good.size());

    EXPECT_EQ(reader.next().status, DecodeStatus::BadMagic);
    EXPECT_TRUE(reader.poisoned());

    reader.feed(good.data(), good.size());
    EXPECT_EQ(reader.next().status, DecodeStatus::BadMagic);
}

TEST(SessionIds, FormatAndParse)
{
    SessionId id = generate_session_id();
    EXPECT_EQ(id[6] & 0xF0, 0x40);
    EXPECT_EQ(id[8] & 0xC0, 0x80);

    std::string text = format_session_id(id);
    EXPECT_EQ(text.size(), 36u);
    auto parsed = parse_session_id(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);

    EXPECT_FALSE(parse_session_id("not-a-session").has_value());
    EXPECT_TRUE(is_nil(SessionId{}));
    EXPECT_FALSE(is_nil(id));
}

TEST(PacketTypes, RoutableSet)
{
    EXPECT_TRUE(is_routable(PacketType::TextMessage));
    EXPECT_TRUE(is_routable(PacketType::AudioFrame));
    EXPECT_TRUE(is_routable(PacketType::FileChunk));
    EXPECT_TRUE(is_routable(PacketType::Invite));
    EXPECT_FALSE(is_routable(PacketType::JoinRoom));
    EXPECT_FALSE(is_routable(PacketType::HandshakeInit));
    EXPECT_FALSE(is_routable(PacketType::AuthRequest));
}
