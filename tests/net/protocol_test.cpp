#include "sendme/net/protocol.hpp"

#include <gtest/gtest.h>

using namespace sendme::net;
using sendme::ErrorKind;
using sendme::store::BlobFormat;
using sendme::store::Hash;
using sendme::store::HashAndFormat;

TEST(ProtocolTest, HelloCarriesNodeId) {
    const NodeId node = Hash::of(std::vector<uint8_t>{1, 2, 3});
    auto frame = encode_hello(node);

    ASSERT_EQ(frame.size(), kHelloSize);
    EXPECT_EQ(frame[0], 'S');
    EXPECT_EQ(frame[4], kProtocolVersion);

    auto decoded = decode_hello(frame);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), node);
}

TEST(ProtocolTest, HelloRejectsForeignPeer) {
    auto frame = encode_hello(Hash{});
    frame[0] = 'H';
    auto decoded = decode_hello(frame);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().kind, ErrorKind::ProtocolViolation);

    frame = encode_hello(Hash{});
    frame[4] = kProtocolVersion + 1;
    EXPECT_TRUE(decode_hello(frame).is_error());

    frame.pop_back();
    EXPECT_TRUE(decode_hello(frame).is_error());
}

TEST(ProtocolTest, RequestLayout) {
    Request request;
    request.kind = RequestKind::Sizes;
    request.content = HashAndFormat{Hash::of(std::vector<uint8_t>{'x'}), BlobFormat::HashSeq};

    auto buffer = encode_request(request);
    ASSERT_EQ(buffer.size(), kRequestSize);
    EXPECT_EQ(buffer[0], static_cast<uint8_t>(RequestKind::Sizes));
    EXPECT_EQ(buffer[1], request.content.hash.bytes()[0]);

    auto decoded = decode_request(buffer);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().kind, RequestKind::Sizes);
    EXPECT_EQ(decoded.value().content, request.content);
}

TEST(ProtocolTest, RequestWithUnknownKindOrFormatIsRejected) {
    auto buffer = encode_request(Request{});
    buffer[0] = 9;
    EXPECT_TRUE(decode_request(buffer).is_error());

    buffer = encode_request(Request{});
    buffer[kRequestSize - 1] = 0x7f;
    EXPECT_TRUE(decode_request(buffer).is_error());
}

TEST(ProtocolTest, StatusBytes) {
    EXPECT_EQ(decode_status(0).value(), ResponseStatus::Ok);
    EXPECT_EQ(decode_status(1).value(), ResponseStatus::NotFound);
    EXPECT_EQ(decode_status(2).value(), ResponseStatus::BadRequest);
    EXPECT_TRUE(decode_status(3).is_error());
    EXPECT_STREQ(status_name(ResponseStatus::NotFound), "not found");
}

TEST(ProtocolTest, SizesAndFrameHeadersAreBigEndian) {
    auto sizes = encode_sizes({1, 0x0102030405060708ULL});
    ASSERT_EQ(sizes.size(), 4u + 16u);
    EXPECT_EQ(sizes[3], 2);
    EXPECT_EQ(sizes[4 + 7], 1);
    EXPECT_EQ(sizes[12], 0x01);
    EXPECT_EQ(sizes[19], 0x08);

    auto header = encode_frame_header(256);
    ASSERT_EQ(header.size(), kFrameHeaderSize);
    EXPECT_EQ(header[6], 1);
    EXPECT_EQ(header[7], 0);
}
