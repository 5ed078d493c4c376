#include "sendme/core/hex.hpp"
#include "sendme/net/ticket.hpp"

#include <gtest/gtest.h>

using namespace sendme::net;
using sendme::ErrorKind;
using sendme::store::BlobFormat;
using sendme::store::Hash;
using sendme::store::HashAndFormat;

namespace {

Ticket sample_ticket() {
    Ticket ticket;
    ticket.addresses = {"127.0.0.1:4242", "[::1]:4242"};
    ticket.node_id = Hash::of(std::vector<uint8_t>{'n', 'o', 'd', 'e'});
    ticket.content = HashAndFormat{Hash::of(std::vector<uint8_t>{'r', 'o', 'o', 't'}), BlobFormat::HashSeq};
    return ticket;
}

std::string encode_payload(const std::string& json_text) {
    return std::string(Ticket::kPrefix) + sendme::hex::encode(json_text);
}

} // namespace

TEST(TicketTest, TextFormRoundTrips) {
    const Ticket ticket = sample_ticket();
    const std::string text = ticket.to_string();

    EXPECT_EQ(text.rfind("sendme", 0), 0u);

    auto parsed = Ticket::parse(text);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
    EXPECT_EQ(parsed.value(), ticket);
}

TEST(TicketTest, RawFormatSurvives) {
    Ticket ticket = sample_ticket();
    ticket.content.format = BlobFormat::Raw;

    auto parsed = Ticket::parse(ticket.to_string());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().content.format, BlobFormat::Raw);
}

TEST(TicketTest, RejectsWrongPrefix) {
    auto parsed = Ticket::parse("blob" + sample_ticket().to_string().substr(6));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::InvalidArgument);
}

TEST(TicketTest, RejectsNonHexPayload) {
    EXPECT_TRUE(Ticket::parse("sendmezz").is_error());
    EXPECT_TRUE(Ticket::parse("sendmeabc").is_error());
}

TEST(TicketTest, RejectsMalformedJson) {
    auto parsed = Ticket::parse(encode_payload("{\"addrs\": ["));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::InvalidArgument);
}

TEST(TicketTest, RejectsMissingOrMistypedFields) {
    auto json = sample_ticket().to_json();

    auto no_addrs = json;
    no_addrs.erase("addrs");
    EXPECT_TRUE(Ticket::from_json(no_addrs).is_error());

    auto empty_addrs = json;
    empty_addrs["addrs"] = nlohmann::json::array();
    EXPECT_TRUE(Ticket::from_json(empty_addrs).is_error());

    auto numeric_hash = json;
    numeric_hash["hash"] = 42;
    EXPECT_TRUE(Ticket::from_json(numeric_hash).is_error());

    auto short_node = json;
    short_node["node"] = "abcd";
    EXPECT_TRUE(Ticket::from_json(short_node).is_error());

    auto bad_format = json;
    bad_format["format"] = "tarball";
    EXPECT_TRUE(Ticket::from_json(bad_format).is_error());

    EXPECT_TRUE(Ticket::from_json(nlohmann::json::array()).is_error());
}

TEST(SplitHostPortTest, HandlesIpv4AndBracketedIpv6) {
    auto v4 = split_host_port("192.168.1.20:4000");
    ASSERT_TRUE(v4.is_ok());
    EXPECT_EQ(v4.value().first, "192.168.1.20");
    EXPECT_EQ(v4.value().second, 4000);

    auto v6 = split_host_port("[fe80::1]:65535");
    ASSERT_TRUE(v6.is_ok());
    EXPECT_EQ(v6.value().first, "fe80::1");
    EXPECT_EQ(v6.value().second, 65535);
}

TEST(SplitHostPortTest, RejectsBadPorts) {
    EXPECT_TRUE(split_host_port("localhost").is_error());
    EXPECT_TRUE(split_host_port("localhost:").is_error());
    EXPECT_TRUE(split_host_port(":80").is_error());
    EXPECT_TRUE(split_host_port("localhost:0").is_error());
    EXPECT_TRUE(split_host_port("localhost:70000").is_error());
    EXPECT_TRUE(split_host_port("localhost:80x").is_error());
}
