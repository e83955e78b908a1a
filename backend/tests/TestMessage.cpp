/**
 * @file TestMessage.cpp
 * @brief Unit tests for the wire message codec.
 */

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "protocol/message.h"

using json = nlohmann::json;

TEST_CASE("Beacon encodes exactly op, room, port and host", "[protocol]")
{
    const auto encoded = json::parse(encode_message(BeaconMessage{"Test", 45123, "alice"}));

    REQUIRE(encoded == json{{"op", "beacon"}, {"room", "Test"}, {"port", 45123}, {"host", "alice"}});
}

TEST_CASE("Peers message keeps entry order and fields", "[protocol]")
{
    const PeersMessage sent{{{"alice (Host)", "192.168.1.10", "idle"}, {"bob", "192.168.1.11", "idle"}}};
    const std::string line = encode_message(sent);

    REQUIRE(line.find('\n') == std::string::npos);
    REQUIRE(json::parse(line)["op"] == "peers");

    const auto decoded = decode_message(line);
    REQUIRE(std::holds_alternative<PeersMessage>(decoded));
    REQUIRE(std::get<PeersMessage>(decoded).peers == sent.peers);
}

TEST_CASE("Hello decodes its name", "[protocol]")
{
    const auto decoded = decode_message(R"({"op":"hello","name":"A"})");

    REQUIRE(std::holds_alternative<HelloMessage>(decoded));
    REQUIRE(std::get<HelloMessage>(decoded).name == "A");
    REQUIRE(std::string(message_op(decoded)) == "hello");
}

TEST_CASE("Beacon decoding ignores fields it does not know", "[protocol]")
{
    const auto decoded = decode_message(
        R"({"op":"beacon","room":"Test","port":9001,"host":"alice","ip":"10.0.0.99"})");

    REQUIRE(std::holds_alternative<BeaconMessage>(decoded));
    const auto& beacon = std::get<BeaconMessage>(decoded);
    REQUIRE(beacon.room == "Test");
    REQUIRE(beacon.port == 9001);
    REQUIRE(beacon.host == "alice");
}

TEST_CASE("Empty peers list is valid", "[protocol]")
{
    const auto decoded = decode_message(R"({"op":"peers","data":[]})");

    REQUIRE(std::get<PeersMessage>(decoded).peers.empty());
}

TEST_CASE("Decoder rejects malformed input", "[protocol]")
{
    REQUIRE_THROWS_AS(decode_message("not json"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(""), ProtocolError);
    REQUIRE_THROWS_AS(decode_message("[1,2,3]"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"room":"Test"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":42})"), ProtocolError);
}

TEST_CASE("Decoder rejects unknown operation tags", "[protocol]")
{
    REQUIRE_THROWS_AS(decode_message(R"({"op":"goodbye","name":"A"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"BEACON","room":"x","port":1,"host":"h"})"), ProtocolError);
}

TEST_CASE("Decoder rejects missing or mistyped fields", "[protocol]")
{
    REQUIRE_THROWS_AS(decode_message(R"({"op":"hello"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"hello","name":7})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"beacon","room":"x","port":"80","host":"h"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"beacon","room":"x","port":70000,"host":"h"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"beacon","room":"x","port":0,"host":"h"})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"peers","data":{}})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_message(R"({"op":"peers","data":[{"name":"a","ip":"1.2.3.4"}]})"), ProtocolError);
}
