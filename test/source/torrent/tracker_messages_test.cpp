#include <catch2/catch.hpp>
#include <cstring>
#include <vector>

#include "torrent/tracker_messages.hpp"

namespace
{
std::vector<uint8_t> bytes(std::initializer_list<uint8_t> values)
{
  return std::vector<uint8_t>(values);
}
}  // namespace

TEST_CASE("Tracker messages are packed", "[library]")
{
  REQUIRE(sizeof(swc::wire::ConnectRequest) == 16);
  REQUIRE(sizeof(swc::wire::ConnectResponse) == 16);
  REQUIRE(sizeof(swc::wire::AnnounceRequest) == 98);
  REQUIRE(sizeof(swc::wire::AnnounceResponseHeader) == 20);
  REQUIRE(sizeof(swc::wire::IpV4Port) == 6);
}

TEST_CASE("Connect request layout", "[library]")
{
  auto datagram = swc::wire::to_datagram(swc::wire::ConnectRequest {0xAABBCCDD});

  REQUIRE(datagram
          == bytes({0x00, 0x00, 0x04, 0x17, 0x27, 0x10, 0x19, 0x80,
                    0x00, 0x00, 0x00, 0x00,
                    0xAA, 0xBB, 0xCC, 0xDD}));
}

TEST_CASE("Announce request layout", "[library]")
{
  swc::AnnounceRequest request {};
  request.info_hash.fill(0x11);
  request.peer_id.fill(0x22);
  request.downloaded = 1;
  request.left = 0x0102030405060708;
  request.uploaded = 3;
  request.event = swc::AnnounceEvent::Started;
  request.num_want = -1;
  request.port = 6881;

  auto datagram = swc::wire::to_datagram(
      swc::wire::AnnounceRequest {0x0102030405060708, 7, 0xCAFEBABE, request});

  REQUIRE(datagram.size() == 98);

  // connection id, action, transaction id
  REQUIRE(std::vector(datagram.begin(), datagram.begin() + 16)
          == bytes({1, 2, 3, 4, 5, 6, 7, 8, 0, 0, 0, 1, 0, 0, 0, 7}));
  REQUIRE(datagram[16] == 0x11);
  REQUIRE(datagram[35] == 0x11);
  REQUIRE(datagram[36] == 0x22);
  REQUIRE(datagram[55] == 0x22);
  // downloaded, left, uploaded
  REQUIRE(datagram[63] == 1);
  REQUIRE(std::vector(datagram.begin() + 64, datagram.begin() + 72)
          == bytes({1, 2, 3, 4, 5, 6, 7, 8}));
  REQUIRE(datagram[79] == 3);
  // event, ip, key, num_want, port
  REQUIRE(std::vector(datagram.begin() + 80, datagram.end())
          == bytes({0, 0, 0, 2,
                    0, 0, 0, 0,
                    0xCA, 0xFE, 0xBA, 0xBE,
                    0xFF, 0xFF, 0xFF, 0xFF,
                    0x1A, 0xE1}));
}

TEST_CASE("Announce request prefers an explicit key", "[library]")
{
  swc::AnnounceRequest request {};
  request.key = 0x01020304;

  swc::wire::AnnounceRequest message {1, 2, 0xCAFEBABE, request};
  REQUIRE(message.key == 0x01020304u);
}

TEST_CASE("Parses connect response", "[library]")
{
  auto datagram = bytes({0, 0, 0, 0, 0, 0, 0, 9, 1, 2, 3, 4, 5, 6, 7, 8});

  auto response = swc::wire::read_message<swc::wire::ConnectResponse>(
      datagram, swc::Actions::Connect);

  REQUIRE(response.has_value());
  REQUIRE(response->transaction_id == 9u);
  REQUIRE(response->connection_id == 0x0102030405060708u);

  REQUIRE(swc::wire::read_message<swc::wire::ConnectResponse>(
              std::span(datagram).first(15), swc::Actions::Connect)
              .error()
          == swc::wire::MessageError::TooShort);
  REQUIRE(swc::wire::read_message<swc::wire::ConnectResponse>(
              datagram, swc::Actions::Announce)
              .error()
          == swc::wire::MessageError::UnexpectedAction);
}

TEST_CASE("Parses announce response peers", "[library]")
{
  auto datagram = bytes({0, 0, 0, 1, 0, 0, 0, 5,
                         0, 0, 0x07, 0x08,
                         0, 0, 0, 3,
                         0, 0, 0, 4,
                         10, 0, 0, 1, 0x1A, 0xE1,
                         192, 168, 1, 2, 0x00, 0x50,
                         1, 2, 3});  // trailing partial entry

  auto response = swc::wire::parse_announce_response(datagram);

  REQUIRE(response.has_value());
  REQUIRE(response->interval == 1800);
  REQUIRE(response->leechers == 3);
  REQUIRE(response->seeders == 4);
  REQUIRE(response->peers
          == std::vector<swc::PeerContactInfo> {
              {boost::asio::ip::make_address_v4("10.0.0.1"), 6881},
              {boost::asio::ip::make_address_v4("192.168.1.2"), 80}});

  REQUIRE(swc::wire::parse_announce_response(std::span(datagram).first(19))
              .error()
          == swc::wire::MessageError::TooShort);
}

TEST_CASE("Parses error message", "[library]")
{
  auto datagram = bytes({0, 0, 0, 3, 0, 0, 0, 5, 'n', 'o', 'p', 'e', 0, 'x'});

  auto header = swc::wire::read_header(datagram);
  REQUIRE(header.has_value());
  REQUIRE(header->action == 3u);
  REQUIRE(swc::wire::parse_error_message(datagram) == "nope");
  REQUIRE(swc::wire::parse_error_message(std::span(datagram).first(8)).empty());
  REQUIRE(swc::wire::read_header(std::span(datagram).first(7)).error()
          == swc::wire::MessageError::TooShort);
}
