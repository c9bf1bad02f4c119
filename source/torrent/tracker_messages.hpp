#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>

#include "auxiliary/big_endian.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace swc
{
using PeerIdBytes = std::array<uint8_t, 20>;

/// Values defined in https://www.bittorrent.org/beps/bep_0015.html
enum class Actions : uint32_t
{
  Connect = 0,
  Announce = 1,
  Error = 3,  // Only sent by tracker to client
};

enum class AnnounceEvent : uint32_t
{
  None = 0,
  Completed = 1,
  Started = 2,
  Stopped = 3,
};

constexpr uint64_t ANNOUNCER_MAGIC = 0x41727101980;

/// What a caller reports about its download.
struct AnnounceRequest
{
  InfoHash info_hash {};
  PeerIdBytes peer_id {};
  uint64_t downloaded = 0;
  uint64_t left = 0;
  uint64_t uploaded = 0;
  AnnounceEvent event = AnnounceEvent::None;
  uint32_t ip_address = 0;  // 0: the tracker uses the sender address
  std::optional<uint32_t> key;  // defaults to the session key
  int32_t num_want = -1;  // -1: tracker default
  uint16_t port = 0;
};

struct PeerContactInfo
{
  boost::asio::ip::address_v4 address;
  uint16_t port;

  bool operator==(const PeerContactInfo&) const = default;
};

struct AnnounceResponse
{
  uint32_t interval = 0;
  uint32_t leechers = 0;
  uint32_t seeders = 0;
  std::vector<PeerContactInfo> peers;
};

namespace wire
{
#pragma pack(push, 1)

struct SWC_PACKED ConnectRequest
{
  explicit ConnectRequest(uint32_t p_transaction_id)
      : transaction_id {p_transaction_id}
  {
  }

  aux::uint64_big protocol_id = ANNOUNCER_MAGIC;
  aux::uint32_big action = static_cast<uint32_t>(Actions::Connect);
  aux::uint32_big transaction_id;
};

struct SWC_PACKED ConnectResponse
{
  aux::uint32_big action;
  aux::uint32_big transaction_id;
  aux::uint64_big connection_id;
};

struct SWC_PACKED AnnounceRequest
{
  AnnounceRequest(uint64_t p_connection_id,
                  uint32_t p_transaction_id,
                  uint32_t p_key,
                  const swc::AnnounceRequest& request)
      : connection_id {p_connection_id}
      , transaction_id {p_transaction_id}
      , downloaded {request.downloaded}
      , left {request.left}
      , uploaded {request.uploaded}
      , event {static_cast<uint32_t>(request.event)}
      , ip_address {request.ip_address}
      , key {request.key.value_or(p_key)}
      , num_want {request.num_want}
      , port {request.port}
  {
    std::copy(request.info_hash.cbegin(), request.info_hash.cend(), info_hash);
    std::copy(request.peer_id.cbegin(), request.peer_id.cend(), peer_id);
  }

  aux::uint64_big connection_id;
  aux::uint32_big action = static_cast<uint32_t>(Actions::Announce);
  aux::uint32_big transaction_id;

  uint8_t info_hash[20];
  uint8_t peer_id[20];
  aux::uint64_big downloaded;
  aux::uint64_big left;
  aux::uint64_big uploaded;
  aux::uint32_big event;
  aux::uint32_big ip_address;
  aux::uint32_big key;
  aux::int32_big num_want;
  aux::uint16_big port;
};

struct SWC_PACKED IpV4Port
{
  aux::uint32_big ip;
  aux::uint16_big port;
};

struct SWC_PACKED AnnounceResponseHeader
{
  aux::uint32_big action;
  aux::uint32_big transaction_id;
  aux::uint32_big interval;
  aux::uint32_big leechers;
  aux::uint32_big seeders;
  // IpV4Port[N]... up to the end of the datagram
};

struct SWC_PACKED ResponseHeader
{
  aux::uint32_big action;
  aux::uint32_big transaction_id;
  // action specific payload; for Actions::Error a message string
};

#pragma pack(pop)

static_assert(sizeof(ConnectRequest) == 16);
static_assert(sizeof(ConnectResponse) == 16);
static_assert(sizeof(AnnounceRequest) == 98);
static_assert(sizeof(IpV4Port) == 6);
static_assert(sizeof(AnnounceResponseHeader) == 20);
static_assert(sizeof(ResponseHeader) == 8);

template<typename T>
concept UdpTrackerMessage = std::is_trivially_copyable_v<T> && requires(const T message) {
  {
    message.action
  } -> std::convertible_to<aux::uint32_big>;
};

template<UdpTrackerMessage T>
std::vector<uint8_t> to_datagram(const T& message)
{
  std::vector<uint8_t> datagram(sizeof(T));
  std::memcpy(datagram.data(), &message, sizeof(T));
  return datagram;
}

enum class MessageError : uint8_t
{
  TooShort,
  UnexpectedAction,
};

/// Reads a fixed layout from the front of `datagram` and checks its action.
template<UdpTrackerMessage T>
std::expected<T, MessageError> read_message(std::span<const uint8_t> datagram,
                                            Actions expected_action)
{
  if (datagram.size() < sizeof(T)) {
    return std::unexpected {MessageError::TooShort};
  }

  T message;
  std::memcpy(&message, datagram.data(), sizeof(T));

  if (message.action != static_cast<uint32_t>(expected_action)) {
    return std::unexpected {MessageError::UnexpectedAction};
  }

  return message;
}

std::expected<ResponseHeader, MessageError> read_header(
    std::span<const uint8_t> datagram);

std::expected<AnnounceResponse, MessageError> parse_announce_response(
    std::span<const uint8_t> datagram);

std::string parse_error_message(std::span<const uint8_t> datagram);

}  // namespace wire
}  // namespace swc
