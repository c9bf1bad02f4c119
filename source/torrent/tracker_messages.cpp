#include "torrent/tracker_messages.hpp"

namespace swc::wire
{
std::expected<ResponseHeader, MessageError> read_header(
    std::span<const uint8_t> datagram)
{
  if (datagram.size() < sizeof(ResponseHeader)) {
    return std::unexpected {MessageError::TooShort};
  }

  ResponseHeader header;
  std::memcpy(&header, datagram.data(), sizeof(header));
  return header;
}

std::expected<AnnounceResponse, MessageError> parse_announce_response(
    std::span<const uint8_t> datagram)
{
  auto header = read_message<AnnounceResponseHeader>(datagram, Actions::Announce);
  if (!header) {
    return std::unexpected {header.error()};
  }

  AnnounceResponse response {.interval = header->interval,
                             .leechers = header->leechers,
                             .seeders = header->seeders,
                             .peers = {}};

  // A trailing partial entry is ignored.
  auto peers = datagram.subspan(sizeof(AnnounceResponseHeader));
  auto peers_count = peers.size() / sizeof(IpV4Port);
  response.peers.reserve(peers_count);

  for (size_t i = 0; i < peers_count; i++) {
    IpV4Port entry;
    std::memcpy(&entry, peers.data() + i * sizeof(IpV4Port), sizeof(entry));

    response.peers.push_back(
        PeerContactInfo {.address = boost::asio::ip::address_v4(
                             static_cast<uint32_t>(entry.ip)),
                         .port = entry.port});
  }

  return response;
}

std::string parse_error_message(std::span<const uint8_t> datagram)
{
  if (datagram.size() <= sizeof(ResponseHeader)) {
    return {};
  }

  auto message = datagram.subspan(sizeof(ResponseHeader));
  std::string text(reinterpret_cast<const char*>(message.data()), message.size());

  // some trackers null terminate the message
  if (auto end = text.find('\0'); end != std::string::npos) {
    text.resize(end);
  }

  return text;
}
}  // namespace swc::wire
