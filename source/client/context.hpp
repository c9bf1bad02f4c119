#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/asio/ip/address_v4.hpp>

#include "auxiliary/log.hpp"
#include "torrent/metadata/bencode.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace swc
{
using namespace std::chrono_literals;

/// Retransmission follows BEP-15: wait request_timeout * 2^n before resending,
/// n = 0 .. max_retransmits, then give up.
struct RetryPolicy
{
  std::chrono::milliseconds request_timeout = 15s;
  uint32_t max_retransmits = 8;

  std::chrono::milliseconds timeout_for_attempt(uint32_t attempt) const
  {
    return request_timeout * (1LL << attempt);
  }
};

struct ClientSettings
{
  boost::asio::ip::address_v4 bind_address = boost::asio::ip::address_v4::any();
  uint16_t bind_port = 0;
  uint16_t listen_port = 6881;
  int32_t num_want = -1;

  RetryPolicy retry {};
  std::chrono::seconds connection_ttl = 60s;

  size_t max_torrent_size = DEFAULT_MAX_TORRENT_FILE_SIZE;
  bencode::DecodeOptions decode {};

  aux::LogLevel log_level = aux::LogLevel::Info;
};
}  // namespace swc
