#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

#include "auxiliary/random.hpp"

namespace aux
{
/*
 * Azureus-style client id: -SC0100-<12 random printable bytes>
 */
class PeerId
{
public:
  static constexpr std::string_view CLIENT_PREFIX = "-SC0100-";
  static constexpr size_t SIZE = 20;

  PeerId()
      : m_peer_id {}
  {
    std::copy(CLIENT_PREFIX.cbegin(), CLIENT_PREFIX.cend(), m_peer_id.begin());

    constexpr std::string_view alphabet =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

    std::generate(m_peer_id.begin() + CLIENT_PREFIX.size(),
                  m_peer_id.end(),
                  [&alphabet]()
                  {
                    return static_cast<uint8_t>(
                        alphabet[generate_random_in_range<size_t>(
                            0, alphabet.size() - 1)]);
                  });
  }

  const std::array<uint8_t, SIZE>& as_raw() const { return m_peer_id; }

  std::string_view as_string() const
  {
    return {reinterpret_cast<const char*>(m_peer_id.data()), m_peer_id.size()};
  }

private:
  std::array<uint8_t, SIZE> m_peer_id;
};
}  // namespace aux
