#pragma once

#include <cstdint>
#include <functional>
#include <span>

#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

namespace swc
{
using boost::asio::ip::udp;

class ITransport
{
public:
  using receive_handler = std::function<void(const udp::endpoint& sender,
                                             std::span<const uint8_t> datagram)>;

  /// Non-blocking; a failure is reported right away, never later.
  virtual boost::system::error_code send_to(std::span<const uint8_t> datagram,
                                            const udp::endpoint& destination) = 0;

  /// Delivers every received datagram to `handler` until close() is called
  /// or a stop is requested.
  virtual void start_receive(receive_handler handler) = 0;

  /// Stops receiving and drops the handler. Safe to call more than once.
  virtual void close() = 0;

  virtual ~ITransport() = default;
};
}  // namespace swc
