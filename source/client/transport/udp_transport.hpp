#pragma once

#include <array>
#include <expected>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/udp.hpp>

#include "auxiliary/cancellation.hpp"
#include "client/transport/transport.hpp"

namespace swc
{
/// UDP datagram ceiling.
constexpr size_t MAX_DATAGRAM_SIZE = 65'535;

class AsioUdpTransport
    : public ITransport
    , public std::enable_shared_from_this<AsioUdpTransport>
{
  udp::socket m_socket;
  udp::endpoint m_sender;
  std::array<uint8_t, MAX_DATAGRAM_SIZE> m_buffer;

  receive_handler m_handler;
  bool m_receiving = false;

  std::shared_ptr<const aux::CancellationFlag> m_cancellation;

public:
  AsioUdpTransport(boost::asio::any_io_executor executor,
                   std::shared_ptr<const aux::CancellationFlag> cancellation);

  ~AsioUdpTransport() override;

  /// Opens a non-blocking IPv4 socket bound to `local`.
  static std::expected<std::shared_ptr<AsioUdpTransport>,
                       boost::system::error_code>
  open(boost::asio::any_io_executor executor,
       const udp::endpoint& local,
       std::shared_ptr<const aux::CancellationFlag> cancellation);

  boost::system::error_code send_to(std::span<const uint8_t> datagram,
                                    const udp::endpoint& destination) override;

  void start_receive(receive_handler handler) override;

  void close() override;

  udp::endpoint local_endpoint() const;

private:
  void receive_loop();

  void on_receive(const boost::system::error_code& ec, size_t bytes_received);
};
}  // namespace swc
