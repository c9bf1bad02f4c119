#include <utility>

#include "client/transport/udp_transport.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <fmt/ostream.h>

#include "auxiliary/log.hpp"

using boost::system::error_code;

namespace swc
{
namespace
{
constexpr aux::Logger logger {"transport"};
}  // namespace

AsioUdpTransport::AsioUdpTransport(
    boost::asio::any_io_executor executor,
    std::shared_ptr<const aux::CancellationFlag> cancellation)
    : m_socket {std::move(executor)}
    , m_cancellation {std::move(cancellation)}
{
}

AsioUdpTransport::~AsioUdpTransport()
{
  close();
}

std::expected<std::shared_ptr<AsioUdpTransport>, error_code>
AsioUdpTransport::open(boost::asio::any_io_executor executor,
                       const udp::endpoint& local,
                       std::shared_ptr<const aux::CancellationFlag> cancellation)
{
  auto transport = std::make_shared<AsioUdpTransport>(std::move(executor),
                                                      std::move(cancellation));
  error_code ec;

  transport->m_socket.open(udp::v4(), ec);
  if (!ec) {
    transport->m_socket.bind(local, ec);
  }
  if (!ec) {
    transport->m_socket.non_blocking(true, ec);
  }

  if (ec) {
    logger.error("cannot open udp socket on {}: {}",
                 fmt::streamed(local),
                 ec.message());
    return std::unexpected {ec};
  }

  logger.debug("udp socket bound to {}",
               fmt::streamed(transport->local_endpoint()));
  return transport;
}

error_code AsioUdpTransport::send_to(std::span<const uint8_t> datagram,
                                     const udp::endpoint& destination)
{
  error_code ec;
  m_socket.send_to(
      boost::asio::buffer(datagram.data(), datagram.size()), destination, 0, ec);

  if (ec) {
    logger.warn("send to {} failed: {}", fmt::streamed(destination), ec.message());
  }

  return ec;
}

void AsioUdpTransport::start_receive(receive_handler handler)
{
  m_handler = std::move(handler);

  if (!m_receiving && m_socket.is_open()) {
    receive_loop();
  }
}

void AsioUdpTransport::close()
{
  m_handler = nullptr;

  if (m_socket.is_open()) {
    error_code ignored;
    m_socket.cancel(ignored);
    m_socket.close(ignored);
  }
}

udp::endpoint AsioUdpTransport::local_endpoint() const
{
  error_code ec;
  auto endpoint = m_socket.local_endpoint(ec);
  return ec ? udp::endpoint {} : endpoint;
}

void AsioUdpTransport::receive_loop()
{
  m_receiving = true;
  m_socket.async_receive_from(
      boost::asio::buffer(m_buffer),
      m_sender,
      [weak = weak_from_this()](const error_code& ec, size_t bytes_received)
      {
        if (auto self = weak.lock()) {
          self->on_receive(ec, bytes_received);
        }
      });
}

void AsioUdpTransport::on_receive(const error_code& ec, size_t bytes_received)
{
  m_receiving = false;

  if (ec == boost::asio::error::operation_aborted || !m_socket.is_open()) {
    return;
  }

  if (ec) {
    // ICMP errors from an earlier send surface here, the socket stays usable
    logger.warn("receive failed: {}", ec.message());
  } else if (m_handler) {
    // the handler may close() us
    auto handler = m_handler;
    handler(m_sender, std::span<const uint8_t>(m_buffer.data(), bytes_received));
  }

  if (m_cancellation && m_cancellation->is_set()) {
    logger.debug("stop requested, receive loop not re-armed");
    return;
  }

  if (m_socket.is_open() && m_handler) {
    receive_loop();
  }
}
}  // namespace swc
