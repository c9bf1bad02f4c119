#include <iterator>
#include <utility>

#include "client/tracker/tracker.hpp"

#include <boost/asio/error.hpp>
#include <fmt/ostream.h>

#include "auxiliary/log.hpp"
#include "auxiliary/random.hpp"

using boost::system::error_code;

namespace swc
{
namespace
{
constexpr aux::Logger logger {"tracker"};

std::string_view describe(wire::MessageError error)
{
  switch (error) {
    case wire::MessageError::TooShort:
      return "too short";
    case wire::MessageError::UnexpectedAction:
      return "unexpected action";
  }

  return "unknown";
}

TrackerFailure transport_failure(const error_code& ec)
{
  return TrackerFailure {.code = TrackerErrc::TransportFailure,
                         .message = ec.message()};
}
}  // namespace

std::string_view to_string(TrackerErrc code)
{
  switch (code) {
    case TrackerErrc::TransportFailure:
      return "transport failure";
    case TrackerErrc::Timeout:
      return "timed out";
    case TrackerErrc::Rejected:
      return "rejected by tracker";
    case TrackerErrc::ShutDown:
      return "tracker shut down";
    case TrackerErrc::UnsupportedTrackerType:
      return "unsupported tracker type";
    case TrackerErrc::NotConnected:
      return "no valid connection id";
  }

  return "unknown";
}

UdpTracker::UdpTracker(boost::asio::any_io_executor executor,
                       std::shared_ptr<ITransport> transport,
                       udp::endpoint tracker_address,
                       ClientSettings settings,
                       std::shared_ptr<const aux::CancellationFlag> cancellation)
    : m_executor {std::move(executor)}
    , m_transport {std::move(transport)}
    , m_tracker_address {std::move(tracker_address)}
    , m_settings {std::move(settings)}
    , m_cancellation {std::move(cancellation)}
    , m_key {aux::generate_random_in_range<uint32_t>()}
{
}

UdpTracker::~UdpTracker()
{
  shutdown();
}

std::expected<void, TrackerFailure> UdpTracker::announce(
    AnnounceRequest request, AnnounceCallback callback)
{
  if (m_shut_down || (m_cancellation && m_cancellation->is_set())) {
    return std::unexpected {
        TrackerFailure {.code = TrackerErrc::ShutDown, .message = {}}};
  }

  ensure_receiving();

  if (m_state == SessionState::Ready && connection_expired()) {
    expire_connection();
  }

  switch (m_state) {
    case SessionState::Ready:
      return send_announce(AnnounceExchange {.request = std::move(request),
                                             .callback = std::move(callback)});

    case SessionState::ConnectPending:
      m_queued.push_back(AnnounceExchange {.request = std::move(request),
                                           .callback = std::move(callback)});
      return {};

    case SessionState::Uninitialized: {
      auto connected = send_connect();
      if (!connected) {
        return std::unexpected {connected.error()};
      }

      m_queued.push_back(AnnounceExchange {.request = std::move(request),
                                           .callback = std::move(callback)});
      return {};
    }
  }

  return {};
}

std::expected<void, TrackerFailure> UdpTracker::announce_stopped(
    AnnounceRequest request)
{
  if (m_shut_down) {
    return std::unexpected {
        TrackerFailure {.code = TrackerErrc::ShutDown, .message = {}}};
  }

  if (m_state != SessionState::Ready || connection_expired()) {
    return std::unexpected {
        TrackerFailure {.code = TrackerErrc::NotConnected, .message = {}}};
  }

  request.event = AnnounceEvent::Stopped;
  auto transaction_id = new_transaction_id();

  if (auto ec = m_transport->send_to(announce_datagram(transaction_id, request),
                                     m_tracker_address))
  {
    return std::unexpected {transport_failure(ec)};
  }

  logger.info("stopped event sent to {}", fmt::streamed(m_tracker_address));
  return {};
}

void UdpTracker::shutdown()
{
  if (m_shut_down) {
    return;
  }

  m_shut_down = true;
  m_transport->close();

  // destroying the timers cancels them; callbacks are dropped unseen
  m_pending.clear();
  m_queued.clear();

  m_connection_id.reset();
  m_state = SessionState::Uninitialized;
}

void UdpTracker::ensure_receiving()
{
  if (m_receiving) {
    return;
  }

  m_receiving = true;
  m_transport->start_receive(
      [weak = weak_from_this()](const udp::endpoint& sender,
                                std::span<const uint8_t> datagram)
      {
        if (auto self = weak.lock()) {
          self->on_datagram(sender, datagram);
        }
      });
}

bool UdpTracker::connection_expired() const
{
  return std::chrono::steady_clock::now() >= m_connection_expiry;
}

void UdpTracker::expire_connection()
{
  logger.debug("connection id {:#x} expired", *m_connection_id);
  m_connection_id.reset();
  m_state = SessionState::Uninitialized;
}

uint32_t UdpTracker::new_transaction_id() const
{
  uint32_t transaction_id;

  do {
    transaction_id = aux::generate_random_in_range<uint32_t>();
  } while (m_pending.contains(transaction_id));

  return transaction_id;
}

std::expected<void, TrackerFailure> UdpTracker::send_connect()
{
  auto transaction_id = new_transaction_id();
  auto datagram = wire::to_datagram(wire::ConnectRequest {transaction_id});

  if (auto ec = m_transport->send_to(datagram, m_tracker_address)) {
    logger.error("connect to {} failed: {}",
                 fmt::streamed(m_tracker_address),
                 ec.message());
    return std::unexpected {transport_failure(ec)};
  }

  logger.debug("connect sent to {}, transaction {:#x}",
               fmt::streamed(m_tracker_address),
               transaction_id);

  m_state = SessionState::ConnectPending;
  track(transaction_id,
        PendingRequest {.exchange = ConnectExchange {},
                        .datagram = std::move(datagram)});
  return {};
}

std::vector<uint8_t> UdpTracker::announce_datagram(
    uint32_t transaction_id, const AnnounceRequest& request) const
{
  return wire::to_datagram(
      wire::AnnounceRequest {*m_connection_id, transaction_id, m_key, request});
}

std::expected<void, TrackerFailure> UdpTracker::send_announce(
    AnnounceExchange exchange)
{
  auto transaction_id = new_transaction_id();
  auto datagram = announce_datagram(transaction_id, exchange.request);

  if (auto ec = m_transport->send_to(datagram, m_tracker_address)) {
    logger.error("announce to {} failed: {}",
                 fmt::streamed(m_tracker_address),
                 ec.message());
    return std::unexpected {transport_failure(ec)};
  }

  logger.debug("announce sent to {}, transaction {:#x}",
               fmt::streamed(m_tracker_address),
               transaction_id);

  auto attempt = exchange.attempt;
  track(transaction_id,
        PendingRequest {.exchange = std::move(exchange),
                        .datagram = std::move(datagram),
                        .attempt = attempt});
  return {};
}

void UdpTracker::track(uint32_t transaction_id, PendingRequest request)
{
  request.serial = m_next_serial++;
  m_pending.insert_or_assign(transaction_id, std::move(request));
  arm_timer(transaction_id);
}

void UdpTracker::arm_timer(uint32_t transaction_id)
{
  if (m_cancellation && m_cancellation->is_set()) {
    logger.debug("stop requested, retry timer for {:#x} not armed",
                 transaction_id);
    return;
  }

  auto& pending = m_pending.at(transaction_id);

  pending.timer = std::make_unique<boost::asio::steady_timer>(
      m_executor, m_settings.retry.timeout_for_attempt(pending.attempt));

  pending.timer->async_wait(
      [weak = weak_from_this(), transaction_id, serial = pending.serial](
          const error_code& ec)
      {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }

        if (auto self = weak.lock()) {
          self->on_timeout(transaction_id, serial);
        }
      });
}

void UdpTracker::on_timeout(uint32_t transaction_id, uint64_t serial)
{
  auto it = m_pending.find(transaction_id);
  if (it == m_pending.end() || it->second.serial != serial) {
    return;
  }

  auto& pending = it->second;

  if (pending.attempt >= m_settings.retry.max_retransmits) {
    logger.error("transaction {:#x} to {} timed out after {} transmissions",
                 transaction_id,
                 fmt::streamed(m_tracker_address),
                 pending.attempt + 1);
    fail_request(transaction_id,
                 TrackerFailure {.code = TrackerErrc::Timeout, .message = {}});
    return;
  }

  if (m_cancellation && m_cancellation->is_set()) {
    return;
  }

  if (std::holds_alternative<AnnounceExchange>(pending.exchange)) {
    if (m_state != SessionState::Ready || connection_expired()) {
      requeue_announce(transaction_id);
      return;
    }

    // the session may have reconnected since the last transmission
    pending.datagram = announce_datagram(
        transaction_id, std::get<AnnounceExchange>(pending.exchange).request);
  }

  pending.attempt++;
  logger.debug("retransmitting transaction {:#x}, attempt {}",
               transaction_id,
               pending.attempt);

  if (auto ec = m_transport->send_to(pending.datagram, m_tracker_address)) {
    fail_request(transaction_id, transport_failure(ec));
    return;
  }

  arm_timer(transaction_id);
}

void UdpTracker::requeue_announce(uint32_t transaction_id)
{
  auto node = m_pending.extract(transaction_id);
  auto exchange = std::get<AnnounceExchange>(std::move(node.mapped().exchange));
  exchange.attempt = node.mapped().attempt + 1;

  logger.debug("transaction {:#x} waits for a new connection id", transaction_id);

  if (m_state == SessionState::Ready) {
    expire_connection();
  }

  if (m_state == SessionState::Uninitialized) {
    if (auto connected = send_connect(); !connected) {
      exchange.callback(std::unexpected {connected.error()});
      return;
    }
  }

  m_queued.push_back(std::move(exchange));
}

void UdpTracker::fail_request(uint32_t transaction_id,
                              const TrackerFailure& failure)
{
  auto node = m_pending.extract(transaction_id);
  if (node.empty()) {
    return;
  }

  auto& exchange = node.mapped().exchange;

  if (std::holds_alternative<ConnectExchange>(exchange)) {
    m_state = SessionState::Uninitialized;
    fail_queued_announces(failure);
    return;
  }

  std::get<AnnounceExchange>(exchange).callback(std::unexpected {failure});
}

void UdpTracker::release_queued_announces()
{
  auto queued = std::exchange(m_queued, {});

  for (auto it = queued.begin(); it != queued.end() && !m_shut_down; ++it) {
    if (m_state != SessionState::Ready) {
      // a callback forced a reconnect; the rest waits for it
      m_queued.insert(m_queued.end(),
                      std::make_move_iterator(it),
                      std::make_move_iterator(queued.end()));
      break;
    }

    auto callback = it->callback;
    auto sent = send_announce(std::move(*it));
    if (!sent) {
      callback(std::unexpected {sent.error()});
    }
  }
}

void UdpTracker::fail_queued_announces(const TrackerFailure& failure)
{
  auto queued = std::exchange(m_queued, {});

  for (auto& entry : queued) {
    if (m_shut_down) {
      break;
    }

    entry.callback(std::unexpected {failure});
  }
}

void UdpTracker::on_datagram(const udp::endpoint& sender,
                             std::span<const uint8_t> datagram)
{
  if (m_shut_down) {
    return;
  }

  if (sender != m_tracker_address) {
    logger.warn("discarding datagram from unexpected sender {}",
                fmt::streamed(sender));
    return;
  }

  auto header = wire::read_header(datagram);
  if (!header) {
    logger.warn("protocol mismatch: {} byte datagram is {}",
                datagram.size(),
                describe(header.error()));
    return;
  }

  uint32_t transaction_id = header->transaction_id;
  auto it = m_pending.find(transaction_id);

  if (it == m_pending.end()) {
    logger.warn("unmatched transaction {:#x}, datagram discarded",
                transaction_id);
    return;
  }

  if (header->action == static_cast<uint32_t>(Actions::Error)) {
    auto message = wire::parse_error_message(datagram);
    logger.warn("tracker {} rejected transaction {:#x}: {}",
                fmt::streamed(m_tracker_address),
                transaction_id,
                message);
    fail_request(transaction_id,
                 TrackerFailure {.code = TrackerErrc::Rejected,
                                 .message = std::move(message)});
    return;
  }

  if (std::holds_alternative<ConnectExchange>(it->second.exchange)) {
    on_connect_response(transaction_id, datagram);
  } else {
    on_announce_response(transaction_id, datagram);
  }
}

void UdpTracker::on_connect_response(uint32_t transaction_id,
                                     std::span<const uint8_t> datagram)
{
  auto response =
      wire::read_message<wire::ConnectResponse>(datagram, Actions::Connect);

  if (!response) {
    logger.warn("protocol mismatch: connect response {}",
                describe(response.error()));
    return;
  }

  m_pending.erase(transaction_id);

  m_connection_id = static_cast<uint64_t>(response->connection_id);
  m_connection_expiry =
      std::chrono::steady_clock::now() + m_settings.connection_ttl;
  m_state = SessionState::Ready;

  logger.info("connected to {}, connection id {:#x}",
              fmt::streamed(m_tracker_address),
              *m_connection_id);

  release_queued_announces();
}

void UdpTracker::on_announce_response(uint32_t transaction_id,
                                      std::span<const uint8_t> datagram)
{
  auto response = wire::parse_announce_response(datagram);

  if (!response) {
    logger.warn("protocol mismatch: announce response {}",
                describe(response.error()));
    return;
  }

  auto node = m_pending.extract(transaction_id);
  auto callback = std::move(std::get<AnnounceExchange>(node.mapped().exchange).callback);

  logger.info("announce to {} done: {} peers, {} seeders, {} leechers, interval {}s",
              fmt::streamed(m_tracker_address),
              response->peers.size(),
              response->seeders,
              response->leechers,
              response->interval);

  callback(std::move(*response));
}
}  // namespace swc
