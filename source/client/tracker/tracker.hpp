#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "auxiliary/cancellation.hpp"
#include "client/context.hpp"
#include "client/transport/transport.hpp"
#include "torrent/tracker_messages.hpp"

namespace swc
{
enum class TrackerErrc : uint8_t
{
  TransportFailure,
  Timeout,
  Rejected,
  ShutDown,
  UnsupportedTrackerType,
  NotConnected,
};

std::string_view to_string(TrackerErrc code);

struct TrackerFailure
{
  TrackerErrc code;
  std::string message;
};

using AnnounceResult = std::expected<AnnounceResponse, TrackerFailure>;
using AnnounceCallback = std::function<void(AnnounceResult)>;

class ITracker
{
public:
  /// Either fails right away or invokes `callback` exactly once later,
  /// unless the tracker is shut down first.
  virtual std::expected<void, TrackerFailure> announce(
      AnnounceRequest request, AnnounceCallback callback) = 0;

  /// Sends a single `Stopped` announce and expects no answer. Works after a
  /// stop request, but needs a live connection id.
  virtual std::expected<void, TrackerFailure> announce_stopped(
      AnnounceRequest request) = 0;

  /// Drops every pending request without invoking its callback.
  virtual void shutdown() = 0;

  virtual ~ITracker() = default;
};

enum class SessionState : uint8_t
{
  Uninitialized,
  ConnectPending,
  Ready,
};

/// BEP-15 announce session against a single tracker.
///
/// All methods and completions run on the executor's thread. Must be owned by
/// a std::shared_ptr: completions reach the session through a weak_ptr.
class UdpTracker
    : public ITracker
    , public std::enable_shared_from_this<UdpTracker>
{
  struct ConnectExchange
  {
  };

  struct AnnounceExchange
  {
    AnnounceRequest request;
    AnnounceCallback callback;
    // transmissions already spent, carried across reconnects
    uint32_t attempt = 0;
  };

  struct PendingRequest
  {
    std::variant<ConnectExchange, AnnounceExchange> exchange;
    std::vector<uint8_t> datagram;
    uint32_t attempt = 0;
    uint64_t serial = 0;
    std::unique_ptr<boost::asio::steady_timer> timer;
  };

  boost::asio::any_io_executor m_executor;
  std::shared_ptr<ITransport> m_transport;
  udp::endpoint m_tracker_address;
  ClientSettings m_settings;
  std::shared_ptr<const aux::CancellationFlag> m_cancellation;

  SessionState m_state = SessionState::Uninitialized;
  std::optional<uint64_t> m_connection_id;
  std::chrono::steady_clock::time_point m_connection_expiry;
  uint32_t m_key;

  std::unordered_map<uint32_t, PendingRequest> m_pending;
  std::vector<AnnounceExchange> m_queued;
  uint64_t m_next_serial = 0;

  bool m_receiving = false;
  bool m_shut_down = false;

public:
  UdpTracker(boost::asio::any_io_executor executor,
             std::shared_ptr<ITransport> transport,
             udp::endpoint tracker_address,
             ClientSettings settings,
             std::shared_ptr<const aux::CancellationFlag> cancellation);

  ~UdpTracker() override;

  UdpTracker(const UdpTracker&) = delete;
  UdpTracker& operator=(const UdpTracker&) = delete;

  std::expected<void, TrackerFailure> announce(
      AnnounceRequest request, AnnounceCallback callback) override;

  std::expected<void, TrackerFailure> announce_stopped(
      AnnounceRequest request) override;

  void shutdown() override;

  SessionState state() const { return m_state; }

  std::optional<uint64_t> connection_id() const { return m_connection_id; }

  /// Requests on the wire awaiting a response, connect included.
  size_t pending_requests() const { return m_pending.size(); }

  /// Announces waiting for the connect exchange to finish.
  size_t queued_announces() const { return m_queued.size(); }

  const udp::endpoint& tracker_address() const { return m_tracker_address; }

private:
  void ensure_receiving();

  bool connection_expired() const;

  uint32_t new_transaction_id() const;

  std::expected<void, TrackerFailure> send_connect();

  void expire_connection();

  std::expected<void, TrackerFailure> send_announce(AnnounceExchange exchange);

  std::vector<uint8_t> announce_datagram(uint32_t transaction_id,
                                         const AnnounceRequest& request) const;

  void requeue_announce(uint32_t transaction_id);

  void track(uint32_t transaction_id, PendingRequest request);

  void arm_timer(uint32_t transaction_id);

  void on_timeout(uint32_t transaction_id, uint64_t serial);

  void fail_request(uint32_t transaction_id, const TrackerFailure& failure);

  void release_queued_announces();

  void fail_queued_announces(const TrackerFailure& failure);

  void on_datagram(const udp::endpoint& sender, std::span<const uint8_t> datagram);

  void on_connect_response(uint32_t transaction_id,
                           std::span<const uint8_t> datagram);

  void on_announce_response(uint32_t transaction_id,
                            std::span<const uint8_t> datagram);
};
}  // namespace swc
