#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/udp.hpp>

#include "auxiliary/cancellation.hpp"
#include "client/context.hpp"
#include "client/tracker/tracker.hpp"

namespace swc
{
enum class TrackerType : uint8_t
{
  Udp,
  Http,
};

struct TrackerUrl
{
  TrackerType type;
  std::string host;
  std::string port;
};

/// Splits "udp://host:port/..." or "http(s)://host[:port]/...".
/// A udp url without a port is rejected.
std::optional<TrackerUrl> parse_tracker_url(std::string_view url);

/// Builds trackers and keeps them alive until it is destroyed, at which point
/// every tracker it built is shut down.
class TrackerFactory
{
  boost::asio::any_io_executor m_executor;
  ClientSettings m_settings;
  std::shared_ptr<const aux::CancellationFlag> m_cancellation;

  std::vector<std::shared_ptr<ITracker>> m_trackers;

public:
  TrackerFactory(boost::asio::any_io_executor executor,
                 ClientSettings settings,
                 std::shared_ptr<const aux::CancellationFlag> cancellation);

  ~TrackerFactory();

  TrackerFactory(const TrackerFactory&) = delete;
  TrackerFactory& operator=(const TrackerFactory&) = delete;

  /// Opens a bound udp transport for `Udp`; `Http` is not implemented.
  std::expected<std::shared_ptr<ITracker>, TrackerFailure> get(
      TrackerType type, const udp::endpoint& tracker_address);

  size_t size() const { return m_trackers.size(); }

  void shutdown();
};
}  // namespace swc
