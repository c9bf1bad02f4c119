#include <cstdint>
#include <regex>
#include <utility>

#include "client/tracker/factory.hpp"

#include <fmt/ostream.h>

#include "auxiliary/log.hpp"
#include "client/transport/udp_transport.hpp"

namespace swc
{
namespace
{
constexpr aux::Logger logger {"factory"};
}  // namespace

std::optional<TrackerUrl> parse_tracker_url(std::string_view url)
{
  static const std::regex rgx(
      R"(^(udp|https?)://([a-zA-Z0-9.-]+)(?::([0-9]{1,5}))?(/.*)?$)");

  std::match_results<std::string_view::const_iterator> match;

  if (!std::regex_match(url.cbegin(), url.cend(), match, rgx)) {
    return std::nullopt;
  }

  TrackerUrl parsed {.type = match[1] == "udp" ? TrackerType::Udp
                                               : TrackerType::Http,
                     .host = match[2].str(),
                     .port = match[3].str()};

  if (parsed.port.empty()) {
    if (parsed.type == TrackerType::Udp) {
      return std::nullopt;
    }

    parsed.port = match[1] == "https" ? "443" : "80";
  }

  if (std::stoul(parsed.port) > UINT16_MAX) {
    return std::nullopt;
  }

  return parsed;
}

TrackerFactory::TrackerFactory(
    boost::asio::any_io_executor executor,
    ClientSettings settings,
    std::shared_ptr<const aux::CancellationFlag> cancellation)
    : m_executor {std::move(executor)}
    , m_settings {std::move(settings)}
    , m_cancellation {std::move(cancellation)}
{
}

TrackerFactory::~TrackerFactory()
{
  shutdown();
}

std::expected<std::shared_ptr<ITracker>, TrackerFailure> TrackerFactory::get(
    TrackerType type, const udp::endpoint& tracker_address)
{
  switch (type) {
    case TrackerType::Udp: {
      auto transport = AsioUdpTransport::open(
          m_executor,
          udp::endpoint {m_settings.bind_address, m_settings.bind_port},
          m_cancellation);

      if (!transport) {
        return std::unexpected {
            TrackerFailure {.code = TrackerErrc::TransportFailure,
                            .message = transport.error().message()}};
      }

      auto tracker = std::make_shared<UdpTracker>(m_executor,
                                                  std::move(*transport),
                                                  tracker_address,
                                                  m_settings,
                                                  m_cancellation);
      m_trackers.push_back(tracker);

      logger.debug("udp tracker created for {}", fmt::streamed(tracker_address));
      return tracker;
    }

    case TrackerType::Http:
      logger.warn("http trackers are not supported");
      break;
  }

  return std::unexpected {
      TrackerFailure {.code = TrackerErrc::UnsupportedTrackerType,
                      .message = {}}};
}

void TrackerFactory::shutdown()
{
  for (auto& tracker : m_trackers) {
    tracker->shutdown();
  }

  m_trackers.clear();
}
}  // namespace swc
