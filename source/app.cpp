#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <functional>

#include "app.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/version.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <openssl/opensslv.h>

#include "auxiliary/peer_id.hpp"
#include "auxiliary/variant_aux.hpp"

using namespace std::chrono_literals;
using boost::asio::ip::udp;

namespace
{
template<typename T>
std::optional<T> parse_number(std::string_view text)
{
  T value {};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);

  if (ec != std::errc {} || end != text.data() + text.size()) {
    return std::nullopt;
  }

  return value;
}

std::optional<udp::endpoint> parse_bind_address(std::string_view text)
{
  auto colon = text.rfind(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto address =
      boost::asio::ip::make_address_v4(std::string {text.substr(0, colon)}, ec);
  auto port = parse_number<uint16_t>(text.substr(colon + 1));

  if (ec || !port) {
    return std::nullopt;
  }

  return udp::endpoint {address, *port};
}
}  // namespace

std::string_view usage()
{
  return "usage: swarmcore <file.torrent> [--bind ip:port] [--port N] "
         "[--timeout-ms N] [--retries N] [--max-depth N] [--strict] "
         "[--verbose]";
}

std::expected<CommandLine, std::string> parse_command_line(
    const std::vector<std::string_view>& args)
{
  CommandLine command_line {};

  for (size_t i = 0; i < args.size(); i++) {
    auto arg = args[i];

    if (arg == "--strict") {
      command_line.settings.decode.duplicate_keys =
          bencode::DuplicateKeyPolicy::Reject;
      continue;
    }

    if (arg == "--verbose") {
      command_line.settings.log_level = aux::LogLevel::Debug;
      continue;
    }

    if (!arg.starts_with("--")) {
      if (!command_line.torrent_file_path.empty()) {
        return std::unexpected {
            fmt::format("unexpected argument '{}'", arg)};
      }

      command_line.torrent_file_path = arg;
      continue;
    }

    if (i + 1 >= args.size()) {
      return std::unexpected {fmt::format("{} expects a value", arg)};
    }

    auto value = args[++i];
    auto invalid = [&]()
    { return std::unexpected {fmt::format("invalid value '{}' for {}", value, arg)}; };

    if (arg == "--bind") {
      auto endpoint = parse_bind_address(value);
      if (!endpoint) {
        return invalid();
      }

      command_line.settings.bind_address = endpoint->address().to_v4();
      command_line.settings.bind_port = endpoint->port();
    } else if (arg == "--port") {
      auto port = parse_number<uint16_t>(value);
      if (!port) {
        return invalid();
      }

      command_line.settings.listen_port = *port;
    } else if (arg == "--timeout-ms") {
      auto timeout = parse_number<uint32_t>(value);
      if (!timeout || *timeout == 0) {
        return invalid();
      }

      command_line.settings.retry.request_timeout =
          std::chrono::milliseconds {*timeout};
    } else if (arg == "--retries") {
      // past 2^30 the backoff multiplier stops being meaningful
      auto retries = parse_number<uint32_t>(value);
      if (!retries || *retries > 30) {
        return invalid();
      }

      command_line.settings.retry.max_retransmits = *retries;
    } else if (arg == "--max-depth") {
      auto depth = parse_number<int>(value);
      if (!depth || *depth < 1) {
        return invalid();
      }

      command_line.settings.decode.max_depth = *depth;
    } else {
      return std::unexpected {fmt::format("unknown option '{}'", arg)};
    }
  }

  if (command_line.torrent_file_path.empty()) {
    return std::unexpected {std::string {"missing torrent file"}};
  }

  return command_line;
}

std::optional<swc::TrackerUrl> select_tracker_url(const swc::TorrentFile& torrent)
{
  std::vector<std::string_view> candidates {torrent.announce};

  for (const auto& tier : torrent.announce_list) {
    candidates.insert(candidates.end(), tier.cbegin(), tier.cend());
  }

  std::optional<swc::TrackerUrl> fallback;

  for (auto candidate : candidates) {
    auto url = swc::parse_tracker_url(candidate);
    if (!url) {
      continue;
    }

    if (url->type == swc::TrackerType::Udp) {
      return url;
    }

    if (!fallback) {
      fallback = std::move(url);
    }
  }

  return fallback;
}

App::App(swc::ClientSettings settings,
         std::shared_ptr<aux::CancellationFlag> cancellation)
    : m_settings {std::move(settings)}
    , m_cancellation {std::move(cancellation)}
{
  fmt::print(fg(fmt::color::aqua) | fmt::emphasis::bold | fmt::emphasis::italic,
             "Welcome to swarmcore!\n");

  fmt::print(fg(fmt::color::antique_white) | fmt::emphasis::bold
                 | fmt::emphasis::italic,
             "Built with:\n");
  fmt::print(fg(fmt::color::orange) | fmt::emphasis::italic,
             " *Boost Version: {}\n",
             BOOST_LIB_VERSION);

  fmt::print(fg(fmt::color::rebecca_purple) | fmt::emphasis::italic,
             " *FMT Version: {}\n",
             FMT_VERSION);

  fmt::print(fg(fmt::color::medium_violet_red) | fmt::emphasis::italic,
             " *OPENSSL Version: {}\n",
             OPENSSL_VERSION_TEXT);
}

int App::run(const std::string& torrent_file_path)
{
  auto torrent = swc::read_torrent_file(
      torrent_file_path, m_settings.max_torrent_size, m_settings.decode);

  if (!torrent) {
    fmt::print(stderr,
               fg(fmt::color::red),
               "cannot load {}: {}\n",
               torrent_file_path,
               swc::to_string(torrent.error()));
    return EXIT_FAILURE;
  }

  print_torrent(*torrent);

  auto url = select_tracker_url(*torrent);
  if (!url) {
    fmt::print(stderr,
               fg(fmt::color::red),
               "no usable announce url in '{}'\n",
               torrent->announce);
    return EXIT_FAILURE;
  }

  return announce(*torrent, *url);
}

void App::print_torrent(const swc::TorrentFile& torrent) const
{
  auto title = fg(fmt::color::antique_white) | fmt::emphasis::bold;

  fmt::print(title, "\n{}\n", torrent.name);
  fmt::print(" info hash:    {:02x}\n", fmt::join(torrent.info_hash, ""));
  fmt::print(" announce:     {}\n", torrent.announce);
  fmt::print(" total size:   {} bytes\n", torrent.total_length());
  fmt::print(" pieces:       {} x {} bytes\n",
             torrent.piece_count(),
             torrent.piece_length);

  if (torrent.is_private) {
    fmt::print(" private:      {}\n", *torrent.is_private);
  }
  if (torrent.comment) {
    fmt::print(" comment:      {}\n", *torrent.comment);
  }
  if (torrent.created_by) {
    fmt::print(" created by:   {}\n", *torrent.created_by);
  }

  std::visit(aux::overloaded {
                 [](const swc::SingleFile& file)
                 { fmt::print(" single file:  {} bytes\n", file.length); },
                 [](const swc::MultipleFiles& layout)
                 {
                   fmt::print(" files:\n");
                   for (const auto& file : layout.files) {
                     fmt::print("   {} ({} bytes)\n",
                                fmt::join(file.path, "/"),
                                file.length);
                   }
                 }},
             torrent.layout);
}

int App::announce(const swc::TorrentFile& torrent, const swc::TrackerUrl& url)
{
  boost::asio::io_context io {};

  swc::TrackerFactory factory {io.get_executor(), m_settings, m_cancellation};

  udp::endpoint tracker_address {};

  if (url.type == swc::TrackerType::Udp) {
    udp::resolver resolver {io};
    boost::system::error_code ec;
    auto results = resolver.resolve(udp::v4(), url.host, url.port, ec);

    if (ec || results.empty()) {
      fmt::print(stderr,
                 fg(fmt::color::red),
                 "cannot resolve {}:{}: {}\n",
                 url.host,
                 url.port,
                 ec ? ec.message() : std::string {"no address"});
      return EXIT_FAILURE;
    }

    tracker_address = results.begin()->endpoint();
  }

  auto tracker = factory.get(url.type, tracker_address);
  if (!tracker) {
    fmt::print(stderr,
               fg(fmt::color::red),
               "tracker {}: {}\n",
               url.host,
               swc::to_string(tracker.error().code));
    return EXIT_FAILURE;
  }

  aux::PeerId peer_id {};

  swc::AnnounceRequest request {.info_hash = torrent.info_hash,
                                .peer_id = peer_id.as_raw(),
                                .downloaded = 0,
                                .left = torrent.total_length(),
                                .uploaded = 0,
                                .event = swc::AnnounceEvent::Started,
                                .ip_address = 0,
                                .key = std::nullopt,
                                .num_want = m_settings.num_want,
                                .port = m_settings.listen_port};

  boost::asio::steady_timer reannounce {io};
  bool done = false;
  bool started = false;
  int exit_code = EXIT_SUCCESS;

  std::function<void()> announce_now;

  auto on_result = [&](swc::AnnounceResult result)
  {
    if (!result) {
      fmt::print(stderr,
                 fg(fmt::color::red),
                 "announce failed: {} {}\n",
                 swc::to_string(result.error().code),
                 result.error().message);
      exit_code = EXIT_FAILURE;
      done = true;
      return;
    }

    fmt::print(fg(fmt::color::light_green),
               "\n{} seeders, {} leechers, next announce in {}s\n",
               result->seeders,
               result->leechers,
               result->interval);

    for (const auto& peer : result->peers) {
      fmt::print("   {}:{}\n", peer.address.to_string(), peer.port);
    }

    started = true;
    request.event = swc::AnnounceEvent::None;

    reannounce.expires_after(
        std::chrono::seconds {std::max<uint32_t>(result->interval, 1)});
    reannounce.async_wait(
        [&](const boost::system::error_code& ec)
        {
          if (!ec && !m_cancellation->is_set()) {
            announce_now();
          }
        });
  };

  announce_now = [&]()
  {
    auto sent = (*tracker)->announce(request, on_result);
    if (!sent) {
      if (sent.error().code != swc::TrackerErrc::ShutDown) {
        fmt::print(stderr,
                   fg(fmt::color::red),
                   "announce failed: {} {}\n",
                   swc::to_string(sent.error().code),
                   sent.error().message);
        exit_code = EXIT_FAILURE;
      }
      done = true;
    }
  };

  announce_now();

  while (!done && !m_cancellation->is_set() && !io.stopped()) {
    io.run_for(200ms);
  }

  if (m_cancellation->is_set()) {
    fmt::print(fg(fmt::color::antique_white), "\nstopping...\n");

    if (started) {
      if (auto stopped = (*tracker)->announce_stopped(request); !stopped) {
        fmt::print(stderr,
                   fg(fmt::color::yellow),
                   "stopped announce not sent: {}\n",
                   swc::to_string(stopped.error().code));
      }
    }
  }

  reannounce.cancel();
  factory.shutdown();
  return exit_code;
}
