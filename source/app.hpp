#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "auxiliary/cancellation.hpp"
#include "client/context.hpp"
#include "client/tracker/factory.hpp"
#include "torrent/metadata/torrentfile.hpp"

struct CommandLine
{
  std::string torrent_file_path;
  swc::ClientSettings settings;
};

/// `args` excludes the program name. Errors are printable usage messages.
std::expected<CommandLine, std::string> parse_command_line(
    const std::vector<std::string_view>& args);

std::string_view usage();

/// Picks the announce url to use: the first udp one in `announce` then
/// `announce-list` order, otherwise the first one that parses at all.
std::optional<swc::TrackerUrl> select_tracker_url(const swc::TorrentFile& torrent);

class App
{
  swc::ClientSettings m_settings;
  std::shared_ptr<aux::CancellationFlag> m_cancellation;

public:
  App(swc::ClientSettings settings,
      std::shared_ptr<aux::CancellationFlag> cancellation);

  int run(const std::string& torrent_file_path);

private:
  void print_torrent(const swc::TorrentFile& torrent) const;

  int announce(const swc::TorrentFile& torrent, const swc::TrackerUrl& url);
};
