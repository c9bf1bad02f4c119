#include <catch2/catch.hpp>

#include "app.hpp"

TEST_CASE("Command line defaults", "[app]")
{
  auto command_line = parse_command_line({"file.torrent"});

  REQUIRE(command_line.has_value());
  REQUIRE(command_line->torrent_file_path == "file.torrent");
  REQUIRE(command_line->settings.listen_port == 6881);
  REQUIRE(command_line->settings.retry.max_retransmits == 8);
  REQUIRE(command_line->settings.decode.duplicate_keys
          == bencode::DuplicateKeyPolicy::LastWins);
  REQUIRE(command_line->settings.log_level == aux::LogLevel::Info);
}

TEST_CASE("Command line options", "[app]")
{
  auto command_line = parse_command_line({"--bind",
                                          "127.0.0.1:7000",
                                          "--port",
                                          "51413",
                                          "--timeout-ms",
                                          "250",
                                          "--retries",
                                          "3",
                                          "--max-depth",
                                          "16",
                                          "--strict",
                                          "--verbose",
                                          "file.torrent"});

  REQUIRE(command_line.has_value());
  const auto& settings = command_line->settings;
  REQUIRE(settings.bind_address == boost::asio::ip::address_v4::loopback());
  REQUIRE(settings.bind_port == 7000);
  REQUIRE(settings.listen_port == 51413);
  REQUIRE(settings.retry.request_timeout == std::chrono::milliseconds {250});
  REQUIRE(settings.retry.max_retransmits == 3);
  REQUIRE(settings.decode.max_depth == 16);
  REQUIRE(settings.decode.duplicate_keys == bencode::DuplicateKeyPolicy::Reject);
  REQUIRE(settings.log_level == aux::LogLevel::Debug);
}

TEST_CASE("Command line errors", "[app]")
{
  REQUIRE_FALSE(parse_command_line({}).has_value());
  REQUIRE_FALSE(parse_command_line({"a.torrent", "b.torrent"}).has_value());
  REQUIRE_FALSE(parse_command_line({"a.torrent", "--port"}).has_value());
  REQUIRE_FALSE(parse_command_line({"a.torrent", "--port", "70000"}).has_value());
  REQUIRE_FALSE(parse_command_line({"a.torrent", "--bind", "localhost"}).has_value());
  REQUIRE_FALSE(parse_command_line({"a.torrent", "--timeout-ms", "0"}).has_value());
  REQUIRE_FALSE(parse_command_line({"a.torrent", "--unknown", "1"}).has_value());
}

TEST_CASE("Prefers a udp announce url", "[app]")
{
  swc::TorrentFile torrent {};
  torrent.announce = "http://tracker.example.org/announce";
  torrent.announce_list = {{"http://tracker.example.org/announce"},
                           {"udp://backup.example.org:6969/announce"}};

  auto url = select_tracker_url(torrent);
  REQUIRE(url.has_value());
  REQUIRE(url->type == swc::TrackerType::Udp);
  REQUIRE(url->host == "backup.example.org");

  torrent.announce_list.clear();
  REQUIRE(select_tracker_url(torrent)->type == swc::TrackerType::Http);

  torrent.announce = "not a url";
  REQUIRE_FALSE(select_tracker_url(torrent).has_value());
}
