#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "bencode.hpp"

namespace swc
{
constexpr size_t SHA1_HASH_SIZE = 20;
constexpr size_t DEFAULT_MAX_TORRENT_FILE_SIZE = 1'000'000;

using InfoHash = std::array<uint8_t, SHA1_HASH_SIZE>;

struct SingleFile
{
  uint64_t length;
};

struct FileEntry
{
  uint64_t length;
  std::vector<std::string> path;
};

struct MultipleFiles
{
  std::vector<FileEntry> files;
};

using FileLayout = std::variant<SingleFile, MultipleFiles>;

struct TorrentFile
{
  std::string announce;
  std::vector<std::vector<std::string>> announce_list;

  std::string name;
  int64_t piece_length;
  std::string pieces;  // concatenated 20 byte SHA1 digests
  std::optional<int64_t> is_private;
  FileLayout layout;

  /// SHA1 of the info dictionary bytes exactly as they appear in the file.
  InfoHash info_hash;

  std::optional<std::string> comment;
  std::optional<std::string> created_by;
  std::optional<std::chrono::seconds> creation_date;

  size_t piece_count() const { return pieces.size() / SHA1_HASH_SIZE; }

  std::string_view piece_hash(size_t index) const
  {
    return std::string_view {pieces}.substr(index * SHA1_HASH_SIZE,
                                            SHA1_HASH_SIZE);
  }

  uint64_t total_length() const;
};

enum class TorrentFileParseError : uint8_t
{
  MissingField,
  TypeMismatch,
  InvalidField,
  InvalidEncoding,
  TooLarge,
  Unreadable,
};

std::string_view to_string(TorrentFileParseError error);

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    const bencode::BeValue& file);

std::expected<TorrentFile, TorrentFileParseError> parse_torrent_file(
    std::string_view content, const bencode::DecodeOptions& options = {});

std::expected<TorrentFile, TorrentFileParseError> read_torrent_file(
    const std::filesystem::path& path,
    size_t max_size = DEFAULT_MAX_TORRENT_FILE_SIZE,
    const bencode::DecodeOptions& options = {});

/// Encodes the info dictionary described by `torrent`. Matches the decoded
/// bytes whenever the source info dictionary held only the modelled keys.
std::string encode_info(const TorrentFile& torrent);

}  // namespace swc
