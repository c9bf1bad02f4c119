#include <fstream>
#include <limits>
#include <system_error>

#include "torrentfile.hpp"

#include <openssl/sha.h>

#include "auxiliary/variant_aux.hpp"

using bencode::BeValue;
using bencode::BeValueTypeIndex;
using bencode::Dict;
using bencode::Integer;
using bencode::List;
using bencode::String;

namespace swc
{
namespace
{
template<typename T, BeValueTypeIndex Index>
std::expected<const T*, TorrentFileParseError> parse_field(
    const Dict& dict, std::string_view field_name)
{
  auto it = dict.find(field_name);
  if (it == dict.end())
    return std::unexpected {TorrentFileParseError::MissingField};

  if (it->second.which() != Index)
    return std::unexpected {TorrentFileParseError::TypeMismatch};

  return &boost::get<T>(it->second);
}

std::expected<int64_t, TorrentFileParseError> to_int64(const Integer& value)
{
  if (value < std::numeric_limits<int64_t>::min()
      || value > std::numeric_limits<int64_t>::max())
  {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }

  return value.convert_to<int64_t>();
}

std::expected<std::string, TorrentFileParseError> parse_string_field(
    const Dict& dict, std::string_view field_name)
{
  auto field = parse_field<String, BeValueTypeIndex::IString>(dict, field_name);
  if (!field) {
    return std::unexpected {field.error()};
  }

  return std::string {**field};
}

std::expected<int64_t, TorrentFileParseError> parse_int_field(
    const Dict& dict, std::string_view field_name)
{
  auto field =
      parse_field<Integer, BeValueTypeIndex::IInteger>(dict, field_name);
  if (!field) {
    return std::unexpected {field.error()};
  }

  return to_int64(**field);
}

std::expected<const List*, TorrentFileParseError> parse_list_field(
    const Dict& dict, std::string_view field_name)
{
  return parse_field<List, BeValueTypeIndex::IList>(dict, field_name);
}

std::expected<const Dict*, TorrentFileParseError> parse_dict_field(
    const Dict& dict, std::string_view field_name)
{
  return parse_field<Dict, BeValueTypeIndex::IDict>(dict, field_name);
}

std::expected<std::vector<std::string>, TorrentFileParseError>
parse_string_list(const List& list)
{
  std::vector<std::string> strings;
  strings.reserve(list.size());

  for (const auto& item : list) {
    if (item.which() != BeValueTypeIndex::IString) {
      return std::unexpected {TorrentFileParseError::TypeMismatch};
    }
    strings.emplace_back(boost::get<String>(item));
  }

  return strings;
}

std::expected<std::vector<std::vector<std::string>>, TorrentFileParseError>
parse_announce_list(const List& tiers)
{
  std::vector<std::vector<std::string>> announce_list;

  for (const auto& tier : tiers) {
    if (tier.which() != BeValueTypeIndex::IList) {
      return std::unexpected {TorrentFileParseError::TypeMismatch};
    }

    auto urls = parse_string_list(boost::get<List>(tier));
    if (!urls) {
      return std::unexpected {urls.error()};
    }

    if (!urls->empty()) {
      announce_list.push_back(std::move(*urls));
    }
  }

  return announce_list;
}

std::expected<MultipleFiles, TorrentFileParseError> parse_files(
    const List& files)
{
  MultipleFiles layout {};

  for (const auto& file_entry : files) {
    if (file_entry.which() != BeValueTypeIndex::IDict) {
      return std::unexpected {TorrentFileParseError::TypeMismatch};
    }
    const auto& file_dict = boost::get<Dict>(file_entry);

    auto length_result = parse_int_field(file_dict, "length");
    if (!length_result) {
      return std::unexpected {length_result.error()};
    }
    if (*length_result < 0) {
      return std::unexpected {TorrentFileParseError::InvalidField};
    }

    auto path_result = parse_list_field(file_dict, "path");
    if (!path_result) {
      return std::unexpected {path_result.error()};
    }

    auto segments = parse_string_list(**path_result);
    if (!segments) {
      return std::unexpected {segments.error()};
    }
    if (segments->empty()) {
      return std::unexpected {TorrentFileParseError::InvalidField};
    }

    layout.files.push_back(
        FileEntry {.length = static_cast<uint64_t>(*length_result),
                   .path = std::move(*segments)});
  }

  return layout;
}

std::expected<FileLayout, TorrentFileParseError> parse_layout(const Dict& info)
{
  if (info.contains("files")) {
    auto files_result = parse_list_field(info, "files");
    if (!files_result) {
      return std::unexpected {files_result.error()};
    }

    auto files = parse_files(**files_result);
    if (!files) {
      return std::unexpected {files.error()};
    }

    return FileLayout {std::move(*files)};
  }

  auto length_result = parse_int_field(info, "length");
  if (!length_result) {
    return std::unexpected {length_result.error()};
  }
  if (*length_result < 0) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }

  return FileLayout {
      SingleFile {.length = static_cast<uint64_t>(*length_result)}};
}

InfoHash hash_bytes(std::string_view bytes)
{
  InfoHash hash {};

  SHA1(reinterpret_cast<const unsigned char*>(bytes.data()),
       bytes.length(),
       hash.data());

  return hash;
}

InfoHash hash_info(const Dict& info)
{
  return hash_bytes(bencode::BEncoder()(info));
}

/// Locates the bytes of the top-level "info" value inside an already
/// validated dictionary. The last occurrence wins, as in the decoded tree.
std::string_view find_info_bytes(std::string_view content,
                                 const bencode::BDecoder& decoder)
{
  std::string_view info_bytes;
  size_t offset = 1;

  while (offset < content.size() && content[offset] != 'e') {
    auto key = decoder.decode(content.substr(offset));
    offset += key.used_chars;

    auto value = decoder.decode(content.substr(offset));
    if (boost::get<String>(key.result) == "info") {
      info_bytes = content.substr(offset, value.used_chars);
    }
    offset += value.used_chars;
  }

  return info_bytes;
}
}  // namespace

uint64_t TorrentFile::total_length() const
{
  return std::visit(
      aux::overloaded {
          [](const SingleFile& file) { return file.length; },
          [](const MultipleFiles& multiple)
          {
            uint64_t total = 0;
            for (const auto& file : multiple.files) {
              total += file.length;
            }
            return total;
          }},
      layout);
}

std::string_view to_string(TorrentFileParseError error)
{
  switch (error) {
    case TorrentFileParseError::MissingField:
      return "missing field";
    case TorrentFileParseError::TypeMismatch:
      return "type mismatch";
    case TorrentFileParseError::InvalidField:
      return "invalid field";
    case TorrentFileParseError::InvalidEncoding:
      return "invalid encoding";
    case TorrentFileParseError::TooLarge:
      return "file too large";
    case TorrentFileParseError::Unreadable:
      return "unreadable file";
  }

  return "unknown error";
}

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    const BeValue& file)
{
  TorrentFile torrent {};

  if (file.which() != BeValueTypeIndex::IDict) {
    return std::unexpected {TorrentFileParseError::TypeMismatch};
  }
  const auto& top_level = boost::get<Dict>(file);

  auto announce_result = parse_string_field(top_level, "announce");
  if (!announce_result) {
    return std::unexpected {announce_result.error()};
  }
  torrent.announce = std::move(*announce_result);

  if (top_level.contains("announce-list")) {
    auto tiers = parse_list_field(top_level, "announce-list");
    if (!tiers) {
      return std::unexpected {tiers.error()};
    }

    auto announce_list = parse_announce_list(**tiers);
    if (!announce_list) {
      return std::unexpected {announce_list.error()};
    }
    torrent.announce_list = std::move(*announce_list);
  }

  auto info_result = parse_dict_field(top_level, "info");
  if (!info_result) {
    return std::unexpected {info_result.error()};
  }
  const auto& info = **info_result;

  torrent.info_hash = hash_info(info);

  auto name_result = parse_string_field(info, "name");
  if (!name_result) {
    return std::unexpected {name_result.error()};
  }
  torrent.name = std::move(*name_result);

  auto piece_length_result = parse_int_field(info, "piece length");
  if (!piece_length_result) {
    return std::unexpected {piece_length_result.error()};
  }
  if (*piece_length_result <= 0) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }
  torrent.piece_length = *piece_length_result;

  auto pieces_result = parse_string_field(info, "pieces");
  if (!pieces_result) {
    return std::unexpected {pieces_result.error()};
  }
  if (pieces_result->size() % SHA1_HASH_SIZE != 0) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }
  torrent.pieces = std::move(*pieces_result);

  if (info.contains("private")) {
    auto private_result = parse_int_field(info, "private");
    if (!private_result) {
      return std::unexpected {private_result.error()};
    }
    torrent.is_private = *private_result;
  }

  auto layout_result = parse_layout(info);
  if (!layout_result) {
    return std::unexpected {layout_result.error()};
  }
  torrent.layout = std::move(*layout_result);

  if (auto comment_result = parse_string_field(top_level, "comment")) {
    torrent.comment = std::move(*comment_result);
  }
  if (auto created_by_result = parse_string_field(top_level, "created by")) {
    torrent.created_by = std::move(*created_by_result);
  }
  if (auto creation_date_result = parse_int_field(top_level, "creation date"))
  {
    torrent.creation_date = std::chrono::seconds(*creation_date_result);
  }

  return torrent;
}

std::expected<TorrentFile, TorrentFileParseError> parse_torrent_file(
    std::string_view content, const bencode::DecodeOptions& options)
{
  bencode::BDecoder decoder {options};
  BeValue decoded;

  try {
    decoded = decoder(content);
  } catch (const bencode::DecodeError&) {
    return std::unexpected {TorrentFileParseError::InvalidEncoding};
  }

  auto torrent = load_torrent_file(decoded);
  if (!torrent) {
    return torrent;
  }

  // the tracker knows the torrent by the hash of the bytes as written,
  // which differ from the re-encoding when keys are unsorted or repeated
  try {
    torrent->info_hash = hash_bytes(find_info_bytes(content, decoder));
  } catch (const bencode::DecodeError&) {
    return std::unexpected {TorrentFileParseError::InvalidEncoding};
  }

  return torrent;
}

std::expected<TorrentFile, TorrentFileParseError> read_torrent_file(
    const std::filesystem::path& path,
    size_t max_size,
    const bencode::DecodeOptions& options)
{
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::unexpected {TorrentFileParseError::Unreadable};
  }

  if (size > max_size) {
    return std::unexpected {TorrentFileParseError::TooLarge};
  }

  std::ifstream file {path, std::ios::binary};
  if (!file) {
    return std::unexpected {TorrentFileParseError::Unreadable};
  }

  std::string content(size, '\0');
  if (!file.read(content.data(), static_cast<std::streamsize>(size))) {
    return std::unexpected {TorrentFileParseError::Unreadable};
  }

  return parse_torrent_file(content, options);
}

std::string encode_info(const TorrentFile& torrent)
{
  Dict info {};

  info.emplace("name", String {torrent.name});
  info.emplace("piece length", Integer {torrent.piece_length});
  info.emplace("pieces", String {torrent.pieces});

  if (torrent.is_private) {
    info.emplace("private", Integer {*torrent.is_private});
  }

  std::visit(aux::overloaded {
                 [&info](const SingleFile& file)
                 { info.emplace("length", Integer {file.length}); },
                 [&info](const MultipleFiles& multiple)
                 {
                   List files {};
                   for (const auto& file : multiple.files) {
                     List path {};
                     for (const auto& segment : file.path) {
                       path.emplace_back(String {segment});
                     }

                     Dict entry {};
                     entry.emplace("length", Integer {file.length});
                     entry.emplace("path", std::move(path));
                     files.emplace_back(std::move(entry));
                   }
                   info.emplace("files", std::move(files));
                 }},
             torrent.layout);

  return bencode::BEncoder()(info);
}

}  // namespace swc
