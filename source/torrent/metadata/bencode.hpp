#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/variant.hpp>

namespace bencode
{
/// Integers have no size limit on the wire; 128 bits is what we accept.
/// The checked backend raises on overflow instead of wrapping.
using Integer = boost::multiprecision::checked_int128_t;

/// Decoded strings are views into the decoded buffer, which must outlive them.
using String = std::string_view;

using BeValue = boost::make_recursive_variant<
    Integer,
    String,
    std::map<String, boost::recursive_variant_>,
    std::vector<boost::recursive_variant_>>::type;

enum BeValueTypeIndex : uint8_t
{
  IInteger = 0,
  IString = 1,
  IDict = 2,
  IList = 3,
};

using List = std::vector<BeValue>;

/// std::string_view compares through char_traits<char>, i.e. as unsigned
/// bytes, so iteration order is the raw byte order the wire format demands.
using Dict = std::map<String, BeValue>;

enum class DecodeErrc : uint8_t
{
  InvalidEncoding,
  TooDeep,
  DuplicateKey,
};

class DecodeError : public std::invalid_argument
{
  DecodeErrc m_code;

public:
  DecodeError(DecodeErrc code, const std::string& what)
      : std::invalid_argument {what}
      , m_code {code}
  {
  }

  DecodeErrc code() const noexcept { return m_code; }
};

enum class DuplicateKeyPolicy : uint8_t
{
  LastWins,
  Reject,
};

struct DecodeOptions
{
  static constexpr int DEFAULT_MAX_DEPTH = 64;

  int max_depth = DEFAULT_MAX_DEPTH;
  DuplicateKeyPolicy duplicate_keys = DuplicateKeyPolicy::LastWins;
};

class BEncoder : public boost::static_visitor<std::string>
{
public:
  std::string operator()(const BeValue& value) const;
  std::string operator()(const Integer& value) const;
  std::string operator()(String value) const;
  std::string operator()(const List& values) const;
  std::string operator()(const Dict& values) const;
};

std::string encode(const BeValue& value);

struct DecodeResult
{
  BeValue result;
  size_t used_chars;
};

class BDecoder
{
  DecodeOptions m_options;

public:
  BDecoder() = default;

  explicit BDecoder(DecodeOptions options);

  /// Decodes the value at the front of `value`; trailing bytes are left
  /// untouched and `used_chars` tells how far decoding went.
  DecodeResult decode(std::string_view value) const;

  BeValue operator()(std::string_view value) const;

private:
  DecodeResult decode_int(std::string_view value) const;
  DecodeResult decode_string(std::string_view value) const;
  DecodeResult decode_dict(std::string_view value, int max_depth) const;
  DecodeResult decode_list(std::string_view value, int max_depth) const;
  DecodeResult decode(std::string_view value, int max_depth) const;
};

/// Human readable rendering, for diagnostics only.
std::string to_string(const BeValue& value);

}  // namespace bencode
