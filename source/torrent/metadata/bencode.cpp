#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

#include "bencode.hpp"

#include <fmt/format.h>

namespace bencode
{
namespace
{
constexpr char INT_PREFIX = 'i';
constexpr char LIST_PREFIX = 'l';
constexpr char DICT_PREFIX = 'd';
constexpr char SUFFIX = 'e';
constexpr char STRING_LENGTH_DELIMITER = ':';
constexpr size_t MINIMUM_BEVALUE_ENCODED_SIZE = 2;

[[noreturn]] void throw_corrupted(std::string_view reason)
{
  throw DecodeError {DecodeErrc::InvalidEncoding,
                     fmt::format("Corrupted encoding: {}", reason)};
}

bool is_digit(char c)
{
  return '0' <= c && c <= '9';
}

bool has_leading_zero(std::string_view digits)
{
  return digits.size() > 1 && digits.front() == '0';
}
}  // namespace

std::string BEncoder::operator()(const BeValue& value) const
{
  return boost::apply_visitor(*this, value);
}

std::string BEncoder::operator()(const Integer& value) const
{
  return INT_PREFIX + value.str() + SUFFIX;
}

std::string BEncoder::operator()(String value) const
{
  std::string encoded = std::to_string(value.length());
  encoded += STRING_LENGTH_DELIMITER;
  encoded.append(value);
  return encoded;
}

std::string BEncoder::operator()(const List& values) const
{
  std::string encoded(1, LIST_PREFIX);

  for (const auto& value : values) {
    encoded += boost::apply_visitor(*this, value);
  }

  encoded += SUFFIX;
  return encoded;
}

std::string BEncoder::operator()(const Dict& values) const
{
  std::string encoded(1, DICT_PREFIX);

  // Dict iterates in raw byte order of its keys.
  for (const auto& [key, value] : values) {
    encoded += (*this)(key);
    encoded += boost::apply_visitor(*this, value);
  }

  encoded += SUFFIX;
  return encoded;
}

std::string encode(const BeValue& value)
{
  return BEncoder()(value);
}

BDecoder::BDecoder(DecodeOptions options)
    : m_options {options}
{
}

DecodeResult BDecoder::decode_int(std::string_view value) const
{
  auto end_index = value.find(SUFFIX, 1);
  if (end_index == std::string_view::npos) {
    throw_corrupted("no integer suffix");
  }

  auto digits = value.substr(1, end_index - 1);
  const bool negative = !digits.empty() && digits.front() == '-';
  if (negative) {
    digits.remove_prefix(1);
  }

  if (digits.empty()) {
    throw_corrupted("integer without digits");
  }

  if (has_leading_zero(digits)) {
    throw_corrupted("integer with leading zero");
  }

  if (negative && digits == "0") {
    throw_corrupted("negative zero");
  }

  if (!std::all_of(digits.cbegin(), digits.cend(), is_digit)) {
    throw_corrupted(fmt::format("integer is not a number: {}", digits));
  }

  Integer int_value = 0;

  try {
    for (auto digit : digits) {
      int_value = int_value * 10 + (digit - '0');
    }
  } catch (const std::runtime_error&) {
    throw_corrupted(fmt::format("integer out of range: {}", digits));
  }

  if (negative) {
    int_value = -int_value;
  }

  return {.result = int_value, .used_chars = end_index + 1};
}

DecodeResult BDecoder::decode_string(std::string_view value) const
{
  auto index_of_delimiter = value.find(STRING_LENGTH_DELIMITER);

  if (index_of_delimiter == std::string_view::npos) {
    throw_corrupted("no string length delimiter");
  }

  auto length_digits = value.substr(0, index_of_delimiter);

  if (length_digits.empty() || has_leading_zero(length_digits)) {
    throw_corrupted("malformed string length");
  }

  size_t length = 0;
  auto result = std::from_chars(
      length_digits.data(), length_digits.data() + length_digits.size(), length);

  if (result.ec != std::errc {}
      || result.ptr != length_digits.data() + length_digits.size())
  {
    throw_corrupted(fmt::format("couldn't decode string length, error-code: {}",
                                static_cast<int>(result.ec)));
  }

  auto payload_start = index_of_delimiter + 1;

  if (length > value.length() - payload_start) {
    throw_corrupted("string length exceeds input");
  }

  return {.result = String(value.data() + payload_start, length),
          .used_chars = payload_start + length};
}

DecodeResult BDecoder::decode_dict(std::string_view value, int max_depth) const
{
  Dict values {};
  size_t index = 1;

  while (true) {
    if (index >= value.length()) {
      throw_corrupted("no dictionary suffix");
    }

    if (value[index] == SUFFIX) {
      break;
    }

    if (!is_digit(value[index])) {
      throw_corrupted("dictionary key is not a string");
    }

    auto [key, key_used_chars] = decode_string(value.substr(index));
    index += key_used_chars;

    if (index >= value.length()) {
      throw_corrupted("dictionary key without value");
    }

    auto [item, item_used_chars] = decode(value.substr(index), max_depth - 1);
    index += item_used_chars;

    auto key_view = boost::get<String>(key);

    if (m_options.duplicate_keys == DuplicateKeyPolicy::Reject
        && values.contains(key_view))
    {
      throw DecodeError {DecodeErrc::DuplicateKey,
                         fmt::format("Duplicate dictionary key: {}", key_view)};
    }

    values.insert_or_assign(key_view, std::move(item));
  }

  return {.result = std::move(values), .used_chars = index + 1};
}

DecodeResult BDecoder::decode_list(std::string_view value, int max_depth) const
{
  List values {};
  size_t index = 1;

  while (true) {
    if (index >= value.length()) {
      throw_corrupted("no list suffix");
    }

    if (value[index] == SUFFIX) {
      break;
    }

    auto [item, used_chars] = decode(value.substr(index), max_depth - 1);
    values.push_back(std::move(item));
    index += used_chars;
  }

  return {.result = std::move(values), .used_chars = index + 1};
}

DecodeResult BDecoder::decode(std::string_view value, int max_depth) const
{
  if (max_depth < 1) {
    throw DecodeError {DecodeErrc::TooDeep, "Reached maximum decoding depth"};
  }

  if (value.length() < MINIMUM_BEVALUE_ENCODED_SIZE) {
    throw_corrupted("input shorter than the smallest encoding");
  }

  switch (value.front()) {
    case INT_PREFIX:
      return decode_int(value);
    case DICT_PREFIX:
      return decode_dict(value, max_depth);
    case LIST_PREFIX:
      return decode_list(value, max_depth);
    default:
      if (is_digit(value.front())) {
        return decode_string(value);
      }

      throw_corrupted(fmt::format("invalid token at front: {:#04x}",
                                  static_cast<uint8_t>(value.front())));
  }
}

DecodeResult BDecoder::decode(std::string_view value) const
{
  return decode(value, m_options.max_depth);
}

BeValue BDecoder::operator()(std::string_view value) const
{
  return decode(value).result;
}

namespace
{
class Printer : public boost::static_visitor<std::string>
{
public:
  std::string operator()(const Integer& value) const { return value.str(); }

  std::string operator()(String value) const
  {
    const bool printable = std::all_of(value.cbegin(),
                                       value.cend(),
                                       [](unsigned char c)
                                       { return std::isprint(c) != 0; });
    if (printable) {
      return fmt::format("\"{}\"", value);
    }

    return fmt::format("<{} bytes>", value.size());
  }

  std::string operator()(const List& values) const
  {
    std::string rendered = "[";
    for (const auto& value : values) {
      if (rendered.size() > 1) {
        rendered += ", ";
      }
      rendered += boost::apply_visitor(*this, value);
    }
    return rendered + "]";
  }

  std::string operator()(const Dict& values) const
  {
    std::string rendered = "{";
    for (const auto& [key, value] : values) {
      if (rendered.size() > 1) {
        rendered += ", ";
      }
      rendered += (*this)(key) + ": " + boost::apply_visitor(*this, value);
    }
    return rendered + "}";
  }
};
}  // namespace

std::string to_string(const BeValue& value)
{
  return boost::apply_visitor(Printer(), value);
}

}  // namespace bencode
