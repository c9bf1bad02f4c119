#pragma once

#include <bit>
#include <cstdint>
#include <type_traits>

#ifndef SWC_PACKED
#  if defined SWC_BROKEN_GCC_STRUCTURE_PACKING && defined __GNUC__
// Used for gcc tool chains accepting but not supporting pragma pack
// See http://gcc.gnu.org/onlinedocs/gcc/Type-Attributes.html
#    define SWC_PACKED __attribute__((__packed__))
#  else
#    define SWC_PACKED
#  endif  // defined SWC_BROKEN_GCC_STRUCTURE_PACKING && defined __GNUC__
#endif  // ndef SWC_PACKED

namespace aux
{
template<typename T>
  requires std::is_integral_v<T>
constexpr T swap_on_little_endian(T value)
{
  if constexpr (std::endian::native == std::endian::little) {
    return std::byteswap(value);
  } else {
    return value;
  }
}

#pragma pack(push, 1)

/// Integer stored in network byte order. Members of wire structs are declared
/// with this type so a struct can be copied to/from a datagram as-is.
template<typename T>
class SWC_PACKED BigEndian
{
public:
  constexpr BigEndian()
      : m_stored {0}
  {
  }

  constexpr BigEndian(T value)
      : m_stored {swap_on_little_endian(value)}
  {
  }

  constexpr BigEndian& operator=(T value)
  {
    m_stored = swap_on_little_endian(value);
    return *this;
  }

  constexpr T value() const { return swap_on_little_endian(m_stored); }

  constexpr operator T() const { return value(); }

private:
  T m_stored;
};

#pragma pack(pop)

using int16_big = BigEndian<int16_t>;
using int32_big = BigEndian<int32_t>;
using int64_big = BigEndian<int64_t>;

using uint16_big = BigEndian<uint16_t>;
using uint32_big = BigEndian<uint32_t>;
using uint64_big = BigEndian<uint64_t>;
}  // namespace aux
