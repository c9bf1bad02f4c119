#pragma once

#include <limits>
#include <random>

namespace aux
{
inline std::mt19937& random_engine()
{
  static std::mt19937 rng {std::random_device {}()};
  return rng;
}

template<typename T,
         T Min = std::numeric_limits<T>::min(),
         T Max = std::numeric_limits<T>::max()>
T generate_random_in_range()
{
  static std::uniform_int_distribution<T> uni {Min, Max};
  return uni(random_engine());
}

template<typename T>
T generate_random_in_range(T min, T max)
{
  std::uniform_int_distribution<T> uni {min, max};
  return uni(random_engine());
}
}  // namespace aux
