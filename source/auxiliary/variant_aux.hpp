#pragma once

namespace aux
{
template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};
}  // namespace aux
