#pragma once

namespace vdev::common {

// Lambda set for std::visit over segment and hosting variants.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace vdev::common
