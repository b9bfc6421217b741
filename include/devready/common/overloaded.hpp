#pragma once

namespace devready {

// Visitor helper for std::visit with one lambda per alternative.
//
//   std::visit(Overloaded{
//       [](const NotFound&) { ... },
//       [](const FoundOnPath& found) { ... },
//   }, state);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace devready
