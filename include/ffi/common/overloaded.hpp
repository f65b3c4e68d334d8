#pragma once

namespace ffi {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const PointerInfo& p) { ... },
//       [](const StructInfo& s) { ... },
//   }, payload);

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace ffi
