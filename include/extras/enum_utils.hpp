#pragma once

#include <string_view>

namespace extras
{

// Value->name conversion for enums. Only declared here, every
// enum wanting a printable name provides its own specialization
// in the module where it is declared:
// ```
// <foo.hpp>
// namespace extras { template<> std::string_view enum_name(foo::Foo value) noexcept; }
// <foo.cpp>
// namespace extras
// {
// template<> std::string_view enum_name(foo::Foo value) noexcept
// {
//   switch (value) { case foo::Foo::A: return "A"; ... }
// }
// }
// ```
template<typename T>
std::string_view enum_name(T value) noexcept;

} // namespace extras
