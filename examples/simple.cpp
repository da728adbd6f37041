#include <cstdint>
#include <format>
#include <iostream>
#include <string>

#include "core/guid_lookup.hpp"
#include "core/type_bindings.hpp"
#include "core/type_table.hpp"

namespace {

struct Point {
  float x;
  float y;
};

enum class Color : std::uint32_t { Red = 1, Green = 2, Blue = 4 };

template <typename T>
struct IReference {};

template <typename T>
struct IIterable {};

constexpr auto kIReference = iid::core::Guid{
    0x61c17706, 0x2d65, 0x11e0, {0x9a, 0xe8, 0xd4, 0x85, 0x64, 0x01, 0x54, 0x72}};
constexpr auto kIIterable = iid::core::Guid{
    0xfaa585ea, 0x6214, 0x4217, {0xaf, 0xda, 0x7f, 0x46, 0xde, 0x58, 0x69, 0xb3}};

template <typename T>
auto print_iid(const iid::core::TypeTable& table, const char* label) -> void {
  auto sig = iid::core::signature_of<T>(table);
  auto iid = iid::core::iid_of<T>(table);
  if (!sig || !iid) {
    std::cerr << label << ": " << (sig ? iid.error().message : sig.error().message) << "\n";
    return;
  }
  std::cout << std::format("{:<24} {:<72} {{{}}}\n", label, *sig, iid->to_string());
}

}  // namespace

int main() {
  iid::core::TypeTable table;

  auto point = iid::core::register_type<Point>(
      table, table.add_struct("Windows.Foundation.Point",
                              {table.primitive(iid::core::PrimitiveType::Float32),
                               table.primitive(iid::core::PrimitiveType::Float32)}));
  auto color = iid::core::register_type<Color>(table, table.add_enum("Sample.Color", true));

  auto reference = table.add_generic_interface("Windows.Foundation.IReference`1", kIReference, 1);
  auto iterable = table.add_generic_interface(
      "Windows.Foundation.Collections.IIterable`1", kIIterable, 1);

  iid::core::register_type<IReference<std::int32_t>>(
      table, table.instantiate(reference, {table.primitive(iid::core::PrimitiveType::Int32)}));
  iid::core::register_type<IReference<Point>>(table, table.instantiate(reference, {point}));
  iid::core::register_type<IIterable<std::u16string>>(
      table, table.instantiate(iterable, {table.string_type()}));
  iid::core::register_type<IIterable<Color>>(table, table.instantiate(iterable, {color}));

  print_iid<IReference<std::int32_t>>(table, "IReference<Int32>");
  print_iid<IReference<Point>>(table, "IReference<Point>");
  print_iid<IIterable<std::u16string>>(table, "IIterable<String>");
  print_iid<IIterable<Color>>(table, "IIterable<Color>");
  return 0;
}
