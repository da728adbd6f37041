#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "core/error.hpp"
#include "core/guid.hpp"
#include "core/guid_lookup.hpp"
#include "core/signature.hpp"
#include "core/type_table.hpp"

namespace iid::core {

/// Primitive descriptor a C++ type maps to, if any.
template <typename T>
constexpr auto primitive_of() -> std::optional<PrimitiveType> {
  using U = std::remove_cvref_t<T>;
  if constexpr (std::is_same_v<U, std::int8_t>) return PrimitiveType::Int8;
  else if constexpr (std::is_same_v<U, std::uint8_t>) return PrimitiveType::UInt8;
  else if constexpr (std::is_same_v<U, std::int16_t>) return PrimitiveType::Int16;
  else if constexpr (std::is_same_v<U, std::uint16_t>) return PrimitiveType::UInt16;
  else if constexpr (std::is_same_v<U, std::int32_t>) return PrimitiveType::Int32;
  else if constexpr (std::is_same_v<U, std::uint32_t>) return PrimitiveType::UInt32;
  else if constexpr (std::is_same_v<U, std::int64_t>) return PrimitiveType::Int64;
  else if constexpr (std::is_same_v<U, std::uint64_t>) return PrimitiveType::UInt64;
  else if constexpr (std::is_same_v<U, float>) return PrimitiveType::Float32;
  else if constexpr (std::is_same_v<U, double>) return PrimitiveType::Float64;
  else if constexpr (std::is_same_v<U, bool>) return PrimitiveType::Boolean;
  else if constexpr (std::is_same_v<U, char16_t>) return PrimitiveType::Char16;
  else if constexpr (std::is_same_v<U, Guid>) return PrimitiveType::Guid;
  else return std::nullopt;
}

/// Bind a C++ type to the full name of a table entry.
template <typename T>
struct TypeBinding {
  static auto set(const std::string& value) -> void {
    auto& storage = name();
    if (!storage.empty() && storage != value) {
      throw std::runtime_error(
          std::format("type already bound to '{}', cannot rebind to '{}'", storage, value));
    }
    storage = value;
  }
  static auto get() -> const std::string& { return name(); }

 private:
  static auto name() -> std::string& {
    static std::string storage;
    return storage;
  }
};

/// Bind `T` to an entry already registered in `table`.
template <typename T>
auto register_type(const TypeTable& table, TypeHandle handle) -> TypeHandle {
  const auto* desc = table.describe(handle);
  if (!desc) {
    throw std::invalid_argument("register_type: handle is not registered in the table");
  }
  TypeBinding<T>::set(desc->full_name);
  return handle;
}

/// Handle of `T`: primitives and std::u16string resolve directly, other types
/// through their TypeBinding.
template <typename T>
auto resolve_type(const TypeTable& table) -> Expected<TypeHandle> {
  using U = std::remove_cvref_t<T>;
  if constexpr (constexpr auto prim = primitive_of<U>(); prim.has_value()) {
    return table.primitive(*prim);
  } else if constexpr (std::is_same_v<U, std::u16string>) {
    return table.string_type();
  } else {
    const auto& name = TypeBinding<U>::get();
    if (name.empty()) {
      return tl::unexpected(make_error(ErrorKind::UnknownType, "C++ type has no type binding"));
    }
    auto handle = table.find(name);
    if (!handle) {
      return tl::unexpected(make_error(ErrorKind::UnknownType,
                                       std::format("bound type '{}' is not in this table", name)));
    }
    return *handle;
  }
}

template <typename T>
auto signature_of(const TypeTable& table) -> Expected<std::string> {
  auto handle = resolve_type<T>(table);
  if (!handle) {
    return tl::unexpected(handle.error());
  }
  return build_signature(table, *handle);
}

template <typename T>
auto iid_of(const TypeTable& table) -> Expected<Guid> {
  auto handle = resolve_type<T>(table);
  if (!handle) {
    return tl::unexpected(handle.error());
  }
  return get_iid(table, *handle);
}

}  // namespace iid::core
