#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace iid::core {

enum class ErrorKind {
  UnsupportedTypeShape,
  MissingIdentifier,
  UnknownType,
  InvalidIdentifier,
  InvalidDescriptor,
};

struct CoreError {
  ErrorKind kind = ErrorKind::InvalidDescriptor;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, CoreError>;

inline auto make_error(ErrorKind kind, std::string message) -> CoreError {
  return CoreError{kind, std::move(message)};
}

auto to_string(ErrorKind kind) -> std::string_view;

}  // namespace iid::core
