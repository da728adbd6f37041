#include "core/error.hpp"

namespace iid::core {

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::UnsupportedTypeShape:
      return "unsupported_type_shape";
    case ErrorKind::MissingIdentifier:
      return "missing_identifier";
    case ErrorKind::UnknownType:
      return "unknown_type";
    case ErrorKind::InvalidIdentifier:
      return "invalid_identifier";
    case ErrorKind::InvalidDescriptor:
      return "invalid_descriptor";
  }
  return "unknown";
}

}  // namespace iid::core
