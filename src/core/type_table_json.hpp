#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "core/error.hpp"
#include "core/type_table.hpp"

namespace iid::core {

using Json = nlohmann::json;

/// Build a TypeTable from a descriptor document:
///
///   { "types": [ { "name": "Sample.Color", "kind": "enum", "flags": true }, ... ] }
///
/// Kinds: enum, struct, interface, delegate, runtimeclass, instance.
/// References must name built-ins or types declared earlier in the document.
auto parse_type_table_json(const Json& json) -> Expected<TypeTable>;

/// Parse `text` as JSON first; syntax errors become InvalidDescriptor.
auto parse_type_table_text(std::string_view text) -> Expected<TypeTable>;

}  // namespace iid::core
