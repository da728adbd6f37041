#pragma once

#include <string>

#include "core/error.hpp"
#include "core/type_descriptor.hpp"

namespace iid::core {

/// Canonical signature of `type`, e.g. "pinterface({faa585ea-...};string)".
///
/// The signature override is consulted first, then an interface's authoring
/// alias, then the kind grammar. Recursion happens at generic arguments,
/// struct fields and a runtime class's default interface. Identifiers are
/// read through the descriptor's guid type, like get_guid.
///
/// Precondition: struct field graphs reachable from `type` are acyclic. The
/// builder does not detect cycles.
auto build_signature(const TypeProvider& provider, TypeHandle type) -> Expected<std::string>;

}  // namespace iid::core
