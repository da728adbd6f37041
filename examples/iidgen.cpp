#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "core/guid_lookup.hpp"
#include "core/signature.hpp"
#include "core/type_table_json.hpp"

DEFINE_string(types, "", "Path to a JSON type descriptor table");
DEFINE_string(type, "", "Full name of the type to identify");
DEFINE_bool(signature_only, false, "Print only the signature");
DEFINE_bool(piid, false, "Derive the identifier even when a published one exists");

namespace {

auto read_file(const std::string& path, std::string& out) -> bool {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

auto fail(const std::string& message) -> int {
  iid::log::error("{}", message);
  std::cerr << "iidgen: " << message << "\n";
  iid::log::shutdown();
  return 1;
}

auto fail(std::string_view event, const iid::core::CoreError& error) -> int {
  iid::log::failure(event, error, {{"type", FLAGS_type}});
  std::cerr << "iidgen: " << iid::core::to_string(error.kind) << ": " << error.message << "\n";
  iid::log::shutdown();
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("iidgen --types=<table.json> --type=<full name>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  iid::log::init();

  if (FLAGS_types.empty() || FLAGS_type.empty()) {
    return fail("both --types and --type are required");
  }

  std::string text;
  if (!read_file(FLAGS_types, text)) {
    return fail("cannot read " + FLAGS_types);
  }

  auto table = iid::core::parse_type_table_text(text);
  if (!table) {
    return fail("type_table_rejected", table.error());
  }
  iid::log::info("type_table_loaded",
                 {{"path", FLAGS_types}, {"types", std::to_string(table->size())}});

  auto handle = table->find(FLAGS_type);
  if (!handle) {
    return fail("unknown type " + FLAGS_type);
  }

  auto signature = iid::core::build_signature(*table, *handle);
  if (!signature) {
    return fail("signature_failed", signature.error());
  }
  if (FLAGS_signature_only) {
    std::cout << *signature << "\n";
    iid::log::shutdown();
    return 0;
  }

  auto iid = FLAGS_piid ? iid::core::create_iid(*table, *handle)
                        : iid::core::get_iid(*table, *handle);
  if (!iid) {
    return fail("iid_failed", iid.error());
  }

  iid::log::info("iid_resolved", {{"type", FLAGS_type}, {"iid", iid->to_string()}});
  std::cout << *signature << "\n{" << iid->to_string() << "}\n";
  iid::log::shutdown();
  return 0;
}
