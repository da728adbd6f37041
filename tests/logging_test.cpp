#include "common/logging/log.hpp"

#include <gtest/gtest.h>

using iid::core::ErrorKind;

TEST(Logging, EventFieldsAreSortedByKey) {
  ASSERT_EQ(iid::log::format_event("type_table_loaded", {}), "type_table_loaded");
  ASSERT_EQ(iid::log::format_event("iid_resolved", {{"type", "IVector<Int32>"}, {"iid", "b939af5b"}}),
            "iid_resolved iid=b939af5b type=IVector<Int32>");
}

TEST(Logging, FailureCarriesErrorKind) {
  auto error = iid::core::make_error(ErrorKind::MissingIdentifier, "Sample.INoId has no identifier");
  ASSERT_EQ(iid::log::format_failure("iid_failed", error, {{"type", "Sample.INoId"}}),
            "iid_failed kind=missing_identifier message=Sample.INoId has no identifier "
            "type=Sample.INoId");
}

TEST(Logging, FailureFieldsOverrideCallerKeys) {
  auto error = iid::core::make_error(ErrorKind::InvalidDescriptor, "bad");
  ASSERT_EQ(iid::log::format_failure("rejected", error, {{"kind", "stale"}}),
            "rejected kind=invalid_descriptor message=bad");
}
