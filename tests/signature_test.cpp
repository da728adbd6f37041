#include "core/signature.hpp"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "core/guid_lookup.hpp"
#include "test_support.hpp"

using iid::core::ErrorKind;
using iid::core::PrimitiveType;
using iid::core::TypeDescriptor;
using iid::core::TypeKind;

namespace {

auto sig(const iid::core::TypeProvider& provider, iid::core::TypeHandle type) -> std::string {
  auto result = iid::core::build_signature(provider, type);
  EXPECT_TRUE(result) << (result ? "" : result.error().message);
  return result ? *result : std::string{};
}

}  // namespace

TEST(Signature, PrimitiveCodes) {
  iid::core::TypeTable table;
  const std::vector<std::pair<PrimitiveType, const char*>> cases = {
      {PrimitiveType::Int8, "i1"},    {PrimitiveType::UInt8, "u1"},
      {PrimitiveType::Int16, "i2"},   {PrimitiveType::UInt16, "u2"},
      {PrimitiveType::Int32, "i4"},   {PrimitiveType::UInt32, "u4"},
      {PrimitiveType::Int64, "i8"},   {PrimitiveType::UInt64, "u8"},
      {PrimitiveType::Float32, "f4"}, {PrimitiveType::Float64, "f8"},
      {PrimitiveType::Boolean, "b1"}, {PrimitiveType::Char16, "c2"},
      {PrimitiveType::Guid, "g16"},
  };
  for (const auto& [type, code] : cases) {
    ASSERT_EQ(sig(table, table.primitive(type)), code);
  }
}

TEST(Signature, StringAndObject) {
  iid::core::TypeTable table;
  ASSERT_EQ(sig(table, table.string_type()), "string");
  ASSERT_EQ(sig(table, table.object_type()), "cinterface(IInspectable)");
}

TEST(Signature, Enums) {
  SampleTable s;
  ASSERT_EQ(sig(s.table, s.color), "enum(Sample.Color;u4)");
  ASSERT_EQ(sig(s.table, s.mode), "enum(Sample.Mode;i4)");
}

TEST(Signature, StructFieldsInDeclaredOrder) {
  SampleTable s;
  ASSERT_EQ(sig(s.table, s.point), "struct(Windows.Foundation.Point;f4;f4)");

  auto rect = s.table.add_struct(
      "Sample.Labeled", {s.table.string_type(), s.point, s.color,
                         s.table.primitive(PrimitiveType::Boolean)});
  ASSERT_EQ(sig(s.table, rect),
            "struct(Sample.Labeled;string;struct(Windows.Foundation.Point;f4;f4);"
            "enum(Sample.Color;u4);b1)");

  auto swapped = s.table.add_struct(
      "Sample.Swapped", {s.table.primitive(PrimitiveType::Boolean), s.table.string_type()});
  ASSERT_EQ(sig(s.table, swapped), "struct(Sample.Swapped;b1;string)");
}

TEST(Signature, EmptyStructKeepsSeparator) {
  iid::core::TypeTable table;
  auto empty = table.add_struct("Sample.Empty", {});
  ASSERT_EQ(sig(table, empty), "struct(Sample.Empty;)");
}

TEST(Signature, InterfaceDelegateAndRuntimeClass) {
  SampleTable s;
  ASSERT_EQ(sig(s.table, s.iwidget), "{5b6f5a7e-0b2d-4f8a-9d61-3c1e2a4b7f90}");
  ASSERT_EQ(sig(s.table, s.widget_handler), "delegate({0d3f1c52-7a4e-4c1b-8e22-915a6b3c4d10})");
  ASSERT_EQ(sig(s.table, s.widget), "rc(Sample.Widget;{5b6f5a7e-0b2d-4f8a-9d61-3c1e2a4b7f90})");
}

TEST(Signature, RuntimeClassWithoutDefaultInterface) {
  iid::core::TypeTable table;
  auto id = *iid::core::Guid::parse("a1b2c3d4-0000-4000-8000-000000000001");
  auto bare = table.add_runtime_class("Sample.Static", std::nullopt, id);
  ASSERT_EQ(sig(table, bare), "{a1b2c3d4-0000-4000-8000-000000000001}");

  auto anonymous = table.add_runtime_class("Sample.Anonymous", std::nullopt);
  auto result = iid::core::build_signature(table, anonymous);
  ASSERT_FALSE(result);
  ASSERT_EQ(result.error().kind, ErrorKind::MissingIdentifier);
}

TEST(Signature, GenericComposition) {
  SampleTable s;
  auto pair = s.table.instantiate(s.key_value_pair, {s.i4, s.table.string_type()});
  ASSERT_EQ(sig(s.table, pair), "pinterface({9de1c535-6ae1-11e0-84e1-18a905bcc53f};i4;string)");

  auto vector = s.table.instantiate(s.vector, {s.i4});
  ASSERT_EQ(sig(s.table, vector), "pinterface({913337e9-11a1-4345-a3a2-4e7f956e222d};i4)");
}

TEST(Signature, NestedGenerics) {
  SampleTable s;
  auto inner = s.table.instantiate(s.map, {s.table.string_type(), s.point});
  auto outer = s.table.instantiate(s.iterable, {inner});
  ASSERT_EQ(sig(s.table, outer),
            "pinterface({faa585ea-6214-4217-afda-7f46de5869b3};"
            "pinterface({3c2925fe-8519-45c1-aa79-197b6718c1c1};string;"
            "struct(Windows.Foundation.Point;f4;f4)))");
}

TEST(Signature, GenericDelegateUsesPinterface) {
  SampleTable s;
  auto handler = s.table.instantiate(s.typed_event_handler, {s.widget, s.table.object_type()});
  ASSERT_EQ(sig(s.table, handler),
            "pinterface({9de1c534-6ae1-11e0-84e1-18a905bcc53f};"
            "rc(Sample.Widget;{5b6f5a7e-0b2d-4f8a-9d61-3c1e2a4b7f90});cinterface(IInspectable))");
}

TEST(Signature, OpenDefinitionIsPlainIdentifier) {
  SampleTable s;
  ASSERT_EQ(sig(s.table, s.iterable), "{faa585ea-6214-4217-afda-7f46de5869b3}");
}

TEST(Signature, OverrideTakesPrecedenceOverKind) {
  SampleTable s;
  s.table.set_signature_override(s.point, [] { return std::string("struct(Legacy.Point;i4;i4)"); });
  s.table.set_signature_override(s.i4, [] { return std::string("custom"); });
  s.table.set_signature_override(s.iwidget, [] { return std::string("{override}"); });
  ASSERT_EQ(sig(s.table, s.point), "struct(Legacy.Point;i4;i4)");
  ASSERT_EQ(sig(s.table, s.i4), "custom");
  ASSERT_EQ(sig(s.table, s.iwidget), "{override}");
}

TEST(Signature, OverrideStillNestsInsideContainers) {
  SampleTable s;
  auto legacy = s.table.add_struct("Sample.Legacy", {s.table.primitive(PrimitiveType::NativeInt)});
  s.table.set_signature_override(legacy, [] { return std::string("struct(Sample.Legacy;i4)"); });
  auto reference = s.table.instantiate(s.reference, {legacy});
  ASSERT_EQ(sig(s.table, reference),
            "pinterface({61c17706-2d65-11e0-9ae8-d48564015472};struct(Sample.Legacy;i4))");
}

TEST(Signature, AuthoringAliasReplacesInterface) {
  SampleTable s;
  auto projected = s.table.instantiate(s.vector, {s.table.string_type()});
  auto bindable = s.table.add_interface(
      "Sample.IBindableList", *iid::core::Guid::parse("393de7de-6fd0-4c0d-bb71-47244a113e93"));
  s.table.set_authoring_alias(bindable, projected);
  ASSERT_EQ(sig(s.table, bindable),
            "pinterface({913337e9-11a1-4345-a3a2-4e7f956e222d};string)");
}

TEST(Signature, NativeIntegersAreUnsupported) {
  SampleTable s;
  auto ptr = s.table.primitive(PrimitiveType::NativeInt);
  auto direct = iid::core::build_signature(s.table, ptr);
  ASSERT_FALSE(direct);
  ASSERT_EQ(direct.error().kind, ErrorKind::UnsupportedTypeShape);

  auto handle = s.table.add_struct("Sample.Handle", {s.i4, s.table.primitive(PrimitiveType::NativeUInt)});
  auto nested = iid::core::build_signature(s.table, handle);
  ASSERT_FALSE(nested);
  ASSERT_EQ(nested.error().kind, ErrorKind::UnsupportedTypeShape);
  ASSERT_NE(nested.error().message.find("UIntPtr"), std::string::npos);
}

TEST(Signature, MissingDeclaredIdentifiers) {
  iid::core::TypeTable table;
  TypeDescriptor iface;
  iface.kind = TypeKind::Interface;
  iface.full_name = "Sample.INoId";
  auto no_id = table.add(iface);

  TypeDescriptor handler;
  handler.kind = TypeKind::Delegate;
  handler.full_name = "Sample.NoIdHandler";
  auto no_id_delegate = table.add(handler);

  for (auto type : {no_id, no_id_delegate}) {
    auto result = iid::core::build_signature(table, type);
    ASSERT_FALSE(result);
    ASSERT_EQ(result.error().kind, ErrorKind::MissingIdentifier);
  }
}

TEST(Signature, IdentifiersFollowGuidType) {
  SampleTable s;
  TypeDescriptor handler;
  handler.kind = TypeKind::Delegate;
  handler.full_name = "Sample.RedirectedHandler";
  auto redirected = s.table.add(handler);
  s.table.set_guid_type(redirected, s.widget_handler);
  ASSERT_EQ(*iid::core::get_guid(s.table, redirected), test_ids::kWidgetHandler);
  ASSERT_EQ(sig(s.table, redirected), "delegate({0d3f1c52-7a4e-4c1b-8e22-915a6b3c4d10})");

  TypeDescriptor iface;
  iface.kind = TypeKind::Interface;
  iface.full_name = "Sample.IRedirected";
  auto plain = s.table.add(iface);
  s.table.set_guid_type(plain, s.iwidget);
  ASSERT_EQ(sig(s.table, plain), "{5b6f5a7e-0b2d-4f8a-9d61-3c1e2a4b7f90}");

  auto vector = s.table.instantiate(s.vector, {s.i4});
  s.table.set_guid_type(vector, s.iterable);
  ASSERT_EQ(sig(s.table, vector), "pinterface({faa585ea-6214-4217-afda-7f46de5869b3};i4)");
}

TEST(Signature, UnknownHandle) {
  iid::core::TypeTable table;
  auto result = iid::core::build_signature(table, iid::core::TypeHandle{9999});
  ASSERT_FALSE(result);
  ASSERT_EQ(result.error().kind, ErrorKind::UnknownType);
}

TEST(Signature, DeterministicAcrossIndependentTables) {
  SampleTable a;
  SampleTable b;
  // Register an unrelated type first so the handles differ between tables.
  b.table.add_enum("Sample.Unrelated", false);
  auto in_a = a.table.instantiate(a.map, {a.table.string_type(), a.color});
  auto in_b = b.table.instantiate(b.map, {b.table.string_type(), *b.table.find("Sample.Color")});
  ASSERT_EQ(sig(a.table, in_a), sig(b.table, in_b));
  ASSERT_EQ(sig(a.table, in_a), sig(a.table, in_a));
}
