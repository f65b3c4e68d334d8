#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

#include <fmt/core.h>

#include "ffi/common/internal_error.hpp"
#include "ffi/config/runtime_config.hpp"
#include "ffi/type/kind_error.hpp"
#include "ffi/type/type_arena.hpp"
#include "ffi/value/value.hpp"

namespace ffi {
namespace {

class ValueConstructionTest : public ::testing::Test {
 protected:
  void TearDown() override {
    config::ApplyConfig(config::RuntimeConfig{});
  }

  TypeArena arena_;
};

// =============================================================================
// Allocate
// =============================================================================

TEST_F(ValueConstructionTest, AllocateAddressesZeroedBufferOfTypeSize) {
  const auto* arr = arena_.ArrayOf(arena_.Uint32(), 6);
  auto v = Allocate(arr);
  ASSERT_TRUE(v.IsValid());
  EXPECT_EQ(v.Kind(), Kind::kArray);
  EXPECT_EQ(&v.Type(), arr);

  auto bytes = v.Buffer();
  ASSERT_EQ(bytes.size(), 24U);
  for (auto b : bytes) {
    EXPECT_EQ(b, std::byte{0});
  }
  ASSERT_NE(v.GetStorage(), nullptr);
  EXPECT_EQ(v.GetStorage()->Size(), 24U);
  EXPECT_EQ(v.UnsafeAddr(), reinterpret_cast<uintptr_t>(v.GetStorage()->Data()));
}

TEST_F(ValueConstructionTest, AllocateNilThrows) {
  EXPECT_THROW((void)Allocate(nullptr), InternalError);
}

TEST_F(ValueConstructionTest, AllocateUsesConfiguredAlignment) {
  config::RuntimeConfig cfg;
  cfg.alignment = 256;
  config::ApplyConfig(cfg);

  auto v = Allocate(arena_.Int8());
  EXPECT_EQ(v.UnsafeAddr() % 256, 0U);
}

TEST_F(ValueConstructionTest, AllocatedStorageOutlivesOriginal) {
  std::weak_ptr<Storage> watch;
  Value field;
  {
    const auto* s = arena_.StructOf(
        "s", {{.name = "a", .type = arena_.Int32(), .offset = 0}});
    auto v = Allocate(s);
    watch = v.GetStorage();
    field = v.Field(0);
  }
  EXPECT_FALSE(watch.expired());
  field.SetInt(5);
  EXPECT_EQ(field.Int(), 5);
  field = Value{};
  EXPECT_TRUE(watch.expired());
}

// =============================================================================
// Validity
// =============================================================================

TEST_F(ValueConstructionTest, ZeroValueIsInvalid) {
  Value v;
  EXPECT_FALSE(v.IsValid());
  EXPECT_EQ(v.ToString(), "<invalid Value>");
}

TEST_F(ValueConstructionTest, ZeroValueAccessorsThrow) {
  Value v;
  EXPECT_THROW((void)v.Kind(), KindError);
  EXPECT_THROW((void)v.Type(), KindError);
  EXPECT_THROW((void)v.Int(), KindError);
  EXPECT_THROW((void)v.Elem(), KindError);
  EXPECT_THROW((void)v.Field(0), KindError);
  EXPECT_THROW((void)v.Addr(), KindError);
  EXPECT_THROW((void)v.Buffer(), KindError);
  try {
    (void)v.UnsafeAddr();
    FAIL() << "expected KindError";
  } catch (const KindError& e) {
    EXPECT_EQ(e.Kind(), Kind::kInvalid);
    EXPECT_STREQ(e.what(), "ffi: call of ffi::Value::UnsafeAddr on zero Value");
  }
}

TEST_F(ValueConstructionTest, EveryProducedValueIsValid) {
  const auto* inner = arena_.StructOf(
      "inner", {{.name = "x", .type = arena_.Int16(), .offset = 0}});
  const auto* outer = arena_.StructOf(
      "outer",
      {{.name = "arr", .type = arena_.ArrayOf(arena_.Int8(), 2), .offset = 0},
       {.name = "in", .type = inner, .offset = 2}});

  auto v = Allocate(outer);
  EXPECT_TRUE(v.IsValid());
  EXPECT_TRUE(v.Field(0).IsValid());
  EXPECT_TRUE(v.Field(0).Index(1).IsValid());
  EXPECT_TRUE(v.FieldByName("in").IsValid());
  EXPECT_TRUE(v.Addr().IsValid());
  EXPECT_TRUE(v.Addr().Elem().IsValid());

  void* slot = nullptr;
  auto wrapped = WrapAddress(inner, &slot);
  EXPECT_TRUE(wrapped.IsValid());
  // A nil pointee is still a well-formed Value.
  EXPECT_TRUE(wrapped.Elem().IsValid());
}

// =============================================================================
// WrapAddress
// =============================================================================

TEST_F(ValueConstructionTest, WrapAddressIntroducesOnePointerLevel) {
  int32_t target = 17;
  int32_t* slot = &target;

  auto v = WrapAddress(arena_.Int32(), static_cast<void*>(&slot));
  ASSERT_TRUE(v.IsValid());
  EXPECT_EQ(v.Kind(), Kind::kPointer);
  EXPECT_EQ(&v.Type().Elem(), arena_.Int32());
  EXPECT_EQ(v.UnsafeAddr(), reinterpret_cast<uintptr_t>(&slot));
  EXPECT_EQ(v.GetStorage(), nullptr);
  EXPECT_FALSE(v.IsNil());

  auto elem = v.Elem();
  EXPECT_EQ(elem.Int(), 17);
  elem.SetInt(-4);
  EXPECT_EQ(target, -4);
}

TEST_F(ValueConstructionTest, WrapAddressOfDataIsReadAsPointerSlot) {
  // Passing the data address itself makes the first word of the data the
  // pointer that Elem() follows; reaching the data directly takes Elem()
  // on a wrapped slot holding its address.
  int64_t data = 0;
  auto as_slot = WrapAddress(arena_.Int64(), &data);
  ASSERT_TRUE(as_slot.IsValid());
  EXPECT_TRUE(as_slot.IsNil());

  int64_t* holder = &data;
  auto direct = WrapAddress(arena_.Int64(), &holder).Elem();
  direct.SetInt(99);
  EXPECT_EQ(data, 99);
  EXPECT_EQ(direct.UnsafeAddr(), reinterpret_cast<uintptr_t>(&data));
}

TEST_F(ValueConstructionTest, WrapAddressNilTypeIsInvalid) {
  void* slot = nullptr;
  auto v = WrapAddress(nullptr, &slot);
  EXPECT_FALSE(v.IsValid());
}

TEST_F(ValueConstructionTest, NilPointeeAccessThrows) {
  void* slot = nullptr;
  auto v = WrapAddress(arena_.Double(), &slot);
  EXPECT_TRUE(v.IsNil());
  auto elem = v.Elem();
  EXPECT_EQ(elem.UnsafeAddr(), 0U);
  EXPECT_THROW((void)elem.Float(), InternalError);
}

// =============================================================================
// Addr
// =============================================================================

TEST_F(ValueConstructionTest, AddrThenElemAliases) {
  auto v = Allocate(arena_.Int32());
  v.SetInt(10);

  auto p = v.Addr();
  ASSERT_TRUE(p.IsValid());
  EXPECT_EQ(p.Kind(), Kind::kPointer);
  EXPECT_EQ(&p.Type().Elem(), arena_.Int32());
  EXPECT_FALSE(p.IsNil());

  auto back = p.Elem();
  EXPECT_EQ(back.UnsafeAddr(), v.UnsafeAddr());
  EXPECT_EQ(back.Int(), 10);
  back.SetInt(11);
  EXPECT_EQ(v.Int(), 11);
  v.SetInt(12);
  EXPECT_EQ(back.Int(), 12);
}

TEST_F(ValueConstructionTest, AddrKeepsPointeeAlive) {
  Value p;
  std::weak_ptr<Storage> watch;
  {
    auto v = Allocate(arena_.Uint64());
    v.SetUint(77);
    watch = v.GetStorage();
    p = v.Addr();
  }
  EXPECT_FALSE(watch.expired());
  auto back = p.Elem();
  EXPECT_EQ(back.Uint(), 77U);
  EXPECT_EQ(back.GetStorage(), watch.lock());
}

TEST_F(ValueConstructionTest, AddrOfAddr) {
  auto v = Allocate(arena_.Int8());
  v.SetInt(-3);
  auto pp = v.Addr().Addr();
  EXPECT_EQ(pp.Type().ToString(), "**int8");
  EXPECT_EQ(pp.Elem().Elem().Int(), -3);
}

TEST_F(ValueConstructionTest, AddrOfWrappedForeignMemory) {
  double data = 2.25;
  double* holder = &data;
  auto v = WrapAddress(arena_.Double(), &holder).Elem();
  auto back = v.Addr().Elem();
  EXPECT_EQ(back.Float(), 2.25);
  EXPECT_EQ(back.GetStorage(), nullptr);
}

// =============================================================================
// Buffer, UnsafeAddr, Indirect
// =============================================================================

TEST_F(ValueConstructionTest, BufferAliasesStorage) {
  auto v = Allocate(arena_.Uint32());
  auto bytes = v.Buffer();
  ASSERT_EQ(bytes.size(), 4U);

  uint32_t pattern = 0xCAFEBABE;
  std::memcpy(bytes.data(), &pattern, sizeof(pattern));
  EXPECT_EQ(v.Uint(), 0xCAFEBABEU);

  v.SetUint(0x01020304);
  uint32_t read_back = 0;
  std::memcpy(&read_back, bytes.data(), sizeof(read_back));
  EXPECT_EQ(read_back, 0x01020304U);
}

TEST_F(ValueConstructionTest, IndirectDereferencesPointersOnly) {
  auto v = Allocate(arena_.Int16());
  v.SetInt(123);
  EXPECT_EQ(Indirect(v).UnsafeAddr(), v.UnsafeAddr());

  auto p = v.Addr();
  auto through = Indirect(p);
  EXPECT_EQ(through.Kind(), Kind::kInt16);
  EXPECT_EQ(through.Int(), 123);
}

TEST_F(ValueConstructionTest, ToStringShowsTypeAndContents) {
  auto v = Allocate(arena_.Int32());
  v.SetInt(-8);
  EXPECT_EQ(v.ToString(), "int32(-8)");
  EXPECT_EQ(fmt::format("{}", v), "int32(-8)");

  auto u = Allocate(arena_.Uint8());
  u.SetUint(255);
  EXPECT_EQ(u.ToString(), "uint8(255)");
}

}  // namespace
}  // namespace ffi
