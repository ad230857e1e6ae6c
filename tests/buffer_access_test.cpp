#include "codegen/buffer_access.h"

#include <cfloat>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>

#include <gtest/gtest.h>

#include "codegen/buffer_construction.h"
#include "jit_harness.h"
#include "varlen_runtime.h"

#include "llvm/IR/Constants.h"

using namespace varlen;

namespace {

class BufferAccessTest : public ::testing::Test {
protected:
  void SetUp() override { reset(CodegenOptions{}); }

  void reset(CodegenOptions options) {
    options.releaseSymbol = test::TestReleaseSymbol;
    harness.reset();
    harness = std::make_unique<test::JitHarness>(options);
    test::releasedPointers().clear();
  }

  llvm::LLVMContext &ctx() { return harness->context(); }
  llvm::Type *i64() { return llvm::Type::getInt64Ty(ctx()); }
  llvm::Type *i8() { return llvm::Type::getInt8Ty(ctx()); }
  llvm::Type *ptrTy() { return llvm::PointerType::get(ctx(), 0); }

  /// i8 name(ptr buf, i64 index) returning whether element index is null.
  void defineIsNullAt(const std::string &name, const BufferLayout &layout) {
    llvm::Function *f = harness->declareFunction(name, i8(), {ptrTy(), i64()});
    FunctionBuildContext fn(harness->codegen(), f);
    auto accessor = makeBufferAccessor(fn, BufferHandle::fromPointer(layout, f->getArg(0)));
    ASSERT_NE(accessor, nullptr);
    llvm::Value *isNull = accessor->isNullAt(f->getArg(1));
    ASSERT_NE(isNull, nullptr);
    ASSERT_TRUE(fn.emitReturn(fn.builder().CreateZExt(isNull, i8())));
    ASSERT_TRUE(fn.finalize());
  }

  std::unique_ptr<test::JitHarness> harness;
};

} // namespace

TEST_F(BufferAccessTest, ConstructSetGetAndFree) {
  llvm::Function *f = harness->declareFunction("five_int32", i64(), {});
  FunctionBuildContext fn(harness->codegen(), f);
  const BufferLayout *layout = harness->layout("Array<int32>");
  ASSERT_NE(layout, nullptr);

  llvm::IRBuilder<> &b = fn.builder();
  auto buffer = emitBufferConstruction(fn, *layout, b.getInt64(5), {{}, "values"});
  ASSERT_TRUE(buffer.has_value());
  auto accessor = makeBufferAccessor(fn, *buffer);
  ASSERT_NE(accessor, nullptr);

  ASSERT_TRUE(accessor->set(b.getInt64(2), b.getInt32(7), ScalarType::signedInt(32)));
  llvm::Value *element = accessor->get(b.getInt64(2));
  llvm::Value *length = accessor->length();
  ASSERT_NE(element, nullptr);
  ASSERT_NE(length, nullptr);
  EXPECT_TRUE(element->getType()->isIntegerTy(32));
  EXPECT_TRUE(length->getType()->isIntegerTy(64));

  ASSERT_TRUE(emitBufferFree(fn, *buffer, {{}, "values"}));
  EXPECT_TRUE(fn.allocations().empty());

  llvm::Value *combined =
      b.CreateAdd(b.CreateMul(b.CreateSExt(element, i64()), b.getInt64(1000)), length);
  ASSERT_TRUE(fn.emitReturn(combined));
  ASSERT_TRUE(fn.finalize());

  // The explicit free is the only release; the exit sequence adds none.
  EXPECT_EQ(test::countCallsTo(*f, test::TestReleaseSymbol), 1u);
  EXPECT_EQ(harness->session().warningCount(), 0u);

  ASSERT_TRUE(harness->compile());
  auto *fiveInt32 = harness->lookup<int64_t()>("five_int32");
  ASSERT_NE(fiveInt32, nullptr);
  EXPECT_EQ(fiveInt32(), 7005);
  EXPECT_EQ(test::releasedPointers().size(), 1u);
}

TEST_F(BufferAccessTest, OverriddenInt8SentinelMatchesItsBitPattern) {
  CodegenOptions options;
  options.sentinelOverrides["Array<int8>"] = 129;
  options.sentinelOverrides["Column<int8>"] = 127;
  reset(options);

  const BufferLayout *array = harness->layout("Array<int8>");
  const BufferLayout *column = harness->layout("Column<int8>");
  ASSERT_NE(array, nullptr);
  ASSERT_NE(column, nullptr);
  defineIsNullAt("int8_is_null_at", *array);
  defineIsNullAt("int8_column_is_null_at", *column);
  ASSERT_TRUE(harness->compile());
  auto *isNullAt =
      harness->lookup<int8_t(varlen_array_header *, int64_t)>("int8_is_null_at");
  auto *columnIsNullAt =
      harness->lookup<int8_t(varlen_column_header *, int64_t)>("int8_column_is_null_at");
  ASSERT_NE(isNullAt, nullptr);
  ASSERT_NE(columnIsNullAt, nullptr);

  // Every byte value: 129 reads back as -127 and nothing else is null.
  int8_t data[256];
  for (int i = 0; i < 256; ++i)
    data[i] = static_cast<int8_t>(i - 128);
  varlen_array_header header{data, 256, 0};
  varlen_column_header columnHeader{data, 256};
  for (int i = 0; i < 256; ++i) {
    EXPECT_EQ(isNullAt(&header, i), data[i] == -127 ? 1 : 0) << int(data[i]);
    EXPECT_EQ(columnIsNullAt(&columnHeader, i), data[i] == 127 ? 1 : 0) << int(data[i]);
  }
}

TEST_F(BufferAccessTest, DefaultArrayAndColumnSentinelsDiffer) {
  const BufferLayout *array = harness->layout("Array<int8>");
  const BufferLayout *column = harness->layout("Column<int8>");
  ASSERT_NE(array, nullptr);
  ASSERT_NE(column, nullptr);
  defineIsNullAt("array_int8_is_null_at", *array);
  defineIsNullAt("column_int8_is_null_at", *column);
  ASSERT_TRUE(harness->compile());
  auto *arrayIsNullAt =
      harness->lookup<int8_t(varlen_array_header *, int64_t)>("array_int8_is_null_at");
  auto *columnIsNullAt =
      harness->lookup<int8_t(varlen_column_header *, int64_t)>("column_int8_is_null_at");
  ASSERT_NE(arrayIsNullAt, nullptr);
  ASSERT_NE(columnIsNullAt, nullptr);

  int8_t data[256];
  for (int i = 0; i < 256; ++i)
    data[i] = static_cast<int8_t>(i - 128);
  varlen_array_header header{data, 256, 0};
  varlen_column_header columnHeader{data, 256};
  for (int i = 0; i < 256; ++i) {
    EXPECT_EQ(arrayIsNullAt(&header, i), data[i] == -127 ? 1 : 0) << int(data[i]);
    EXPECT_EQ(columnIsNullAt(&columnHeader, i), data[i] == -128 ? 1 : 0) << int(data[i]);
  }
}

TEST_F(BufferAccessTest, FloatSentinelComparesExactBits) {
  const BufferLayout *layout = harness->layout("Array<float32>");
  ASSERT_NE(layout, nullptr);
  defineIsNullAt("float_is_null_at", *layout);

  llvm::Function *f = harness->declareFunction(
      "float_set_null_at", llvm::Type::getVoidTy(ctx()), {ptrTy(), i64()});
  {
    FunctionBuildContext fn(harness->codegen(), f);
    auto accessor = makeBufferAccessor(fn, BufferHandle::fromPointer(*layout, f->getArg(0)));
    ASSERT_NE(accessor, nullptr);
    ASSERT_TRUE(accessor->setNullAt(f->getArg(1)));
    ASSERT_TRUE(fn.finalize());
  }

  ASSERT_TRUE(harness->compile());
  auto *isNullAt =
      harness->lookup<int8_t(varlen_array_header *, int64_t)>("float_is_null_at");
  auto *setNullAt =
      harness->lookup<void(varlen_array_header *, int64_t)>("float_set_null_at");
  ASSERT_NE(isNullAt, nullptr);
  ASSERT_NE(setNullAt, nullptr);

  const float arrayNull = 2.0f * FLT_MIN;
  float data[] = {arrayNull, std::numeric_limits<float>::quiet_NaN(), 0.0f,
                  -arrayNull, FLT_MIN, 2.5f};
  varlen_array_header header{data, 6, 0};
  EXPECT_EQ(isNullAt(&header, 0), 1);
  EXPECT_EQ(isNullAt(&header, 1), 0);
  EXPECT_EQ(isNullAt(&header, 2), 0);
  EXPECT_EQ(isNullAt(&header, 3), 0);
  EXPECT_EQ(isNullAt(&header, 4), 0);

  setNullAt(&header, 5);
  uint32_t stored = 0;
  uint32_t expected = 0;
  std::memcpy(&stored, &data[5], sizeof(stored));
  std::memcpy(&expected, &arrayNull, sizeof(expected));
  EXPECT_EQ(stored, expected);
  EXPECT_EQ(isNullAt(&header, 5), 1);
}

TEST_F(BufferAccessTest, BareAndIndexedNullOperationsTouchDifferentState) {
  const BufferLayout *layout = harness->layout("Array<int32>");
  ASSERT_NE(layout, nullptr);
  llvm::Type *voidTy = llvm::Type::getVoidTy(ctx());

  llvm::Function *whole = harness->declareFunction("mark_buffer", voidTy, {ptrTy()});
  {
    FunctionBuildContext fn(harness->codegen(), whole);
    auto accessor =
        makeBufferAccessor(fn, BufferHandle::fromPointer(*layout, whole->getArg(0)));
    ASSERT_NE(accessor, nullptr);
    ASSERT_TRUE(accessor->setNull());
    ASSERT_TRUE(fn.finalize());
  }

  llvm::Function *element = harness->declareFunction("mark_second", voidTy, {ptrTy()});
  {
    FunctionBuildContext fn(harness->codegen(), element);
    auto accessor =
        makeBufferAccessor(fn, BufferHandle::fromPointer(*layout, element->getArg(0)));
    ASSERT_NE(accessor, nullptr);
    // Narrow indices are widened to i64.
    ASSERT_TRUE(accessor->setNullAt(fn.builder().getInt8(1)));
    ASSERT_TRUE(fn.finalize());
  }

  ASSERT_TRUE(harness->compile());
  auto *markBuffer = harness->lookup<void(varlen_array_header *)>("mark_buffer");
  auto *markSecond = harness->lookup<void(varlen_array_header *)>("mark_second");
  ASSERT_NE(markBuffer, nullptr);
  ASSERT_NE(markSecond, nullptr);

  int32_t data[] = {1, 2, 3};
  varlen_array_header header{data, 3, 0};
  markBuffer(&header);
  EXPECT_EQ(header.is_null, 1);
  EXPECT_EQ(data[0], 1);
  EXPECT_EQ(data[1], 2);

  header.is_null = 0;
  markSecond(&header);
  EXPECT_EQ(header.is_null, 0);
  EXPECT_EQ(data[1], std::numeric_limits<int32_t>::min() + 1);
  EXPECT_EQ(data[2], 3);
}

TEST_F(BufferAccessTest, ColumnHasNoWholeBufferNullState) {
  const BufferLayout *layout = harness->layout("Column<int32>");
  ASSERT_NE(layout, nullptr);
  llvm::Function *f = harness->declareFunction("column", llvm::Type::getVoidTy(ctx()),
                                               {ptrTy()});
  FunctionBuildContext fn(harness->codegen(), f);
  auto accessor = makeBufferAccessor(fn, BufferHandle::fromPointer(*layout, f->getArg(0)));
  ASSERT_NE(accessor, nullptr);

  EXPECT_EQ(accessor->isNull(), nullptr);
  ASSERT_TRUE(harness->session().hadError());
  EXPECT_EQ(harness->session().diagnostics().back().hint,
            "use the indexed form to test elements");
  EXPECT_FALSE(accessor->setNull());

  // Element sentinels still apply.
  harness->session().clearDiagnostics();
  EXPECT_NE(accessor->isNullAt(fn.builder().getInt64(0)), nullptr);
  EXPECT_FALSE(harness->session().hadError());
}

TEST_F(BufferAccessTest, ElementTypesWithoutSentinelAreReported) {
  const BufferLayout *layout = harness->layout("Array<uint16>");
  ASSERT_NE(layout, nullptr);
  llvm::Function *f = harness->declareFunction("unsigned_elements",
                                               llvm::Type::getVoidTy(ctx()), {ptrTy()});
  FunctionBuildContext fn(harness->codegen(), f);
  auto accessor = makeBufferAccessor(fn, BufferHandle::fromPointer(*layout, f->getArg(0)));
  ASSERT_NE(accessor, nullptr);

  EXPECT_EQ(accessor->isNullAt(fn.builder().getInt64(0)), nullptr);
  EXPECT_FALSE(accessor->setNullAt(fn.builder().getInt64(0)));
  ASSERT_EQ(harness->session().diagnostics().size(), 2u);
  EXPECT_NE(harness->session().diagnostics().front().message.find("Array<uint16>"),
            std::string::npos);
}

TEST_F(BufferAccessTest, LoadedBuffersWriteThroughTheirStorage) {
  const BufferLayout *layout = harness->layout("Array<int16>", BufferPassing::ByValue);
  ASSERT_NE(layout, nullptr);
  llvm::Function *f = harness->declareFunction("mark_loaded", i8(), {ptrTy()});
  FunctionBuildContext fn(harness->codegen(), f);

  llvm::Value *loaded =
      fn.builder().CreateLoad(layout->structType(), f->getArg(0), "loaded");
  BufferHandle handle = BufferHandle::fromLoaded(*layout, loaded);
  EXPECT_EQ(handle.storage, f->getArg(0));
  auto accessor = makeBufferAccessor(fn, handle);
  ASSERT_NE(accessor, nullptr);

  ASSERT_TRUE(accessor->setNull());
  llvm::Value *isNull = accessor->isNull();
  ASSERT_NE(isNull, nullptr);
  ASSERT_TRUE(fn.emitReturn(fn.builder().CreateZExt(isNull, i8())));
  ASSERT_TRUE(fn.finalize());

  ASSERT_TRUE(harness->compile());
  auto *markLoaded = harness->lookup<int8_t(varlen_array_header *)>("mark_loaded");
  ASSERT_NE(markLoaded, nullptr);

  int16_t data[] = {4, 5};
  varlen_array_header header{data, 2, 0};
  EXPECT_EQ(markLoaded(&header), 1);
  EXPECT_EQ(header.is_null, 1);
}

TEST_F(BufferAccessTest, LoadedBufferWithoutStorageCannotBeUpdated) {
  const BufferLayout *layout = harness->layout("Array<int16>", BufferPassing::ByValue);
  ASSERT_NE(layout, nullptr);
  llvm::Function *f = harness->declareFunction("no_storage",
                                               llvm::Type::getVoidTy(ctx()), {});
  FunctionBuildContext fn(harness->codegen(), f);

  auto accessor = makeBufferAccessor(
      fn, BufferHandle::fromLoaded(*layout, llvm::UndefValue::get(layout->structType())));
  ASSERT_NE(accessor, nullptr);
  EXPECT_NE(accessor->length(), nullptr);
  EXPECT_FALSE(accessor->setNull());
  ASSERT_TRUE(harness->session().hadError());
  EXPECT_NE(harness->session().diagnostics().back().message.find("no storage"),
            std::string::npos);
}

TEST_F(BufferAccessTest, RejectsBadIndicesAndMismatchedHandles) {
  const BufferLayout *layout = harness->layout("Array<int64>");
  ASSERT_NE(layout, nullptr);
  llvm::Function *f = harness->declareFunction("bad_access",
                                               llvm::Type::getVoidTy(ctx()), {ptrTy()});
  FunctionBuildContext fn(harness->codegen(), f);

  auto accessor = makeBufferAccessor(fn, BufferHandle::fromPointer(*layout, f->getArg(0)));
  ASSERT_NE(accessor, nullptr);
  llvm::Value *fpIndex = llvm::ConstantFP::get(fn.builder().getDoubleTy(), 1.0);
  EXPECT_EQ(accessor->get(fpIndex), nullptr);
  EXPECT_FALSE(accessor->set(fpIndex, fn.builder().getInt64(3),
                             ScalarType::signedInt(64)));
  ASSERT_EQ(harness->session().diagnostics().size(), 2u);
  EXPECT_EQ(harness->session().diagnostics().front().message,
            "Buffer index must be an integer");

  EXPECT_EQ(makeBufferAccessor(fn, BufferHandle::fromPointer(*layout,
                                                             fn.builder().getInt64(0))),
            nullptr);
  EXPECT_EQ(makeBufferAccessor(fn, BufferHandle::fromLoaded(*layout, f->getArg(0))),
            nullptr);
  EXPECT_EQ(makeBufferAccessor(fn, BufferHandle{}), nullptr);
  EXPECT_EQ(harness->session().diagnostics().size(), 5u);
}
