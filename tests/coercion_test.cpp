#include "codegen/coercion.h"

#include <cstdint>

#include <gtest/gtest.h>

#include "codegen/function_context.h"
#include "jit_harness.h"

using namespace varlen;

TEST(CoercionPlanTest, IntegerStoresFollowSourceSignedness) {
  EXPECT_EQ(planStoreCoercion(ScalarType::signedInt(64), ScalarType::signedInt(32)),
            CoercionOp::Truncate);
  EXPECT_EQ(planStoreCoercion(ScalarType::signedInt(8), ScalarType::signedInt(32)),
            CoercionOp::SignExtend);
  EXPECT_EQ(planStoreCoercion(ScalarType::unsignedInt(8), ScalarType::signedInt(32)),
            CoercionOp::ZeroExtend);
  EXPECT_EQ(planStoreCoercion(ScalarType::signedInt(8), ScalarType::unsignedInt(64)),
            CoercionOp::SignExtend);
  EXPECT_EQ(planStoreCoercion(ScalarType::signedInt(32), ScalarType::unsignedInt(32)),
            CoercionOp::None);
}

TEST(CoercionPlanTest, BooleansZeroExtendAndTruncate) {
  EXPECT_EQ(planStoreCoercion(ScalarType::boolean(1), ScalarType::boolean()),
            CoercionOp::ZeroExtend);
  EXPECT_EQ(planStoreCoercion(ScalarType::boolean(), ScalarType::signedInt(32)),
            CoercionOp::ZeroExtend);
  EXPECT_EQ(planStoreCoercion(ScalarType::signedInt(32), ScalarType::boolean()),
            CoercionOp::Truncate);
  EXPECT_EQ(planStoreCoercion(ScalarType::boolean(), ScalarType::boolean()),
            CoercionOp::None);
}

TEST(CoercionPlanTest, FloatsStayFloats) {
  EXPECT_EQ(planStoreCoercion(ScalarType::floating(64), ScalarType::floating(32)),
            CoercionOp::FPTruncate);
  EXPECT_EQ(planStoreCoercion(ScalarType::floating(32), ScalarType::floating(64)),
            CoercionOp::FPExtend);
  EXPECT_EQ(planStoreCoercion(ScalarType::floating(64), ScalarType::floating(64)),
            CoercionOp::None);
  EXPECT_EQ(planStoreCoercion(ScalarType::floating(64), ScalarType::signedInt(64)),
            CoercionOp::Unsupported);
  EXPECT_EQ(planStoreCoercion(ScalarType::signedInt(32), ScalarType::floating(32)),
            CoercionOp::Unsupported);
  EXPECT_EQ(planStoreCoercion(ScalarType::boolean(), ScalarType::floating(64)),
            CoercionOp::Unsupported);
  EXPECT_STREQ(coercionOpName(CoercionOp::FPTruncate), "fptrunc");
}

namespace {

class CoercionCodegenTest : public ::testing::Test {
protected:
  /// Define `name(source) -> destination-widened-back` storing through a stack
  /// slot of the destination type, the way an element store would.
  bool defineRoundTrip(const std::string &name, ScalarType source,
                       ScalarType destination) {
    llvm::LLVMContext &ctx = harness.context();
    llvm::Type *srcTy = llvmTypeFor(ctx, source);
    llvm::Type *dstTy = llvmTypeFor(ctx, destination);
    llvm::Function *f = harness.declareFunction(name, dstTy, {srcTy});
    FunctionBuildContext fn(harness.codegen(), f);
    llvm::AllocaInst *slot = fn.createEntryAlloca(dstTy, "slot");
    llvm::Value *stored =
        emitStoreCoercion(fn.builder(), f->getArg(0), source, destination);
    if (!stored)
      return false;
    fn.builder().CreateStore(stored, slot);
    return fn.emitReturn(fn.builder().CreateLoad(dstTy, slot, "reload")) &&
           fn.finalize();
  }

  test::JitHarness harness;
};

} // namespace

TEST_F(CoercionCodegenTest, StoredValuesRoundTrip) {
  ASSERT_TRUE(defineRoundTrip("narrow", ScalarType::signedInt(64),
                              ScalarType::signedInt(32)));
  ASSERT_TRUE(defineRoundTrip("widen_signed", ScalarType::signedInt(8),
                              ScalarType::signedInt(64)));
  ASSERT_TRUE(defineRoundTrip("widen_unsigned", ScalarType::unsignedInt(8),
                              ScalarType::signedInt(64)));
  ASSERT_TRUE(defineRoundTrip("same", ScalarType::signedInt(16),
                              ScalarType::unsignedInt(16)));
  ASSERT_TRUE(defineRoundTrip("fp_narrow", ScalarType::floating(64),
                              ScalarType::floating(32)));
  ASSERT_TRUE(defineRoundTrip("fp_widen", ScalarType::floating(32),
                              ScalarType::floating(64)));
  ASSERT_TRUE(defineRoundTrip("flag", ScalarType::boolean(1), ScalarType::boolean()));
  ASSERT_FALSE(harness.session().hadError());
  ASSERT_TRUE(harness.compile());

  auto *narrow = harness.lookup<int32_t(int64_t)>("narrow");
  auto *widenSigned = harness.lookup<int64_t(int8_t)>("widen_signed");
  auto *widenUnsigned = harness.lookup<int64_t(uint8_t)>("widen_unsigned");
  auto *same = harness.lookup<uint16_t(int16_t)>("same");
  auto *fpNarrow = harness.lookup<float(double)>("fp_narrow");
  auto *fpWiden = harness.lookup<double(float)>("fp_widen");
  auto *flag = harness.lookup<int8_t(bool)>("flag");
  ASSERT_NE(narrow, nullptr);
  ASSERT_NE(flag, nullptr);

  EXPECT_EQ(narrow(7), 7);
  EXPECT_EQ(narrow(0x100000005ll), 5);
  EXPECT_EQ(narrow(-2), -2);
  EXPECT_EQ(widenSigned(-127), -127);
  EXPECT_EQ(widenUnsigned(200), 200);
  EXPECT_EQ(same(-1), 0xffffu);
  EXPECT_FLOAT_EQ(fpNarrow(1.5), 1.5f);
  EXPECT_DOUBLE_EQ(fpWiden(0.25f), 0.25);
  EXPECT_EQ(flag(true), 1);
  EXPECT_EQ(flag(false), 0);
}

TEST_F(CoercionCodegenTest, NarrowingStoresKeepTheLowBits) {
  ASSERT_TRUE(defineRoundTrip("narrow_u32_u8", ScalarType::unsignedInt(32),
                              ScalarType::unsignedInt(8)));
  ASSERT_TRUE(defineRoundTrip("narrow_u64_i16", ScalarType::unsignedInt(64),
                              ScalarType::signedInt(16)));
  ASSERT_TRUE(defineRoundTrip("to_bool", ScalarType::signedInt(32),
                              ScalarType::boolean()));
  ASSERT_TRUE(defineRoundTrip("u16_to_bool", ScalarType::unsignedInt(16),
                              ScalarType::boolean()));
  ASSERT_FALSE(harness.session().hadError());
  ASSERT_TRUE(harness.compile());

  auto *narrowByte = harness.lookup<uint8_t(uint32_t)>("narrow_u32_u8");
  auto *narrowShort = harness.lookup<int16_t(uint64_t)>("narrow_u64_i16");
  auto *toBool = harness.lookup<int8_t(int32_t)>("to_bool");
  auto *shortToBool = harness.lookup<int8_t(uint16_t)>("u16_to_bool");
  ASSERT_TRUE(narrowByte && narrowShort && toBool && shortToBool);

  EXPECT_EQ(narrowByte(0x1ffu), 0xffu);
  EXPECT_EQ(narrowByte(300u), 44u);
  EXPECT_EQ(narrowByte(0xffffffffu), 0xffu);
  EXPECT_EQ(narrowShort(0x12345u), 0x2345);
  EXPECT_EQ(narrowShort(0xffffu), -1);

  // Truncation into a boolean element keeps the low byte, not truthiness.
  EXPECT_EQ(toBool(1), 1);
  EXPECT_EQ(toBool(0x101), 1);
  EXPECT_EQ(toBool(0x100), 0);
  EXPECT_EQ(shortToBool(0xff01u), 1);
  EXPECT_EQ(shortToBool(0x0200u), 0);
}

TEST_F(CoercionCodegenTest, CrossFamilyStoreIsReported) {
  llvm::LLVMContext &ctx = harness.context();
  llvm::Function *f = harness.declareFunction(
      "bad", llvm::Type::getVoidTy(ctx), {llvm::Type::getDoubleTy(ctx)});
  FunctionBuildContext fn(harness.codegen(), f);

  EXPECT_EQ(emitStoreCoercion(fn.builder(), f->getArg(0), ScalarType::floating(64),
                              ScalarType::signedInt(32)),
            nullptr);
  ASSERT_TRUE(harness.session().hadError());
  EXPECT_NE(harness.session().diagnostics().back().message.find("float64"),
            std::string::npos);
}

TEST_F(CoercionCodegenTest, MismatchedSourceTypeIsReported) {
  llvm::LLVMContext &ctx = harness.context();
  llvm::Function *f = harness.declareFunction(
      "mismatch", llvm::Type::getVoidTy(ctx), {llvm::Type::getInt32Ty(ctx)});
  FunctionBuildContext fn(harness.codegen(), f);

  EXPECT_EQ(emitStoreCoercion(fn.builder(), f->getArg(0), ScalarType::signedInt(64),
                              ScalarType::signedInt(32)),
            nullptr);
  EXPECT_TRUE(harness.session().hadError());
}
