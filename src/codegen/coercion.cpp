// This file implements the store-side numeric coercion applied before values
// are written into buffer elements.
//
// Earlier stages may promote arithmetic to a wider canonical width (int32 +
// int32 producing int64); the promotion has to be undone before writing into
// fixed-width storage.

#include "codegen/coercion.h"

#include "compiler_session.h"

namespace varlen {

const char *coercionOpName(CoercionOp op) {
  switch (op) {
  case CoercionOp::None:
    return "none";
  case CoercionOp::Truncate:
    return "trunc";
  case CoercionOp::SignExtend:
    return "sext";
  case CoercionOp::ZeroExtend:
    return "zext";
  case CoercionOp::FPTruncate:
    return "fptrunc";
  case CoercionOp::FPExtend:
    return "fpext";
  case CoercionOp::Unsupported:
    return "unsupported";
  }
  return "unsupported";
}

CoercionOp planStoreCoercion(const ScalarType &source,
                             const ScalarType &destination) {
  if (source.isFloat()) {
    if (!destination.isFloat())
      return CoercionOp::Unsupported;
    if (destination.bitWidth < source.bitWidth)
      return CoercionOp::FPTruncate;
    if (destination.bitWidth > source.bitWidth)
      return CoercionOp::FPExtend;
    return CoercionOp::None;
  }

  if (!destination.isIntegral())
    return CoercionOp::Unsupported;

  if (destination.bitWidth < source.bitWidth)
    return CoercionOp::Truncate;
  if (destination.bitWidth > source.bitWidth) {
    if (source.isSigned())
      return CoercionOp::SignExtend;
    return CoercionOp::ZeroExtend;
  }
  return CoercionOp::None;
}

llvm::Value *emitStoreCoercion(llvm::IRBuilder<> &builder, llvm::Value *value,
                               const ScalarType &source,
                               const ScalarType &destination,
                               const std::string &label) {
  if (!value)
    return nullptr;

  llvm::LLVMContext &ctx = builder.getContext();
  llvm::Type *sourceTy = llvmTypeFor(ctx, source);
  llvm::Type *destTy = llvmTypeFor(ctx, destination);
  if (!sourceTy || !destTy) {
    reportCompilerError("Unsupported scalar width in buffer store");
    return nullptr;
  }
  if (value->getType() != sourceTy) {
    reportCompilerError("Internal error: stored value does not match its "
                        "declared type '" + source.name() + "'");
    return nullptr;
  }

  const CoercionOp op = planStoreCoercion(source, destination);
  switch (op) {
  case CoercionOp::None:
    return value;
  case CoercionOp::Truncate:
    return builder.CreateTrunc(value, destTy, label + ".trunc");
  case CoercionOp::SignExtend:
    return builder.CreateSExt(value, destTy, label + ".sext");
  case CoercionOp::ZeroExtend:
    return builder.CreateZExt(value, destTy, label + ".zext");
  case CoercionOp::FPTruncate:
    return builder.CreateFPTrunc(value, destTy, label + ".fptrunc");
  case CoercionOp::FPExtend:
    return builder.CreateFPExt(value, destTy, label + ".fpext");
  case CoercionOp::Unsupported:
    break;
  }

  reportCompilerError("Cannot store a value of type '" + source.name() +
                          "' into a buffer of '" + destination.name() + "'",
                      "convert the value explicitly before storing it");
  return nullptr;
}

} // namespace varlen
