#ifndef VARLEN_CODEGEN_COERCION_H
#define VARLEN_CODEGEN_COERCION_H

#include <string>

#include "types/scalar_type.h"

#include "llvm/IR/IRBuilder.h"
#include "llvm/IR/Value.h"

namespace varlen {

enum class CoercionOp {
  None,
  Truncate,
  SignExtend,
  ZeroExtend,
  FPTruncate,
  FPExtend,
  Unsupported
};

const char *coercionOpName(CoercionOp op);

/// Decide how a value of type source is adapted before being stored into an
/// element of type destination. The rule follows the source kind:
///
///   integer -> integral  narrower: truncate; wider: sext if signed, else zext
///   float   -> float     narrower: fptrunc;  wider: fpext
///   boolean -> integral  narrower: truncate; wider: zext
///
/// Equal widths pass through. Stores across the integral/floating boundary are
/// Unsupported.
CoercionOp planStoreCoercion(const ScalarType &source,
                             const ScalarType &destination);

/// Apply the planned coercion. Reports an error and returns nullptr when the
/// store is unsupported or value does not have the LLVM type of source.
llvm::Value *emitStoreCoercion(llvm::IRBuilder<> &builder, llvm::Value *value,
                               const ScalarType &source,
                               const ScalarType &destination,
                               const std::string &label = "coerce");

} // namespace varlen

#endif // VARLEN_CODEGEN_COERCION_H
