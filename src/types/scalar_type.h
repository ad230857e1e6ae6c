#ifndef VARLEN_TYPES_SCALAR_TYPE_H
#define VARLEN_TYPES_SCALAR_TYPE_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "llvm/IR/LLVMContext.h"
#include "llvm/IR/Type.h"

namespace varlen {

class BufferLayout;
struct CodegenContext;

enum class NumericKind { SignedInt, UnsignedInt, Float, Boolean };

/// A scalar representation: what a buffer stores per element, or what the
/// front end hands to a store. Boolean elements occupy a byte; boolean values
/// coming out of comparisons are one bit wide.
struct ScalarType {
  NumericKind kind = NumericKind::SignedInt;
  unsigned bitWidth = 32;

  static constexpr ScalarType signedInt(unsigned bits) {
    return {NumericKind::SignedInt, bits};
  }
  static constexpr ScalarType unsignedInt(unsigned bits) {
    return {NumericKind::UnsignedInt, bits};
  }
  static constexpr ScalarType floating(unsigned bits) {
    return {NumericKind::Float, bits};
  }
  static constexpr ScalarType boolean(unsigned bits = 8) {
    return {NumericKind::Boolean, bits};
  }

  bool isInteger() const {
    return kind == NumericKind::SignedInt || kind == NumericKind::UnsignedInt;
  }
  bool isSigned() const { return kind == NumericKind::SignedInt; }
  bool isFloat() const { return kind == NumericKind::Float; }
  bool isBoolean() const { return kind == NumericKind::Boolean; }
  bool isIntegral() const { return isInteger() || isBoolean(); }

  unsigned byteWidth() const { return (bitWidth + 7) / 8; }

  /// Canonical spelling used in layout and sentinel keys ("int32", "bool").
  std::string name() const;

  bool operator==(const ScalarType &other) const = default;
};

std::optional<ScalarType> scalarTypeFromName(std::string_view name);

/// LLVM representation of a scalar: iN for integral kinds, float/double.
llvm::Type *llvmTypeFor(llvm::LLVMContext &context, const ScalarType &type);

/// Infer the scalar type of an LLVM value type. Integers are taken as signed
/// and i1 as a boolean; callers that know better pass the type explicitly.
std::optional<ScalarType> scalarTypeFromLLVM(const llvm::Type *type);

/// Canonical descriptor an element type or extra member resolves to: either a
/// scalar or a nested buffer layout embedded by value.
struct TypeDescriptor {
  std::optional<ScalarType> scalar;
  const BufferLayout *nested = nullptr;

  bool isScalar() const { return scalar.has_value(); }
  std::string name() const;
  llvm::Type *llvmType(llvm::LLVMContext &context) const;
};

class TypeDescriptorResolver {
public:
  virtual ~TypeDescriptorResolver() = default;

  virtual std::optional<TypeDescriptor> resolve(CodegenContext &context,
                                                std::string_view spec) const = 0;
};

/// Resolves scalar names and nested "Container<elem>" specs.
class DefaultTypeDescriptorResolver : public TypeDescriptorResolver {
public:
  std::optional<TypeDescriptor> resolve(CodegenContext &context,
                                        std::string_view spec) const override;
};

} // namespace varlen

#endif // VARLEN_TYPES_SCALAR_TYPE_H
