// This file implements the scalar type model shared by the layout, coercion
// and sentinel code, plus the default type-descriptor resolver.

#include "types/scalar_type.h"

#include <map>

#include "buffer/buffer_layout.h"
#include "codegen_context.h"

namespace varlen {

namespace {

std::string_view trimSpaces(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
    text.remove_prefix(1);
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
    text.remove_suffix(1);
  return text;
}

const std::map<std::string, ScalarType, std::less<>> &scalarNameTable() {
  static const std::map<std::string, ScalarType, std::less<>> table = {
      {"int8", ScalarType::signedInt(8)},
      {"int16", ScalarType::signedInt(16)},
      {"int32", ScalarType::signedInt(32)},
      {"int64", ScalarType::signedInt(64)},
      {"uint8", ScalarType::unsignedInt(8)},
      {"uint16", ScalarType::unsignedInt(16)},
      {"uint32", ScalarType::unsignedInt(32)},
      {"uint64", ScalarType::unsignedInt(64)},
      {"float32", ScalarType::floating(32)},
      {"float64", ScalarType::floating(64)},
      {"bool", ScalarType::boolean()},
      // aliases
      {"int8_t", ScalarType::signedInt(8)},
      {"int16_t", ScalarType::signedInt(16)},
      {"int32_t", ScalarType::signedInt(32)},
      {"int64_t", ScalarType::signedInt(64)},
      {"uint8_t", ScalarType::unsignedInt(8)},
      {"uint16_t", ScalarType::unsignedInt(16)},
      {"uint32_t", ScalarType::unsignedInt(32)},
      {"uint64_t", ScalarType::unsignedInt(64)},
      {"size_t", ScalarType::unsignedInt(64)},
      {"i8", ScalarType::signedInt(8)},
      {"i16", ScalarType::signedInt(16)},
      {"i32", ScalarType::signedInt(32)},
      {"i64", ScalarType::signedInt(64)},
      {"u8", ScalarType::unsignedInt(8)},
      {"u16", ScalarType::unsignedInt(16)},
      {"u32", ScalarType::unsignedInt(32)},
      {"u64", ScalarType::unsignedInt(64)},
      {"f32", ScalarType::floating(32)},
      {"f64", ScalarType::floating(64)},
      {"byte", ScalarType::unsignedInt(8)},
      {"short", ScalarType::signedInt(16)},
      {"int", ScalarType::signedInt(32)},
      {"long", ScalarType::signedInt(64)},
      {"float", ScalarType::floating(32)},
      {"double", ScalarType::floating(64)},
      {"boolean", ScalarType::boolean()},
  };
  return table;
}

} // namespace

std::string ScalarType::name() const {
  switch (kind) {
  case NumericKind::SignedInt:
    return "int" + std::to_string(bitWidth);
  case NumericKind::UnsignedInt:
    return "uint" + std::to_string(bitWidth);
  case NumericKind::Float:
    return "float" + std::to_string(bitWidth);
  case NumericKind::Boolean:
    return "bool";
  }
  return "<unknown>";
}

std::optional<ScalarType> scalarTypeFromName(std::string_view name) {
  name = trimSpaces(name);
  const auto &table = scalarNameTable();
  auto it = table.find(name);
  if (it == table.end())
    return std::nullopt;
  return it->second;
}

llvm::Type *llvmTypeFor(llvm::LLVMContext &context, const ScalarType &type) {
  if (type.isFloat()) {
    if (type.bitWidth == 32)
      return llvm::Type::getFloatTy(context);
    if (type.bitWidth == 64)
      return llvm::Type::getDoubleTy(context);
    return nullptr;
  }
  if (type.bitWidth == 0)
    return nullptr;
  return llvm::Type::getIntNTy(context, type.bitWidth);
}

std::optional<ScalarType> scalarTypeFromLLVM(const llvm::Type *type) {
  if (!type)
    return std::nullopt;
  if (type->isFloatTy())
    return ScalarType::floating(32);
  if (type->isDoubleTy())
    return ScalarType::floating(64);
  if (type->isIntegerTy(1))
    return ScalarType::boolean(1);
  if (type->isIntegerTy())
    return ScalarType::signedInt(type->getIntegerBitWidth());
  return std::nullopt;
}

std::string TypeDescriptor::name() const {
  if (scalar)
    return scalar->name();
  if (nested)
    return nested->key();
  return "<unresolved>";
}

llvm::Type *TypeDescriptor::llvmType(llvm::LLVMContext &context) const {
  if (scalar)
    return llvmTypeFor(context, *scalar);
  if (nested)
    return nested->structType();
  return nullptr;
}

std::optional<TypeDescriptor>
DefaultTypeDescriptorResolver::resolve(CodegenContext &context,
                                       std::string_view spec) const {
  spec = trimSpaces(spec);
  if (auto scalar = scalarTypeFromName(spec)) {
    TypeDescriptor desc;
    desc.scalar = *scalar;
    return desc;
  }

  if (spec.find('<') == std::string_view::npos)
    return std::nullopt;

  auto bufferSpec = parseBufferTypeSpec(spec);
  if (!bufferSpec)
    return std::nullopt;
  // Nested buffers are embedded as structs, so they are always by value here.
  bufferSpec->passing = BufferPassing::ByValue;
  const BufferLayout *layout = deriveBufferLayout(context, *bufferSpec);
  if (!layout)
    return std::nullopt;

  TypeDescriptor desc;
  desc.nested = layout;
  return desc;
}

} // namespace varlen
