// This file implements element access, null-flag and null-sentinel codegen for
// both buffer addressing modes.

#include "codegen/buffer_access.h"

#include "buffer/null_sentinels.h"
#include "codegen/coercion.h"

#include "llvm/IR/Constants.h"

namespace varlen {

namespace {

llvm::Value *normalizeIndex(llvm::IRBuilder<> &builder, llvm::Value *index) {
  if (!index || !index->getType()->isIntegerTy()) {
    reportCompilerError("Buffer index must be an integer");
    return nullptr;
  }
  return builder.CreateSExtOrTrunc(index, builder.getInt64Ty(), "buffer.index");
}

} // namespace

llvm::Value *BufferAccessor::length() {
  return loadField(BufferLayout::SizeFieldIndex, buffer.layout->sizeType(),
                   "buffer.size");
}

llvm::Value *BufferAccessor::payloadPointer() {
  return loadField(BufferLayout::PointerFieldIndex,
                   llvm::PointerType::get(fn.llvmContext(), 0), "buffer.data");
}

llvm::Value *BufferAccessor::elementAddress(llvm::Value *index) {
  llvm::Value *idx = normalizeIndex(fn.builder(), index);
  if (!idx)
    return nullptr;
  llvm::Value *data = payloadPointer();
  if (!data)
    return nullptr;
  return fn.builder().CreateGEP(buffer.layout->elementStorageType(), data, idx,
                                "buffer.elem.ptr");
}

llvm::Value *BufferAccessor::get(llvm::Value *index) {
  llvm::Value *address = elementAddress(index);
  if (!address)
    return nullptr;
  return fn.builder().CreateLoad(buffer.layout->elementStorageType(), address,
                                 "buffer.elem");
}

bool BufferAccessor::set(llvm::Value *index, llvm::Value *value,
                         const ScalarType &valueType) {
  llvm::Value *stored = emitStoreCoercion(fn.builder(), value, valueType,
                                          buffer.layout->elementType(),
                                          "buffer.store");
  if (!stored)
    return false;
  llvm::Value *address = elementAddress(index);
  if (!address)
    return false;
  fn.builder().CreateStore(stored, address);
  return true;
}

std::optional<unsigned> BufferAccessor::nullFlagField(const char *operation) {
  auto field = buffer.layout->nullFlagFieldIndex();
  if (!field) {
    reportCompilerError(std::string(operation) + " requires a null flag, but '" +
                            buffer.layout->key() + "' has no '" +
                            NullFlagMemberName + "' member",
                        "use the indexed form to test elements");
  }
  return field;
}

std::optional<llvm::APInt> BufferAccessor::nullSentinel(const char *operation) {
  const ScalarType &element = buffer.layout->elementType();
  const std::string key = sentinelKey(buffer.layout->container(), element);
  auto raw = fn.codegen().sentinels().lookup(key);
  if (!raw) {
    reportCompilerError(std::string(operation) + ": no null sentinel configured for '" +
                        key + "'");
    return std::nullopt;
  }
  return sentinelBits(*raw, element.bitWidth);
}

llvm::Value *BufferAccessor::isNull() {
  auto field = nullFlagField("isNull");
  if (!field)
    return nullptr;
  const BufferMember &flag =
      buffer.layout->extraMembers()[*field - BufferLayout::FirstExtraFieldIndex];
  llvm::Value *value = loadField(*field, flag.type.llvmType(fn.llvmContext()),
                                 "buffer.null.flag");
  if (!value)
    return nullptr;
  return fn.builder().CreateICmpNE(
      value, llvm::ConstantInt::get(value->getType(), 0), "buffer.is_null");
}

llvm::Value *BufferAccessor::isNullAt(llvm::Value *index) {
  auto sentinel = nullSentinel("isNullAt");
  if (!sentinel)
    return nullptr;
  llvm::Value *element = get(index);
  if (!element)
    return nullptr;

  llvm::IRBuilder<> &b = fn.builder();
  if (buffer.layout->elementType().isFloat())
    element = b.CreateBitCast(element, b.getIntNTy(sentinel->getBitWidth()),
                              "buffer.elem.bits");
  return b.CreateICmpEQ(element, llvm::ConstantInt::get(fn.llvmContext(), *sentinel),
                        "buffer.elem.is_null");
}

bool BufferAccessor::setNull() {
  auto field = nullFlagField("setNull");
  if (!field)
    return false;
  const BufferMember &flag =
      buffer.layout->extraMembers()[*field - BufferLayout::FirstExtraFieldIndex];
  return storeField(*field,
                    llvm::ConstantInt::get(flag.type.llvmType(fn.llvmContext()), 1));
}

bool BufferAccessor::setNullAt(llvm::Value *index) {
  auto sentinel = nullSentinel("setNullAt");
  if (!sentinel)
    return false;
  const ScalarType &element = buffer.layout->elementType();
  llvm::Constant *bits = llvm::ConstantInt::get(fn.llvmContext(), *sentinel);
  llvm::Constant *value = bits;
  if (element.isFloat())
    value = llvm::ConstantExpr::getBitCast(bits, buffer.layout->elementStorageType());
  return set(index, value, element);
}

// PointerBufferAccessor -------------------------------------------------------

llvm::Value *PointerBufferAccessor::loadField(unsigned fieldIndex,
                                              llvm::Type *type,
                                              const std::string &name) {
  llvm::IRBuilder<> &b = fn.builder();
  llvm::Value *address = b.CreateStructGEP(buffer.layout->structType(),
                                           buffer.value, fieldIndex,
                                           name + ".addr");
  return b.CreateLoad(type, address, name);
}

bool PointerBufferAccessor::storeField(unsigned fieldIndex, llvm::Value *value) {
  llvm::IRBuilder<> &b = fn.builder();
  llvm::Value *address = b.CreateStructGEP(buffer.layout->structType(),
                                           buffer.value, fieldIndex,
                                           "buffer.field.addr");
  b.CreateStore(value, address);
  return true;
}

// LoadedBufferAccessor --------------------------------------------------------

llvm::Value *LoadedBufferAccessor::loadField(unsigned fieldIndex, llvm::Type *,
                                             const std::string &name) {
  return fn.builder().CreateExtractValue(buffer.value, {fieldIndex}, name);
}

bool LoadedBufferAccessor::storeField(unsigned fieldIndex, llvm::Value *value) {
  if (!buffer.storage) {
    reportCompilerError("Cannot update a field of buffer value '" +
                            buffer.layout->key() + "' that has no storage",
                        "keep the buffer in memory or pass it by reference");
    return false;
  }
  llvm::IRBuilder<> &b = fn.builder();
  llvm::Value *address = b.CreateStructGEP(buffer.layout->structType(),
                                           buffer.storage, fieldIndex,
                                           "buffer.field.addr");
  b.CreateStore(value, address);
  buffer.value = b.CreateInsertValue(buffer.value, value, {fieldIndex},
                                     "buffer.updated");
  return true;
}

std::unique_ptr<BufferAccessor> makeBufferAccessor(FunctionBuildContext &fn,
                                                   const BufferHandle &buffer) {
  if (!buffer.isValid()) {
    reportCompilerError("Buffer access on an incomplete buffer value");
    return nullptr;
  }

  switch (buffer.addressing) {
  case BufferAddressing::StructPointer:
    if (!buffer.value->getType()->isPointerTy()) {
      reportCompilerError("Buffer '" + buffer.layout->key() +
                          "' is addressed through a pointer, but its value is not one");
      return nullptr;
    }
    return std::make_unique<PointerBufferAccessor>(fn, buffer);
  case BufferAddressing::LoadedStruct:
    if (buffer.value->getType() != buffer.layout->structType()) {
      reportCompilerError("Buffer value does not have the struct type of '" +
                          buffer.layout->key() + "'");
      return nullptr;
    }
    return std::make_unique<LoadedBufferAccessor>(fn, buffer);
  }
  return nullptr;
}

} // namespace varlen
