#ifndef VARLEN_CODEGEN_BUFFER_ACCESS_H
#define VARLEN_CODEGEN_BUFFER_ACCESS_H

#include <memory>
#include <optional>
#include <string>

#include "codegen/buffer_value.h"
#include "codegen/function_context.h"
#include "types/scalar_type.h"

#include "llvm/ADT/APInt.h"
#include "llvm/IR/Value.h"

namespace varlen {

/// Element and null-state operations on one buffer value. Indices may be of
/// any integer width; they are brought to i64. Nothing is bounds checked.
///
/// Failures are reported through the compiler session; value-producing
/// operations then return nullptr and the others return false.
class BufferAccessor {
public:
  virtual ~BufferAccessor() = default;

  const BufferHandle &handle() const { return buffer; }

  /// Element count as i64.
  llvm::Value *length();
  llvm::Value *payloadPointer();

  llvm::Value *get(llvm::Value *index);
  bool set(llvm::Value *index, llvm::Value *value, const ScalarType &valueType);

  /// Whole-buffer null flag as i1.
  llvm::Value *isNull();
  /// Whether element index holds the null sentinel, as i1.
  llvm::Value *isNullAt(llvm::Value *index);
  bool setNull();
  bool setNullAt(llvm::Value *index);

protected:
  BufferAccessor(FunctionBuildContext &fn, BufferHandle handle)
      : fn(fn), buffer(std::move(handle)) {}

  virtual llvm::Value *loadField(unsigned fieldIndex, llvm::Type *type,
                                 const std::string &name) = 0;
  virtual bool storeField(unsigned fieldIndex, llvm::Value *value) = 0;

  FunctionBuildContext &fn;
  BufferHandle buffer;

private:
  llvm::Value *elementAddress(llvm::Value *index);
  std::optional<unsigned> nullFlagField(const char *operation);
  std::optional<llvm::APInt> nullSentinel(const char *operation);
};

/// Buffer reached through a pointer to its struct.
class PointerBufferAccessor final : public BufferAccessor {
public:
  PointerBufferAccessor(FunctionBuildContext &fn, BufferHandle handle)
      : BufferAccessor(fn, std::move(handle)) {}

protected:
  llvm::Value *loadField(unsigned fieldIndex, llvm::Type *type,
                         const std::string &name) override;
  bool storeField(unsigned fieldIndex, llvm::Value *value) override;
};

/// Buffer held as a first-class struct value. Field stores update the value
/// seen by later operations of this accessor and, when the struct was loaded
/// from memory, write through to that storage.
class LoadedBufferAccessor final : public BufferAccessor {
public:
  LoadedBufferAccessor(FunctionBuildContext &fn, BufferHandle handle)
      : BufferAccessor(fn, std::move(handle)) {}

protected:
  llvm::Value *loadField(unsigned fieldIndex, llvm::Type *type,
                         const std::string &name) override;
  bool storeField(unsigned fieldIndex, llvm::Value *value) override;
};

/// Pick the accessor matching the handle's addressing mode. Returns nullptr
/// (after reporting) when the handle's value does not fit that mode.
std::unique_ptr<BufferAccessor> makeBufferAccessor(FunctionBuildContext &fn,
                                                   const BufferHandle &buffer);

} // namespace varlen

#endif // VARLEN_CODEGEN_BUFFER_ACCESS_H
