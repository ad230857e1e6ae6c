#ifndef VARLEN_CODEGEN_BUFFER_VALUE_H
#define VARLEN_CODEGEN_BUFFER_VALUE_H

#include <optional>

#include "buffer/buffer_layout.h"

#include "llvm/IR/Instructions.h"
#include "llvm/IR/Value.h"

namespace varlen {

/// How a buffer value reached the code being generated.
///
/// StructPointer: a pointer to the {ptr, sz, ...} struct (parameters, results
/// and buffers constructed by reference).
/// LoadedStruct: the struct as a first-class value (by-value buffers). When it
/// was produced by a load, the address it came from is kept as storage.
enum class BufferAddressing { StructPointer, LoadedStruct };

struct BufferHandle {
  const BufferLayout *layout = nullptr;
  llvm::Value *value = nullptr;
  BufferAddressing addressing = BufferAddressing::StructPointer;
  llvm::Value *storage = nullptr;
  /// Payload allocation tracked by the current function, when it constructed
  /// this buffer.
  llvm::Value *payload = nullptr;
  std::optional<unsigned> constructionId;

  bool isValid() const { return layout && value; }

  static BufferHandle fromPointer(const BufferLayout &layout, llvm::Value *ptr) {
    BufferHandle handle;
    handle.layout = &layout;
    handle.value = ptr;
    handle.addressing = BufferAddressing::StructPointer;
    return handle;
  }

  static BufferHandle fromLoaded(const BufferLayout &layout, llvm::Value *value) {
    BufferHandle handle;
    handle.layout = &layout;
    handle.value = value;
    handle.addressing = BufferAddressing::LoadedStruct;
    if (auto *load = llvm::dyn_cast<llvm::LoadInst>(value))
      handle.storage = load->getPointerOperand();
    return handle;
  }
};

} // namespace varlen

#endif // VARLEN_CODEGEN_BUFFER_VALUE_H
