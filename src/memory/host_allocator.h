#ifndef VARLEN_MEMORY_HOST_ALLOCATOR_H
#define VARLEN_MEMORY_HOST_ALLOCATOR_H

#include <string>

#include "llvm/IR/DerivedTypes.h"
#include "llvm/IR/Module.h"

namespace varlen::memory {

/// Entry points generated code calls to obtain and release buffer payloads:
///
///   ptr  allocate(i64 count, i64 elementSize)
///   void release(ptr)
///   void allocationFailed(i64 count, i64 elementSize)   ; does not return
///   void listPush(ptr list, ptr payload)
///   void listDispose(ptr list)
///
/// The list entry points manage a varlen_payload_list {ptr, i64, i64} holding
/// the payloads of a construction that runs repeatedly within one call.
class HostAllocator {
public:
  virtual ~HostAllocator() = default;

  virtual llvm::FunctionCallee allocateFunction(llvm::Module &module) const = 0;
  virtual llvm::FunctionCallee releaseFunction(llvm::Module &module) const = 0;
  virtual llvm::FunctionCallee
  allocationFailureFunction(llvm::Module &module) const = 0;
  virtual llvm::FunctionCallee payloadListPushFunction(llvm::Module &module) const = 0;
  virtual llvm::FunctionCallee
  payloadListDisposeFunction(llvm::Module &module) const = 0;

  /// The in-frame layout of a payload list.
  static llvm::StructType *payloadListType(llvm::LLVMContext &ctx);
};

/// Binds the entry points to external symbols, declared on first use.
class SymbolHostAllocator : public HostAllocator {
public:
  SymbolHostAllocator(std::string allocateSymbol, std::string releaseSymbol,
                      std::string failureSymbol, std::string listPushSymbol,
                      std::string listDisposeSymbol);

  llvm::FunctionCallee allocateFunction(llvm::Module &module) const override;
  llvm::FunctionCallee releaseFunction(llvm::Module &module) const override;
  llvm::FunctionCallee
  allocationFailureFunction(llvm::Module &module) const override;
  llvm::FunctionCallee payloadListPushFunction(llvm::Module &module) const override;
  llvm::FunctionCallee
  payloadListDisposeFunction(llvm::Module &module) const override;

  const std::string &allocateSymbol() const { return allocateName; }
  const std::string &releaseSymbol() const { return releaseName; }

private:
  std::string allocateName;
  std::string releaseName;
  std::string failureName;
  std::string listPushName;
  std::string listDisposeName;
};

} // namespace varlen::memory

#endif // VARLEN_MEMORY_HOST_ALLOCATOR_H
