// This file implements the symbol-based host allocator used by buffer
// construction and cleanup codegen.

#include "memory/host_allocator.h"

#include <utility>

#include "llvm/IR/Attributes.h"
#include "llvm/IR/Function.h"

namespace varlen::memory {

SymbolHostAllocator::SymbolHostAllocator(std::string allocateSymbol,
                                         std::string releaseSymbol,
                                         std::string failureSymbol,
                                         std::string listPushSymbol,
                                         std::string listDisposeSymbol)
    : allocateName(std::move(allocateSymbol)),
      releaseName(std::move(releaseSymbol)),
      failureName(std::move(failureSymbol)),
      listPushName(std::move(listPushSymbol)),
      listDisposeName(std::move(listDisposeSymbol)) {}

llvm::StructType *HostAllocator::payloadListType(llvm::LLVMContext &ctx) {
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);
  auto *sizeTy = llvm::Type::getInt64Ty(ctx);
  return llvm::StructType::get(ctx, {voidPtrTy, sizeTy, sizeTy});
}

llvm::FunctionCallee
SymbolHostAllocator::allocateFunction(llvm::Module &module) const {
  llvm::LLVMContext &ctx = module.getContext();
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);
  auto *sizeTy = llvm::Type::getInt64Ty(ctx);
  auto *fnType = llvm::FunctionType::get(voidPtrTy, {sizeTy, sizeTy}, false);
  return module.getOrInsertFunction(allocateName, fnType);
}

llvm::FunctionCallee
SymbolHostAllocator::releaseFunction(llvm::Module &module) const {
  llvm::LLVMContext &ctx = module.getContext();
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);
  auto *fnType =
      llvm::FunctionType::get(llvm::Type::getVoidTy(ctx), {voidPtrTy}, false);
  return module.getOrInsertFunction(releaseName, fnType);
}

llvm::FunctionCallee
SymbolHostAllocator::allocationFailureFunction(llvm::Module &module) const {
  llvm::LLVMContext &ctx = module.getContext();
  auto *sizeTy = llvm::Type::getInt64Ty(ctx);
  auto *fnType = llvm::FunctionType::get(llvm::Type::getVoidTy(ctx),
                                         {sizeTy, sizeTy}, false);
  llvm::FunctionCallee callee = module.getOrInsertFunction(failureName, fnType);
  if (auto *fn = llvm::dyn_cast<llvm::Function>(callee.getCallee()))
    fn->setDoesNotReturn();
  return callee;
}

llvm::FunctionCallee
SymbolHostAllocator::payloadListPushFunction(llvm::Module &module) const {
  llvm::LLVMContext &ctx = module.getContext();
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);
  auto *fnType = llvm::FunctionType::get(llvm::Type::getVoidTy(ctx),
                                         {voidPtrTy, voidPtrTy}, false);
  return module.getOrInsertFunction(listPushName, fnType);
}

llvm::FunctionCallee
SymbolHostAllocator::payloadListDisposeFunction(llvm::Module &module) const {
  llvm::LLVMContext &ctx = module.getContext();
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);
  auto *fnType =
      llvm::FunctionType::get(llvm::Type::getVoidTy(ctx), {voidPtrTy}, false);
  return module.getOrInsertFunction(listDisposeName, fnType);
}

} // namespace varlen::memory
