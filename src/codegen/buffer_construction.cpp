// This file implements buffer construction through the host allocator and the
// explicit free operation.

#include "codegen/buffer_construction.h"

#include "codegen/buffer_access.h"

#include "llvm/IR/Constants.h"
#include "llvm/Support/raw_ostream.h"

namespace varlen {

std::optional<BufferHandle>
emitBufferConstruction(FunctionBuildContext &fn, const BufferLayout &layout,
                       llvm::Value *count, const memory::AllocationSite &site) {
  if (!count || !count->getType()->isIntegerTy()) {
    reportCompilerError("Element count of '" + layout.key() +
                        "' must be an integer");
    return std::nullopt;
  }

  llvm::IRBuilder<> &b = fn.builder();
  if (!b.GetInsertBlock()) {
    reportCompilerError("Buffer construction emitted without an insertion point");
    return std::nullopt;
  }

  llvm::LLVMContext &ctx = fn.llvmContext();
  llvm::Module &module = fn.module();
  const memory::HostAllocator &allocator = fn.codegen().allocator();
  const std::string label = site.label.empty() ? std::string("buffer") : site.label;

  llvm::Type *i64 = b.getInt64Ty();
  llvm::Value *elementCount = b.CreateZExtOrTrunc(count, i64, label + ".count");
  llvm::Value *elementSize =
      llvm::ConstantInt::get(i64, layout.elementType().byteWidth());

  llvm::Value *payload = b.CreateCall(allocator.allocateFunction(module),
                                      {elementCount, elementSize},
                                      label + ".payload");

  // A null payload is only valid for an empty request.
  auto *ptrTy = llvm::PointerType::get(ctx, 0);
  llvm::Value *noPayload = b.CreateICmpEQ(
      payload, llvm::ConstantPointerNull::get(ptrTy), label + ".alloc.null");
  llvm::Value *nonEmpty = b.CreateICmpNE(
      elementCount, llvm::ConstantInt::get(i64, 0), label + ".alloc.nonempty");
  llvm::Value *failed = b.CreateAnd(noPayload, nonEmpty, label + ".alloc.failed");

  llvm::Function *parent = b.GetInsertBlock()->getParent();
  llvm::BasicBlock *failBB =
      llvm::BasicBlock::Create(ctx, label + ".alloc.fail", parent);
  llvm::BasicBlock *okBB = llvm::BasicBlock::Create(ctx, label + ".alloc.ok", parent);
  b.CreateCondBr(failed, failBB, okBB);

  b.SetInsertPoint(failBB);
  b.CreateCall(allocator.allocationFailureFunction(module),
               {elementCount, elementSize});
  b.CreateUnreachable();

  b.SetInsertPoint(okBB);
  const unsigned constructionId = fn.trackAllocation(payload, site);

  llvm::StructType *structTy = layout.structType();
  llvm::AllocaInst *storage = fn.createEntryAlloca(structTy, label + ".struct");

  auto fieldAddress = [&](unsigned index, const std::string &name) {
    return b.CreateStructGEP(structTy, storage, index, label + "." + name + ".addr");
  };

  b.CreateStore(payload, fieldAddress(BufferLayout::PointerFieldIndex, "ptr"));
  b.CreateStore(elementCount, fieldAddress(BufferLayout::SizeFieldIndex, "sz"));

  const auto nullFlag = layout.nullFlagFieldIndex();
  for (const BufferMember &member : layout.extraMembers()) {
    llvm::Type *memberTy = member.type.llvmType(ctx);
    llvm::Value *initial = llvm::Constant::getNullValue(memberTy);
    if (nullFlag && member.fieldIndex == *nullFlag) {
      llvm::Value *empty = b.CreateICmpEQ(
          elementCount, llvm::ConstantInt::get(i64, 0), label + ".empty");
      initial = b.CreateZExt(empty, memberTy, label + ".is_null");
    }
    b.CreateStore(initial, fieldAddress(member.fieldIndex, member.name));
  }

  BufferHandle handle;
  if (layout.passedByValue()) {
    handle = BufferHandle::fromLoaded(
        layout, b.CreateLoad(structTy, storage, label + ".value"));
  } else {
    handle = BufferHandle::fromPointer(layout, storage);
  }
  handle.payload = payload;
  handle.constructionId = constructionId;
  return handle;
}

bool emitBufferFree(FunctionBuildContext &fn, const BufferHandle &buffer,
                    const memory::AllocationSite &site) {
  auto accessor = makeBufferAccessor(fn, buffer);
  if (!accessor)
    return false;
  llvm::Value *data = accessor->payloadPointer();
  if (!data)
    return false;

  fn.builder().CreateCall(fn.codegen().allocator().releaseFunction(fn.module()),
                          {data});
  fn.noteFree(buffer, site);

  if (fn.codegen().options.traceAllocations) {
    llvm::errs() << "[varlen-alloc] " << fn.usage().functionName
                 << ": explicit free of " << buffer.layout->key();
    if (buffer.constructionId)
      llvm::errs() << " (construction #" << *buffer.constructionId << ")";
    llvm::errs() << "\n";
  }
  return true;
}

} // namespace varlen
