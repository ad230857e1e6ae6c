// This file implements the per-function allocation registry and the cleanup
// codegen run by the exit sequence.

#include "memory/allocation_tracker.h"

#include <algorithm>
#include <utility>

#include "memory/host_allocator.h"

#include "llvm/IR/BasicBlock.h"
#include "llvm/IR/Constants.h"
#include "llvm/IR/Function.h"
#include "llvm/IR/Instructions.h"

namespace varlen::memory {

void AllocationTracker::record(llvm::Value *address, AllocationSite site,
                               llvm::Value *slot) {
  if (!address)
    return;
  TrackedAllocation entry;
  entry.address = address;
  entry.slot = slot;
  entry.site = std::move(site);
  allocations.push_back(std::move(entry));
}

bool AllocationTracker::forget(llvm::Value *address) {
  auto it = std::find_if(
      allocations.begin(), allocations.end(),
      [address](const TrackedAllocation &entry) { return entry.address == address; });
  if (it == allocations.end())
    return false;
  allocations.erase(it);
  return true;
}

bool AllocationTracker::collectInto(llvm::Value *address, llvm::Value *list,
                                     llvm::FunctionCallee disposeList) {
  for (TrackedAllocation &entry : allocations) {
    if (entry.address != address)
      continue;
    entry.list = list;
    entry.disposeList = disposeList;
    return true;
  }
  return false;
}

bool AllocationTracker::contains(const llvm::Value *address) const {
  return std::any_of(
      allocations.begin(), allocations.end(),
      [address](const TrackedAllocation &entry) { return entry.address == address; });
}

const TrackedAllocation *
AllocationTracker::find(const llvm::Value *address) const {
  for (const TrackedAllocation &entry : allocations) {
    if (entry.address == address)
      return &entry;
  }
  return nullptr;
}

unsigned AllocationTracker::drainAndFree(llvm::IRBuilder<> &builder,
                                         llvm::FunctionCallee release,
                                         llvm::Value *exceptAddress) {
  if (allocations.empty())
    return 0;

  const bool exceptIsTracked = exceptAddress && contains(exceptAddress);
  const bool guardAtRuntime =
      exceptAddress && !exceptIsTracked &&
      !llvm::isa<llvm::ConstantPointerNull>(exceptAddress);

  llvm::LLVMContext &ctx = builder.getContext();
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);

  unsigned emitted = 0;
  for (const TrackedAllocation &entry : allocations) {
    if (entry.list) {
      llvm::Value *keep = guardAtRuntime ? exceptAddress : nullptr;
      if (exceptIsTracked && entry.address == exceptAddress)
        keep = builder.CreateLoad(voidPtrTy, entry.slot, "buffer.cleanup.kept");
      releaseList(builder, release, entry, keep);
      ++emitted;
      continue;
    }
    if (exceptIsTracked && entry.address == exceptAddress)
      continue;

    llvm::Value *address = entry.address;
    if (entry.slot)
      address = builder.CreateLoad(voidPtrTy, entry.slot, "buffer.cleanup.ptr");

    if (!guardAtRuntime) {
      builder.CreateCall(release, {address});
      ++emitted;
      continue;
    }

    llvm::Function *fn = builder.GetInsertBlock()->getParent();
    llvm::BasicBlock *freeBB =
        llvm::BasicBlock::Create(ctx, "buffer.cleanup.free", fn);
    llvm::BasicBlock *nextBB =
        llvm::BasicBlock::Create(ctx, "buffer.cleanup.next", fn);

    llvm::Value *owned =
        builder.CreateICmpNE(address, exceptAddress, "buffer.cleanup.owned");
    builder.CreateCondBr(owned, freeBB, nextBB);

    builder.SetInsertPoint(freeBB);
    builder.CreateCall(release, {address});
    builder.CreateBr(nextBB);
    ++emitted;

    builder.SetInsertPoint(nextBB);
  }

  allocations.clear();
  return emitted;
}

void AllocationTracker::releaseList(llvm::IRBuilder<> &builder,
                                    llvm::FunctionCallee release,
                                    const TrackedAllocation &entry,
                                    llvm::Value *keep) {
  llvm::LLVMContext &ctx = builder.getContext();
  auto *voidPtrTy = llvm::PointerType::get(ctx, 0);
  llvm::Type *i64 = builder.getInt64Ty();
  llvm::StructType *listTy = HostAllocator::payloadListType(ctx);
  llvm::Function *fn = builder.GetInsertBlock()->getParent();

  llvm::Value *items = builder.CreateLoad(
      voidPtrTy, builder.CreateStructGEP(listTy, entry.list, 0), "buffer.list.items");
  llvm::Value *size = builder.CreateLoad(
      i64, builder.CreateStructGEP(listTy, entry.list, 1), "buffer.list.size");

  llvm::BasicBlock *before = builder.GetInsertBlock();
  llvm::BasicBlock *headBB = llvm::BasicBlock::Create(ctx, "buffer.list.head", fn);
  llvm::BasicBlock *bodyBB = llvm::BasicBlock::Create(ctx, "buffer.list.body", fn);
  llvm::BasicBlock *nextBB = llvm::BasicBlock::Create(ctx, "buffer.list.next", fn);
  llvm::BasicBlock *doneBB = llvm::BasicBlock::Create(ctx, "buffer.list.done", fn);
  builder.CreateBr(headBB);

  builder.SetInsertPoint(headBB);
  llvm::PHINode *index = builder.CreatePHI(i64, 2, "buffer.list.index");
  index->addIncoming(builder.getInt64(0), before);
  builder.CreateCondBr(builder.CreateICmpULT(index, size), bodyBB, doneBB);

  builder.SetInsertPoint(bodyBB);
  llvm::Value *payload = builder.CreateLoad(
      voidPtrTy, builder.CreateGEP(voidPtrTy, items, index), "buffer.list.payload");
  if (keep) {
    llvm::BasicBlock *freeBB =
        llvm::BasicBlock::Create(ctx, "buffer.list.free", fn, nextBB);
    builder.CreateCondBr(builder.CreateICmpNE(payload, keep, "buffer.list.owned"),
                         freeBB, nextBB);
    builder.SetInsertPoint(freeBB);
  }
  builder.CreateCall(release, {payload});
  builder.CreateBr(nextBB);

  builder.SetInsertPoint(nextBB);
  index->addIncoming(builder.CreateAdd(index, builder.getInt64(1)), nextBB);
  builder.CreateBr(headBB);

  builder.SetInsertPoint(doneBB);
  builder.CreateCall(entry.disposeList, {entry.list});
}

} // namespace varlen::memory
