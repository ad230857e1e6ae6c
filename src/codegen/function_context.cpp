// This file implements FunctionBuildContext: entry-block slots, the single
// exit block and the release of tracked payloads on the way out.

#include "codegen/function_context.h"

#include <iterator>
#include <utility>
#include <vector>

#include "llvm/Analysis/CFG.h"
#include "llvm/IR/CFG.h"
#include "llvm/IR/Constants.h"
#include "llvm/IR/Instructions.h"
#include "llvm/IR/Verifier.h"
#include "llvm/Support/raw_ostream.h"

namespace varlen {

namespace {

bool runsRepeatedly(const llvm::BasicBlock *block) {
  for (const llvm::BasicBlock *successor : llvm::successors(block)) {
    if (llvm::isPotentiallyReachable(successor, block))
      return true;
  }
  return false;
}

llvm::StoreInst *slotStore(const memory::TrackedAllocation &entry) {
  for (llvm::User *user : entry.slot->users()) {
    auto *store = llvm::dyn_cast<llvm::StoreInst>(user);
    if (store && store->getValueOperand() == entry.address)
      return store;
  }
  return nullptr;
}

} // namespace

FunctionBuildContext::FunctionBuildContext(CodegenContext &codegen,
                                           llvm::Function *function,
                                           SourceLocation location)
    : codegenState(codegen), fn(function) {
  summary.functionName = fn->getName().str();
  summary.location = location;
  if (fn->empty()) {
    llvm::BasicBlock *entry =
        llvm::BasicBlock::Create(*codegenState.llvmContext, "entry", fn);
    builder().SetInsertPoint(entry);
  }
}

llvm::AllocaInst *FunctionBuildContext::createEntryAlloca(llvm::Type *type,
                                                          const std::string &name) {
  llvm::IRBuilder<> entryBuilder(&fn->getEntryBlock(),
                                 fn->getEntryBlock().begin());
  return entryBuilder.CreateAlloca(type, nullptr, name);
}

unsigned FunctionBuildContext::trackAllocation(llvm::Value *payload,
                                               const memory::AllocationSite &site) {
  auto *ptrTy = llvm::PointerType::get(llvmContext(), 0);
  const std::string base = site.label.empty() ? std::string("buffer") : site.label;

  llvm::AllocaInst *slot = createEntryAlloca(ptrTy, base + ".payload.slot");
  llvm::IRBuilder<> init(slot->getParent(), std::next(slot->getIterator()));
  init.CreateStore(llvm::ConstantPointerNull::get(ptrTy), slot);

  builder().CreateStore(payload, slot);
  tracker.record(payload, site, slot);

  const unsigned id = nextConstructionId++;
  summary.constructions.push_back({id, site.location, site.label});

  if (codegenState.options.traceAllocations) {
    llvm::errs() << "[varlen-alloc] " << summary.functionName
                 << ": tracking construction #" << id;
    if (!site.label.empty())
      llvm::errs() << " (" << site.label << ")";
    llvm::errs() << "\n";
  }
  return id;
}

void FunctionBuildContext::noteFree(const BufferHandle &buffer,
                                    const memory::AllocationSite &site) {
  if (buffer.payload)
    tracker.forget(buffer.payload);
  summary.frees.push_back({buffer.constructionId, site.location, site.label});
}

void FunctionBuildContext::collectRepeatedConstructions() {
  std::vector<std::pair<const memory::TrackedAllocation *, llvm::StoreInst *>> repeated;
  for (const memory::TrackedAllocation &entry : tracker.entries()) {
    if (!entry.slot)
      continue;
    llvm::StoreInst *store = slotStore(entry);
    if (store && runsRepeatedly(store->getParent()))
      repeated.emplace_back(&entry, store);
  }
  if (repeated.empty())
    return;

  const memory::HostAllocator &allocator = codegenState.allocator();
  llvm::FunctionCallee push = allocator.payloadListPushFunction(module());
  llvm::FunctionCallee dispose = allocator.payloadListDisposeFunction(module());
  llvm::StructType *listTy = memory::HostAllocator::payloadListType(llvmContext());

  for (const auto &[entry, store] : repeated) {
    const std::string base =
        entry->site.label.empty() ? std::string("buffer") : entry->site.label;
    llvm::AllocaInst *list = createEntryAlloca(listTy, base + ".payload.list");
    llvm::IRBuilder<> init(list->getParent(), std::next(list->getIterator()));
    init.CreateStore(llvm::ConstantAggregateZero::get(listTy), list);

    llvm::IRBuilder<> after(store->getParent(), std::next(store->getIterator()));
    after.CreateCall(push, {list, entry->address});

    if (codegenState.options.traceAllocations) {
      llvm::errs() << "[varlen-alloc] " << summary.functionName << ": "
                   << base << " is constructed in a loop, collecting its payloads\n";
    }
    tracker.collectInto(entry->address, list, dispose);
  }
}

llvm::BasicBlock *FunctionBuildContext::exitBlock() {
  if (!exit) {
    exit = llvm::BasicBlock::Create(llvmContext(), "function.exit");
    llvm::Type *retTy = fn->getReturnType();
    if (!retTy->isVoidTy() && !returnValueSlot)
      returnValueSlot = createEntryAlloca(retTy, "retval.slot");
  }
  return exit;
}

bool FunctionBuildContext::emitReturn(llvm::Value *value) {
  const std::string where = "In function '" + summary.functionName + "': ";
  if (done) {
    reportCompilerError(where + "return emitted after the function was finalized");
    return false;
  }
  if (!builder().GetInsertBlock()) {
    reportCompilerError(where + "return emitted without an insertion point");
    return false;
  }

  llvm::Type *retTy = fn->getReturnType();
  if (retTy->isVoidTy()) {
    if (value) {
      reportCompilerError(where + "void function cannot return a value");
      return false;
    }
  } else {
    if (!value) {
      reportCompilerError(where + "missing return value");
      return false;
    }
    if (value->getType() != retTy) {
      reportCompilerError(where + "return value does not match the function's return type");
      return false;
    }
  }

  llvm::BasicBlock *exitBB = exitBlock();
  if (value)
    builder().CreateStore(value, returnValueSlot);
  builder().CreateBr(exitBB);
  builder().ClearInsertionPoint();
  ++plainReturns;
  return true;
}

bool FunctionBuildContext::emitBufferReturn(const BufferHandle &buffer,
                                            llvm::Value *slot) {
  const std::string where = "In function '" + summary.functionName + "': ";
  if (done) {
    reportCompilerError(where + "return emitted after the function was finalized");
    return false;
  }
  if (!buffer.isValid() || !slot) {
    reportCompilerError(where + "buffer return needs a buffer and a result slot");
    return false;
  }
  if (!builder().GetInsertBlock()) {
    reportCompilerError(where + "return emitted without an insertion point");
    return false;
  }
  if (!fn->getReturnType()->isVoidTy()) {
    reportCompilerError(where + "buffers are returned through the result slot",
                        "declare the function as returning void");
    return false;
  }
  if (resultSlot && (resultSlot != slot || resultLayout != buffer.layout)) {
    reportCompilerError(where + "every buffer return must use the same result slot and layout");
    return false;
  }

  llvm::IRBuilder<> &b = builder();
  llvm::StructType *structTy = buffer.layout->structType();
  llvm::Value *aggregate = buffer.value;
  if (buffer.addressing == BufferAddressing::StructPointer)
    aggregate = b.CreateLoad(structTy, buffer.value, "buffer.result");
  b.CreateStore(aggregate, slot);

  resultSlot = slot;
  resultLayout = buffer.layout;
  returnedPayload = bufferReturns == 0 ? buffer.payload : nullptr;
  ++bufferReturns;

  if (buffer.constructionId)
    summary.returnedConstructions.push_back(*buffer.constructionId);
  else
    summary.returnsUnknownBuffer = true;

  b.CreateBr(exitBlock());
  b.ClearInsertionPoint();
  return true;
}

llvm::Value *FunctionBuildContext::returnedPayloadForDrain() {
  if (!resultSlot)
    return nullptr;
  if (bufferReturns == 1 && returnedPayload)
    return returnedPayload;

  // Several return sites: compare against what the caller will receive.
  llvm::IRBuilder<> &b = builder();
  llvm::Value *field = b.CreateStructGEP(resultLayout->structType(), resultSlot,
                                         BufferLayout::PointerFieldIndex,
                                         "buffer.result.ptr.addr");
  return b.CreateLoad(llvm::PointerType::get(llvmContext(), 0), field,
                      "buffer.result.ptr");
}

bool FunctionBuildContext::finalize() {
  const std::string where = "In function '" + summary.functionName + "': ";
  if (done) {
    reportCompilerError(where + "function was already finalized");
    return false;
  }

  llvm::IRBuilder<> &b = builder();
  llvm::BasicBlock *current = b.GetInsertBlock();
  if (current && current->getParent() == fn && !current->getTerminator()) {
    if (!fn->getReturnType()->isVoidTy()) {
      reportCompilerError(where + "control reaches the end of a non-void function");
      return false;
    }
    if (bufferReturns > 0) {
      reportCompilerError(where + "control reaches the end without returning a buffer");
      return false;
    }
    if (!emitReturn())
      return false;
  }
  if (plainReturns > 0 && bufferReturns > 0) {
    reportCompilerError(where + "function mixes buffer returns with plain returns");
    return false;
  }

  collectRepeatedConstructions();

  llvm::BasicBlock *exitBB = exitBlock();
  exitBB->insertInto(fn);
  b.SetInsertPoint(exitBB);

  const std::size_t tracked = tracker.size();
  llvm::Value *keep = returnedPayloadForDrain();
  const unsigned released = tracker.drainAndFree(
      b, codegenState.allocator().releaseFunction(module()), keep);

  if (codegenState.options.traceAllocations) {
    llvm::errs() << "[varlen-alloc] " << summary.functionName << ": "
                 << released << " release(s) emitted for " << tracked
                 << " tracked payload(s)";
    if (keep)
      llvm::errs() << ", returned payload kept";
    llvm::errs() << "\n";
  }

  llvm::Type *retTy = fn->getReturnType();
  if (retTy->isVoidTy())
    b.CreateRetVoid();
  else
    b.CreateRet(b.CreateLoad(retTy, returnValueSlot, "retval"));
  b.ClearInsertionPoint();
  done = true;

  if (auto *consumer = codegenState.bufferUsageConsumer())
    consumer->consume(summary);

  if (codegenState.options.verifyFunctions) {
    std::string message;
    llvm::raw_string_ostream os(message);
    if (llvm::verifyFunction(*fn, &os)) {
      os.flush();
      reportCompilerError(where + "generated IR failed verification: " + message);
      return false;
    }
  }
  return true;
}

} // namespace varlen
