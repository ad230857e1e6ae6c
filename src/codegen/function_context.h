#ifndef VARLEN_CODEGEN_FUNCTION_CONTEXT_H
#define VARLEN_CODEGEN_FUNCTION_CONTEXT_H

#include <optional>
#include <string>

#include "analysis/missing_free.h"
#include "codegen/buffer_value.h"
#include "codegen_context.h"
#include "compiler_session.h"
#include "memory/allocation_tracker.h"

#include "llvm/IR/Function.h"
#include "llvm/IR/IRBuilder.h"

namespace varlen {

/// Build state of one generated function. It owns the payload allocations the
/// function made and routes every return through a single exit block, where
/// finalize() releases them.
///
/// After emitReturn/emitBufferReturn the builder has no insertion point; the
/// caller positions it before emitting more code.
class FunctionBuildContext {
public:
  FunctionBuildContext(CodegenContext &codegen, llvm::Function *function,
                       SourceLocation location = {});

  FunctionBuildContext(const FunctionBuildContext &) = delete;
  FunctionBuildContext &operator=(const FunctionBuildContext &) = delete;

  CodegenContext &codegen() { return codegenState; }
  llvm::IRBuilder<> &builder() { return *codegenState.builder; }
  llvm::LLVMContext &llvmContext() { return *codegenState.llvmContext; }
  llvm::Module &module() { return *codegenState.module; }
  llvm::Function *function() const { return fn; }

  memory::AllocationTracker &allocations() { return tracker; }
  const analysis::BufferUsageSummary &usage() const { return summary; }

  llvm::AllocaInst *createEntryAlloca(llvm::Type *type, const std::string &name);

  /// Track a payload produced by this function. The address is mirrored into a
  /// null-initialised entry slot so the exit sequence may release it on every
  /// path. A construction that finalize() finds on a cycle of the CFG also
  /// appends each payload to a payload list, and the exit sequence releases
  /// all of them. Returns the construction id used by the usage summary.
  unsigned trackAllocation(llvm::Value *payload, const memory::AllocationSite &site);

  /// Account for an explicit release emitted by the caller. The payload stops
  /// being tracked, so a free on only some paths leaves the others to leak.
  void noteFree(const BufferHandle &buffer, const memory::AllocationSite &site);

  bool emitReturn(llvm::Value *value = nullptr);

  /// Copy buffer into resultSlot (a pointer to the caller's result struct) and
  /// leave through the exit block. The payload is handed to the caller and
  /// excluded from the exit drain.
  bool emitBufferReturn(const BufferHandle &buffer, llvm::Value *resultSlot);

  /// Emit the exit block, run the usage consumer and verify the function.
  /// A function whose current block is still open returns void implicitly.
  bool finalize();
  bool finalized() const { return done; }

private:
  llvm::BasicBlock *exitBlock();
  void collectRepeatedConstructions();
  llvm::Value *returnedPayloadForDrain();

  CodegenContext &codegenState;
  llvm::Function *fn;
  memory::AllocationTracker tracker;
  analysis::BufferUsageSummary summary;
  unsigned nextConstructionId = 0;

  llvm::BasicBlock *exit = nullptr;
  llvm::AllocaInst *returnValueSlot = nullptr;
  llvm::Value *resultSlot = nullptr;
  const BufferLayout *resultLayout = nullptr;
  llvm::Value *returnedPayload = nullptr;
  unsigned plainReturns = 0;
  unsigned bufferReturns = 0;
  bool done = false;
};

} // namespace varlen

#endif // VARLEN_CODEGEN_FUNCTION_CONTEXT_H
