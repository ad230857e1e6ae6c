#ifndef VARLEN_CODEGEN_BUFFER_CONSTRUCTION_H
#define VARLEN_CODEGEN_BUFFER_CONSTRUCTION_H

#include <optional>

#include "buffer/buffer_layout.h"
#include "codegen/buffer_value.h"
#include "codegen/function_context.h"
#include "memory/allocation_tracker.h"

#include "llvm/IR/Value.h"

namespace varlen {

/// Allocate a payload of count elements through the host allocator and build
/// the buffer struct around it:
///
///   ptr     = allocate(zext(count), sizeof(element))   ; traps on failure
///   sz      = zext(count)
///   is_null = (count == 0)                              ; when the layout has it
///
/// Other extra members start zeroed. The payload is tracked by fn, so the exit
/// sequence releases it unless it is freed or returned. By-reference layouts
/// yield a struct-pointer handle, by-value layouts a loaded struct.
std::optional<BufferHandle>
emitBufferConstruction(FunctionBuildContext &fn, const BufferLayout &layout,
                       llvm::Value *count, const memory::AllocationSite &site = {});

/// Release the payload of buffer now. When fn constructed it, the exit
/// sequence will not release it again.
bool emitBufferFree(FunctionBuildContext &fn, const BufferHandle &buffer,
                    const memory::AllocationSite &site = {});

} // namespace varlen

#endif // VARLEN_CODEGEN_BUFFER_CONSTRUCTION_H
