#ifndef VARLEN_CODEGEN_BUFFER_ABI_H
#define VARLEN_CODEGEN_BUFFER_ABI_H

#include <string>

#include "buffer/buffer_layout.h"
#include "codegen_context.h"
#include "types/scalar_type.h"

namespace varlen {

/// Scalar type element values travel as across the C ABI: 64-bit integers
/// keeping the element's signedness, double, or a one-bit boolean.
ScalarType abiValueType(const ScalarType &element);

/// "array_int32" for Array<int32>.
std::string defaultAbiPrefix(const BufferLayout &layout);

/// Emit externally visible helpers operating on one buffer type. Buffers are
/// always passed to them by pointer; by-value layouts are loaded first.
///
///   void <p>_new(i64 count, ptr out)
///   i64  <p>_len(ptr buf)
///   T    <p>_get(ptr buf, i64 index)         ; T = i64 | double | i8 (bool)
///   void <p>_set(ptr buf, i64 index, T value)  ; T = i64 | double | i1
///   i8   <p>_is_null(ptr buf)                 ; layouts with a null flag
///   i8   <p>_is_null_at(ptr buf, i64 index)
///   void <p>_set_null(ptr buf)                ; layouts with a null flag
///   void <p>_set_null_at(ptr buf, i64 index)
///   void <p>_free(ptr buf)
///
/// Returns false if any helper could not be generated.
bool emitBufferAbi(CodegenContext &context, const BufferLayout &layout,
                   const std::string &prefix);

} // namespace varlen

#endif // VARLEN_CODEGEN_BUFFER_ABI_H
