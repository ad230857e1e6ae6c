#ifndef VARLEN_RUNTIME_H
#define VARLEN_RUNTIME_H

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
#define VARLEN_STATIC_ASSERT static_assert
#else
#include <stddef.h>
#include <stdint.h>
#define VARLEN_STATIC_ASSERT _Static_assert
#endif

/* Memory image of the buffer structs generated code works with. Array
 * buffers carry the whole-buffer null flag, Column buffers do not. */
typedef struct varlen_array_header {
  void *ptr;
  uint64_t sz;
  int8_t is_null;
} varlen_array_header;

typedef struct varlen_column_header {
  void *ptr;
  uint64_t sz;
} varlen_column_header;

VARLEN_STATIC_ASSERT(offsetof(varlen_array_header, ptr) == 0,
                     "Buffer payload pointer must be the first field");
VARLEN_STATIC_ASSERT(offsetof(varlen_array_header, sz) == sizeof(void *),
                     "Buffer size must follow the payload pointer");
VARLEN_STATIC_ASSERT(offsetof(varlen_array_header, is_null) ==
                         sizeof(void *) + sizeof(uint64_t),
                     "Null flag must follow the size field");
VARLEN_STATIC_ASSERT(sizeof(varlen_column_header) ==
                         sizeof(void *) + sizeof(uint64_t),
                     "Column header must be {ptr, sz}");

/* Payloads allocated by a construction that may run more than once per call
 * (inside a loop). Generated code keeps one list per such construction in its
 * frame, zero-initialised, and walks it on function exit. */
typedef struct varlen_payload_list {
  void **items;
  int64_t size;
  int64_t capacity;
} varlen_payload_list;

VARLEN_STATIC_ASSERT(sizeof(varlen_payload_list) ==
                         sizeof(void *) + 2 * sizeof(int64_t),
                     "Payload list must be {ptr, i64, i64}");

typedef void (*varlen_allocation_failure_handler)(int64_t element_count,
                                                  int64_t element_size);

#ifdef __cplusplus
extern "C" {
#endif

/* Zero-filled storage for element_count elements of element_size bytes.
 * Returns NULL for an empty request and when the byte count overflows or the
 * system allocator fails. Release with free(). */
void *allocate_varlen_buffer(int64_t element_count, int64_t element_size);

/* Called by generated code when allocate_varlen_buffer failed for a non-empty
 * request. Runs the installed handler and then aborts. */
void varlen_allocation_failed(int64_t element_count, int64_t element_size);

/* Append payload to list, growing its storage. NULL payloads are ignored.
 * Failing to grow the list is reported through varlen_allocation_failed. */
void varlen_payload_list_push(varlen_payload_list *list, void *payload);

/* Release the list's own storage and reset it. The payloads are untouched. */
void varlen_payload_list_dispose(varlen_payload_list *list);

/* Install a handler for allocation failures; NULL restores the default, which
 * prints a message to stderr. Returns the previous handler. */
varlen_allocation_failure_handler
varlen_set_allocation_failure_handler(varlen_allocation_failure_handler handler);

#ifdef __cplusplus
}
#endif

#endif /* VARLEN_RUNTIME_H */
