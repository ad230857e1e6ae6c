// This file implements the host side of buffer allocation: the allocator
// generated code calls, the failure hook it traps into and the payload lists
// used for constructions inside loops.

#include "varlen_runtime.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace {

void defaultAllocationFailureHandler(int64_t elementCount, int64_t elementSize) {
  std::fprintf(stderr,
               "[varlen-alloc] failed to allocate %lld element(s) of %lld byte(s)\n",
               static_cast<long long>(elementCount),
               static_cast<long long>(elementSize));
}

std::atomic<varlen_allocation_failure_handler> FailureHandler{
    &defaultAllocationFailureHandler};

} // namespace

extern "C" {

void *allocate_varlen_buffer(int64_t element_count, int64_t element_size) {
  if (element_count <= 0 || element_size <= 0)
    return nullptr;
  const auto count = static_cast<std::size_t>(element_count);
  const auto size = static_cast<std::size_t>(element_size);
  if (count > std::numeric_limits<std::size_t>::max() / size)
    return nullptr;
  return std::calloc(count, size);
}

void varlen_allocation_failed(int64_t element_count, int64_t element_size) {
  varlen_allocation_failure_handler handler = FailureHandler.load();
  if (handler)
    handler(element_count, element_size);
  std::abort();
}

void varlen_payload_list_push(varlen_payload_list *list, void *payload) {
  if (!list || !payload)
    return;
  if (list->size == list->capacity) {
    const int64_t capacity = list->capacity > 0 ? list->capacity * 2 : 8;
    if (static_cast<uint64_t>(capacity) >
        std::numeric_limits<std::size_t>::max() / sizeof(void *))
      varlen_allocation_failed(capacity, sizeof(void *));
    void *items = std::realloc(list->items,
                               static_cast<std::size_t>(capacity) * sizeof(void *));
    if (!items)
      varlen_allocation_failed(capacity, sizeof(void *));
    list->items = static_cast<void **>(items);
    list->capacity = capacity;
  }
  list->items[list->size++] = payload;
}

void varlen_payload_list_dispose(varlen_payload_list *list) {
  if (!list)
    return;
  std::free(list->items);
  list->items = nullptr;
  list->size = 0;
  list->capacity = 0;
}

varlen_allocation_failure_handler
varlen_set_allocation_failure_handler(varlen_allocation_failure_handler handler) {
  if (!handler)
    handler = &defaultAllocationFailureHandler;
  return FailureHandler.exchange(handler);
}

} // extern "C"
