#ifndef VARLEN_MEMORY_ALLOCATION_TRACKER_H
#define VARLEN_MEMORY_ALLOCATION_TRACKER_H

#include <cstddef>
#include <string>
#include <vector>

#include "compiler_session.h"

#include "llvm/IR/IRBuilder.h"
#include "llvm/IR/Value.h"

namespace varlen::memory {

struct AllocationSite {
  SourceLocation location{};
  std::string label;
};

struct TrackedAllocation {
  llvm::Value *address = nullptr;
  /// Entry-block stack slot holding the address (null until the allocation
  /// runs). Cleanup loads from it, so the release is valid on paths where the
  /// allocation was never reached.
  llvm::Value *slot = nullptr;
  /// Set for a construction that may run several times per call: a
  /// varlen_payload_list receiving every payload, and the callee that frees
  /// the list's storage once it has been walked.
  llvm::Value *list = nullptr;
  llvm::FunctionCallee disposeList;
  AllocationSite site;
};

/// Registry of the payload allocations a single function build context has
/// generated. Entries are appended by buffer construction, removed by explicit
/// frees and released in bulk by the function's exit sequence.
class AllocationTracker {
public:
  AllocationTracker() = default;

  void record(llvm::Value *address, AllocationSite site = {},
              llvm::Value *slot = nullptr);

  /// Drop the entry for address after the caller emitted its own release.
  /// Returns false when the address was not tracked.
  bool forget(llvm::Value *address);

  /// Release every payload collected in list instead of only the one in the
  /// entry's slot. Returns false when the address was not tracked.
  bool collectInto(llvm::Value *address, llvm::Value *list,
                   llvm::FunctionCallee disposeList);

  bool contains(const llvm::Value *address) const;
  const TrackedAllocation *find(const llvm::Value *address) const;
  const std::vector<TrackedAllocation> &entries() const { return allocations; }
  std::size_t size() const { return allocations.size(); }
  bool empty() const { return allocations.empty(); }

  /// Emit a release call for every tracked address except exceptAddress, then
  /// clear the registry including the excluded slot; ownership of that payload
  /// passes to the caller. An excluded value that is itself tracked is skipped
  /// at compile time. Any other non-null exceptAddress is a runtime value, so
  /// each release is guarded by a pointer comparison against it. Entries with
  /// a payload list are walked in a loop; the excluded payload of such an
  /// entry is the latest one, read back from its slot.
  ///
  /// Returns the number of release call sites emitted.
  unsigned drainAndFree(llvm::IRBuilder<> &builder, llvm::FunctionCallee release,
                        llvm::Value *exceptAddress = nullptr);

  void clear() { allocations.clear(); }

private:
  void releaseList(llvm::IRBuilder<> &builder, llvm::FunctionCallee release,
                   const TrackedAllocation &entry, llvm::Value *keep);

  std::vector<TrackedAllocation> allocations;
};

} // namespace varlen::memory

#endif // VARLEN_MEMORY_ALLOCATION_TRACKER_H
