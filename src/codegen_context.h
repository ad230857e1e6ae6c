#ifndef VARLEN_CODEGEN_CONTEXT_H
#define VARLEN_CODEGEN_CONTEXT_H

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "buffer/buffer_layout.h"
#include "buffer/null_sentinels.h"
#include "codegen_options.h"
#include "memory/host_allocator.h"
#include "types/scalar_type.h"

#include "llvm/IR/IRBuilder.h"
#include "llvm/IR/LLVMContext.h"
#include "llvm/IR/Module.h"

namespace varlen {

namespace analysis {
class BufferUsageConsumer;
} // namespace analysis

struct GeneratedModule {
  std::unique_ptr<llvm::LLVMContext> llvmContext;
  std::unique_ptr<llvm::Module> module;
};

/// CodegenContext stores the IR-generation state shared by every function
/// lowered in one module: the LLVM objects, the layout cache and the external
/// collaborators (sentinel table, host allocator, type resolver, usage
/// consumer). Each context is used by one thread at a time.
struct CodegenContext {
  std::unique_ptr<llvm::LLVMContext> llvmContext;
  std::unique_ptr<llvm::Module> module;
  std::unique_ptr<llvm::IRBuilder<>> builder;
  CodegenOptions options;

  std::map<std::string, std::unique_ptr<BufferLayout>> layoutCache;

  std::unique_ptr<TypeDescriptorResolver> typeResolver;
  std::unique_ptr<NullSentinelTable> nullSentinels;
  std::unique_ptr<memory::HostAllocator> hostAllocator;
  std::unique_ptr<analysis::BufferUsageConsumer> usageConsumer;

  CodegenContext();
  ~CodegenContext();

  CodegenContext(const CodegenContext &) = delete;
  CodegenContext &operator=(const CodegenContext &) = delete;

  /// Create a fresh LLVM context, module and builder. Previously derived
  /// layouts belong to the old context and are dropped.
  void initializeModule(const std::string &moduleName);
  bool hasModule() const { return module != nullptr; }

  /// Hand the module (with the context that owns its types) to the caller,
  /// e.g. to add it to a JIT. The codegen context is left without a module.
  GeneratedModule releaseModule();

  const TypeDescriptorResolver &resolver();
  const NullSentinelTable &sentinels();
  const memory::HostAllocator &allocator();
  analysis::BufferUsageConsumer *bufferUsageConsumer();

  void reset();
};

} // namespace varlen

#endif // VARLEN_CODEGEN_CONTEXT_H
