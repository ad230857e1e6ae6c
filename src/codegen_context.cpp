// This file implements CodegenContext setup and the lazily created default
// collaborators.

#include "codegen_context.h"

#include "analysis/missing_free.h"

#include "llvm/Config/llvm-config.h"

namespace varlen {

CodegenContext::CodegenContext() = default;

CodegenContext::~CodegenContext() = default;

void CodegenContext::initializeModule(const std::string &moduleName) {
  layoutCache.clear();
  builder.reset();
  module.reset();
  llvmContext = std::make_unique<llvm::LLVMContext>();
#if LLVM_VERSION_MAJOR < 15
  llvmContext->enableOpaquePointers();
#endif
  module = std::make_unique<llvm::Module>(moduleName, *llvmContext);
  builder = std::make_unique<llvm::IRBuilder<>>(*llvmContext);
}

GeneratedModule CodegenContext::releaseModule() {
  GeneratedModule result;
  layoutCache.clear();
  builder.reset();
  result.module = std::move(module);
  result.llvmContext = std::move(llvmContext);
  return result;
}

const TypeDescriptorResolver &CodegenContext::resolver() {
  if (!typeResolver)
    typeResolver = std::make_unique<DefaultTypeDescriptorResolver>();
  return *typeResolver;
}

const NullSentinelTable &CodegenContext::sentinels() {
  if (!nullSentinels) {
    auto table = makeDefaultNullSentinelTable();
    for (const auto &[key, value] : options.sentinelOverrides)
      table->set(key, value);
    nullSentinels = std::move(table);
  }
  return *nullSentinels;
}

const memory::HostAllocator &CodegenContext::allocator() {
  if (!hostAllocator)
    hostAllocator = std::make_unique<memory::SymbolHostAllocator>(
        options.allocateSymbol, options.releaseSymbol,
        options.allocationFailureSymbol, options.payloadListPushSymbol,
        options.payloadListDisposeSymbol);
  return *hostAllocator;
}

analysis::BufferUsageConsumer *CodegenContext::bufferUsageConsumer() {
  if (!usageConsumer && !options.disableLeakWarnings)
    usageConsumer = std::make_unique<analysis::MissingFreeChecker>();
  return usageConsumer.get();
}

void CodegenContext::reset() {
  layoutCache.clear();
  builder.reset();
  module.reset();
  llvmContext.reset();
  typeResolver.reset();
  nullSentinels.reset();
  hostAllocator.reset();
  usageConsumer.reset();
}

} // namespace varlen
