// This file implements varlenc, the command-line driver that emits the C ABI
// helpers of the requested buffer types as textual LLVM IR.

#include "buffer/buffer_layout.h"
#include "codegen/buffer_abi.h"
#include "codegen_context.h"
#include "codegen_options.h"
#include "compiler_session.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

#include "llvm/IR/Module.h"
#include "llvm/IR/Verifier.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

namespace {

constexpr const char *DefaultOutputPath = "varlen_buffers.ll";

void printUsage() {
  fprintf(stderr, "Usage: varlenc [options] <Container<elem>>...\n");
  fprintf(stderr, "Options:\n");
  fprintf(stderr, "  -o <file>          Write LLVM IR to <file> (default %s)\n",
          DefaultOutputPath);
  fprintf(stderr, "  -o -               Write LLVM IR to stdout\n");
  fprintf(stderr, "  --module-name <n>  Name of the generated module\n");
  fprintf(stderr, "  --by-value         Pass buffers as struct values\n");
  fprintf(stderr, "  --by-reference     Pass buffers through struct pointers (default)\n");
  fprintf(stderr, "  --prefix <p>       Helper prefix for the next buffer type\n");
  fprintf(stderr, "  --allocate-symbol <s>\n");
  fprintf(stderr, "                     Allocator entry point (default allocate_varlen_buffer)\n");
  fprintf(stderr, "  --release-symbol <s>\n");
  fprintf(stderr, "                     Release entry point (default free)\n");
  fprintf(stderr, "  --failure-symbol <s>\n");
  fprintf(stderr, "                     Allocation failure hook (default varlen_allocation_failed)\n");
  fprintf(stderr, "  --sentinel <key>=<value>\n");
  fprintf(stderr, "                     Override a null sentinel, e.g. Array<int8>=129\n");
  fprintf(stderr, "  --trace-allocations\n");
  fprintf(stderr, "                     Log tracked allocations and releases\n");
  fprintf(stderr, "  --no-leak-warnings Do not warn about buffers that are never freed\n");
  fprintf(stderr, "  --no-verify        Skip verification of generated functions\n");
}

struct BufferRequest {
  std::string typeSpec;
  std::string prefix;
};

bool takeValue(int argc, char **argv, int &i, const std::string &arg,
               std::string &out) {
  if (i + 1 >= argc) {
    fprintf(stderr, "Error: %s requires a value\n", arg.c_str());
    printUsage();
    return false;
  }
  out = argv[++i];
  return true;
}

bool writeModule(llvm::Module &module, const std::string &path) {
  if (path == "-") {
    module.print(llvm::outs(), nullptr);
    return true;
  }
  std::error_code ec;
  llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
  if (ec) {
    fprintf(stderr, "Error: Failed to write LLVM IR to '%s': %s\n",
            path.c_str(), ec.message().c_str());
    return false;
  }
  module.print(out, nullptr);
  return true;
}

} // namespace

int main(int argc, char **argv) {
  varlen::CodegenOptions options = varlen::loadOptionsFromEnvironment();
  std::string outputPath = DefaultOutputPath;
  std::string moduleName = "varlen_buffers";
  std::string pendingPrefix;
  std::vector<BufferRequest> requests;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "-h" || arg == "--help") {
      printUsage();
      return 0;
    } else if (arg == "-o") {
      if (!takeValue(argc, argv, i, arg, outputPath))
        return 1;
    } else if (arg == "--module-name") {
      if (!takeValue(argc, argv, i, arg, moduleName))
        return 1;
    } else if (arg == "--by-value") {
      options.defaultPassing = varlen::BufferPassing::ByValue;
    } else if (arg == "--by-reference") {
      options.defaultPassing = varlen::BufferPassing::ByReference;
    } else if (arg == "--prefix") {
      if (!takeValue(argc, argv, i, arg, pendingPrefix))
        return 1;
    } else if (arg == "--allocate-symbol") {
      if (!takeValue(argc, argv, i, arg, options.allocateSymbol))
        return 1;
    } else if (arg == "--release-symbol") {
      if (!takeValue(argc, argv, i, arg, options.releaseSymbol))
        return 1;
    } else if (arg == "--failure-symbol") {
      if (!takeValue(argc, argv, i, arg, options.allocationFailureSymbol))
        return 1;
    } else if (arg == "--sentinel" || arg.rfind("--sentinel=", 0) == 0) {
      if (arg == "--sentinel") {
        if (!takeValue(argc, argv, i, arg, value))
          return 1;
      } else {
        value = arg.substr(std::strlen("--sentinel="));
      }
      std::string key;
      uint64_t raw = 0;
      if (!varlen::parseSentinelOverride(value, key, raw)) {
        fprintf(stderr, "Error: Invalid value for --sentinel: '%s'\n", value.c_str());
        return 1;
      }
      options.sentinelOverrides[key] = raw;
    } else if (arg == "--trace-allocations") {
      options.traceAllocations = true;
    } else if (arg == "--no-leak-warnings") {
      options.disableLeakWarnings = true;
    } else if (arg == "--no-verify") {
      options.verifyFunctions = false;
    } else if (!arg.empty() && arg[0] == '-') {
      fprintf(stderr, "Error: Unknown option '%s'\n", arg.c_str());
      printUsage();
      return 1;
    } else {
      requests.push_back({arg, pendingPrefix});
      pendingPrefix.clear();
    }
  }

  if (requests.empty()) {
    fprintf(stderr, "Error: No buffer types given\n");
    printUsage();
    return 1;
  }

  CompilerSession session(options);
  ScopedCompilerSession scope(session);
  varlen::CodegenContext &codegen = session.codegen();
  codegen.initializeModule(moduleName);

  bool hadFailure = false;
  for (const BufferRequest &request : requests) {
    auto spec = varlen::parseBufferTypeSpec(request.typeSpec, options.defaultPassing);
    if (!spec) {
      fprintf(stderr, "Error: Cannot parse buffer type '%s'\n",
              request.typeSpec.c_str());
      hadFailure = true;
      continue;
    }
    const varlen::BufferLayout *layout = varlen::deriveBufferLayout(codegen, *spec);
    if (!layout) {
      hadFailure = true;
      continue;
    }
    const std::string prefix =
        request.prefix.empty() ? varlen::defaultAbiPrefix(*layout) : request.prefix;
    if (!varlen::emitBufferAbi(codegen, *layout, prefix))
      hadFailure = true;
  }

  if (hadFailure || session.hadError())
    return 1;

  if (options.verifyFunctions && llvm::verifyModule(*codegen.module, &llvm::errs())) {
    fprintf(stderr, "Error: Generated module failed verification\n");
    return 1;
  }

  return writeModule(*codegen.module, outputPath) ? 0 : 1;
}
