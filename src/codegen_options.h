#ifndef VARLEN_CODEGEN_OPTIONS_H
#define VARLEN_CODEGEN_OPTIONS_H

#include <cstdint>
#include <map>
#include <string>

namespace varlen {

enum class BufferPassing { ByReference, ByValue };

struct CodegenOptions {
  std::string allocateSymbol = "allocate_varlen_buffer";
  std::string releaseSymbol = "free";
  std::string allocationFailureSymbol = "varlen_allocation_failed";
  std::string payloadListPushSymbol = "varlen_payload_list_push";
  std::string payloadListDisposeSymbol = "varlen_payload_list_dispose";
  BufferPassing defaultPassing = BufferPassing::ByReference;
  bool traceAllocations = false;
  bool disableLeakWarnings = false;
  bool verifyFunctions = true;
  /// Per-key overrides layered over the default sentinel table, e.g.
  /// {"Array<int8>", 129}.
  std::map<std::string, uint64_t> sentinelOverrides;
};

/// Build options from the VARLEN_* environment variables on top of the
/// defaults.
CodegenOptions loadOptionsFromEnvironment();

/// Interpret an environment switch value. Unset is false, an empty value is
/// true, and "0", "false" and "off" (any case) are false.
bool parseEnvironmentSwitch(const char *value);

/// Parse "KEY=VALUE" where VALUE is decimal or 0x-prefixed hexadecimal.
bool parseSentinelOverride(const std::string &text, std::string &key,
                           uint64_t &value);

} // namespace varlen

#endif // VARLEN_CODEGEN_OPTIONS_H
