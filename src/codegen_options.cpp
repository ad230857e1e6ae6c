// This file implements loading of codegen options from the environment.

#include "codegen_options.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace varlen {

bool parseEnvironmentSwitch(const char *value) {
  if (!value)
    return false;
  while (std::isspace(static_cast<unsigned char>(*value)))
    ++value;
  if (*value == '\0')
    return true;

  std::string lowered;
  lowered.reserve(std::strlen(value));
  for (const char *ptr = value; *ptr; ++ptr)
    lowered.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(*ptr))));

  if (lowered == "0" || lowered == "false" || lowered == "off")
    return false;
  return true;
}

bool parseSentinelOverride(const std::string &text, std::string &key,
                           uint64_t &value) {
  std::size_t eq = text.rfind('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == text.size())
    return false;

  std::string number = text.substr(eq + 1);
  int base = 10;
  if (number.size() > 2 && number[0] == '0' &&
      (number[1] == 'x' || number[1] == 'X')) {
    base = 16;
    number = number.substr(2);
  }

  // strtoull accepts leading blanks and a sign; neither is a valid raw value.
  const auto lead = static_cast<unsigned char>(number[0]);
  if (base == 16 ? !std::isxdigit(lead) : !std::isdigit(lead))
    return false;

  char *end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(number.c_str(), &end, base);
  if (errno != 0 || end == number.c_str() || *end != '\0')
    return false;

  key = text.substr(0, eq);
  value = static_cast<uint64_t>(parsed);
  return true;
}

CodegenOptions loadOptionsFromEnvironment() {
  CodegenOptions options;
  options.traceAllocations =
      parseEnvironmentSwitch(std::getenv("VARLEN_TRACE_ALLOCATIONS"));
  options.disableLeakWarnings =
      parseEnvironmentSwitch(std::getenv("VARLEN_DISABLE_LEAK_WARNINGS"));

  if (const char *sym = std::getenv("VARLEN_ALLOCATE_SYMBOL"); sym && *sym)
    options.allocateSymbol = sym;
  if (const char *sym = std::getenv("VARLEN_RELEASE_SYMBOL"); sym && *sym)
    options.releaseSymbol = sym;
  return options;
}

} // namespace varlen
