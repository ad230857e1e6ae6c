#ifndef VARLEN_BUFFER_NULL_SENTINELS_H
#define VARLEN_BUFFER_NULL_SENTINELS_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "types/scalar_type.h"

#include "llvm/ADT/APInt.h"

namespace varlen {

/// Per-target table of reserved "null" bit patterns, keyed by
/// "<Container><<element>>" (e.g. "Array<int8>"). Values arrive as raw
/// unsigned patterns; they are reinterpreted at the element width.
class NullSentinelTable {
public:
  virtual ~NullSentinelTable() = default;

  virtual std::optional<uint64_t> lookup(std::string_view key) const = 0;
};

class StaticNullSentinelTable : public NullSentinelTable {
public:
  StaticNullSentinelTable() = default;

  std::optional<uint64_t> lookup(std::string_view key) const override;

  void set(std::string key, uint64_t rawValue);
  bool erase(std::string_view key);
  std::size_t size() const { return entries.size(); }

private:
  std::map<std::string, uint64_t, std::less<>> entries;
};

/// Sentinels following the OmniSciDB conventions for Array and Column of the
/// signed integer, boolean and floating point element types.
std::unique_ptr<StaticNullSentinelTable> makeDefaultNullSentinelTable();

std::string sentinelKey(std::string_view container, const ScalarType &element);

/// Reinterpret a raw unsigned sentinel at the given width. A value of 129 at
/// width 8 is the bit pattern of -127.
llvm::APInt sentinelBits(uint64_t rawValue, unsigned bitWidth);

} // namespace varlen

#endif // VARLEN_BUFFER_NULL_SENTINELS_H
