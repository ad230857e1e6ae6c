// This file implements the null sentinel table and the default sentinel
// values.

#include "buffer/null_sentinels.h"

#include <cfloat>
#include <cstring>
#include <limits>
#include <type_traits>

namespace varlen {

namespace {

uint64_t floatBits(float value) {
  uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  return bits;
}

uint64_t doubleBits(double value) {
  uint64_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  return bits;
}

template <typename T> uint64_t minimumBits(int offset) {
  using Unsigned = std::make_unsigned_t<T>;
  return static_cast<Unsigned>(
      static_cast<T>(std::numeric_limits<T>::min() + offset));
}

void setContainerDefaults(StaticNullSentinelTable &table, const char *container,
                          int intOffset, int floatScale) {
  table.set(sentinelKey(container, ScalarType::signedInt(8)),
            minimumBits<int8_t>(intOffset));
  table.set(sentinelKey(container, ScalarType::signedInt(16)),
            minimumBits<int16_t>(intOffset));
  table.set(sentinelKey(container, ScalarType::signedInt(32)),
            minimumBits<int32_t>(intOffset));
  table.set(sentinelKey(container, ScalarType::signedInt(64)),
            minimumBits<int64_t>(intOffset));
  table.set(sentinelKey(container, ScalarType::boolean()),
            minimumBits<int8_t>(intOffset));
  table.set(sentinelKey(container, ScalarType::floating(32)),
            floatBits(static_cast<float>(floatScale) * FLT_MIN));
  table.set(sentinelKey(container, ScalarType::floating(64)),
            doubleBits(static_cast<double>(floatScale) * DBL_MIN));
}

} // namespace

std::optional<uint64_t>
StaticNullSentinelTable::lookup(std::string_view key) const {
  auto it = entries.find(key);
  if (it == entries.end())
    return std::nullopt;
  return it->second;
}

void StaticNullSentinelTable::set(std::string key, uint64_t rawValue) {
  entries[std::move(key)] = rawValue;
}

bool StaticNullSentinelTable::erase(std::string_view key) {
  auto it = entries.find(key);
  if (it == entries.end())
    return false;
  entries.erase(it);
  return true;
}

std::unique_ptr<StaticNullSentinelTable> makeDefaultNullSentinelTable() {
  auto table = std::make_unique<StaticNullSentinelTable>();
  // Array elements use OmniSciDB's NULL_ARRAY_* values (min + 1, 2 * FLT_MIN);
  // column elements use the plain NULL_* values.
  setContainerDefaults(*table, "Array", 1, 2);
  setContainerDefaults(*table, "Column", 0, 1);
  return table;
}

std::string sentinelKey(std::string_view container, const ScalarType &element) {
  std::string key(container);
  key += '<';
  key += element.name();
  key += '>';
  return key;
}

llvm::APInt sentinelBits(uint64_t rawValue, unsigned bitWidth) {
  return llvm::APInt(64, rawValue).zextOrTrunc(bitWidth);
}

} // namespace varlen
