#ifndef VARLEN_BUFFER_BUFFER_LAYOUT_H
#define VARLEN_BUFFER_BUFFER_LAYOUT_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegen_options.h"
#include "types/scalar_type.h"

#include "llvm/IR/DerivedTypes.h"
#include "llvm/IR/LLVMContext.h"

namespace varlen {

struct CodegenContext;

struct MemberDecl {
  std::string name;
  std::string typeSpec;
};

/// Request for a buffer layout: the container name, its type arguments (one
/// element type is required) and the members stored after {ptr, sz}.
struct BufferTypeSpec {
  std::string container = "Array";
  std::vector<std::string> typeArguments;
  std::vector<MemberDecl> extraMembers;
  BufferPassing passing = BufferPassing::ByReference;
};

struct BufferMember {
  std::string name;
  TypeDescriptor type;
  unsigned fieldIndex = 0;
};

/// Derived, immutable description of
///
///   struct Buffer { T *ptr; uint64_t sz; <extra members...> };
///
/// Downstream code addresses the fields positionally, so the pointer is always
/// field 0, the size field 1 and extras follow in declaration order.
class BufferLayout {
public:
  static constexpr unsigned PointerFieldIndex = 0;
  static constexpr unsigned SizeFieldIndex = 1;
  static constexpr unsigned FirstExtraFieldIndex = 2;

  BufferLayout(std::string container, ScalarType elementType,
               std::vector<BufferMember> extraMembers, BufferPassing passing,
               llvm::StructType *structType, llvm::Type *elementStorageType);

  const std::string &container() const { return containerName; }
  const ScalarType &elementType() const { return element; }
  const std::vector<BufferMember> &extraMembers() const { return extras; }
  BufferPassing passing() const { return passingMode; }
  bool passedByValue() const { return passingMode == BufferPassing::ByValue; }

  llvm::StructType *structType() const { return structTy; }
  llvm::Type *elementStorageType() const { return elementTy; }
  llvm::Type *sizeType() const;

  /// Type used for parameters and returns: the struct itself when passed by
  /// value, otherwise a pointer to it.
  llvm::Type *valueType() const;

  std::optional<unsigned> nullFlagFieldIndex() const;
  bool hasNullFlag() const { return nullFlagFieldIndex().has_value(); }
  const BufferMember *findMember(std::string_view name) const;

  /// "Array<int32>"; also the key of the sentinel table.
  std::string key() const;
  /// Includes extras and passing mode; identifies the layout in the cache.
  std::string cacheKey() const;

private:
  std::string containerName;
  ScalarType element;
  std::vector<BufferMember> extras;
  BufferPassing passingMode;
  llvm::StructType *structTy;
  llvm::Type *elementTy;
};

inline constexpr const char *NullFlagMemberName = "is_null";

/// Extra members a known container carries: Array has the null flag, Column
/// has nothing beyond {ptr, sz}.
std::vector<MemberDecl> conventionalExtraMembers(std::string_view container);

BufferTypeSpec arrayBufferSpec(std::string elementType,
                               BufferPassing passing = BufferPassing::ByReference);
BufferTypeSpec columnBufferSpec(std::string elementType,
                                BufferPassing passing = BufferPassing::ByReference);

/// Parse "Container<arg, ...>". Extras are the container's conventional ones.
std::optional<BufferTypeSpec>
parseBufferTypeSpec(std::string_view text,
                    BufferPassing passing = BufferPassing::ByReference);

/// Derive (or fetch from the context cache) the layout for spec. Reports a
/// configuration error and returns nullptr for malformed requests.
const BufferLayout *deriveBufferLayout(CodegenContext &context,
                                       const BufferTypeSpec &spec);

} // namespace varlen

#endif // VARLEN_BUFFER_BUFFER_LAYOUT_H
