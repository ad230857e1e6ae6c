// This file implements buffer layout derivation: validating a buffer type
// request, resolving its element and extra members, and caching the result.

#include "buffer/buffer_layout.h"

#include <utility>

#include "buffer/null_sentinels.h"
#include "codegen_context.h"
#include "compiler_session.h"

namespace varlen {

namespace {

std::string_view trimSpaces(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
    text.remove_prefix(1);
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
    text.remove_suffix(1);
  return text;
}

/// Split a type argument list at top-level commas ("int32, Array<int8>").
std::optional<std::vector<std::string>> splitTypeArguments(std::string_view text) {
  std::vector<std::string> args;
  int depth = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '<') {
      ++depth;
    } else if (c == '>') {
      if (--depth < 0)
        return std::nullopt;
    } else if (c == ',' && depth == 0) {
      args.emplace_back(trimSpaces(text.substr(start, i - start)));
      start = i + 1;
    }
  }
  if (depth != 0)
    return std::nullopt;
  std::string_view tail = trimSpaces(text.substr(start));
  if (!tail.empty() || !args.empty())
    args.emplace_back(tail);
  return args;
}

std::string composeCacheKey(const std::string &container,
                            const ScalarType &element,
                            const std::vector<BufferMember> &members,
                            BufferPassing passing) {
  std::string key = sentinelKey(container, element);
  key += '{';
  for (std::size_t i = 0; i < members.size(); ++i) {
    if (i)
      key += ',';
    key += members[i].name;
    key += ':';
    key += members[i].type.name();
  }
  key += '}';
  if (passing == BufferPassing::ByValue)
    key += "/byval";
  return key;
}

} // namespace

BufferLayout::BufferLayout(std::string container, ScalarType elementType,
                           std::vector<BufferMember> extraMembers,
                           BufferPassing passing, llvm::StructType *structType,
                           llvm::Type *elementStorageType)
    : containerName(std::move(container)), element(elementType),
      extras(std::move(extraMembers)), passingMode(passing),
      structTy(structType), elementTy(elementStorageType) {}

llvm::Type *BufferLayout::sizeType() const {
  return structTy->getElementType(SizeFieldIndex);
}

llvm::Type *BufferLayout::valueType() const {
  if (passedByValue())
    return structTy;
  return llvm::PointerType::get(structTy->getContext(), 0);
}

std::optional<unsigned> BufferLayout::nullFlagFieldIndex() const {
  for (const auto &member : extras) {
    if (member.name != NullFlagMemberName || !member.type.scalar)
      continue;
    if (member.type.scalar->isIntegral() && member.type.scalar->bitWidth == 8)
      return member.fieldIndex;
  }
  return std::nullopt;
}

const BufferMember *BufferLayout::findMember(std::string_view name) const {
  for (const auto &member : extras) {
    if (member.name == name)
      return &member;
  }
  return nullptr;
}

std::string BufferLayout::key() const {
  return sentinelKey(containerName, element);
}

std::string BufferLayout::cacheKey() const {
  return composeCacheKey(containerName, element, extras, passingMode);
}

std::vector<MemberDecl> conventionalExtraMembers(std::string_view container) {
  if (container == "Array")
    return {{NullFlagMemberName, "int8"}};
  return {};
}

BufferTypeSpec arrayBufferSpec(std::string elementType, BufferPassing passing) {
  BufferTypeSpec spec;
  spec.container = "Array";
  spec.typeArguments.push_back(std::move(elementType));
  spec.extraMembers = conventionalExtraMembers(spec.container);
  spec.passing = passing;
  return spec;
}

BufferTypeSpec columnBufferSpec(std::string elementType, BufferPassing passing) {
  BufferTypeSpec spec;
  spec.container = "Column";
  spec.typeArguments.push_back(std::move(elementType));
  spec.extraMembers = conventionalExtraMembers(spec.container);
  spec.passing = passing;
  return spec;
}

std::optional<BufferTypeSpec> parseBufferTypeSpec(std::string_view text,
                                                  BufferPassing passing) {
  text = trimSpaces(text);
  std::size_t open = text.find('<');
  if (open == std::string_view::npos || open == 0 || text.back() != '>')
    return std::nullopt;

  auto args = splitTypeArguments(text.substr(open + 1, text.size() - open - 2));
  if (!args)
    return std::nullopt;

  BufferTypeSpec spec;
  spec.container = std::string(trimSpaces(text.substr(0, open)));
  spec.typeArguments = std::move(*args);
  spec.extraMembers = conventionalExtraMembers(spec.container);
  spec.passing = passing;
  return spec;
}

const BufferLayout *deriveBufferLayout(CodegenContext &context,
                                       const BufferTypeSpec &spec) {
  if (!context.llvmContext) {
    reportCompilerError("Internal error: buffer layout requested without an "
                        "active LLVM context");
    return nullptr;
  }

  if (spec.container.empty()) {
    reportCompilerError("Buffer type is missing a container name");
    return nullptr;
  }

  if (spec.typeArguments.size() != 1) {
    reportCompilerError(
        "Buffer type '" + spec.container + "' expects exactly one element "
            "type argument, got " + std::to_string(spec.typeArguments.size()),
        "write the element type as e.g. " + spec.container + "<int32>");
    return nullptr;
  }

  const std::string &elementSpec = spec.typeArguments.front();
  std::optional<ScalarType> element = scalarTypeFromName(elementSpec);
  if (!element) {
    reportCompilerError("Unknown buffer element type '" + elementSpec + "' in '" +
                        spec.container + "'");
    return nullptr;
  }

  llvm::LLVMContext &llvmCtx = *context.llvmContext;
  llvm::Type *elementTy = llvmTypeFor(llvmCtx, *element);
  if (!elementTy) {
    reportCompilerError("Unsupported buffer element type '" + elementSpec + "'");
    return nullptr;
  }

  std::vector<BufferMember> members;
  members.reserve(spec.extraMembers.size());
  for (const auto &decl : spec.extraMembers) {
    if (decl.name.empty()) {
      reportCompilerError("Extra member of '" + spec.container +
                          "' is missing a name");
      return nullptr;
    }
    for (const auto &existing : members) {
      if (existing.name == decl.name) {
        reportCompilerError("Duplicate extra member '" + decl.name + "' in '" +
                            spec.container + "'");
        return nullptr;
      }
    }
    if (decl.name == "ptr" || decl.name == "sz") {
      reportCompilerError("Extra member '" + decl.name + "' of '" +
                          spec.container + "' collides with a builtin field");
      return nullptr;
    }

    auto resolved = context.resolver().resolve(context, decl.typeSpec);
    if (!resolved) {
      reportCompilerError("Cannot resolve type '" + decl.typeSpec +
                          "' of extra member '" + decl.name + "' in '" +
                          spec.container + "'");
      return nullptr;
    }

    BufferMember member;
    member.name = decl.name;
    member.type = *resolved;
    member.fieldIndex =
        BufferLayout::FirstExtraFieldIndex + static_cast<unsigned>(members.size());
    members.push_back(std::move(member));
  }

  std::string key = composeCacheKey(spec.container, *element, members, spec.passing);
  auto cached = context.layoutCache.find(key);
  if (cached != context.layoutCache.end())
    return cached->second.get();

  std::vector<llvm::Type *> fields;
  fields.reserve(BufferLayout::FirstExtraFieldIndex + members.size());
  fields.push_back(llvm::PointerType::get(llvmCtx, 0));
  fields.push_back(llvm::Type::getInt64Ty(llvmCtx));
  for (const auto &member : members)
    fields.push_back(member.type.llvmType(llvmCtx));

  llvm::StructType *structTy = llvm::StructType::get(llvmCtx, fields);

  auto layout = std::make_unique<BufferLayout>(spec.container, *element,
                                               std::move(members), spec.passing,
                                               structTy, elementTy);
  const BufferLayout *result = layout.get();
  context.layoutCache.emplace(std::move(key), std::move(layout));
  return result;
}

} // namespace varlen
