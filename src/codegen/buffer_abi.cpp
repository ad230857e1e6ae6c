// This file emits the C ABI helpers exported for each buffer type. They are
// ordinary generated functions: construction, access and release go through
// the same codegen the front end uses.

#include "codegen/buffer_abi.h"

#include <cctype>
#include <functional>
#include <vector>

#include "buffer/null_sentinels.h"
#include "codegen/buffer_access.h"
#include "codegen/buffer_construction.h"
#include "codegen/function_context.h"

#include "llvm/IR/Function.h"
#include "llvm/Support/raw_ostream.h"

namespace varlen {

namespace {

class AbiEmitter {
public:
  AbiEmitter(CodegenContext &context, const BufferLayout &layout,
             const std::string &prefix)
      : context(context), layout(layout), prefix(prefix),
        ctx(*context.llvmContext), ptrTy(llvm::PointerType::get(ctx, 0)),
        i64(llvm::Type::getInt64Ty(ctx)), i8(llvm::Type::getInt8Ty(ctx)),
        voidTy(llvm::Type::getVoidTy(ctx)) {}

  bool emitAll();

private:
  using Body = std::function<bool(FunctionBuildContext &, llvm::Function *)>;

  bool emit(const std::string &suffix, llvm::Type *result,
            std::vector<llvm::Type *> params, std::vector<const char *> names,
            const Body &body);

  bool emitFree();
  BufferHandle handleFor(FunctionBuildContext &fn, llvm::Value *buffer);
  llvm::Type *getResultType() const;
  llvm::Value *promote(llvm::IRBuilder<> &builder, llvm::Value *element) const;

  CodegenContext &context;
  const BufferLayout &layout;
  std::string prefix;
  llvm::LLVMContext &ctx;
  llvm::PointerType *ptrTy;
  llvm::Type *i64;
  llvm::Type *i8;
  llvm::Type *voidTy;
};

bool AbiEmitter::emit(const std::string &suffix, llvm::Type *result,
                      std::vector<llvm::Type *> params,
                      std::vector<const char *> names, const Body &body) {
  const std::string name = prefix + "_" + suffix;
  llvm::Module &module = *context.module;
  if (module.getFunction(name)) {
    reportCompilerError("Function '" + name + "' is already defined",
                        "choose a different prefix for '" + layout.key() + "'");
    return false;
  }

  auto *fnType = llvm::FunctionType::get(result, params, false);
  llvm::Function *function = llvm::Function::Create(
      fnType, llvm::Function::ExternalLinkage, name, module);
  unsigned idx = 0;
  for (auto &arg : function->args())
    arg.setName(names[idx++]);

  FunctionBuildContext fn(context, function);
  if (body(fn, function) && fn.finalize())
    return true;
  function->eraseFromParent();
  return false;
}

BufferHandle AbiEmitter::handleFor(FunctionBuildContext &fn, llvm::Value *buffer) {
  if (!layout.passedByValue())
    return BufferHandle::fromPointer(layout, buffer);
  return BufferHandle::fromLoaded(
      layout, fn.builder().CreateLoad(layout.structType(), buffer, "buf.value"));
}

llvm::Type *AbiEmitter::getResultType() const {
  const ScalarType &element = layout.elementType();
  if (element.isBoolean())
    return i8;
  return llvmTypeFor(ctx, abiValueType(element));
}

llvm::Value *AbiEmitter::promote(llvm::IRBuilder<> &builder,
                                 llvm::Value *element) const {
  const ScalarType &type = layout.elementType();
  if (type.isBoolean()) {
    llvm::Value *set = builder.CreateICmpNE(
        element, llvm::ConstantInt::get(element->getType(), 0), "elem.bool");
    return builder.CreateZExt(set, i8, "elem.byte");
  }
  if (type.isFloat())
    return builder.CreateFPExt(element, builder.getDoubleTy(), "elem.wide");
  if (type.isSigned())
    return builder.CreateSExtOrTrunc(element, i64, "elem.wide");
  return builder.CreateZExtOrTrunc(element, i64, "elem.wide");
}

bool AbiEmitter::emitAll() {
  bool ok = true;
  const ScalarType valueType = abiValueType(layout.elementType());
  llvm::Type *valueTy = llvmTypeFor(ctx, valueType);

  ok &= emit("new", voidTy, {i64, ptrTy}, {"count", "out"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               auto buffer = emitBufferConstruction(fn, layout, f->getArg(0),
                                                    {{}, "buf"});
               return buffer && fn.emitBufferReturn(*buffer, f->getArg(1));
             });

  ok &= emitFree();

  ok &= emit("len", i64, {ptrTy}, {"buf"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
               llvm::Value *length = accessor ? accessor->length() : nullptr;
               return length && fn.emitReturn(length);
             });

  ok &= emit("get", getResultType(), {ptrTy, i64}, {"buf", "index"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
               llvm::Value *element = accessor ? accessor->get(f->getArg(1)) : nullptr;
               return element && fn.emitReturn(promote(fn.builder(), element));
             });

  ok &= emit("set", voidTy, {ptrTy, i64, valueTy}, {"buf", "index", "value"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
               return accessor &&
                      accessor->set(f->getArg(1), f->getArg(2), valueType) &&
                      fn.emitReturn();
             });

  if (layout.hasNullFlag()) {
    ok &= emit("is_null", i8, {ptrTy}, {"buf"},
               [&](FunctionBuildContext &fn, llvm::Function *f) {
                 auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
                 llvm::Value *isNull = accessor ? accessor->isNull() : nullptr;
                 return isNull &&
                        fn.emitReturn(fn.builder().CreateZExt(isNull, i8, "result"));
               });

    ok &= emit("set_null", voidTy, {ptrTy}, {"buf"},
               [&](FunctionBuildContext &fn, llvm::Function *f) {
                 auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
                 return accessor && accessor->setNull() && fn.emitReturn();
               });
  }

  // Element-level null helpers need a sentinel for the element type.
  const bool hasSentinel =
      context.sentinels()
          .lookup(sentinelKey(layout.container(), layout.elementType()))
          .has_value();
  if (!hasSentinel)
    return ok;

  ok &= emit("is_null_at", i8, {ptrTy, i64}, {"buf", "index"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
               llvm::Value *isNull =
                   accessor ? accessor->isNullAt(f->getArg(1)) : nullptr;
               return isNull &&
                      fn.emitReturn(fn.builder().CreateZExt(isNull, i8, "result"));
             });

  ok &= emit("set_null_at", voidTy, {ptrTy, i64}, {"buf", "index"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               auto accessor = makeBufferAccessor(fn, handleFor(fn, f->getArg(0)));
               return accessor && accessor->setNullAt(f->getArg(1)) &&
                      fn.emitReturn();
             });

  return ok;
}

bool AbiEmitter::emitFree() {
  return emit("free", voidTy, {ptrTy}, {"buf"},
             [&](FunctionBuildContext &fn, llvm::Function *f) {
               return emitBufferFree(fn, handleFor(fn, f->getArg(0)),
                                     {{}, "buf"}) &&
                      fn.emitReturn();
             });
}

} // namespace

ScalarType abiValueType(const ScalarType &element) {
  if (element.isFloat())
    return ScalarType::floating(64);
  if (element.isBoolean())
    return ScalarType::boolean(1);
  if (element.isSigned())
    return ScalarType::signedInt(64);
  return ScalarType::unsignedInt(64);
}

std::string defaultAbiPrefix(const BufferLayout &layout) {
  std::string prefix;
  for (char c : layout.container())
    prefix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return prefix + "_" + layout.elementType().name();
}

bool emitBufferAbi(CodegenContext &context, const BufferLayout &layout,
                   const std::string &prefix) {
  if (!context.hasModule()) {
    reportCompilerError("Cannot emit helpers for '" + layout.key() +
                        "' without a module");
    return false;
  }
  if (context.options.traceAllocations)
    llvm::errs() << "[varlen-alloc] emitting helpers '" << prefix << "_*' for "
                 << layout.key() << "\n";
  AbiEmitter emitter(context, layout, prefix);
  return emitter.emitAll();
}

} // namespace varlen
