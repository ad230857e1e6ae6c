#ifndef VARLEN_COMPILER_SESSION_H
#define VARLEN_COMPILER_SESSION_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct SourceLocation {
  std::size_t line = 0;
  std::size_t column = 0;

  constexpr bool isValid() const noexcept { return line != 0; }
};

enum class DiagnosticSeverity { Error, Warning };

struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  SourceLocation location{};
  std::string message;
  std::string hint;
};

namespace varlen {
struct CodegenContext;
struct CodegenOptions;
} // namespace varlen

/// CompilerSession groups the codegen state and the diagnostics produced while
/// lowering buffer operations for one compilation unit.
class CompilerSession {
public:
  CompilerSession();
  explicit CompilerSession(const varlen::CodegenOptions &options);
  ~CompilerSession();

  varlen::CodegenContext &codegen();

  const std::vector<Diagnostic> &diagnostics() const;
  bool hadError() const;
  std::size_t warningCount() const;

  void addDiagnostic(Diagnostic diagnostic);
  void clearDiagnostics();

  /// Location attached to diagnostics reported while it is set. Front ends
  /// update it as they walk their source.
  void setCurrentLocation(SourceLocation loc);
  SourceLocation currentLocation() const;

  void resetAll();

private:
  std::unique_ptr<varlen::CodegenContext> codegenState;
  std::vector<Diagnostic> diagnosticLog;
  SourceLocation location{};
  bool errorSeen = false;
};

/// Session stack management -------------------------------------------------

void pushCompilerSession(CompilerSession &session);
void popCompilerSession();
CompilerSession &currentCompilerSession();
bool hasCompilerSession();

varlen::CodegenContext &currentCodegen();

void reportCompilerError(const std::string &message, std::string_view hint = {});
void reportCompilerWarning(const std::string &message,
                           SourceLocation loc = {},
                           std::string_view hint = {});

/// RAII helper that keeps a session on the stack for the current scope.
class ScopedCompilerSession {
public:
  explicit ScopedCompilerSession(CompilerSession &session) {
    pushCompilerSession(session);
  }
  ~ScopedCompilerSession() { popCompilerSession(); }

  ScopedCompilerSession(const ScopedCompilerSession &) = delete;
  ScopedCompilerSession &operator=(const ScopedCompilerSession &) = delete;
};

#endif // VARLEN_COMPILER_SESSION_H
