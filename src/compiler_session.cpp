// This file implements compiler session management and the diagnostic
// reporting used by the buffer lowering code.

#include "compiler_session.h"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "codegen_context.h"
#include "codegen_options.h"

namespace {
thread_local std::vector<CompilerSession *> SessionStack;

std::string formatDiagnostic(const char *label, SourceLocation loc,
                             const std::string &message) {
  std::ostringstream oss;
  oss << label;
  if (loc.isValid()) {
    oss << " at line " << loc.line << ", column " << loc.column;
  }
  oss << ": " << message;
  return oss.str();
}
} // namespace

// CompilerSession -------------------------------------------------------------

CompilerSession::CompilerSession()
    : CompilerSession(varlen::loadOptionsFromEnvironment()) {}

CompilerSession::CompilerSession(const varlen::CodegenOptions &options)
    : codegenState(std::make_unique<varlen::CodegenContext>()) {
  codegenState->options = options;
}

CompilerSession::~CompilerSession() = default;

varlen::CodegenContext &CompilerSession::codegen() { return *codegenState; }

const std::vector<Diagnostic> &CompilerSession::diagnostics() const {
  return diagnosticLog;
}

bool CompilerSession::hadError() const { return errorSeen; }

std::size_t CompilerSession::warningCount() const {
  std::size_t count = 0;
  for (const auto &diag : diagnosticLog) {
    if (diag.severity == DiagnosticSeverity::Warning)
      ++count;
  }
  return count;
}

void CompilerSession::addDiagnostic(Diagnostic diagnostic) {
  if (diagnostic.severity == DiagnosticSeverity::Error)
    errorSeen = true;
  diagnosticLog.push_back(std::move(diagnostic));
}

void CompilerSession::clearDiagnostics() {
  diagnosticLog.clear();
  errorSeen = false;
}

void CompilerSession::setCurrentLocation(SourceLocation loc) { location = loc; }

SourceLocation CompilerSession::currentLocation() const { return location; }

void CompilerSession::resetAll() {
  const varlen::CodegenOptions preserved = codegenState->options;
  codegenState->reset();
  codegenState->options = preserved;
  clearDiagnostics();
  location = {};
}

// Session stack helpers --------------------------------------------------------

void pushCompilerSession(CompilerSession &session) {
  SessionStack.push_back(&session);
}

void popCompilerSession() {
  if (SessionStack.empty())
    throw std::runtime_error("No active compiler session to pop");
  SessionStack.pop_back();
}

CompilerSession &currentCompilerSession() {
  if (SessionStack.empty())
    throw std::runtime_error("No active compiler session");
  return *SessionStack.back();
}

bool hasCompilerSession() { return !SessionStack.empty(); }

varlen::CodegenContext &currentCodegen() {
  return currentCompilerSession().codegen();
}

void reportCompilerError(const std::string &message, std::string_view hint) {
  SourceLocation loc{};
  if (hasCompilerSession())
    loc = currentCompilerSession().currentLocation();

  std::string formatted = formatDiagnostic("Error", loc, message);
  fprintf(stderr, "%s\n", formatted.c_str());

  if (!hint.empty()) {
    fprintf(stderr, "  hint: %.*s\n", static_cast<int>(hint.size()), hint.data());
  }

  if (hasCompilerSession()) {
    currentCompilerSession().addDiagnostic(
        {DiagnosticSeverity::Error, loc, message, std::string(hint)});
  }
}

void reportCompilerWarning(const std::string &message, SourceLocation loc,
                           std::string_view hint) {
  if (!loc.isValid() && hasCompilerSession())
    loc = currentCompilerSession().currentLocation();

  std::string formatted = formatDiagnostic("Warning", loc, message);
  fprintf(stderr, "%s\n", formatted.c_str());

  if (!hint.empty()) {
    fprintf(stderr, "  hint: %.*s\n", static_cast<int>(hint.size()), hint.data());
  }

  if (hasCompilerSession()) {
    currentCompilerSession().addDiagnostic(
        {DiagnosticSeverity::Warning, loc, message, std::string(hint)});
  }
}
