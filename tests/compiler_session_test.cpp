#include "compiler_session.h"

#include <stdexcept>

#include <gtest/gtest.h>

#include "codegen_context.h"
#include "codegen_options.h"

TEST(CompilerSessionTest, ScopedSessionsNest) {
  ASSERT_FALSE(hasCompilerSession());
  CompilerSession outer(varlen::CodegenOptions{});
  CompilerSession inner(varlen::CodegenOptions{});
  {
    ScopedCompilerSession outerScope(outer);
    EXPECT_EQ(&currentCompilerSession(), &outer);
    {
      ScopedCompilerSession innerScope(inner);
      EXPECT_EQ(&currentCompilerSession(), &inner);
      EXPECT_EQ(&currentCodegen(), &inner.codegen());
    }
    EXPECT_EQ(&currentCompilerSession(), &outer);
  }
  EXPECT_FALSE(hasCompilerSession());
}

TEST(CompilerSessionTest, EmptyStackThrows) {
  ASSERT_FALSE(hasCompilerSession());
  EXPECT_THROW(popCompilerSession(), std::runtime_error);
  EXPECT_THROW(currentCompilerSession(), std::runtime_error);
  EXPECT_THROW(currentCodegen(), std::runtime_error);
}

TEST(CompilerSessionTest, DiagnosticsAreRecordedOnTheCurrentSession) {
  CompilerSession session(varlen::CodegenOptions{});
  ScopedCompilerSession scope(session);

  session.setCurrentLocation({7, 2});
  reportCompilerWarning("suspicious");
  EXPECT_FALSE(session.hadError());
  EXPECT_EQ(session.warningCount(), 1u);
  EXPECT_EQ(session.diagnostics().back().location.line, 7u);

  reportCompilerWarning("elsewhere", {9, 4}, "look here");
  EXPECT_EQ(session.diagnostics().back().location.line, 9u);
  EXPECT_EQ(session.diagnostics().back().hint, "look here");

  reportCompilerError("broken", "fix it");
  EXPECT_TRUE(session.hadError());
  ASSERT_EQ(session.diagnostics().size(), 3u);
  const Diagnostic &error = session.diagnostics().back();
  EXPECT_EQ(error.severity, DiagnosticSeverity::Error);
  EXPECT_EQ(error.message, "broken");
  EXPECT_EQ(error.hint, "fix it");
  EXPECT_EQ(error.location.column, 2u);

  session.clearDiagnostics();
  EXPECT_FALSE(session.hadError());
  EXPECT_TRUE(session.diagnostics().empty());
}

TEST(CompilerSessionTest, ReportingWithoutSessionOnlyPrints) {
  ASSERT_FALSE(hasCompilerSession());
  EXPECT_NO_THROW(reportCompilerError("nobody is listening"));
  EXPECT_NO_THROW(reportCompilerWarning("nor here"));
}

TEST(CompilerSessionTest, ResetKeepsOptions) {
  varlen::CodegenOptions options;
  options.traceAllocations = true;
  options.releaseSymbol = "host_release";
  CompilerSession session(options);
  ScopedCompilerSession scope(session);

  session.codegen().initializeModule("reset_me");
  ASSERT_TRUE(session.codegen().hasModule());
  reportCompilerError("before reset");
  session.setCurrentLocation({3, 3});

  session.resetAll();
  EXPECT_FALSE(session.codegen().hasModule());
  EXPECT_FALSE(session.hadError());
  EXPECT_FALSE(session.currentLocation().isValid());
  EXPECT_TRUE(session.codegen().options.traceAllocations);
  EXPECT_EQ(session.codegen().options.releaseSymbol, "host_release");
}
