#include "analysis/missing_free.h"

#include <algorithm>

#include "llvm/Support/raw_ostream.h"

namespace varlen::analysis {

std::vector<MissingFreeFinding> findMissingFrees(const BufferUsageSummary &summary) {
  std::vector<MissingFreeFinding> findings;
  if (summary.returnsUnknownBuffer)
    return findings;

  for (const auto &construction : summary.constructions) {
    const bool freed = std::any_of(
        summary.frees.begin(), summary.frees.end(),
        [&](const BufferFreeSite &site) {
          return site.constructionId && *site.constructionId == construction.id;
        });
    if (freed)
      continue;
    const bool returned =
        std::find(summary.returnedConstructions.begin(),
                  summary.returnedConstructions.end(),
                  construction.id) != summary.returnedConstructions.end();
    if (returned)
      continue;
    findings.push_back({summary.functionName, construction});
  }
  return findings;
}

void MissingFreeChecker::consume(const BufferUsageSummary &summary) {
  for (auto &finding : findMissingFrees(summary)) {
    std::string what = finding.construction.label.empty()
                           ? std::string("buffer")
                           : "buffer '" + finding.construction.label + "'";
    reportCompilerWarning("In function '" + finding.functionName + "': " + what +
                              " is never freed",
                          finding.construction.location,
                          "call free on it or return it");
    llvm::errs() << "[varlen-leak] " << finding.functionName << ": construction #"
                 << finding.construction.id << " has no matching free\n";
    reported.push_back(std::move(finding));
  }
}

} // namespace varlen::analysis
