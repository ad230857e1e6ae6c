#ifndef VARLEN_ANALYSIS_MISSING_FREE_H
#define VARLEN_ANALYSIS_MISSING_FREE_H

#include <optional>
#include <string>
#include <vector>

#include "compiler_session.h"

namespace varlen::analysis {

struct BufferConstructionSite {
  unsigned id = 0;
  SourceLocation location{};
  std::string label;
};

struct BufferFreeSite {
  std::optional<unsigned> constructionId;
  SourceLocation location{};
  std::string label;
};

/// What one function did with buffers: where it constructed them, where it
/// freed them explicitly and which constructions it handed to its caller.
struct BufferUsageSummary {
  std::string functionName;
  SourceLocation location{};
  std::vector<BufferConstructionSite> constructions;
  std::vector<BufferFreeSite> frees;
  std::vector<unsigned> returnedConstructions;
  /// A buffer of unknown origin was returned; it may alias a construction.
  bool returnsUnknownBuffer = false;
};

class BufferUsageConsumer {
public:
  virtual ~BufferUsageConsumer() = default;

  virtual void consume(const BufferUsageSummary &summary) = 0;
};

struct MissingFreeFinding {
  std::string functionName;
  BufferConstructionSite construction;
};

/// Constructions with neither an explicit free nor a transfer to the caller.
std::vector<MissingFreeFinding> findMissingFrees(const BufferUsageSummary &summary);

/// Reports each finding as a compiler warning. The exit sequence frees such
/// buffers anyway; the warning points at code that relies on it.
class MissingFreeChecker : public BufferUsageConsumer {
public:
  void consume(const BufferUsageSummary &summary) override;

  const std::vector<MissingFreeFinding> &findings() const { return reported; }

private:
  std::vector<MissingFreeFinding> reported;
};

} // namespace varlen::analysis

#endif // VARLEN_ANALYSIS_MISSING_FREE_H
