#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"
#include "massing/search/ObjectiveScorer.h"
#include "massing/utils/CancellationToken.h"
#include <optional>
#include <string>
#include <vector>

namespace massing {
namespace search {

// One evaluated point of the shape grid
struct ShapeCandidate {
    building::ShapeVariant shape;
    double score = 0.0;
    bool selectable = false;
    size_t floorCount = 0;
    double grossArea = 0.0;
    building::Termination termination = building::Termination::HeightCap;
};

struct SearchResult {
    std::optional<ShapeCandidate> best;
    building::FloorStack bestStack;     // empty when there is no winner
    std::vector<ShapeCandidate> trace;  // every evaluated candidate, in enumeration order
    bool cancelled = false;
};

/**
 * GridSearchOptimizer - exhaustive search over a shape candidate list.
 *
 * Every candidate gets its own FloorStack, built in parallel into its own
 * slot. The winner is picked afterwards with a total order (selectable
 * first, higher score, smaller ratio, smaller orientation), so the result
 * does not depend on the order candidates are listed or evaluated in.
 */
class GridSearchOptimizer {
public:
    // Relative tolerance under which two scores count as tied
    static constexpr double SCORE_TOLERANCE = 1e-9;

    GridSearchOptimizer(const lot::LotGeometry& lot, const params::ParameterSet& params);

    // Evaluate candidates on worker threads (default) or sequentially
    void setParallel(bool parallel) { parallel_ = parallel; }

    // Lot id quoted in log messages
    void setLotId(std::string lotId) { lotId_ = std::move(lotId); }

    // Candidates from ShapeCandidateSpace::forParameters
    SearchResult search(const CancellationToken* cancel = nullptr) const;

    SearchResult search(const std::vector<building::ShapeVariant>& candidates,
                        const CancellationToken* cancel = nullptr) const;

    // True when `a` ranks strictly ahead of `b`
    static bool ranksAhead(const ShapeCandidate& a, const ShapeCandidate& b);

private:
    const lot::LotGeometry& lot_;
    const params::ParameterSet& params_;
    bool parallel_ = true;
    std::string lotId_ = "-";
};

} // namespace search
} // namespace massing
