#include "massing/search/GridSearchOptimizer.h"
#include "massing/building/FloorStackBuilder.h"
#include "massing/search/ShapeCandidateSpace.h"
#include "massing/utils/ParallelProgress.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace massing {
namespace search {

namespace {

struct Slot {
    bool evaluated = false;
    ShapeCandidate candidate;
    building::FloorStack stack;
};

bool scoresTied(double a, double b) {
    double scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) <= GridSearchOptimizer::SCORE_TOLERANCE * scale;
}

} // namespace

GridSearchOptimizer::GridSearchOptimizer(const lot::LotGeometry& lot, const params::ParameterSet& params)
    : lot_(lot)
    , params_(params) {}

bool GridSearchOptimizer::ranksAhead(const ShapeCandidate& a, const ShapeCandidate& b) {
    if (a.selectable != b.selectable) return a.selectable;
    if (!scoresTied(a.score, b.score)) return a.score > b.score;
    if (a.shape.ratio != b.shape.ratio) return a.shape.ratio < b.shape.ratio;
    if (a.shape.orientation != b.shape.orientation) return a.shape.orientation < b.shape.orientation;
    // Orthogonal before composite
    return !a.shape.composite && b.shape.composite;
}

SearchResult GridSearchOptimizer::search(const CancellationToken* cancel) const {
    return search(ShapeCandidateSpace::forParameters(params_).candidates(), cancel);
}

SearchResult GridSearchOptimizer::search(const std::vector<building::ShapeVariant>& candidates,
                                         const CancellationToken* cancel) const {
    SearchResult result;
    if (candidates.empty()) {
        return result;
    }

    building::FloorStackBuilder builder(lot_, params_);
    builder.setLotId(lotId_);
    ObjectiveScorer scorer(params_, lot_.area());
    scorer.setLotId(lotId_);
    std::vector<Slot> slots(candidates.size());

    auto evaluate = [&](int i) {
        if (cancel && cancel->isCancelled()) return;

        const building::ShapeVariant& shape = candidates[static_cast<size_t>(i)];
        Slot& slot = slots[static_cast<size_t>(i)];
        slot.stack = builder.build(shape);

        ObjectiveScore s = scorer.score(slot.stack);
        slot.candidate.shape = shape;
        slot.candidate.score = s.value;
        slot.candidate.selectable = s.selectable;
        slot.candidate.floorCount = slot.stack.size();
        slot.candidate.grossArea = slot.stack.grossArea();
        slot.candidate.termination = slot.stack.termination;
        slot.evaluated = true;
    };

    int count = static_cast<int>(candidates.size());
    if (parallel_) {
        parallel::parallel_for_progress(0, count, evaluate, nullptr, "Shape candidates");
    } else {
        for (int i = 0; i < count; ++i) evaluate(i);
    }

    for (const auto& slot : slots) {
        if (slot.evaluated) result.trace.push_back(slot.candidate);
    }

    if (cancel && cancel->isCancelled()) {
        result.cancelled = true;
        return result;
    }

    // Reduce in canonical (ratio, orientation) order so listing order cannot matter
    std::vector<size_t> order(slots.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::sort(order.begin(), order.end(), [&candidates](size_t a, size_t b) {
        const building::ShapeVariant& sa = candidates[a];
        const building::ShapeVariant& sb = candidates[b];
        if (sa.ratio != sb.ratio) return sa.ratio < sb.ratio;
        if (sa.orientation != sb.orientation) return sa.orientation < sb.orientation;
        if (sa.composite != sb.composite) return !sa.composite;
        return a < b;
    });

    const Slot* best = nullptr;
    for (size_t idx : order) {
        const Slot& slot = slots[idx];
        if (!slot.candidate.selectable) continue;
        if (!best || ranksAhead(slot.candidate, best->candidate)) {
            best = &slot;
        }
    }

    if (best) {
        result.best = best->candidate;
        result.bestStack = best->stack;
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                     "Lot %s: best %s score %.4f over %zu candidates", lotId_.c_str(),
                     best->candidate.shape.id().c_str(), best->candidate.score, candidates.size());
    } else {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                     "Lot %s: no selectable candidate among %zu", lotId_.c_str(), candidates.size());
    }
    return result;
}

} // namespace search
} // namespace massing
