#include "massing/pipeline/LotEvaluator.h"
#include "massing/Errors.h"
#include "massing/building/FloorStackBuilder.h"
#include <SDL3/SDL_log.h>

namespace massing {
namespace pipeline {

namespace {

StackOutcome finish(building::FloorStack stack,
                    const std::string& lotId,
                    const lot::LotGeometry& lot,
                    const params::ParameterSet& params) {
    StackOutcome out;
    out.stack = std::move(stack);
    parking::ParkingAllocator allocator(params, lot.area());
    allocator.setLotId(lotId);
    out.parking = allocator.allocate(out.stack);
    out.metrics = metrics::MetricsAggregator(params).summarize(out.stack, out.parking, lot);
    return out;
}

} // namespace

const char* lotStatusName(LotStatus status) {
    switch (status) {
        case LotStatus::Ok: return "ok";
        case LotStatus::Infeasible: return "infeasible";
        case LotStatus::InvalidInput: return "invalid_input";
        case LotStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

LotResult LotResult::invalidInput(const std::string& lotId, const std::string& message) {
    LotResult r;
    r.lotId = lotId;
    r.status = LotStatus::InvalidInput;
    r.message = message;
    return r;
}

LotResult LotEvaluator::evaluate(const std::string& lotId,
                                 const lot::LotGeometry& lot,
                                 const params::ParameterSet& params,
                                 const CancellationToken* cancel) const {
    LotResult result;
    result.lotId = lotId;
    result.objective = params.strategy.objective;

    if (cancel && cancel->isCancelled()) {
        result.status = LotStatus::Cancelled;
        result.message = "cancelled before start";
        return result;
    }

    try {
        params.validate();
        lot.validate();

        building::FloorStackBuilder builder(lot, params);
        builder.setLotId(lotId);
        result.baseline = finish(builder.build(), lotId, lot, params);

        if (result.baseline.stack.empty()) {
            const building::FloorStack& s = result.baseline.stack;
            result.status = LotStatus::Infeasible;
            result.message = std::string("no floor fits: ") +
                (s.rejectReason ? building::rejectReasonName(*s.rejectReason)
                                : building::terminationName(s.termination));
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Lot %s: infeasible (%s)",
                        lotId.c_str(), result.message.c_str());
            return result;
        }

        SDL_Log("Lot %s: baseline %zu floors, GFA %.1f m2, FAR %.3f",
                lotId.c_str(), result.baseline.metrics.floorCount,
                result.baseline.metrics.grossFloorArea, result.baseline.metrics.far);

        search::GridSearchOptimizer optimizer(lot, params);
        optimizer.setParallel(parallelCandidates_);
        optimizer.setLotId(lotId);
        search::SearchResult found = optimizer.search(cancel);
        result.trace = std::move(found.trace);

        if (found.cancelled) {
            result.status = LotStatus::Cancelled;
            result.message = "search cancelled";
            return result;
        }

        if (found.best) {
            result.bestCandidate = found.best;
            result.objectiveValue = found.best->score;
            result.best = finish(std::move(found.bestStack), lotId, lot, params);
            SDL_Log("Lot %s: best shape %s, %s = %.4f",
                    lotId.c_str(), found.best->shape.id().c_str(),
                    params::objectiveName(params.strategy.objective), found.best->score);
        } else {
            result.message = "no selectable shape candidate; baseline only";
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Lot %s: %s", lotId.c_str(), result.message.c_str());
        }
    } catch (const MassingError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Lot %s: invalid input: %s", lotId.c_str(), e.what());
        LotResult invalid = LotResult::invalidInput(lotId, e.what());
        invalid.objective = params.strategy.objective;
        return invalid;
    }

    return result;
}

} // namespace pipeline
} // namespace massing
