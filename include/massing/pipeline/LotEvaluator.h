#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/lot/LotGeometry.h"
#include "massing/metrics/MetricsAggregator.h"
#include "massing/params/ParameterSet.h"
#include "massing/parking/ParkingAllocator.h"
#include "massing/search/GridSearchOptimizer.h"
#include "massing/utils/CancellationToken.h"
#include <optional>
#include <string>
#include <vector>

namespace massing {
namespace pipeline {

enum class LotStatus {
    Ok,
    Infeasible,     // not even the ground floor fits
    InvalidInput,   // malformed lot or parameters
    Cancelled
};

const char* lotStatusName(LotStatus status);

// A finished stack with its parking plan and summary
struct StackOutcome {
    building::FloorStack stack;
    parking::ParkingPlan parking;
    metrics::SummaryMetrics metrics;
};

struct LotResult {
    std::string lotId;
    LotStatus status = LotStatus::Ok;
    std::string message;
    params::Objective objective = params::Objective::MaximizeFarWithinHeight;

    StackOutcome baseline;

    // Absent when no candidate was selectable (baseline only)
    std::optional<search::ShapeCandidate> bestCandidate;
    std::optional<StackOutcome> best;
    std::optional<double> objectiveValue;

    std::vector<search::ShapeCandidate> trace;

    static LotResult invalidInput(const std::string& lotId, const std::string& message);
};

/**
 * LotEvaluator - full evaluation of one lot.
 *
 * Baseline stack -> parking -> metrics, then the shape search over the
 * candidate space of the modeling mode, and parking and metrics for its
 * winner. Input errors are caught here so one bad lot never stops a batch.
 */
class LotEvaluator {
public:
    // Evaluate shape candidates on worker threads
    void setParallelCandidates(bool parallel) { parallelCandidates_ = parallel; }

    LotResult evaluate(const std::string& lotId,
                       const lot::LotGeometry& lot,
                       const params::ParameterSet& params,
                       const CancellationToken* cancel = nullptr) const;

private:
    bool parallelCandidates_ = true;
};

} // namespace pipeline
} // namespace massing
