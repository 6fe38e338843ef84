#pragma once

#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"
#include "massing/pipeline/LotEvaluator.h"
#include "massing/utils/CancellationToken.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace massing {
namespace pipeline {

// One lot of a batch. `inputError` is set when the job reader could not resolve it
struct LotJob {
    std::string id;
    lot::LotGeometry lot;
    std::optional<params::ParameterSet> params;
    std::string inputError;
};

/**
 * ResultCollector - the only shared state of a batch.
 * Accepts at most one result per lot id; later commits for the same id are refused.
 */
class ResultCollector {
public:
    // False when a result for this lot id was already committed
    bool commit(LotResult result);

    bool contains(const std::string& lotId) const;
    size_t size() const;

    // Committed results in commit order
    std::vector<LotResult> results() const;

private:
    mutable std::mutex mutex_;
    std::vector<LotResult> results_;
    std::unordered_set<std::string> ids_;
};

/**
 * BatchRunner - evaluates independent lots on worker threads.
 * Cancellation stops lots that have not started; committed results stay.
 */
class BatchRunner {
public:
    // Returns the number of results committed by this run
    size_t run(const std::vector<LotJob>& jobs,
               ResultCollector& collector,
               const CancellationToken* cancel = nullptr) const;
};

} // namespace pipeline
} // namespace massing
