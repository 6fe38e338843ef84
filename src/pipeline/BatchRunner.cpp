#include "massing/pipeline/BatchRunner.h"
#include "massing/utils/ParallelProgress.h"
#include <SDL3/SDL_log.h>
#include <atomic>

namespace massing {
namespace pipeline {

bool ResultCollector::commit(LotResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ids_.insert(result.lotId).second) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Lot %s: duplicate result refused", result.lotId.c_str());
        return false;
    }
    results_.push_back(std::move(result));
    return true;
}

bool ResultCollector::contains(const std::string& lotId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(lotId) > 0;
}

size_t ResultCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

std::vector<LotResult> ResultCollector::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

size_t BatchRunner::run(const std::vector<LotJob>& jobs,
                        ResultCollector& collector,
                        const CancellationToken* cancel) const {
    std::atomic<size_t> committed{0};

    LotEvaluator evaluator;
    // Lots already run side by side; keep each lot's search on its own thread
    evaluator.setParallelCandidates(jobs.size() <= 1);

    parallel::parallel_for_progress(0, static_cast<int>(jobs.size()), [&](int i) {
        if (cancel && cancel->isCancelled()) return;

        const LotJob& job = jobs[static_cast<size_t>(i)];
        LotResult result;
        if (!job.inputError.empty() || !job.params) {
            std::string message = job.inputError.empty() ? "no resolved parameters" : job.inputError;
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Lot %s: invalid input: %s",
                         job.id.c_str(), message.c_str());
            result = LotResult::invalidInput(job.id, message);
        } else {
            result = evaluator.evaluate(job.id, job.lot, *job.params, cancel);
        }

        if (collector.commit(std::move(result))) {
            ++committed;
        }
    }, nullptr, "Lots");

    SDL_Log("BatchRunner: %zu of %zu lots committed%s", committed.load(), jobs.size(),
            (cancel && cancel->isCancelled()) ? " (cancelled)" : "");
    return committed.load();
}

} // namespace pipeline
} // namespace massing
