#include "massing/search/ObjectiveScorer.h"

namespace massing {
namespace search {

namespace {
constexpr double FAR_TOLERANCE = 1e-9;
}

ObjectiveScorer::ObjectiveScorer(const params::ParameterSet& params, double lotArea)
    : objective_(params.strategy.objective)
    , maxFar_(params.normative.maxFar)
    , targetUnitArea_(params.architectural.targetUnitArea)
    , lotArea_(lotArea)
    , includeParkingInFar_(params.strategy.includeParkingInFar)
    , parking_(params, lotArea) {}

ObjectiveScore ObjectiveScorer::score(const building::FloorStack& stack) const {
    ObjectiveScore s;
    if (stack.empty() || lotArea_ <= 0.0) {
        return s;
    }

    s.selectable = true;
    switch (objective_) {
        case params::Objective::MaximizeFarWithinHeight: {
            double farArea = stack.grossArea();
            if (includeParkingInFar_) {
                farArea += parking_.allocate(stack).farArea();
            }
            s.value = farArea / lotArea_;
            if (s.value > maxFar_ + FAR_TOLERANCE) {
                s.selectable = false;
            }
            break;
        }
        case params::Objective::MaximizeUnits:
            s.value = static_cast<double>(stack.estimatedUnits(targetUnitArea_));
            break;
        case params::Objective::MaximizeEfficiency:
            s.value = stack.weightedEfficiency();
            break;
    }
    return s;
}

} // namespace search
} // namespace massing
