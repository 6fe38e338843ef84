#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/params/ParameterSet.h"
#include "massing/parking/ParkingAllocator.h"

namespace massing {
namespace search {

struct ObjectiveScore {
    double value = 0.0;
    bool selectable = false;   // false: empty stack or FAR above max_far
};

/**
 * ObjectiveScorer - scalar score of a finished stack.
 *
 *  maximize_far_within_height  gross area / lot area; above max_far the
 *                              candidate keeps its raw value but is not selectable.
 *                              With include_parking_in_far the stack's parking
 *                              area is added to the numerator
 *  maximize_units              sum over floors of floor(usable / target_unit_area)
 *  maximize_efficiency         area-weighted usable / gross
 */
class ObjectiveScorer {
public:
    ObjectiveScorer(const params::ParameterSet& params, double lotArea);

    ObjectiveScore score(const building::FloorStack& stack) const;

    void setLotId(const std::string& lotId) { parking_.setLotId(lotId); }

private:
    params::Objective objective_;
    double maxFar_;
    double targetUnitArea_;
    double lotArea_;
    bool includeParkingInFar_;
    parking::ParkingAllocator parking_;
};

} // namespace search
} // namespace massing
