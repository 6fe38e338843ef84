#include "massing/parking/ParkingAllocator.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

namespace massing {
namespace parking {

namespace {
constexpr double AREA_EPSILON = 1e-9;
}

ParkingAllocator::ParkingAllocator(const params::ParameterSet& params, double lotArea)
    : parking_(params.parking)
    , targetUnitArea_(params.architectural.targetUnitArea)
    , includeInFar_(params.strategy.includeParkingInFar)
    , lotArea_(lotArea) {}

int ParkingAllocator::requiredStalls(int residentialUnits, const params::ParkingParameters& parking) {
    double stalls = residentialUnits * parking.ratioResidential;
    if (parking.commercialAreaForParkingRatio > 0.0) {
        stalls += parking.commercialArea / parking.commercialAreaForParkingRatio * parking.ratioCommercial;
    }
    // 12.0000000001 stalls is still 12
    return static_cast<int>(std::ceil(stalls - AREA_EPSILON));
}

ParkingPlan ParkingAllocator::allocate(const building::FloorStack& stack) const {
    ParkingPlan plan;
    plan.type = parking_.type;
    plan.countsTowardFar = includeInFar_;
    plan.residentialUnits = stack.estimatedUnits(targetUnitArea_);

    if (!parking_.required) {
        return plan;
    }

    plan.required = true;
    plan.stallsRequired = requiredStalls(plan.residentialUnits, parking_);
    double areaPerStall = parking_.areaPerSlot * (1.0 + parking_.rampAreaPerFloorFraction);
    plan.areaRequired = plan.stallsRequired * areaPerStall;

    int levelCount = parking_.levelsAllowed;
    double levelCapacity = lotArea_;
    if (parking_.type == params::ParkingType::Surface) {
        double groundArea = stack.empty() ? 0.0 : stack.floors.front().area;
        levelCapacity = std::max(0.0, lotArea_ - groundArea);
        levelCount = std::min(levelCount, 1);
    }
    plan.capacity = levelCapacity * levelCount;

    double remaining = plan.areaRequired;
    for (int i = 0; i < levelCount && remaining > AREA_EPSILON; ++i) {
        ParkingLevel level;
        level.area = std::min(levelCapacity, remaining);
        if (level.area <= AREA_EPSILON) break;

        if (parking_.type == params::ParkingType::Surface) {
            level.level = 0;
            level.baseElevation = 0.0;
            level.floorHeight = 0.0;
        } else {
            level.level = -(i + 1);
            level.baseElevation = -(i + 1) * parking_.floorHeight;
            level.floorHeight = parking_.floorHeight;
        }

        plan.levels.push_back(level);
        plan.areaProvided += level.area;
        remaining -= level.area;
    }

    plan.stallsProvided = static_cast<int>(std::floor(plan.areaProvided / areaPerStall + AREA_EPSILON));
    plan.stallsProvided = std::min(plan.stallsProvided, plan.stallsRequired);

    if (remaining > AREA_EPSILON) {
        plan.shortfall = true;
        plan.shortfallArea = remaining;
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                     "Lot %s: %d stalls need %.1f m2, %d %s level(s) hold %.1f m2",
                     lotId_.c_str(), plan.stallsRequired, plan.areaRequired, levelCount,
                     params::parkingTypeName(parking_.type), plan.capacity);
    }
    return plan;
}

} // namespace parking
} // namespace massing
