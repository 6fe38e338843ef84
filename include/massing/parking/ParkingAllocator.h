#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/params/ParameterSet.h"
#include <string>
#include <vector>

namespace massing {
namespace parking {

// One parking level: -1, -2, ... below ground, 0 for surface parking
struct ParkingLevel {
    int level = -1;
    double area = 0.0;
    double baseElevation = 0.0;
    double floorHeight = 0.0;
};

struct ParkingPlan {
    bool required = false;
    params::ParkingType type = params::ParkingType::Underground;

    int residentialUnits = 0;
    int stallsRequired = 0;
    double areaRequired = 0.0;

    int stallsProvided = 0;
    double areaProvided = 0.0;
    double capacity = 0.0;          // area available over the allowed levels

    std::vector<ParkingLevel> levels;

    bool shortfall = false;
    double shortfallArea = 0.0;

    bool countsTowardFar = false;

    // Parking area added to the FAR numerator
    double farArea() const { return countsTowardFar ? areaProvided : 0.0; }
};

/**
 * ParkingAllocator - stall demand and parking levels for a stack.
 *
 * Stalls = ceil(units * ratio_residential
 *               + commercial_area / commercial_area_for_parking_ratio * ratio_commercial)
 * Area   = stalls * area_per_slot * (1 + ramp_area_per_floor_fraction)
 *
 * Underground levels may each use the whole lot; surface parking is a single
 * level on the part of the lot the ground floor leaves free. Demand beyond
 * parking_levels_allowed is reported as a shortfall, never added as levels.
 */
class ParkingAllocator {
public:
    ParkingAllocator(const params::ParameterSet& params, double lotArea);

    ParkingPlan allocate(const building::FloorStack& stack) const;

    // Lot id quoted in log messages
    void setLotId(std::string lotId) { lotId_ = std::move(lotId); }

    static int requiredStalls(int residentialUnits, const params::ParkingParameters& parking);

private:
    params::ParkingParameters parking_;
    double targetUnitArea_;
    bool includeInFar_;
    double lotArea_;
    std::string lotId_ = "-";
};

} // namespace parking
} // namespace massing
