#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"
#include "massing/parking/ParkingAllocator.h"
#include <string>
#include <vector>

namespace massing {
namespace metrics {

enum class ViolationKind {
    Height,
    Far,
    Coverage,
    ParkingShortfall
};

const char* violationKindName(ViolationKind kind);

struct Violation {
    ViolationKind kind;
    std::string message;
};

// Read-only summary of one finished stack
struct SummaryMetrics {
    double lotArea = 0.0;
    double grossFloorArea = 0.0;
    double farArea = 0.0;          // gross plus parking when it counts toward FAR
    double far = 0.0;
    int estimatedUnits = 0;

    int parkingStallsRequired = 0;
    int parkingStallsProvided = 0;
    double parkingAreaRequired = 0.0;
    double parkingAreaProvided = 0.0;
    bool parkingShortfall = false;

    size_t floorCount = 0;
    double totalHeight = 0.0;
    double coverage = 0.0;         // ground floor area / lot area
    double efficiency = 0.0;       // area-weighted usable / gross
    bool meetsTargetEfficiency = false;
    double slenderness = 0.0;      // total height / ground floor minimum dimension

    std::vector<Violation> violations;
    bool compliant() const { return violations.empty(); }
};

/**
 * MetricsAggregator - reduces a stack and its parking plan to SummaryMetrics
 * and checks the result against height, FAR, coverage and parking limits.
 * Pure reduction; never rejects.
 */
class MetricsAggregator {
public:
    explicit MetricsAggregator(const params::ParameterSet& params);

    SummaryMetrics summarize(const building::FloorStack& stack,
                             const parking::ParkingPlan& parking,
                             const lot::LotGeometry& lot) const;

private:
    params::ParameterSet params_;
};

} // namespace metrics
} // namespace massing
