#include "massing/metrics/MetricsAggregator.h"
#include <cstdio>

namespace massing {
namespace metrics {

namespace {

constexpr double LIMIT_EPSILON = 1e-9;

std::string formatMessage(const char* fmt, double actual, double limit) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), fmt, actual, limit);
    return buf;
}

} // namespace

const char* violationKindName(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::Height: return "height";
        case ViolationKind::Far: return "far";
        case ViolationKind::Coverage: return "coverage";
        case ViolationKind::ParkingShortfall: return "parking_shortfall";
    }
    return "unknown";
}

MetricsAggregator::MetricsAggregator(const params::ParameterSet& params)
    : params_(params) {}

SummaryMetrics MetricsAggregator::summarize(const building::FloorStack& stack,
                                            const parking::ParkingPlan& parking,
                                            const lot::LotGeometry& lot) const {
    SummaryMetrics m;
    m.lotArea = lot.area();
    m.grossFloorArea = stack.grossArea();
    m.farArea = m.grossFloorArea + parking.farArea();
    m.far = m.lotArea > 0.0 ? m.farArea / m.lotArea : 0.0;
    m.estimatedUnits = stack.estimatedUnits(params_.architectural.targetUnitArea);

    m.parkingStallsRequired = parking.stallsRequired;
    m.parkingStallsProvided = parking.stallsProvided;
    m.parkingAreaRequired = parking.areaRequired;
    m.parkingAreaProvided = parking.areaProvided;
    m.parkingShortfall = parking.shortfall;

    m.floorCount = stack.size();
    m.totalHeight = stack.totalHeight();
    m.efficiency = stack.weightedEfficiency();
    m.meetsTargetEfficiency = !stack.empty() &&
                              m.efficiency + LIMIT_EPSILON >= params_.architectural.targetEfficiency;

    if (!stack.empty()) {
        const building::FloorRecord& ground = stack.floors.front();
        m.coverage = m.lotArea > 0.0 ? ground.area / m.lotArea : 0.0;
        if (ground.minDimension > 0.0) {
            m.slenderness = m.totalHeight / ground.minDimension;
        }
    }

    const params::NormativeParameters& norm = params_.normative;
    if (m.totalHeight > norm.maxHeight + LIMIT_EPSILON) {
        m.violations.push_back({ViolationKind::Height,
            formatMessage("height %.2f m exceeds max_height %.2f m", m.totalHeight, norm.maxHeight)});
    }
    if (m.far > norm.maxFar + LIMIT_EPSILON) {
        m.violations.push_back({ViolationKind::Far,
            formatMessage("FAR %.3f exceeds max_far %.3f", m.far, norm.maxFar)});
    }
    if (m.coverage > norm.maxLotCoverage + LIMIT_EPSILON) {
        m.violations.push_back({ViolationKind::Coverage,
            formatMessage("coverage %.3f exceeds max_lot_coverage %.3f", m.coverage, norm.maxLotCoverage)});
    }
    if (parking.shortfall) {
        m.violations.push_back({ViolationKind::ParkingShortfall,
            formatMessage("parking short by %.1f m2 of %.1f m2 required",
                          parking.shortfallArea, parking.areaRequired)});
    }
    return m;
}

} // namespace metrics
} // namespace massing
