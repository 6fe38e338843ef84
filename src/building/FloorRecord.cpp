#include "massing/building/FloorRecord.h"
#include <cmath>
#include <cstdio>

namespace massing {
namespace building {

std::string ShapeVariant::id() const {
    if (!composite) return "orthogonal";

    char buf[48];
    std::snprintf(buf, sizeof(buf), "r%g_o%g", ratio, orientation);
    return buf;
}

const char* rejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::Empty: return "empty";
        case RejectReason::BelowMinArea: return "below_min_area";
        case RejectReason::BelowMinWidth: return "below_min_width";
        case RejectReason::PatioTooSmall: return "patio_too_small";
        case RejectReason::CoreDoesNotFit: return "core_does_not_fit";
        case RejectReason::BelowMinUnitArea: return "below_min_unit_area";
        case RejectReason::UnsupportedShape: return "unsupported_shape";
        case RejectReason::Degenerate: return "degenerate";
    }
    return "unknown";
}

const char* terminationName(Termination termination) {
    switch (termination) {
        case Termination::HeightCap: return "height_cap";
        case Termination::Degenerate: return "degenerate";
        case Termination::FloorLimit: return "floor_limit";
        case Termination::Infeasible: return "infeasible";
    }
    return "unknown";
}

bool FloorRecord::operator==(const FloorRecord& other) const {
    return index == other.index && label == other.label &&
           baseElevation == other.baseElevation && floorHeight == other.floorHeight &&
           footprint == other.footprint && area == other.area &&
           setbacks == other.setbacks && hasSetback == other.hasSetback &&
           shape == other.shape && coreArea == other.coreArea &&
           circulationArea == other.circulationArea && usableArea == other.usableArea &&
           efficiency == other.efficiency && minDimension == other.minDimension;
}

double FloorStack::grossArea() const {
    double total = 0.0;
    for (const auto& f : floors) total += f.area;
    return total;
}

double FloorStack::totalHeight() const {
    return floors.empty() ? 0.0 : floors.back().topElevation();
}

double FloorStack::usableArea() const {
    double total = 0.0;
    for (const auto& f : floors) total += f.usableArea;
    return total;
}

int FloorStack::estimatedUnits(double targetUnitArea) const {
    if (targetUnitArea <= 0.0) return 0;

    int units = 0;
    for (const auto& f : floors) {
        units += static_cast<int>(std::floor(f.usableArea / targetUnitArea));
    }
    return units;
}

double FloorStack::weightedEfficiency() const {
    double gross = grossArea();
    if (gross <= 0.0) return 0.0;
    // sum(efficiency_i * area_i) / sum(area_i) == usable / gross
    return usableArea() / gross;
}

} // namespace building
} // namespace massing
