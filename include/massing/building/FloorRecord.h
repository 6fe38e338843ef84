#pragma once

#include "massing/building/SetbackEngine.h"
#include "massing/geom/Polygon.h"
#include <optional>
#include <string>
#include <vector>

namespace massing {
namespace building {

/**
 * Shape parameterisation of a footprint.
 * The orthogonal shape is the plain offset polygon; a composite shape keeps
 * an L-shaped part of it (leg thickness `ratio`, mask rotated by
 * `orientation` degrees).
 */
struct ShapeVariant {
    double ratio = 1.0;
    double orientation = 0.0;
    bool composite = false;

    static ShapeVariant orthogonal() { return ShapeVariant(); }
    static ShapeVariant compositeShape(double ratio, double orientation) {
        return ShapeVariant{ratio, orientation, true};
    }

    // "orthogonal" or "r0.5_o90"
    std::string id() const;

    bool operator==(const ShapeVariant& other) const {
        return ratio == other.ratio && orientation == other.orientation && composite == other.composite;
    }
    bool operator!=(const ShapeVariant& other) const { return !(*this == other); }
};

// Why a footprint was not accepted
enum class RejectReason {
    Empty,
    BelowMinArea,
    BelowMinWidth,
    PatioTooSmall,
    CoreDoesNotFit,
    BelowMinUnitArea,
    UnsupportedShape,
    Degenerate
};

const char* rejectReasonName(RejectReason reason);

/**
 * One floor of a massing. Built by FootprintGenerator (geometry and derived
 * areas) and FloorStackBuilder (index, label and elevations).
 */
struct FloorRecord {
    int index = 1;                 // 1-based, ground floor = 1
    std::string label;
    double baseElevation = 0.0;
    double floorHeight = 0.0;

    geom::Polygon footprint;
    double area = 0.0;
    SetbackOffsets setbacks;
    bool hasSetback = false;
    std::optional<ShapeVariant> shape;

    double coreArea = 0.0;
    double circulationArea = 0.0;
    double usableArea = 0.0;
    double efficiency = 0.0;       // usable / area
    double minDimension = 0.0;     // narrowest planar dimension

    double topElevation() const { return baseElevation + floorHeight; }

    bool operator==(const FloorRecord& other) const;
    bool operator!=(const FloorRecord& other) const { return !(*this == other); }
};

// Outcome of a single footprint; a rejection is a value, not an error
struct FootprintResult {
    std::optional<FloorRecord> floor;
    RejectReason reason = RejectReason::Empty;

    bool accepted() const { return floor.has_value(); }

    static FootprintResult accept(FloorRecord record) {
        FootprintResult r;
        r.floor = std::move(record);
        return r;
    }
    static FootprintResult reject(RejectReason why) {
        FootprintResult r;
        r.reason = why;
        return r;
    }
};

// Why a stack stopped growing
enum class Termination {
    HeightCap,     // next floor would exceed max_height
    Degenerate,    // a floor above the ground floor was rejected
    FloorLimit,    // max_floor_count safeguard
    Infeasible     // the ground floor itself was rejected
};

const char* terminationName(Termination termination);

struct FloorStack {
    std::vector<FloorRecord> floors;
    Termination termination = Termination::HeightCap;
    std::optional<RejectReason> rejectReason;
    std::optional<ShapeVariant> shape;

    bool empty() const { return floors.empty(); }
    size_t size() const { return floors.size(); }

    double grossArea() const;
    double totalHeight() const;
    double usableArea() const;

    // Sum over floors of floor(usable / targetUnitArea)
    int estimatedUnits(double targetUnitArea) const;

    // Area-weighted mean of per-floor efficiency
    double weightedEfficiency() const;

    bool operator==(const FloorStack& other) const {
        return floors == other.floors && termination == other.termination &&
               rejectReason == other.rejectReason && shape == other.shape;
    }
};

} // namespace building
} // namespace massing
