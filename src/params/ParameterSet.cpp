#include "massing/params/ParameterSet.h"
#include "massing/Errors.h"
#include <cctype>
#include <cmath>

namespace massing {
namespace params {

namespace {

std::string toLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

void requireNonNegative(const char* field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ParameterError(std::string(field) + " must be a finite non-negative number (got " +
                             std::to_string(value) + ")");
    }
}

void requirePositive(const char* field, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ParameterError(std::string(field) + " must be greater than zero (got " +
                             std::to_string(value) + ")");
    }
}

void requireFraction(const char* field, double value, bool allowOne) {
    requireNonNegative(field, value);
    if (value > 1.0 || (!allowOne && value >= 1.0)) {
        throw ParameterError(std::string(field) + " must be below " + (allowOne ? "or equal to " : "") +
                             "1 (got " + std::to_string(value) + ")");
    }
}

} // namespace

const char* objectiveName(Objective objective) {
    switch (objective) {
        case Objective::MaximizeFarWithinHeight: return "maximize_far_within_height";
        case Objective::MaximizeUnits: return "maximize_units";
        case Objective::MaximizeEfficiency: return "maximize_efficiency";
    }
    return "unknown";
}

const char* modelingModeName(ModelingMode mode) {
    return mode == ModelingMode::Basic ? "basic" : "advanced";
}

const char* parkingTypeName(ParkingType type) {
    return type == ParkingType::Underground ? "underground" : "surface";
}

std::optional<Objective> parseObjective(const std::string& name) {
    std::string s = toLower(name);
    if (s == "maximize_far_within_height") return Objective::MaximizeFarWithinHeight;
    if (s == "maximize_units") return Objective::MaximizeUnits;
    if (s == "maximize_efficiency") return Objective::MaximizeEfficiency;
    return std::nullopt;
}

std::optional<ModelingMode> parseModelingMode(const std::string& name) {
    std::string s = toLower(name);
    if (s == "basic") return ModelingMode::Basic;
    if (s == "advanced") return ModelingMode::Advanced;
    return std::nullopt;
}

std::optional<ParkingType> parseParkingType(const std::string& name) {
    std::string s = toLower(name);
    if (s == "underground" || s == "subsolo") return ParkingType::Underground;
    if (s == "surface" || s == "superficie") return ParkingType::Surface;
    return std::nullopt;
}

void ParameterSet::validate() const {
    const NormativeParameters& n = normative;
    requireNonNegative("max_height", n.maxHeight);
    requireNonNegative("max_far", n.maxFar);
    requireFraction("max_lot_coverage", n.maxLotCoverage, true);
    requirePositive("gf_floor_height", n.gfFloorHeight);
    requirePositive("uf_floor_height", n.ufFloorHeight);
    requireNonNegative("min_front_setback", n.minFrontSetback);
    requireNonNegative("min_back_setback", n.minBackSetback);
    requireNonNegative("min_side_setback", n.minSideSetback);
    if (n.minSetbackStartFloor < 1) {
        throw ParameterError("min_setback_start_floor must be at least 1 (got " +
                             std::to_string(n.minSetbackStartFloor) + ")");
    }
    requireNonNegative("back_setback_percent", n.backSetbackPercent);
    if (n.slendernessRatio) requireNonNegative("slenderness_ratio", *n.slendernessRatio);

    const ArchitecturalParameters& a = architectural;
    requireNonNegative("min_floor_area", a.minFloorArea);
    requireNonNegative("min_unit_area", a.minUnitArea);
    requirePositive("target_unit_area", a.targetUnitArea);
    if (a.numUnitsTarget && *a.numUnitsTarget < 0) {
        throw ParameterError("num_units_target must not be negative");
    }
    requireNonNegative("min_unit_width", a.minUnitWidth);
    requireNonNegative("min_patios_dimension", a.minPatiosDimension);
    requireFraction("core_area_fraction", a.coreAreaFraction, false);
    requireNonNegative("access_width", a.accessWidth);
    requireFraction("target_efficiency", a.targetEfficiency, true);

    const ParkingParameters& p = parking;
    if (p.calculationType != "per_unit") {
        throw ParameterError("parking_calculation_type '" + p.calculationType +
                             "' is not supported (only per_unit)");
    }
    requireNonNegative("parking_ratio_residential", p.ratioResidential);
    requireNonNegative("parking_ratio_commercial", p.ratioCommercial);
    requirePositive("commercial_area_for_parking_ratio", p.commercialAreaForParkingRatio);
    requireNonNegative("commercial_area", p.commercialArea);
    requirePositive("parking_area_per_slot", p.areaPerSlot);
    if (p.maxParkingRatio) requireNonNegative("max_parking_ratio", *p.maxParkingRatio);
    if (p.levelsAllowed < 0) {
        throw ParameterError("parking_levels_allowed must not be negative");
    }
    requireNonNegative("ramp_area_per_floor_fraction", p.rampAreaPerFloorFraction);
    requirePositive("parking_floor_height", p.floorHeight);

    const ModelingStrategy& s = strategy;
    if (s.maxFloorCount < 1) {
        throw ParameterError("max_floor_count must be at least 1");
    }
    if (s.mode == ModelingMode::Advanced) {
        if (s.shapeRatioSteps.empty()) {
            throw ParameterError("shape_ratio_steps must not be empty in advanced mode");
        }
        if (s.orientationSteps.empty()) {
            throw ParameterError("orientation_steps must not be empty in advanced mode");
        }
    }
    for (double r : s.shapeRatioSteps) {
        if (!std::isfinite(r) || r <= 0.0 || r > 1.0) {
            throw ParameterError("shape_ratio_steps values must be in (0, 1] (got " +
                                 std::to_string(r) + ")");
        }
    }
    for (double o : s.orientationSteps) {
        if (!std::isfinite(o)) {
            throw ParameterError("orientation_steps values must be finite");
        }
    }
}

} // namespace params
} // namespace massing
