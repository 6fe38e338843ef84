#include "massing/params/ParameterLoader.h"
#include "massing/Errors.h"
#include <fstream>
#include <iterator>

namespace massing {
namespace params {

using json = nlohmann::json;

namespace {

const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    if (!doc.contains(name)) return empty;
    const json& s = doc[name];
    if (s.is_null()) return empty;
    if (!s.is_object()) {
        throw ParameterError(std::string(name) + " must be an object");
    }
    return s;
}

template <typename T>
std::optional<T> optionalValue(const json& s, const char* key) {
    if (!s.contains(key) || s[key].is_null()) return std::nullopt;
    return s[key].get<T>();
}

std::string scalarAsString(const json& s, const char* key, const std::string& fallback) {
    if (!s.contains(key) || s[key].is_null()) return fallback;
    const json& v = s[key];
    if (v.is_string()) return v.get<std::string>();
    // Lot numbers come as integers from cadastral exports
    return v.dump();
}

std::vector<double> numberList(const json& s, const char* key, const std::vector<double>& fallback) {
    if (!s.contains(key)) return fallback;
    const json& v = s[key];
    if (!v.is_array()) {
        throw ParameterError(std::string(key) + " must be a list of numbers");
    }
    std::vector<double> out;
    out.reserve(v.size());
    for (const auto& item : v) {
        out.push_back(item.get<double>());
    }
    return out;
}

} // namespace

json ParameterLoader::loadDocument(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("failed to open " + path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    try {
        return json::parse(content);
    } catch (const json::exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

json ParameterLoader::parseDocument(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
}

json ParameterLoader::merge(const json& base, const json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }

    json result = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (result.contains(it.key()) && result[it.key()].is_object() && it.value().is_object()) {
            result[it.key()] = merge(result[it.key()], it.value());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

ParameterSet ParameterLoader::fromJson(const json& doc) {
    ParameterSet p;

    try {
        const json& zoning = section(doc, "zoning_parameters");
        p.zoning.lotNumber = scalarAsString(zoning, "numlote", "");
        p.zoning.zone = scalarAsString(zoning, "zot", "");

        const json& norm = section(doc, "normative_parameters");
        NormativeParameters& n = p.normative;
        n.maxHeight = norm.value("max_height", n.maxHeight);
        n.maxFar = norm.value("max_far", n.maxFar);
        n.maxLotCoverage = norm.value("max_lot_coverage", n.maxLotCoverage);
        n.gfFloorHeight = norm.value("gf_floor_height", n.gfFloorHeight);
        n.ufFloorHeight = norm.value("uf_floor_height", n.ufFloorHeight);
        n.minFrontSetback = norm.value("min_front_setback", n.minFrontSetback);
        n.minBackSetback = norm.value("min_back_setback", n.minBackSetback);
        n.minSideSetback = norm.value("min_side_setback", n.minSideSetback);
        n.minSetbackStartFloor = norm.value("min_setback_start_floor", n.minSetbackStartFloor);
        n.backSetbackPercent = norm.value("back_setback_percent", n.backSetbackPercent);
        n.slendernessRatio = optionalValue<double>(norm, "slenderness_ratio");

        const json& arch = section(doc, "architectural_parameters");
        ArchitecturalParameters& a = p.architectural;
        a.minFloorArea = arch.value("min_floor_area", a.minFloorArea);
        a.minUnitArea = arch.value("min_unit_area", a.minUnitArea);
        a.targetUnitArea = arch.value("target_unit_area", a.targetUnitArea);
        a.numUnitsTarget = optionalValue<int>(arch, "num_units_target");
        a.minUnitWidth = arch.value("min_unit_width", a.minUnitWidth);
        a.minPatiosDimension = arch.value("min_patios_dimension", a.minPatiosDimension);
        a.coreAreaFraction = arch.value("core_area_fraction", a.coreAreaFraction);
        a.accessWidth = arch.value("access_width", a.accessWidth);
        a.targetEfficiency = arch.value("target_efficiency", a.targetEfficiency);

        const json& park = section(doc, "parking_parameters");
        ParkingParameters& k = p.parking;
        k.required = park.value("parking_required", k.required);
        k.calculationType = park.value("parking_calculation_type", k.calculationType);
        k.ratioResidential = park.value("parking_ratio_residential", k.ratioResidential);
        k.ratioCommercial = park.value("parking_ratio_commercial", k.ratioCommercial);
        k.commercialAreaForParkingRatio =
            park.value("commercial_area_for_parking_ratio", k.commercialAreaForParkingRatio);
        k.commercialArea = park.value("commercial_area", k.commercialArea);
        if (park.contains("parking_type")) {
            std::string typeStr = park["parking_type"].get<std::string>();
            auto type = parseParkingType(typeStr);
            if (!type) {
                throw ParameterError("unknown parking_type '" + typeStr + "'");
            }
            k.type = *type;
        }
        k.areaPerSlot = park.value("parking_area_per_slot", k.areaPerSlot);
        k.maxParkingRatio = optionalValue<double>(park, "max_parking_ratio");
        k.levelsAllowed = park.value("parking_levels_allowed", k.levelsAllowed);
        k.rampAreaPerFloorFraction = park.value("ramp_area_per_floor_fraction", k.rampAreaPerFloorFraction);
        k.floorHeight = park.value("parking_floor_height", k.floorHeight);

        const json& strat = section(doc, "modeling_strategy");
        ModelingStrategy& s = p.strategy;
        if (strat.contains("modeling_mode")) {
            std::string modeStr = strat["modeling_mode"].get<std::string>();
            auto mode = parseModelingMode(modeStr);
            if (!mode) {
                throw ParameterError("unknown modeling_mode '" + modeStr + "'");
            }
            s.mode = *mode;
        }
        s.includeParkingInFar = strat.value("include_parking_in_far", s.includeParkingInFar);
        if (strat.contains("optimization_objective")) {
            std::string objStr = strat["optimization_objective"].get<std::string>();
            auto objective = parseObjective(objStr);
            if (!objective) {
                throw ParameterError("unknown optimization_objective '" + objStr + "'");
            }
            s.objective = *objective;
        }
        s.maxFloorCount = strat.value("max_floor_count", s.maxFloorCount);

        const json& grid = section(strat, "grid_search_parameters");
        s.shapeRatioSteps = numberList(grid, "shape_ratio_steps", s.shapeRatioSteps);
        s.orientationSteps = numberList(grid, "orientation_steps", s.orientationSteps);
    } catch (const json::exception& e) {
        throw ParameterError(std::string("parameter type error: ") + e.what());
    }

    p.validate();
    return p;
}

ParameterSet ParameterLoader::resolve(const json& defaults, const json& project, const json& lot) {
    json doc = defaults.is_object() ? defaults : json::object();
    if (project.is_object()) doc = merge(doc, project);
    if (lot.is_object()) doc = merge(doc, lot);
    return fromJson(doc);
}

} // namespace params
} // namespace massing
