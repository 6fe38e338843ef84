#pragma once

#include <optional>
#include <string>
#include <vector>

namespace massing {
namespace params {

// Score driving the shape search
enum class Objective {
    MaximizeFarWithinHeight = 0,
    MaximizeUnits = 1,
    MaximizeEfficiency = 2
};

// Basic evaluates only the orthogonal shape; advanced searches the ratio x orientation grid
enum class ModelingMode {
    Basic = 0,
    Advanced = 1
};

enum class ParkingType {
    Underground = 0,
    Surface = 1
};

const char* objectiveName(Objective objective);
const char* modelingModeName(ModelingMode mode);
const char* parkingTypeName(ParkingType type);

std::optional<Objective> parseObjective(const std::string& name);
std::optional<ModelingMode> parseModelingMode(const std::string& name);
// Accepts "underground"/"subsolo" and "surface"/"superficie"
std::optional<ParkingType> parseParkingType(const std::string& name);

// Identification carried through to the outputs
struct ZoningParameters {
    std::string lotNumber;
    std::string zone;
};

// Code-imposed limits (metres, ratios)
struct NormativeParameters {
    double maxHeight = 60.0;
    double maxFar = 2.0;
    double maxLotCoverage = 0.6;
    double gfFloorHeight = 4.0;
    double ufFloorHeight = 3.0;
    double minFrontSetback = 5.0;
    double minBackSetback = 3.0;
    double minSideSetback = 1.5;
    int minSetbackStartFloor = 3;
    double backSetbackPercent = 0.20;
    std::optional<double> slendernessRatio;   // reserved
};

struct ArchitecturalParameters {
    double minFloorArea = 50.0;
    double minUnitArea = 30.0;
    double targetUnitArea = 60.0;
    std::optional<int> numUnitsTarget;        // reserved
    double minUnitWidth = 3.0;
    double minPatiosDimension = 4.0;
    double coreAreaFraction = 0.15;
    double accessWidth = 1.2;
    double targetEfficiency = 0.8;
};

struct ParkingParameters {
    bool required = true;
    std::string calculationType = "per_unit";
    double ratioResidential = 1.0;
    double ratioCommercial = 0.5;
    double commercialAreaForParkingRatio = 100.0;
    double commercialArea = 0.0;
    ParkingType type = ParkingType::Underground;
    double areaPerSlot = 25.0;
    std::optional<double> maxParkingRatio;    // reserved
    int levelsAllowed = 2;
    double rampAreaPerFloorFraction = 0.10;
    double floorHeight = 3.0;
};

struct ModelingStrategy {
    ModelingMode mode = ModelingMode::Advanced;
    bool includeParkingInFar = false;
    Objective objective = Objective::MaximizeFarWithinHeight;
    std::vector<double> shapeRatioSteps = {0.3, 0.5, 0.7};
    std::vector<double> orientationSteps = {0.0, 90.0, 180.0, 270.0};
    int maxFloorCount = 200;
};

/**
 * Fully resolved parameters for one lot.
 *
 * Built once (see ParameterLoader) and treated as immutable for the whole
 * evaluation of the lot. The member defaults match config/default.json.
 */
struct ParameterSet {
    ZoningParameters zoning;
    NormativeParameters normative;
    ArchitecturalParameters architectural;
    ParkingParameters parking;
    ModelingStrategy strategy;

    // Throws ParameterError naming the first offending field
    void validate() const;
};

} // namespace params
} // namespace massing
