#include "massing/building/FloorStackBuilder.h"
#include <SDL3/SDL_log.h>

namespace massing {
namespace building {

namespace {
// Tolerance on the height cap so 43.0 <= 45.0 style sums are not lost to rounding
constexpr double HEIGHT_EPSILON = 1e-9;
}

FloorStackBuilder::FloorStackBuilder(const lot::LotGeometry& lot, const params::ParameterSet& params)
    : lot_(lot)
    , params_(params)
    , setbacks_(params.normative)
    , generator_(params.architectural) {}

std::string FloorStackBuilder::floorLabel(int floorIndex) {
    if (floorIndex <= 1) return "Ground";
    return "Level " + std::to_string(floorIndex - 1);
}

FloorStack FloorStackBuilder::build(const ShapeVariant& shape) const {
    FloorStack stack = build([&shape](int) { return shape; });
    if (shape.composite) {
        stack.shape = shape;
    }
    return stack;
}

FloorStack FloorStackBuilder::build(const ShapeProvider& provider) const {
    const params::NormativeParameters& norm = params_.normative;
    FloorStack stack;

    int floorIndex = 1;
    double baseElevation = 0.0;

    while (true) {
        if (floorIndex > params_.strategy.maxFloorCount) {
            stack.termination = Termination::FloorLimit;
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Lot %s: stopped at max_floor_count=%d",
                        lotId_.c_str(), params_.strategy.maxFloorCount);
            break;
        }

        double floorHeight = floorIndex == 1 ? norm.gfFloorHeight : norm.ufFloorHeight;
        if (baseElevation + floorHeight > norm.maxHeight + HEIGHT_EPSILON) {
            stack.termination = Termination::HeightCap;
            break;
        }

        SetbackOffsets offsets = setbacks_.offsets(floorIndex, baseElevation);
        FootprintResult result = generator_.generate(lot_, offsets, provider(floorIndex));
        if (!result.accepted()) {
            stack.termination = stack.floors.empty() ? Termination::Infeasible : Termination::Degenerate;
            stack.rejectReason = result.reason;
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                         "Lot %s: floor %d rejected (%s), back setback %.2f",
                         lotId_.c_str(), floorIndex, rejectReasonName(result.reason), offsets.back);
            break;
        }

        FloorRecord record = std::move(*result.floor);
        record.index = floorIndex;
        record.label = floorLabel(floorIndex);
        record.baseElevation = baseElevation;
        record.floorHeight = floorHeight;
        stack.floors.push_back(std::move(record));

        baseElevation += floorHeight;
        ++floorIndex;
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                 "Lot %s: %zu floors, %.1f m, terminated by %s", lotId_.c_str(),
                 stack.floors.size(), stack.totalHeight(), terminationName(stack.termination));
    return stack;
}

} // namespace building
} // namespace massing
