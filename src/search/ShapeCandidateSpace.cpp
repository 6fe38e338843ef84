#include "massing/search/ShapeCandidateSpace.h"
#include <algorithm>

namespace massing {
namespace search {

namespace {

std::vector<double> sortedUnique(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

} // namespace

ShapeCandidateSpace ShapeCandidateSpace::forParameters(const params::ParameterSet& params) {
    if (params.strategy.mode == params::ModelingMode::Basic) {
        return identity();
    }
    return grid(params.strategy.shapeRatioSteps, params.strategy.orientationSteps);
}

ShapeCandidateSpace ShapeCandidateSpace::identity() {
    ShapeCandidateSpace space;
    space.candidates_.push_back(building::ShapeVariant::orthogonal());
    return space;
}

ShapeCandidateSpace ShapeCandidateSpace::grid(std::vector<double> ratios, std::vector<double> orientations) {
    ratios = sortedUnique(std::move(ratios));
    orientations = sortedUnique(std::move(orientations));

    ShapeCandidateSpace space;
    space.candidates_.reserve(ratios.size() * orientations.size());
    for (double r : ratios) {
        for (double o : orientations) {
            space.candidates_.push_back(building::ShapeVariant::compositeShape(r, o));
        }
    }
    return space;
}

} // namespace search
} // namespace massing
