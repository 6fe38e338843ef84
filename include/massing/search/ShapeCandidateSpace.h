#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/params/ParameterSet.h"
#include <vector>

namespace massing {
namespace search {

/**
 * ShapeCandidateSpace - the shapes a search evaluates.
 *
 * Basic mode is the single orthogonal (identity) shape. Advanced mode is
 * the product shape_ratio_steps x orientation_steps of composite shapes,
 * with duplicate steps removed and enumerated ratio-major in ascending order.
 */
class ShapeCandidateSpace {
public:
    static ShapeCandidateSpace forParameters(const params::ParameterSet& params);

    static ShapeCandidateSpace identity();
    static ShapeCandidateSpace grid(std::vector<double> ratios, std::vector<double> orientations);

    const std::vector<building::ShapeVariant>& candidates() const { return candidates_; }
    size_t size() const { return candidates_.size(); }
    bool empty() const { return candidates_.empty(); }

private:
    std::vector<building::ShapeVariant> candidates_;
};

} // namespace search
} // namespace massing
