#pragma once

#include "massing/building/FloorRecord.h"
#include "massing/building/SetbackEngine.h"
#include "massing/lot/LotGeometry.h"
#include "massing/params/ParameterSet.h"
#include <optional>
#include <vector>

namespace massing {
namespace building {

/**
 * FootprintGenerator - buildable polygon of a single floor.
 *
 * Every boundary edge is pushed inward by the offset of its role. On a
 * convex lot this is an exact intersection of inward half-planes; on a
 * concave lot the edges are shrunk with mitred joins and the result is
 * only kept when it is still a simple CCW polygon inside the lot.
 *
 * Composite shapes then keep an L-shaped part of the offset polygon:
 * in the bounding box of the offset polygon (lot frame) each leg is
 * `ratio` of the box dimension thick, and the mask is turned rigidly about
 * the box centre by `orientation` degrees. A clip that splits the legs
 * apart is rejected as Degenerate.
 *
 * The result is checked against the architectural minimums; a failure is
 * returned as a RejectReason.
 */
class FootprintGenerator {
public:
    explicit FootprintGenerator(const params::ArchitecturalParameters& arch);

    FootprintResult generate(const lot::LotGeometry& lot,
                             const SetbackOffsets& offsets,
                             const ShapeVariant& shape) const;

    /**
     * Lot boundary pushed inward by per-role offsets.
     * Returns an empty polygon when the offsets consume the lot and
     * nullopt when a concave lot cannot be offset cleanly.
     */
    static std::optional<geom::Polygon> offsetPolygon(const lot::LotGeometry& lot,
                                                      const SetbackOffsets& offsets);

    // L-shaped mask covering the box of `region` in the lot frame (CCW)
    static geom::Polygon compositeMask(const lot::LotGeometry& lot,
                                       const geom::Polygon& region,
                                       const ShapeVariant& shape);

private:
    struct MaskLayout {
        std::vector<geom::Point> mask;        // L, world coordinates
        std::vector<geom::Point> openCorner;  // courtyard rectangle, empty when ratio >= 1
        double legX = 0.0;
        double legY = 0.0;
    };

    static MaskLayout maskLayout(const lot::LotGeometry& lot,
                                 const geom::Polygon& region,
                                 const ShapeVariant& shape);

    params::ArchitecturalParameters arch_;
};

} // namespace building
} // namespace massing
