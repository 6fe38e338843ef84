#include "massing/building/FootprintGenerator.h"
#include "massing/geom/GeomUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace massing {
namespace building {

namespace {

constexpr double AREA_EPSILON = 1e-9;

struct FrameBounds {
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
};

FrameBounds boundsInFrame(const lot::LotFrame& frame, const geom::Polygon& poly) {
    FrameBounds b;
    for (const auto& v : poly.vertices()) {
        geom::Point p = frame.toLocal(v);
        b.minX = std::min(b.minX, p.x);
        b.minY = std::min(b.minY, p.y);
        b.maxX = std::max(b.maxX, p.x);
        b.maxY = std::max(b.maxY, p.y);
    }
    return b;
}

bool insideLot(const geom::Polygon& lotBoundary, const std::vector<geom::Point>& pts) {
    for (const auto& p : pts) {
        if (!lotBoundary.contains(p)) return false;
    }
    return true;
}

std::vector<geom::Point> boxCorners(double x0, double y0, double x1, double y1) {
    return {geom::Point(x0, y0), geom::Point(x1, y0), geom::Point(x1, y1), geom::Point(x0, y1)};
}

} // namespace

/**
 * The L is the box of `region` minus the rectangle left open by the two
 * legs. The nearest right angle of the orientation picks the open corner;
 * the remainder, within [-45, 45), rotates the L rigidly about the box
 * centre, so leg thickness stays in metres.
 */
FootprintGenerator::MaskLayout FootprintGenerator::maskLayout(const lot::LotGeometry& lot,
                                                              const geom::Polygon& region,
                                                              const ShapeVariant& shape) {
    lot::LotFrame frame = lot.frame();
    FrameBounds box = boundsInFrame(frame, region);
    double r = std::clamp(shape.ratio, 0.0, 1.0);

    MaskLayout layout;
    layout.legX = r * box.width();
    layout.legY = r * box.height();

    double o = std::fmod(shape.orientation, 360.0);
    if (o < 0.0) o += 360.0;
    double turns = std::floor((o + 45.0) / 90.0);
    int quadrant = static_cast<int>(turns) % 4;
    double residual = (o - 90.0 * turns) * M_PI / 180.0;

    // Open corner index in the CCW box corners: 0 leaves the far right
    // corner open, 90 the far left, 180 the near left, 270 the near right
    int open = (quadrant + 2) % 4;
    bool openHighX = open == 1 || open == 2;
    bool openHighY = open == 2 || open == 3;
    double cx0 = openHighX ? box.minX + layout.legX : box.minX;
    double cx1 = openHighX ? box.maxX : box.maxX - layout.legX;
    double cy0 = openHighY ? box.minY + layout.legY : box.minY;
    double cy1 = openHighY ? box.maxY : box.maxY - layout.legY;

    std::vector<geom::Point> outer = boxCorners(box.minX, box.minY, box.maxX, box.maxY);
    std::vector<geom::Point> corner = boxCorners(cx0, cy0, cx1, cy1);

    std::vector<geom::Point> ell;
    ell.reserve(6);
    for (int i = 0; i < 4; ++i) {
        if (i != open) {
            ell.push_back(outer[i]);
            continue;
        }
        ell.push_back(corner[(i + 3) % 4]);
        ell.push_back(corner[(i + 2) % 4]);
        ell.push_back(corner[(i + 1) % 4]);
    }

    geom::Point centre((box.minX + box.maxX) * 0.5, (box.minY + box.maxY) * 0.5);
    auto place = [&](const geom::Point& p) {
        geom::Point local = residual == 0.0 ? p : p.subtract(centre).rotate(residual).add(centre);
        return frame.toWorld(local);
    };

    for (const auto& p : ell) layout.mask.push_back(place(p));
    if (r < 1.0) {
        for (const auto& p : corner) layout.openCorner.push_back(place(p));
    }
    return layout;
}

FootprintGenerator::FootprintGenerator(const params::ArchitecturalParameters& arch)
    : arch_(arch) {}

std::optional<geom::Polygon> FootprintGenerator::offsetPolygon(const lot::LotGeometry& lot,
                                                               const SetbackOffsets& offsets) {
    const geom::Polygon& boundary = lot.boundary();
    size_t n = boundary.size();

    if (boundary.isConvex()) {
        std::vector<geom::Point> result = boundary.vertices();
        for (size_t i = 0; i < n && !result.empty(); ++i) {
            geom::Point edge = boundary.vectori(i);
            if (edge.length() < geom::GeomUtils::EPSILON) continue;

            // Inward normal of a CCW ring
            geom::Point inward = edge.norm().rotate90();
            double amount = offsets.forRole(lot.edgeRole(i));
            result = geom::GeomUtils::clipHalfPlane(result, boundary.edgeStart(i), inward, amount);
        }
        return geom::Polygon(geom::GeomUtils::simplify(result));
    }

    std::vector<double> amounts(n);
    for (size_t i = 0; i < n; ++i) {
        amounts[i] = offsets.forRole(lot.edgeRole(i));
    }

    std::vector<geom::Point> shrunk = geom::GeomUtils::simplify(
        geom::GeomUtils::shrink(boundary.vertices(), amounts));
    if (shrunk.empty()) {
        return geom::Polygon();
    }

    geom::Polygon result(std::move(shrunk));
    if (!result.isCounterClockwise()) {
        // Opposite offsets crossed over: nothing is left
        return geom::Polygon();
    }
    if (!result.isSimple() || !insideLot(boundary, result.vertices())) {
        return std::nullopt;
    }
    return result;
}

geom::Polygon FootprintGenerator::compositeMask(const lot::LotGeometry& lot,
                                                const geom::Polygon& region,
                                                const ShapeVariant& shape) {
    return geom::Polygon(maskLayout(lot, region, shape).mask);
}

FootprintResult FootprintGenerator::generate(const lot::LotGeometry& lot,
                                             const SetbackOffsets& offsets,
                                             const ShapeVariant& shape) const {
    auto offset = offsetPolygon(lot, offsets);
    if (!offset) {
        return FootprintResult::reject(RejectReason::Degenerate);
    }
    if (offset->size() < 3 || offset->area() < AREA_EPSILON) {
        return FootprintResult::reject(RejectReason::Empty);
    }

    FloorRecord record;
    record.setbacks = offsets;
    record.hasSetback = offset->area() < lot.area() - AREA_EPSILON;

    double spine = 0.0;
    double minDimension = 0.0;
    std::optional<double> patio;

    if (!shape.composite) {
        record.footprint = *offset;
        geom::OrientedBox box = geom::GeomUtils::minAreaRect(offset->vertices());
        spine = box.length;
        minDimension = geom::GeomUtils::minimumWidth(offset->vertices());
        if (!offset->isConvex()) {
            minDimension = std::min(minDimension, geom::GeomUtils::minimumInteriorDepth(offset->vertices()));
        }
    } else {
        if (!offset->isConvex()) {
            return FootprintResult::reject(RejectReason::UnsupportedShape);
        }

        MaskLayout layout = maskLayout(lot, *offset, shape);
        std::vector<geom::Point> clipped = geom::GeomUtils::clipConvex(layout.mask, offset->vertices());
        if (clipped.size() < 3) {
            return FootprintResult::reject(RejectReason::Empty);
        }
        record.footprint = geom::Polygon(std::move(clipped));
        if (record.footprint.area() < AREA_EPSILON) {
            return FootprintResult::reject(RejectReason::Empty);
        }
        // Legs cut apart by the offset polygon come back bridged
        if (!record.footprint.isSimple()) {
            return FootprintResult::reject(RejectReason::Degenerate);
        }

        FrameBounds box = boundsInFrame(lot.frame(), *offset);
        double r = std::min(shape.ratio, 1.0);
        const auto& fp = record.footprint.vertices();

        spine = (box.width() + box.height()) * (1.0 - 0.5 * r);
        minDimension = std::min({geom::GeomUtils::minimumWidth(fp),
                                 geom::GeomUtils::minimumInteriorDepth(fp),
                                 layout.legX, layout.legY});
        if (!layout.openCorner.empty()) {
            // Part of the open corner that lies on buildable ground
            std::vector<geom::Point> court = geom::GeomUtils::clipConvex(layout.openCorner, offset->vertices());
            patio = court.size() < 3 ? 0.0 : geom::GeomUtils::minimumWidth(court);
        }
        record.shape = shape;
    }

    record.area = record.footprint.area();
    record.minDimension = minDimension;
    if (record.area < arch_.minFloorArea) {
        return FootprintResult::reject(RejectReason::BelowMinArea);
    }
    if (minDimension < arch_.minUnitWidth) {
        return FootprintResult::reject(RejectReason::BelowMinWidth);
    }
    if (patio && *patio < arch_.minPatiosDimension) {
        return FootprintResult::reject(RejectReason::PatioTooSmall);
    }

    record.coreArea = arch_.coreAreaFraction * record.area;
    if (std::sqrt(record.coreArea) > minDimension + geom::GeomUtils::EPSILON) {
        return FootprintResult::reject(RejectReason::CoreDoesNotFit);
    }

    record.circulationArea = arch_.accessWidth * spine;
    record.usableArea = std::max(0.0, record.area - record.coreArea - record.circulationArea);
    record.efficiency = record.usableArea / record.area;
    if (record.usableArea < arch_.minUnitArea) {
        return FootprintResult::reject(RejectReason::BelowMinUnitArea);
    }

    return FootprintResult::accept(std::move(record));
}

} // namespace building
} // namespace massing
