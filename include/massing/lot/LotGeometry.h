#pragma once

#include "massing/geom/Point.h"
#include "massing/geom/Polygon.h"
#include <optional>
#include <string>
#include <vector>

namespace massing {
namespace lot {

// Role of a boundary face; selects which setback applies to it
enum class FaceRole {
    Front,
    Back,
    Side
};

const char* faceRoleName(FaceRole role);

// Accepts "front"/"back"/"side" and the cadastral "frente"/"fundos"/"lateral"
std::optional<FaceRole> parseFaceRole(const std::string& name);

// One tagged segment of the lot boundary
struct BoundaryFace {
    geom::Point a;
    geom::Point b;
    FaceRole role = FaceRole::Side;
};

// Local axes of a lot: `axis` runs along the (first) front edge
struct LotFrame {
    geom::Point origin;
    geom::Point axis{1.0, 0.0};

    geom::Point normal() const { return axis.rotate90(); }

    // World -> frame coordinates
    geom::Point toLocal(const geom::Point& p) const {
        geom::Point d = p.subtract(origin);
        return geom::Point(d.dot(axis), d.dot(normal()));
    }

    // Frame -> world coordinates
    geom::Point toWorld(const geom::Point& p) const {
        return origin.add(axis.scale(p.x)).add(normal().scale(p.y));
    }
};

/**
 * LotGeometry - one cadastral parcel: boundary ring plus role-tagged faces.
 *
 * The ring is accepted closed (first vertex repeated last, as in GeoJSON),
 * stored open and normalised to counter-clockwise order. A face that ends
 * part way along a ring edge splits that edge there; each boundary edge
 * is then assigned the role of the face that covers it. Construction never
 * throws; call validate() before handing the lot to the builders.
 */
class LotGeometry {
public:
    static constexpr double FACE_TOLERANCE = 1e-3;

    LotGeometry() = default;
    LotGeometry(const std::vector<geom::Point>& ring, std::vector<BoundaryFace> faces);

    /**
     * Lot whose faces are inferred from its shape: the longest edge is the
     * front, the edge most nearly opposite to it is the back, the rest are sides.
     */
    static LotGeometry withInferredFaces(const std::vector<geom::Point>& ring);

    /**
     * Axis-aligned width x depth lot with its front on y = 0,
     * back on y = depth and sides on x = 0 / x = width.
     */
    static LotGeometry rectangle(double width, double depth);

    const geom::Polygon& boundary() const { return boundary_; }
    const std::vector<BoundaryFace>& faces() const { return faces_; }
    double area() const { return boundary_.area(); }
    bool isClosed() const { return closed_; }

    // Role of boundary edge i; only meaningful on a validated lot
    FaceRole edgeRole(size_t edge) const;
    const std::vector<std::optional<FaceRole>>& edgeRoles() const { return edgeRoles_; }

    LotFrame frame() const;

    /**
     * Throws InvalidLotError when the ring is not closed, has fewer than three
     * distinct vertices or no area, self-intersects, a face does not lie on
     * the boundary, or a boundary edge is left without a role.
     */
    void validate() const;

private:
    void classifyEdges();

    geom::Polygon boundary_;
    std::vector<BoundaryFace> faces_;
    std::vector<std::optional<FaceRole>> edgeRoles_;
    std::vector<bool> edgeConflict_;
    bool closed_ = false;
};

} // namespace lot
} // namespace massing
