#include "massing/lot/LotGeometry.h"
#include "massing/Errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace massing {
namespace lot {

const char* faceRoleName(FaceRole role) {
    switch (role) {
        case FaceRole::Front: return "front";
        case FaceRole::Back: return "back";
        case FaceRole::Side: return "side";
    }
    return "unknown";
}

namespace {

// Face ends that fall inside a ring edge become ring vertices, so each
// resulting edge lies under at most one face
geom::Polygon splitAtFaceEnds(const geom::Polygon& ring, const std::vector<BoundaryFace>& faces) {
    const double tol = LotGeometry::FACE_TOLERANCE;
    size_t n = ring.size();
    if (n < 3 || faces.empty()) {
        return ring;
    }

    std::vector<geom::Point> pts;
    pts.reserve(n + 2 * faces.size());
    for (size_t i = 0; i < n; ++i) {
        geom::Point a = ring.edgeStart(i);
        geom::Point b = ring.edgeEnd(i);
        pts.push_back(a);

        geom::Point dir = b.subtract(a);
        double len = dir.length();
        if (len < 2.0 * tol) continue;

        std::vector<double> cuts;
        for (const auto& face : faces) {
            for (const geom::Point& end : {face.a, face.b}) {
                if (!geom::GeomUtils::pointOnSegment(end, a, b, tol)) continue;
                double t = end.subtract(a).dot(dir) / (len * len);
                if (t * len > tol && (1.0 - t) * len > tol) {
                    cuts.push_back(t);
                }
            }
        }

        std::sort(cuts.begin(), cuts.end());
        double last = 0.0;
        for (double t : cuts) {
            if ((t - last) * len <= tol) continue;
            pts.push_back(geom::GeomUtils::lerp(a, b, t));
            last = t;
        }
    }
    return geom::Polygon(std::move(pts));
}

} // namespace

std::optional<FaceRole> parseFaceRole(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "front" || lower == "frente") return FaceRole::Front;
    if (lower == "back" || lower == "fundos" || lower == "fundo") return FaceRole::Back;
    if (lower == "side" || lower == "lateral") return FaceRole::Side;
    return std::nullopt;
}

LotGeometry::LotGeometry(const std::vector<geom::Point>& ring, std::vector<BoundaryFace> faces)
    : faces_(std::move(faces)) {
    std::vector<geom::Point> pts = ring;

    closed_ = pts.size() >= 4 && pts.front().equals(pts.back(), FACE_TOLERANCE);
    if (closed_) {
        pts.pop_back();
    }

    // Consecutive duplicates carry no edge
    std::vector<geom::Point> cleaned;
    cleaned.reserve(pts.size());
    for (const auto& p : pts) {
        if (cleaned.empty() || !cleaned.back().equals(p, geom::GeomUtils::EPSILON)) {
            cleaned.push_back(p);
        }
    }
    if (cleaned.size() > 1 && cleaned.front().equals(cleaned.back(), geom::GeomUtils::EPSILON)) {
        cleaned.pop_back();
    }

    boundary_ = splitAtFaceEnds(geom::Polygon(std::move(cleaned)).counterClockwise(), faces_);
    classifyEdges();
}

LotGeometry LotGeometry::withInferredFaces(const std::vector<geom::Point>& ring) {
    LotGeometry bare(ring, {});
    const geom::Polygon& poly = bare.boundary();
    size_t n = poly.size();
    if (n < 3) {
        return bare;
    }

    size_t front = 0;
    for (size_t i = 1; i < n; ++i) {
        if (poly.vectori(i).length() > poly.vectori(front).length()) {
            front = i;
        }
    }

    geom::Point frontDir = poly.vectori(front).norm();
    size_t back = front;
    double mostOpposite = std::numeric_limits<double>::max();
    for (size_t i = 0; i < n; ++i) {
        if (i == front) continue;
        double d = frontDir.dot(poly.vectori(i).norm());
        if (d < mostOpposite) {
            mostOpposite = d;
            back = i;
        }
    }

    std::vector<BoundaryFace> faces;
    faces.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        FaceRole role = FaceRole::Side;
        if (i == front) role = FaceRole::Front;
        else if (i == back) role = FaceRole::Back;
        faces.push_back(BoundaryFace{poly.edgeStart(i), poly.edgeEnd(i), role});
    }

    return LotGeometry(ring, std::move(faces));
}

LotGeometry LotGeometry::rectangle(double width, double depth) {
    std::vector<geom::Point> ring = {
        {0.0, 0.0}, {width, 0.0}, {width, depth}, {0.0, depth}, {0.0, 0.0}
    };
    std::vector<BoundaryFace> faces = {
        {{0.0, 0.0}, {width, 0.0}, FaceRole::Front},
        {{width, 0.0}, {width, depth}, FaceRole::Side},
        {{width, depth}, {0.0, depth}, FaceRole::Back},
        {{0.0, depth}, {0.0, 0.0}, FaceRole::Side},
    };
    return LotGeometry(ring, std::move(faces));
}

void LotGeometry::classifyEdges() {
    size_t n = boundary_.size();
    edgeRoles_.assign(n, std::nullopt);
    edgeConflict_.assign(n, false);

    for (size_t i = 0; i < n; ++i) {
        geom::Point a = boundary_.edgeStart(i);
        geom::Point b = boundary_.edgeEnd(i);

        for (const auto& face : faces_) {
            bool covers = geom::GeomUtils::pointOnSegment(a, face.a, face.b, FACE_TOLERANCE) &&
                          geom::GeomUtils::pointOnSegment(b, face.a, face.b, FACE_TOLERANCE);
            if (!covers) continue;

            if (edgeRoles_[i] && *edgeRoles_[i] != face.role) {
                edgeConflict_[i] = true;
            }
            edgeRoles_[i] = face.role;
        }
    }
}

FaceRole LotGeometry::edgeRole(size_t edge) const {
    return edgeRoles_[edge].value_or(FaceRole::Side);
}

LotFrame LotGeometry::frame() const {
    LotFrame f;
    size_t n = boundary_.size();
    if (n < 2) return f;

    size_t ref = 0;
    for (size_t i = 0; i < n; ++i) {
        if (edgeRoles_[i] == FaceRole::Front) {
            ref = i;
            break;
        }
    }

    f.origin = boundary_.edgeStart(ref);
    geom::Point dir = boundary_.vectori(ref);
    if (dir.length() > geom::GeomUtils::EPSILON) {
        f.axis = dir.norm();
    }
    return f;
}

void LotGeometry::validate() const {
    if (!closed_) {
        throw InvalidLotError("lot ring is not closed (first vertex must be repeated last)");
    }
    if (boundary_.size() < 3) {
        throw InvalidLotError("lot ring has fewer than three distinct vertices");
    }
    if (boundary_.area() < geom::GeomUtils::EPSILON) {
        throw InvalidLotError("lot ring encloses no area");
    }
    if (!boundary_.isSimple()) {
        throw InvalidLotError("lot boundary is self-intersecting");
    }

    for (size_t f = 0; f < faces_.size(); ++f) {
        const BoundaryFace& face = faces_[f];
        for (const geom::Point& end : {face.a, face.b}) {
            bool onBoundary = false;
            for (size_t i = 0; i < boundary_.size() && !onBoundary; ++i) {
                onBoundary = geom::GeomUtils::pointOnSegment(
                    end, boundary_.edgeStart(i), boundary_.edgeEnd(i), FACE_TOLERANCE);
            }
            if (!onBoundary) {
                std::ostringstream msg;
                msg << "face " << f << " (" << faceRoleName(face.role) << ") endpoint ("
                    << end.x << ", " << end.y << ") is not on the lot boundary";
                throw InvalidLotError(msg.str());
            }
        }
    }

    for (size_t i = 0; i < boundary_.size(); ++i) {
        if (!edgeRoles_[i]) {
            std::ostringstream msg;
            msg << "boundary edge " << i << " is not covered by any face";
            throw InvalidLotError(msg.str());
        }
        if (edgeConflict_[i]) {
            std::ostringstream msg;
            msg << "boundary edge " << i << " is covered by faces with different roles";
            throw InvalidLotError(msg.str());
        }
    }
}

} // namespace lot
} // namespace massing
