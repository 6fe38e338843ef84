#include "massing/geom/Polygon.h"
#include <algorithm>
#include <cmath>

namespace massing {
namespace geom {

double Polygon::area() const {
    return std::abs(square());
}

double Polygon::perimeter() const {
    double len = 0.0;
    forEdge([&len](const Point& v0, const Point& v1) {
        len += Point::distance(v0, v1);
    });
    return len;
}

Point Polygon::centroid() const {
    double x = 0.0, y = 0.0, a = 0.0;
    forEdge([&x, &y, &a](const Point& v0, const Point& v1) {
        double f = GeomUtils::cross(v0.x, v0.y, v1.x, v1.y);
        a += f;
        x += (v0.x + v1.x) * f;
        y += (v0.y + v1.y) * f;
    });
    if (std::abs(a) < GeomUtils::EPSILON) {
        return vertices_.empty() ? Point() : vertices_[0];
    }
    double s6 = 1.0 / (3.0 * a);
    return Point(s6 * x, s6 * y);
}

Rectangle Polygon::getBounds() const {
    if (vertices_.empty()) return Rectangle();

    Rectangle rect(vertices_[0].x, vertices_[0].y);
    for (const auto& v : vertices_) {
        rect.left = std::min(rect.left, v.x);
        rect.right = std::max(rect.right, v.x);
        rect.top = std::min(rect.top, v.y);
        rect.bottom = std::max(rect.bottom, v.y);
    }
    return rect;
}

bool Polygon::isConvex() const {
    size_t len = vertices_.size();
    if (len < 3) return false;

    double sign = square() >= 0 ? 1.0 : -1.0;
    for (size_t i = 0; i < len; ++i) {
        const Point& v0 = vertices_[(i + len - 1) % len];
        const Point& v1 = vertices_[i];
        const Point& v2 = vertices_[(i + 1) % len];
        double turn = GeomUtils::cross(v1.x - v0.x, v1.y - v0.y, v2.x - v1.x, v2.y - v1.y);
        if (turn * sign < -GeomUtils::EPSILON) return false;
    }
    return true;
}

bool Polygon::isSimple() const {
    size_t len = vertices_.size();
    if (len < 3) return false;

    for (size_t i = 0; i < len; ++i) {
        for (size_t j = i + 1; j < len; ++j) {
            // Adjacent edges share a vertex by construction
            bool adjacent = (j == i + 1) || (i == 0 && j == len - 1);
            if (adjacent) continue;

            if (GeomUtils::segmentsIntersect(edgeStart(i), edgeEnd(i), edgeStart(j), edgeEnd(j))) {
                return false;
            }
        }
    }
    return true;
}

Polygon Polygon::reversed() const {
    std::vector<Point> pts(vertices_.rbegin(), vertices_.rend());
    return Polygon(std::move(pts));
}

Polygon Polygon::rotated(double a, const Point& pivot) const {
    std::vector<Point> pts;
    pts.reserve(vertices_.size());
    for (const auto& v : vertices_) {
        pts.push_back(v.subtract(pivot).rotate(a).add(pivot));
    }
    return Polygon(std::move(pts));
}

} // namespace geom
} // namespace massing
