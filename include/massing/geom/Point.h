#pragma once

#include <cmath>

namespace massing {
namespace geom {

/**
 * 2D point / vector in metric lot coordinates (metres).
 * Value type: floor footprints own their vertices.
 */
class Point {
public:
    double x;
    double y;

    Point() : x(0), y(0) {}
    Point(double x, double y) : x(x), y(y) {}

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point& other) const {
        return !(*this == other);
    }

    // Approximate equality for floating point comparisons
    bool equals(const Point& other, double epsilon = 1e-9) const {
        return std::abs(x - other.x) < epsilon && std::abs(y - other.y) < epsilon;
    }

    Point add(const Point& other) const {
        return Point(x + other.x, y + other.y);
    }

    Point subtract(const Point& other) const {
        return Point(x - other.x, y - other.y);
    }

    Point scale(double f) const {
        return Point(x * f, y * f);
    }

    double length() const {
        return std::sqrt(x * x + y * y);
    }

    static double distance(const Point& p1, const Point& p2) {
        double dx = p2.x - p1.x;
        double dy = p2.y - p1.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    static Point midpoint(const Point& p1, const Point& p2) {
        return Point((p1.x + p2.x) / 2.0, (p1.y + p2.y) / 2.0);
    }

    Point norm(double len = 1.0) const {
        double l = length();
        if (l > 0) {
            return Point(x / l * len, y / l * len);
        }
        return *this;
    }

    // Rotate 90 degrees counterclockwise
    Point rotate90() const {
        return Point(-y, x);
    }

    // Rotate around the origin by angle in radians
    Point rotate(double a) const {
        double cosA = std::cos(a);
        double sinA = std::sin(a);
        return Point(x * cosA - y * sinA, y * cosA + x * sinA);
    }

    double dot(const Point& other) const {
        return x * other.x + y * other.y;
    }

    // z-component of the 3D cross product
    double cross(const Point& other) const {
        return x * other.y - y * other.x;
    }
};

} // namespace geom
} // namespace massing
