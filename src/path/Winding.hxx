#ifndef CREGIONS_WINDING_HXX
#define CREGIONS_WINDING_HXX

#include "Intersection.hxx"
#include "Polygon.hxx"

#include <stdexcept>
#include <vector>

namespace cregions {

class NotImplementedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// PolygonWinding: winding numbers, side tests, interior angles and truncation
// of (possibly unbounded) polygons.
//
// Unbounded polygons are handled by truncation: every ray "to infinity"
// followed by a ray "from infinity" is cut where it meets a bounding circle
// and the two cut points are joined by a counterclockwise arc of that circle.
// Winding numbers of points inside the circle are unchanged by the cut.
class PolygonWinding {
public:
    explicit PolygonWinding(double tol = kDefaultTol) : tol_(tol), ix_(tol) {}

    double tol() const { return tol_; }

    // Sunday's signed crossing count. Unreliable for z on the boundary. An
    // unbounded polygon is truncated along a circle enclosing z.
    int winding(const Point& z, const CircularPolygon& p) const;
    bool isLeft(const Point& z, const CircularPolygon& p) const { return winding(z, p) > 0; }
    bool isRight(const Point& z, const CircularPolygon& p) const { return winding(z, p) < 0; }

    // Bounded polygons are returned unchanged. Throws NotImplementedError when
    // there is no finite vertex, or when an unbounded polygon also has arcs.
    CircularPolygon truncate(const CircularPolygon& p) const;
    // Default circle: centroid of the finite vertices, radius twice the
    // largest distance from it to a finite vertex.
    CircularPolygon truncate(const Polygon& p) const;
    CircularPolygon truncate(const Polygon& p, const Circle& c) const;

    // Interior angle at each vertex. Finite vertices get angles in (0, 2pi],
    // vertices at infinity angles in [-2pi, 0]. Angles are measured on the left
    // of the boundary, so a clockwise polygon reports its exterior angles.
    std::vector<double> angles(const Polygon& p) const;

private:
    double tol_;
    CurveIntersector ix_;

    // Throws NotImplementedError for an unbounded polygon with arcs.
    Polygon straightSides(const CircularPolygon& p) const;
    Circle boundingCircle(const Polygon& p) const;
    // Intersection of the ray with the circle farthest from the ray's base.
    Point exitPoint(const Ray& r, const Circle& c) const;
    std::vector<double> rawAngles(const Polygon& p) const;
};

} // namespace cregions

#endif // CREGIONS_WINDING_HXX
