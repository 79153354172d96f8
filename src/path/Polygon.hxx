#ifndef CREGIONS_POLYGON_HXX
#define CREGIONS_POLYGON_HXX

#include "Path.hxx"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace cregions {

// Thrown when side index() has a kind the polygon type does not admit.
class UnsupportedSideError : public std::runtime_error {
public:
    UnsupportedSideError(std::size_t index, const std::string& what) : std::runtime_error(what), index_(index) {}
    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

// Closed path whose sides are segments, rays or arcs.
class CircularPolygon : public ClosedPath {
public:
    explicit CircularPolygon(std::vector<Curve> curves, double tol = kDefaultTol);
    explicit CircularPolygon(const ClosedPath& p);

    // Sides are the curves; a vertex is the start of a side.
    const std::vector<Curve>& sides() const { return curves_; }

    CircularPolygon translate(const Point& z) const;
    CircularPolygon scale(const Point& z) const;
    CircularPolygon reverse() const;
    CircularPolygon conj() const;
    CircularPolygon inv() const;

protected:
    CircularPolygon(std::vector<Curve> curves, double tol, Unchecked)
        : ClosedPath(std::move(curves), tol, Unchecked{}) {}
};

// Vertex of a polygon given by its corners. A vertex at infinity is described
// by the angle of the ray arriving at it ("to infinity") and the angle of the
// ray leaving it ("from infinity").
class PolygonVertex {
public:
    PolygonVertex(const Point& z) : z_(z), angleIn_(0.0), angleOut_(0.0), finite_(true) {}
    PolygonVertex(double x) : PolygonVertex(Point(x)) {}
    static PolygonVertex atInfinity(double angleIn, double angleOut);

    bool isFinite() const { return finite_; }
    const Point& point() const { return z_; }
    double angleIn() const { return angleIn_; }
    double angleOut() const { return angleOut_; }

private:
    PolygonVertex() : z_(infinity()), angleIn_(0.0), angleOut_(0.0), finite_(false) {}

    Point z_;
    double angleIn_;
    double angleOut_;
    bool finite_;
};

// Circular polygon restricted to segment and ray sides.
class Polygon : public CircularPolygon {
public:
    explicit Polygon(std::vector<Curve> curves, double tol = kDefaultTol);
    explicit Polygon(const std::vector<PolygonVertex>& vertices, double tol = kDefaultTol);

    Polygon translate(const Point& z) const;
    Polygon scale(const Point& z) const;
    Polygon reverse() const;
    Polygon conj() const;
    // Segments and rays invert to segments and arcs.
    CircularPolygon inv() const;

protected:
    Polygon(std::vector<Curve> curves, double tol, Unchecked) : CircularPolygon(std::move(curves), tol, Unchecked{}) {}
};

// Rectangle xlim[0] < x < xlim[1], ylim[0] < y < ylim[1], traversed from (xlim[0], ylim[0]).
Polygon rectangle(const std::array<double, 2>& xlim, const std::array<double, 2>& ylim);
// Rectangle with opposing corners z1, z2.
Polygon rectangle(const Point& z1, const Point& z2);
// Regular n-gon with vertices at the n-th roots of unity; throws for n < 3.
Polygon nGon(int n);

} // namespace cregions

#endif // CREGIONS_POLYGON_HXX
