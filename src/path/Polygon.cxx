#include "Polygon.hxx"

#include <cmath>

namespace cregions {

namespace {
static void checkSides(const std::vector<Curve>& sides, bool allowArcs) {
    for (std::size_t k = 0; k < sides.size(); ++k) {
        const Curve& s = sides[k];
        if (s.is<Segment>() || s.is<Ray>() || (allowArcs && s.is<Arc>())) continue;
        throw UnsupportedSideError(k, "Side " + std::to_string(k) + " is a " + kindName(s.kind()) +
                                          (allowArcs ? "; sides must be segments, rays or arcs"
                                                     : "; sides must be segments or rays"));
    }
}

static std::vector<Curve> sidesFromVertices(const std::vector<PolygonVertex>& v) {
    const std::size_t n = v.size();
    if (n < 2) throw std::invalid_argument("Polygon needs at least two vertices");
    std::vector<Curve> sides;
    sides.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        const PolygonVertex& a = v[k];
        const PolygonVertex& b = v[(k + 1) % n];
        if (a.isFinite() && b.isFinite()) {
            sides.emplace_back(Segment(a.point(), b.point()));
        } else if (a.isFinite()) {
            sides.emplace_back(Ray(a.point(), b.angleIn()));
        } else if (b.isFinite()) {
            sides.emplace_back(Ray(b.point(), a.angleOut(), true));
        } else {
            throw std::invalid_argument("Consecutive vertices at infinity");
        }
    }
    return sides;
}
} // anonymous namespace

// ---------------------------------------------------------------- CircularPolygon

CircularPolygon::CircularPolygon(std::vector<Curve> curves, double tol) : ClosedPath(std::move(curves), tol) {
    checkSides(curves_, true);
}

CircularPolygon::CircularPolygon(const ClosedPath& p) : ClosedPath(p.curves(), p.tol(), Unchecked{}) {
    checkSides(curves_, true);
}

CircularPolygon CircularPolygon::translate(const Point& z) const { return CircularPolygon(translated(z), tol_, Unchecked{}); }
CircularPolygon CircularPolygon::scale(const Point& z) const { return CircularPolygon(scaled(z), tol_, Unchecked{}); }
CircularPolygon CircularPolygon::reverse() const { return CircularPolygon(reversed(), tol_, Unchecked{}); }
CircularPolygon CircularPolygon::conj() const { return CircularPolygon(conjugated(), tol_, Unchecked{}); }
CircularPolygon CircularPolygon::inv() const { return CircularPolygon(inverted(), tol_, Unchecked{}); }

// ---------------------------------------------------------------- Polygon

PolygonVertex PolygonVertex::atInfinity(double angleIn, double angleOut) {
    PolygonVertex v;
    v.angleIn_ = angleIn;
    v.angleOut_ = angleOut;
    return v;
}

Polygon::Polygon(std::vector<Curve> curves, double tol) : CircularPolygon(std::move(curves), tol) {
    checkSides(curves_, false);
}

Polygon::Polygon(const std::vector<PolygonVertex>& vertices, double tol) : Polygon(sidesFromVertices(vertices), tol) {}

Polygon Polygon::translate(const Point& z) const { return Polygon(translated(z), tol_, Unchecked{}); }
Polygon Polygon::scale(const Point& z) const { return Polygon(scaled(z), tol_, Unchecked{}); }
Polygon Polygon::reverse() const { return Polygon(reversed(), tol_, Unchecked{}); }
Polygon Polygon::conj() const { return Polygon(conjugated(), tol_, Unchecked{}); }
CircularPolygon Polygon::inv() const { return CircularPolygon::inv(); }

// ---------------------------------------------------------------- constructors

Polygon rectangle(const std::array<double, 2>& xlim, const std::array<double, 2>& ylim) {
    const Point z0(xlim[0], ylim[0]), z1(xlim[1], ylim[0]), z2(xlim[1], ylim[1]), z3(xlim[0], ylim[1]);
    return Polygon(std::vector<Curve>{Segment(z0, z1), Segment(z1, z2), Segment(z2, z3), Segment(z3, z0)});
}

Polygon rectangle(const Point& z1, const Point& z2) {
    return rectangle(std::array<double, 2>{z1.real(), z2.real()}, std::array<double, 2>{z1.imag(), z2.imag()});
}

Polygon nGon(int n) {
    if (n < 3) throw std::invalid_argument("An n-gon needs at least three vertices");
    std::vector<PolygonVertex> v;
    v.reserve(static_cast<std::size_t>(n));
    for (int k = 0; k < n; ++k) v.emplace_back(std::polar(1.0, kTwoPi * k / n));
    return Polygon(v);
}

} // namespace cregions
