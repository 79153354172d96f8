#ifndef CREGIONS_INTERSECTION_HXX
#define CREGIONS_INTERSECTION_HXX

#include "Curve.hxx"

#include <cstddef>
#include <vector>

namespace cregions {

// Outcome of intersecting two curves: isolated points, overlapping
// sub-curves, or nothing. Kind is derived from the contents.
class IntersectionResult {
public:
    enum class Kind { Empty, SinglePoint, PointPair, MultiplePoints, Overlap };

    IntersectionResult() = default;

    static IntersectionResult none() { return IntersectionResult(); }
    static IntersectionResult at(const Point& z);
    // Collapses to a single point when a and b coincide within tol.
    static IntersectionResult pair(const Point& a, const Point& b, double tol = kDefaultTol);
    static IntersectionResult overlap(const Curve& c);

    Kind kind() const;
    bool empty() const { return points_.empty() && curves_.empty(); }
    const std::vector<Point>& points() const { return points_; }
    const std::vector<Curve>& curves() const { return curves_; }

    // Appends a point unless an equal one (within tol) is already present.
    void addPoint(const Point& z, double tol = kDefaultTol);
    void addCurve(const Curve& c) { curves_.push_back(c); }
    void merge(const IntersectionResult& other, double tol = kDefaultTol);

private:
    std::vector<Point> points_;
    std::vector<Curve> curves_;
};

// Closed-form pairwise intersection of elementary curves. One canonical
// routine exists per unordered pair of kinds; the swapped order reuses it.
// All coincidence and containment decisions use the relative tolerance
// tol*(1 + |scale|) of the quantities involved.
class CurveIntersector {
public:
    explicit CurveIntersector(double tol = kDefaultTol) : tol_(tol) {}

    double tol() const { return tol_; }

    IntersectionResult intersect(const Curve& a, const Curve& b) const;

    // Signed number of crossings of the rightward horizontal ray from z with
    // the curve: +1 for each upward crossing, -1 for each downward one.
    // Crossings exactly at a curve endpoint count only at its lower end, so
    // consecutive sides sharing a vertex are not counted twice. A level line
    // that only touches an arc at its highest or lowest point does not cross it.
    int horizontalCrossing(const Point& z, const Curve& c) const;

    // Canonical pair routines, ordered Line < Ray < Segment < Circle < Arc.
    IntersectionResult intersect(const Line& a, const Line& b) const;
    IntersectionResult intersect(const Line& a, const Ray& b) const;
    IntersectionResult intersect(const Line& a, const Segment& b) const;
    IntersectionResult intersect(const Line& a, const Circle& b) const;
    IntersectionResult intersect(const Line& a, const Arc& b) const;
    IntersectionResult intersect(const Ray& a, const Ray& b) const;
    IntersectionResult intersect(const Ray& a, const Segment& b) const;
    IntersectionResult intersect(const Ray& a, const Circle& b) const;
    IntersectionResult intersect(const Ray& a, const Arc& b) const;
    IntersectionResult intersect(const Segment& a, const Segment& b) const;
    IntersectionResult intersect(const Segment& a, const Circle& b) const;
    IntersectionResult intersect(const Segment& a, const Arc& b) const;
    IntersectionResult intersect(const Circle& a, const Circle& b) const;
    IntersectionResult intersect(const Circle& a, const Arc& b) const;
    IntersectionResult intersect(const Arc& a, const Arc& b) const;

private:
    double tol_;

    // Solves z1 + t1*s1 == z2 + t2*s2. Returns false when the 2x2 system is
    // ill-conditioned (condition number > 1/tol), i.e. the directions are parallel.
    bool meet(const Point& z1, const Point& s1, const Point& z2, const Point& s2, double& t1, double& t2) const;

    double slack(double scale) const { return tol_ * (1.0 + scale); }
    IntersectionResult keepOnArc(const IntersectionResult& r, const Arc& a) const;
    IntersectionResult keepWithin(const IntersectionResult& r, const Curve& c) const;
};

} // namespace cregions

#endif // CREGIONS_INTERSECTION_HXX
