#include "Intersection.hxx"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <vector>

namespace cregions {

namespace {
// Canonical ordering of the curve kinds for pair dispatch.
template <class T> struct KindRank;
template <> struct KindRank<Line> : std::integral_constant<int, 0> {};
template <> struct KindRank<Ray> : std::integral_constant<int, 1> {};
template <> struct KindRank<Segment> : std::integral_constant<int, 2> {};
template <> struct KindRank<Circle> : std::integral_constant<int, 3> {};
template <> struct KindRank<Arc> : std::integral_constant<int, 4> {};

static const Point kI(0.0, 1.0);

struct ArcCut {
    double t;
    double y;
};

// Signed crossings of the rightward horizontal ray from z with the arc of the
// circle (zc, r) sweeping angle fractions [start, start + delta]. The arc is
// cut at its highest and lowest points; each piece is monotone in height and
// obeys the same half-open rule as a segment, so a level line that only
// touches the arc is never counted.
static int arcCrossing(const Point& z, const Point& zc, double r, double start, double delta) {
    auto height = [&](double t) { return zc.imag() + r * std::sin(kTwoPi * (start + delta * t)); };
    std::vector<ArcCut> cuts{{0.0, height(0.0)}, {1.0, height(1.0)}};
    for (int m = -2; m <= 2; ++m) {
        const double tTop = (0.25 + m - start) / delta;
        const double tBottom = (0.75 + m - start) / delta;
        if (tTop > 0.0 && tTop < 1.0) cuts.push_back({tTop, zc.imag() + r});
        if (tBottom > 0.0 && tBottom < 1.0) cuts.push_back({tBottom, zc.imag() - r});
    }
    std::sort(cuts.begin(), cuts.end(), [](const ArcCut& a, const ArcCut& b) { return a.t < b.t; });

    const double y = z.imag();
    // endpoint heights computed by neighbouring curves differ in the last bits
    const double eps = 8.0 * std::numeric_limits<double>::epsilon() * (1.0 + std::fabs(y));
    auto snap = [&](double h) { return std::fabs(h - y) <= eps ? y : h; };

    int crossings = 0;
    for (std::size_t k = 0; k + 1 < cuts.size(); ++k) {
        const double y0 = snap(cuts[k].y), y1 = snap(cuts[k + 1].y);
        int dir = 0;
        if (y0 <= y && y < y1) dir = 1;
        else if (y1 <= y && y < y0) dir = -1;
        if (dir == 0) continue;
        const double tm = 0.5 * (cuts[k].t + cuts[k + 1].t);
        const double side = std::cos(kTwoPi * (start + delta * tm)) > 0.0 ? 1.0 : -1.0;
        const double dy = y - zc.imag();
        const double x = zc.real() + side * std::sqrt(std::max(0.0, r * r - dy * dy));
        if (x > z.real()) crossings += dir;
    }
    return crossings;
}
}

// ---------------------------------------------------------------- IntersectionResult

IntersectionResult IntersectionResult::at(const Point& z) {
    IntersectionResult r;
    r.points_.push_back(z);
    return r;
}

IntersectionResult IntersectionResult::pair(const Point& a, const Point& b, double tol) {
    if (isApprox(a, b, tol)) return at(0.5 * (a + b));
    IntersectionResult r;
    r.points_ = {a, b};
    return r;
}

IntersectionResult IntersectionResult::overlap(const Curve& c) {
    IntersectionResult r;
    r.curves_.push_back(c);
    return r;
}

IntersectionResult::Kind IntersectionResult::kind() const {
    if (!curves_.empty()) return Kind::Overlap;
    switch (points_.size()) {
        case 0: return Kind::Empty;
        case 1: return Kind::SinglePoint;
        case 2: return Kind::PointPair;
        default: return Kind::MultiplePoints;
    }
}

void IntersectionResult::addPoint(const Point& z, double tol) {
    for (const auto& p : points_) {
        if (isApprox(p, z, tol)) return;
    }
    points_.push_back(z);
}

void IntersectionResult::merge(const IntersectionResult& other, double tol) {
    for (const auto& p : other.points_) addPoint(p, tol);
    for (const auto& c : other.curves_) curves_.push_back(c);
}

// ---------------------------------------------------------------- dispatch

IntersectionResult CurveIntersector::intersect(const Curve& a, const Curve& b) const {
    return std::visit([this](const auto& x, const auto& y) -> IntersectionResult {
        using X = std::decay_t<decltype(x)>;
        using Y = std::decay_t<decltype(y)>;
        if constexpr (KindRank<X>::value <= KindRank<Y>::value) {
            return intersect(x, y);
        } else {
            return intersect(y, x);
        }
    }, a.variant(), b.variant());
}

bool CurveIntersector::meet(const Point& z1, const Point& s1, const Point& z2, const Point& s2,
                            double& t1, double& t2) const {
    const double n1 = std::abs(s1), n2 = std::abs(s2);
    if (n1 == 0.0 || n2 == 0.0) return false;
    const Point u1 = s1 / n1, u2 = s2 / n2;
    // M = [ re(u1) -re(u2) ; im(u1) -im(u2) ]
    const double a = u1.real(), b = -u2.real(), c = u1.imag(), e = -u2.imag();
    const double det = a * e - b * c;
    if (det == 0.0) return false;
    // cond(M) = smax/smin = smax^2/|det| for a 2x2 matrix
    const double F = a * a + b * b + c * c + e * e;
    const double smax2 = 0.5 * (F + std::sqrt(std::max(0.0, F * F - 4.0 * det * det)));
    if (smax2 / std::fabs(det) > 1.0 / tol_) return false;
    const Point d = z2 - z1;
    t1 = (d.real() * e - b * d.imag()) / det / n1;
    t2 = (a * d.imag() - c * d.real()) / det / n2;
    return true;
}

IntersectionResult CurveIntersector::keepOnArc(const IntersectionResult& r, const Arc& a) const {
    IntersectionResult out;
    for (const auto& p : r.points()) {
        if (a.containsAngle(angleFraction(p - a.circle().center()), tol_)) out.addPoint(p, tol_);
    }
    return out;
}

IntersectionResult CurveIntersector::keepWithin(const IntersectionResult& r, const Curve& c) const {
    IntersectionResult out;
    for (const auto& p : r.points()) {
        if (c.dist(p) <= slack(std::abs(p))) out.addPoint(p, tol_);
    }
    return out;
}

// ---------------------------------------------------------------- straight pairs

IntersectionResult CurveIntersector::intersect(const Line& a, const Line& b) const {
    double t1 = 0.0, t2 = 0.0;
    if (!meet(a.base(), a.direction(), b.base(), b.direction(), t1, t2)) {
        // parallel: either the same line or disjoint
        return a.dist(b.base()) <= slack(std::abs(b.base())) ? IntersectionResult::overlap(a) : IntersectionResult::none();
    }
    return IntersectionResult::at(a.base() + t1 * a.direction());
}

IntersectionResult CurveIntersector::intersect(const Line& a, const Ray& b) const {
    double t1 = 0.0, t2 = 0.0;
    if (!meet(a.base(), a.direction(), b.base(), b.direction(), t1, t2)) {
        return a.dist(b.base()) <= slack(std::abs(b.base())) ? IntersectionResult::overlap(b) : IntersectionResult::none();
    }
    if (t2 < -slack(std::abs(b.base()))) return IntersectionResult::none();
    return IntersectionResult::at(a.base() + t1 * a.direction());
}

IntersectionResult CurveIntersector::intersect(const Line& a, const Segment& b) const {
    double t1 = 0.0, t2 = 0.0;
    if (!meet(a.base(), a.direction(), b.first(), b.second() - b.first(), t1, t2)) {
        return a.dist(b.first()) <= slack(std::abs(b.first())) ? IntersectionResult::overlap(b) : IntersectionResult::none();
    }
    if (t2 < -tol_ || t2 > 1.0 + tol_) return IntersectionResult::none();
    return IntersectionResult::at(a.base() + t1 * a.direction());
}

IntersectionResult CurveIntersector::intersect(const Ray& a, const Ray& b) const {
    const Point s1 = a.direction(), s2 = b.direction();
    double t1 = 0.0, t2 = 0.0;
    if (!meet(a.base(), s1, b.base(), s2, t1, t2)) {
        const double scale = std::abs(a.base()) + std::abs(b.base());
        if (Line(a.base(), s1).dist(b.base()) > slack(scale)) return IntersectionResult::none();
        // position of b's base along a
        const double u = (std::conj(s1) * (b.base() - a.base())).real();
        if ((std::conj(s1) * s2).real() > 0.0) {
            // same direction: the ray starting further along lies inside the other
            return u >= 0.0 ? IntersectionResult::overlap(b) : IntersectionResult::overlap(a);
        }
        if (u > slack(scale)) return IntersectionResult::overlap(Segment(a.base(), b.base()));
        if (u >= -slack(scale)) return IntersectionResult::at(a.base());
        return IntersectionResult::none();
    }
    if (t1 < -slack(std::abs(a.base())) || t2 < -slack(std::abs(b.base()))) return IntersectionResult::none();
    return IntersectionResult::at(a.base() + t1 * s1);
}

IntersectionResult CurveIntersector::intersect(const Ray& a, const Segment& b) const {
    const Point s1 = a.direction();
    double t1 = 0.0, t2 = 0.0;
    if (!meet(a.base(), s1, b.first(), b.second() - b.first(), t1, t2)) {
        const double scale = std::abs(a.base()) + std::abs(b.first()) + std::abs(b.second());
        if (Line(a.base(), s1).dist(b.first()) > slack(scale)) return IntersectionResult::none();
        // project the segment onto the ray's axis
        double p = (std::conj(s1) * (b.first() - a.base())).real();
        double q = (std::conj(s1) * (b.second() - a.base())).real();
        if (p > q) std::swap(p, q);
        if (q < -slack(scale)) return IntersectionResult::none();
        const double lo = std::max(0.0, p);
        if (q - lo <= slack(scale)) return IntersectionResult::at(a.base() + lo * s1);
        return IntersectionResult::overlap(Segment(a.base() + lo * s1, a.base() + q * s1));
    }
    if (t1 < -slack(std::abs(a.base())) || t2 < -tol_ || t2 > 1.0 + tol_) return IntersectionResult::none();
    return IntersectionResult::at(a.base() + t1 * s1);
}

IntersectionResult CurveIntersector::intersect(const Segment& a, const Segment& b) const {
    const Point s1 = a.second() - a.first();
    double t1 = 0.0, t2 = 0.0;
    if (!meet(a.first(), s1, b.first(), b.second() - b.first(), t1, t2)) {
        const double scale = std::abs(a.first()) + std::abs(a.second());
        if (Line::through(a.first(), a.second()).dist(b.first()) > slack(scale + std::abs(b.first()))) {
            return IntersectionResult::none();
        }
        // scale the first segment to [0,1] and clip the second against it
        double p = ((b.first() - a.first()) / s1).real();
        double q = ((b.second() - a.first()) / s1).real();
        if (p > q) std::swap(p, q);
        if (q < -tol_ || p > 1.0 + tol_) return IntersectionResult::none();
        const double lo = std::max(0.0, p), hi = std::min(1.0, q);
        if ((hi - lo) * std::abs(s1) <= slack(scale)) {
            return IntersectionResult::at(a.point(std::min(1.0, std::max(0.0, 0.5 * (lo + hi)))));
        }
        return IntersectionResult::overlap(Segment(a.point(lo), a.point(hi)));
    }
    if (t1 < -tol_ || t1 > 1.0 + tol_ || t2 < -tol_ || t2 > 1.0 + tol_) return IntersectionResult::none();
    return IntersectionResult::at(a.point(t1));
}

// ---------------------------------------------------------------- circular pairs

IntersectionResult CurveIntersector::intersect(const Line& a, const Circle& b) const {
    // foot of the radius perpendicular to the line
    const Line radial(b.center(), kI * a.direction());
    const IntersectionResult foot = intersect(a, radial);
    if (foot.kind() != IntersectionResult::Kind::SinglePoint) return IntersectionResult::none();
    const Point zf = foot.points().front();
    const double d = std::abs(zf - b.center()), r = b.radius();
    if (d > r + slack(r)) return IntersectionResult::none();
    const Point w = std::sqrt(std::max(0.0, r * r - d * d)) * a.direction();
    return IntersectionResult::pair(zf + w, zf - w, tol_);
}

IntersectionResult CurveIntersector::intersect(const Line& a, const Arc& b) const {
    return keepOnArc(intersect(a, b.circle()), b);
}

IntersectionResult CurveIntersector::intersect(const Ray& a, const Circle& b) const {
    return keepWithin(intersect(Line(a.base(), a.direction()), b), a);
}

IntersectionResult CurveIntersector::intersect(const Ray& a, const Arc& b) const {
    return keepOnArc(intersect(a, b.circle()), b);
}

IntersectionResult CurveIntersector::intersect(const Segment& a, const Circle& b) const {
    return keepWithin(intersect(Line::through(a.first(), a.second()), b), a);
}

IntersectionResult CurveIntersector::intersect(const Segment& a, const Arc& b) const {
    return keepOnArc(intersect(a, b.circle()), b);
}

IntersectionResult CurveIntersector::intersect(const Circle& a, const Circle& b) const {
    const double r1 = a.radius(), r2 = b.radius();
    const Point delta = b.center() - a.center();
    const double d = std::abs(delta);
    const double scale = r1 + r2;
    if (d <= slack(std::abs(a.center()))) {
        // concentric: identical or disjoint
        return isApprox(r1, r2, tol_) ? IntersectionResult::overlap(a) : IntersectionResult::none();
    }
    if (d > r1 + r2 + slack(scale) || d < std::fabs(r1 - r2) - slack(scale)) return IntersectionResult::none();
    const double along = (r1 * r1 - r2 * r2 + d * d) / (2.0 * d);
    const Point p = a.center() + along * delta / d;
    const double h = std::sqrt(std::max(0.0, r1 * r1 - along * along));
    const Point w = kI * h * delta / d;
    return IntersectionResult::pair(p + w, p - w, tol_);
}

IntersectionResult CurveIntersector::intersect(const Circle& a, const Arc& b) const {
    const IntersectionResult r = intersect(a, b.circle());
    if (r.kind() == IntersectionResult::Kind::Overlap) return IntersectionResult::overlap(b);
    return keepOnArc(r, b);
}

IntersectionResult CurveIntersector::intersect(const Arc& a, const Arc& b) const {
    const IntersectionResult r = intersect(a.circle(), b.circle());
    if (r.kind() != IntersectionResult::Kind::Overlap) return keepOnArc(keepOnArc(r, a), b);

    // Same circle: intersect the angular ranges, taken counterclockwise
    const double w1 = std::fabs(a.delta()), w2 = std::fabs(b.delta());
    const double s1 = a.delta() >= 0.0 ? a.start() : mod1(a.start() + a.delta());
    const double s2 = b.delta() >= 0.0 ? b.start() : mod1(b.start() + b.delta());
    IntersectionResult out;
    for (int k = -1; k <= 1; ++k) {
        const double lo = std::max(s1, s2 + k);
        const double hi = std::min(s1 + w1, s2 + k + w2);
        if (hi < lo - tol_) continue;
        if (hi - lo <= tol_) {
            out.addPoint(a.circle().point(mod1(lo)), tol_);
        } else {
            out.addCurve(Arc(a.circle(), lo, hi - lo));
        }
    }
    return out;
}

// ---------------------------------------------------------------- crossings

int CurveIntersector::horizontalCrossing(const Point& z, const Curve& c) const {
    if (c.is<Segment>()) {
        // fast path: compare heights directly
        const Segment& s = c.as<Segment>();
        const double y = z.imag(), y0 = s.first().imag(), y1 = s.second().imag();
        const double side = (std::conj(s.second() - s.first()) * (z - s.first())).imag();
        if (y0 <= y) {
            if (y1 > y && side > 0.0) return 1;
        } else if (y1 <= y && side < 0.0) {
            return -1;
        }
        return 0;
    }

    if (c.is<Arc>()) {
        const Arc& a = c.as<Arc>();
        return arcCrossing(z, a.circle().center(), a.circle().radius(), a.start(), a.delta());
    }
    if (c.is<Circle>()) {
        const Circle& o = c.as<Circle>();
        return arcCrossing(z, o.center(), o.radius(), 0.0, o.ccw() ? 1.0 : -1.0);
    }

    const IntersectionResult r = intersect(Curve(Line(z, Point(1.0))), c);
    int crossings = 0;
    for (const auto& p : r.points()) {
        if (p.real() <= z.real()) continue;
        const double dy = c.unitTangent(c.arg(p)).imag();
        if (std::fabs(dy) <= tol_) continue;
        const int sign = dy > 0.0 ? 1 : -1;
        if (c.is<Ray>()) {
            // an endpoint is counted only when it is the lower end of the crossing
            const double eps = slack(std::abs(p));
            if (std::abs(p - c.point(0.0)) <= eps && sign < 0) continue;
            if (std::abs(p - c.point(1.0)) <= eps && sign > 0) continue;
        }
        crossings += sign;
    }
    return crossings;
}

} // namespace cregions
