#include "Curve.hxx"

#include <limits>
#include <stdexcept>
#include <type_traits>

namespace cregions {

namespace {
static bool passesThroughOrigin(double distToOrigin, double scale, double tol) {
    return distToOrigin <= tol * (1.0 + scale);
}

static Curve invertLine(const Line& l, double tol) {
    if (passesThroughOrigin(l.dist(Point(0.0)), std::abs(l.base()), tol)) {
        return Line(Point(0.0), -std::conj(l.direction()));
    }
    return circleThrough(1.0 / l.point(0.25), 1.0 / l.point(0.5), 1.0 / l.point(0.75));
}

static Curve invertCircle(const Circle& c, double tol) {
    if (passesThroughOrigin(std::fabs(std::abs(c.center()) - c.radius()), c.radius(), tol)) {
        // Image is the line traversed from the image of the point after the origin onward
        const double t0 = c.arg(Point(0.0));
        return Line::through(1.0 / c.point(t0 + 0.25), 1.0 / c.point(t0 + 0.5));
    }
    return circleThrough(1.0 / c.point(0.0), 1.0 / c.point(1.0 / 3.0), 1.0 / c.point(2.0 / 3.0));
}

static Curve invertSegment(const Segment& s, double tol) {
    const double scale = std::max(std::abs(s.first()), std::abs(s.second()));
    if (passesThroughOrigin(s.dist(Point(0.0)), scale, tol)) {
        throw std::domain_error("Cannot invert a segment that passes through the origin");
    }
    const Point a = 1.0 / s.first(), b = 1.0 / s.second();
    if (passesThroughOrigin(Line::through(s.first(), s.second()).dist(Point(0.0)), scale, tol)) return Segment(a, b);
    return arcThrough(a, 1.0 / s.point(0.5), b);
}

static Curve invertRay(const Ray& r, double tol) {
    const double scale = std::abs(r.base());
    if (passesThroughOrigin(r.dist(Point(0.0)), scale, tol)) {
        throw std::domain_error("Cannot invert a ray that passes through the origin");
    }
    // The far end of the ray maps to the origin
    const Point base = 1.0 / r.base();
    const Point mid = 1.0 / (r.base() + r.direction());
    const Point a = r.reversed() ? Point(0.0) : base;
    const Point b = r.reversed() ? base : Point(0.0);
    if (passesThroughOrigin(Line(r.base(), r.direction()).dist(Point(0.0)), scale, tol)) return Segment(a, b);
    return arcThrough(a, mid, b);
}

static Curve invertArc(const Arc& a, double tol) {
    const Circle& c = a.circle();
    if (passesThroughOrigin(a.dist(Point(0.0)), c.radius() + std::abs(c.center()), tol)) {
        throw std::domain_error("Cannot invert an arc that passes through the origin");
    }
    const Point p0 = 1.0 / a.point(0.0), p1 = 1.0 / a.point(1.0);
    if (passesThroughOrigin(std::fabs(std::abs(c.center()) - c.radius()), c.radius(), tol)) return Segment(p0, p1);
    return arcThrough(p0, 1.0 / a.point(0.5), p1);
}
} // anonymous namespace

Point Curve::point(double t) const {
    return std::visit([t](const auto& c) { return c.point(t); }, v_);
}

Point Curve::tangent(double t) const {
    return std::visit([t](const auto& c) { return c.tangent(t); }, v_);
}

Point Curve::unitTangent(double t) const {
    return std::visit([t](const auto& c) { return c.unitTangent(t); }, v_);
}

Point Curve::normal(double t) const { return Point(0.0, 1.0) * unitTangent(t); }

double Curve::arclength() const {
    return std::visit([](const auto& c) { return c.arclength(); }, v_);
}

bool Curve::isFinite() const {
    return std::visit([](const auto& c) { return c.isFinite(); }, v_);
}

Curve Curve::reverse() const {
    return std::visit([](const auto& c) { return Curve(c.reverse()); }, v_);
}

Curve Curve::conj() const {
    return std::visit([](const auto& c) { return Curve(c.conj()); }, v_);
}

Curve Curve::translate(const Point& z) const {
    return std::visit([&z](const auto& c) { return Curve(c.translate(z)); }, v_);
}

Curve Curve::scale(const Point& z) const {
    if (z == Point(0.0)) throw std::invalid_argument("Cannot scale a curve by zero");
    return std::visit([&z](const auto& c) { return Curve(c.scale(z)); }, v_);
}

Curve Curve::inv(double tol) const {
    switch (kind()) {
        case CurveKind::Line: return invertLine(as<Line>(), tol);
        case CurveKind::Ray: return invertRay(as<Ray>(), tol);
        case CurveKind::Segment: return invertSegment(as<Segment>(), tol);
        case CurveKind::Circle: return invertCircle(as<Circle>(), tol);
        case CurveKind::Arc: return invertArc(as<Arc>(), tol);
    }
    throw std::logic_error("Unknown curve kind");
}

double Curve::dist(const Point& z) const {
    return std::visit([&z](const auto& c) { return c.dist(z); }, v_);
}

Point Curve::closest(const Point& z) const {
    return std::visit([&z](const auto& c) { return c.closest(z); }, v_);
}

double Curve::arg(const Point& z) const {
    return std::visit([&z](const auto& c) { return c.arg(z); }, v_);
}

bool Curve::isApprox(const Curve& other, double tol) const {
    if (kind() != other.kind()) return false;
    return std::visit([&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        return c.isApprox(other.as<T>(), tol);
    }, v_);
}

std::string kindName(CurveKind kind) {
    switch (kind) {
        case CurveKind::Line: return "Line";
        case CurveKind::Ray: return "Ray";
        case CurveKind::Segment: return "Segment";
        case CurveKind::Circle: return "Circle";
        case CurveKind::Arc: return "Arc";
    }
    return "Unknown";
}

Curve circleThrough(const Point& a, const Point& b, const Point& c) {
    if (!isFinite(a)) return Line::through(b, c);
    if (!isFinite(b)) return Line::through(a, c);
    if (!isFinite(c)) return Line::through(a, b);
    // Intersection of the chord bisectors, with a as the local origin
    const Point B = b - a, C = c - a;
    const double D = 2.0 * (B.real() * C.imag() - B.imag() * C.real());
    const double eps = std::numeric_limits<double>::epsilon();
    if (std::fabs(D) <= 64.0 * eps * std::abs(B) * std::abs(C)) {
        return a != b ? Line::through(a, b) : Line::through(a, c);
    }
    const double nb = std::norm(B), nc = std::norm(C);
    const Point center = a + Point((C.imag() * nb - B.imag() * nc) / D, (B.real() * nc - C.real() * nb) / D);
    return Circle(center, std::abs(a - center), D > 0.0);
}

Curve arcThrough(const Point& a, const Point& m, const Point& b) {
    const Curve c = circleThrough(a, m, b);
    if (!c.is<Circle>()) return Segment(a, b);
    const Point zc = c.as<Circle>().center();
    const double start = angleFraction(a - zc);
    const double ccwSpan = mod1(angleFraction(b - zc) - start);
    const double midSpan = mod1(angleFraction(m - zc) - start);
    const double delta = midSpan < ccwSpan ? ccwSpan : ccwSpan - 1.0;
    return Arc(Circle(zc, c.as<Circle>().radius()), start, delta);
}

Arc arcAround(const Point& a, const Point& b, const Point& center) {
    const double start = angleFraction(a - center);
    return Arc(Circle(center, std::abs(a - center)), start, mod1(angleFraction(b - center) - start));
}

} // namespace cregions
