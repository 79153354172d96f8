#include "Winding.hxx"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace cregions {

namespace {
// x mod 2pi in [0, 2pi)
static double modTwoPi(double x) {
    double m = std::fmod(x, kTwoPi);
    if (m < 0.0) m += kTwoPi;
    return m;
}

// Turn from direction s1 to direction s2, in (-pi, pi]; negative is a left turn.
static double turn(const Point& s1, const Point& s2) { return kPi - modTwoPi(std::arg(s2 / s1) + kPi); }

static bool isForwardRay(const Curve& c) { return c.is<Ray>() && !c.as<Ray>().reversed(); }
static bool isReversedRay(const Curve& c) { return c.is<Ray>() && c.as<Ray>().reversed(); }

static std::vector<Point> finiteVertices(const Polygon& p) {
    std::vector<Point> v;
    for (const auto& z : p.vertices()) {
        if (isFinite(z)) v.push_back(z);
    }
    return v;
}
} // anonymous namespace

int PolygonWinding::winding(const Point& z, const CircularPolygon& p) const {
    int w = 0;
    if (p.isFinite()) {
        for (const auto& side : p.sides()) w += ix_.horizontalCrossing(z, side);
        return w;
    }
    // Cut along a circle that also encloses z, so the cut cannot change W(z)
    const Polygon poly = straightSides(p);
    Circle c = boundingCircle(poly);
    const double reach = 2.0 * std::abs(z - c.center());
    if (reach > c.radius()) c = Circle(c.center(), reach);
    const CircularPolygon cut = truncate(poly, c);
    for (const auto& side : cut.sides()) w += ix_.horizontalCrossing(z, side);
    return w;
}

Polygon PolygonWinding::straightSides(const CircularPolygon& p) const {
    const auto& s = p.sides();
    const bool straight = std::all_of(s.begin(), s.end(), [](const Curve& c) { return !c.is<Arc>(); });
    if (!straight) throw NotImplementedError("Truncation of an unbounded circular polygon with arcs is not implemented");
    return Polygon(s, p.tol());
}

Circle PolygonWinding::boundingCircle(const Polygon& p) const {
    const std::vector<Point> v = finiteVertices(p);
    if (v.empty()) throw NotImplementedError("Truncation of a polygon without finite vertices is not implemented");
    const Point zc = std::accumulate(v.begin(), v.end(), Point(0.0)) / static_cast<double>(v.size());
    double R = 0.0;
    for (const auto& z : v) R = std::max(R, std::abs(z - zc));
    // A single finite vertex leaves no spread to scale from.
    return Circle(zc, R > 0.0 ? 2.0 * R : 1.0);
}

CircularPolygon PolygonWinding::truncate(const CircularPolygon& p) const {
    if (p.isFinite()) return p;
    return truncate(straightSides(p));
}

CircularPolygon PolygonWinding::truncate(const Polygon& p) const {
    if (p.isFinite()) return p;
    return truncate(p, boundingCircle(p));
}

Point PolygonWinding::exitPoint(const Ray& r, const Circle& c) const {
    const IntersectionResult hits = ix_.intersect(r, c);
    if (hits.points().empty()) throw std::invalid_argument("Ray does not meet the truncation circle");
    Point best = hits.points().front();
    for (const auto& z : hits.points()) {
        if (std::abs(z - r.base()) > std::abs(best - r.base())) best = z;
    }
    return best;
}

CircularPolygon PolygonWinding::truncate(const Polygon& p, const Circle& c) const {
    const auto& s = p.sides();
    const std::size_t n = s.size();
    const Circle circle(c.center(), c.radius());
    std::vector<Curve> out;
    out.reserve(n + 2);

    // When the first side returns from infinity, its partner is the last side.
    bool pending = false;
    Point zPre;
    if (isReversedRay(s.front()) && isForwardRay(s.back())) {
        zPre = exitPoint(s.back().as<Ray>(), circle);
        pending = true;
    }

    for (std::size_t k = 0; k < n; ++k) {
        if (!s[k].is<Ray>()) {
            out.push_back(s[k]);
            continue;
        }
        const Ray& r = s[k].as<Ray>();
        if (!r.reversed()) {
            zPre = exitPoint(r, circle);
            out.emplace_back(Segment(r.base(), zPre));
            pending = true;
            continue;
        }
        if (!pending) throw std::invalid_argument("Ray from infinity without a ray to infinity before it");
        const Point zPost = exitPoint(r, circle);
        const Point zc = circle.center();
        const double start = angleFraction(zPre - zc);
        const double span = mod1(std::arg((zPost - zc) / (zPre - zc)) / kTwoPi);
        out.emplace_back(Arc(circle, start, span));
        out.emplace_back(Segment(zPost, r.base()));
        pending = false;
    }
    return CircularPolygon(out, p.tol());
}

std::vector<double> PolygonWinding::rawAngles(const Polygon& p) const {
    const std::size_t n = p.size();
    std::vector<double> theta(n, 0.0);
    if (n == 2) return theta;

    const auto& s = p.sides();
    const std::vector<Point> v = p.vertices();
    double R = 0.0;
    for (const auto& z : finiteVertices(p)) R = std::max(R, std::abs(z));
    if (R == 0.0) R = 1.0;

    for (std::size_t k = 0; k < n; ++k) {
        const std::size_t kp = (k + n - 1) % n;
        theta[k] = kPi + turn(s[kp].unitTangent(0.5), s[k].unitTangent(0.5));
        if (isFinite(v[k])) continue;
        theta[k] -= kTwoPi;
        if (std::fabs(theta[k]) <= tol_) {
            // Parallel rays: decide between 0 and -2pi from where they cross a large circle
            const Circle big(Point(0.0), 100.0 * R);
            const Point zPrev = exitPoint(s[kp].as<Ray>(), big);
            const Point zNext = exitPoint(s[k].as<Ray>(), big);
            if (std::arg(zNext / zPrev) < 0.0) theta[k] -= kTwoPi;
        }
    }
    return theta;
}

std::vector<double> PolygonWinding::angles(const Polygon& p) const {
    std::vector<double> theta = rawAngles(p);
    const double sum = std::accumulate(theta.begin(), theta.end(), 0.0);
    if (sum < 0.0) {
        for (auto& a : theta) a = -a;
    }
    return theta;
}

} // namespace cregions
