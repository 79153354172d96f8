#include "Path.hxx"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cregions {

Path::Path(std::vector<Curve> curves, double tol) : curves_(std::move(curves)), tol_(tol) {
    if (curves_.empty()) throw std::invalid_argument("Path needs at least one curve");
    for (std::size_t k = 0; k + 1 < curves_.size(); ++k) {
        if (!joined(curves_[k].point(1.0), curves_[k + 1].point(0.0))) {
            throw PathContinuityError(k, "Curve " + std::to_string(k) + " does not end where curve " +
                                             std::to_string(k + 1) + " starts");
        }
    }
}

// Two infinite endpoints meet at the point at infinity.
bool Path::joined(const Point& a, const Point& b) const {
    if (!cregions::isFinite(a) || !cregions::isFinite(b)) return !cregions::isFinite(a) && !cregions::isFinite(b);
    return cregions::isApprox(a, b, tol_);
}

const Curve& Path::curve(int k) const {
    if (k < 0 || static_cast<std::size_t>(k) >= curves_.size()) {
        throw std::out_of_range("Curve index " + std::to_string(k) + " out of range");
    }
    return curves_[static_cast<std::size_t>(k)];
}

Point Path::vertex(int k) const {
    const int n = static_cast<int>(curves_.size());
    if (k < 0 || k > n) throw std::out_of_range("Vertex index " + std::to_string(k) + " out of range");
    return k == n ? curves_.back().point(1.0) : curves_[static_cast<std::size_t>(k)].point(0.0);
}

std::vector<Point> Path::vertices() const {
    std::vector<Point> v;
    v.reserve(curves_.size() + 1);
    for (const auto& c : curves_) v.push_back(c.point(0.0));
    v.push_back(curves_.back().point(1.0));
    return v;
}

std::pair<std::size_t, double> Path::sideArgs(double t) const {
    const double n = static_cast<double>(curves_.size());
    if (!(t >= 0.0 && t <= n)) throw std::out_of_range("Path parameter " + std::to_string(t) + " out of range");
    if (t == n) return {curves_.size() - 1, 1.0};
    const double k = std::floor(t);
    return {static_cast<std::size_t>(k), t - k};
}

Point Path::point(double t) const {
    const auto [k, s] = sideArgs(t);
    return curves_[k].point(s);
}

Point Path::tangent(double t) const {
    const auto [k, s] = sideArgs(t);
    return curves_[k].tangent(s);
}

Point Path::unitTangent(double t) const {
    const auto [k, s] = sideArgs(t);
    return curves_[k].unitTangent(s);
}

Point Path::normal(double t) const {
    const auto [k, s] = sideArgs(t);
    return curves_[k].normal(s);
}

bool Path::isFinite() const {
    return std::all_of(curves_.begin(), curves_.end(), [](const Curve& c) { return c.isFinite(); });
}

double Path::arclength() const {
    double len = 0.0;
    for (const auto& c : curves_) len += c.arclength();
    return len;
}

double Path::dist(const Point& z) const {
    double d = std::numeric_limits<double>::infinity();
    for (const auto& c : curves_) d = std::min(d, c.dist(z));
    return d;
}

Point Path::closest(const Point& z) const {
    std::size_t best = 0;
    double d = std::numeric_limits<double>::infinity();
    for (std::size_t k = 0; k < curves_.size(); ++k) {
        const double dk = curves_[k].dist(z);
        if (dk < d) { d = dk; best = k; }
    }
    return curves_[best].closest(z);
}

bool Path::isApprox(const Path& other, double tol) const {
    if (curves_.size() != other.curves_.size()) return false;
    for (std::size_t k = 0; k < curves_.size(); ++k) {
        if (!curves_[k].isApprox(other.curves_[k], tol)) return false;
    }
    return true;
}

// ---------------------------------------------------------------- curve-wise maps

std::vector<Curve> Path::translated(const Point& z) const {
    std::vector<Curve> out;
    out.reserve(curves_.size());
    for (const auto& c : curves_) out.push_back(c.translate(z));
    return out;
}

std::vector<Curve> Path::scaled(const Point& z) const {
    std::vector<Curve> out;
    out.reserve(curves_.size());
    for (const auto& c : curves_) out.push_back(c.scale(z));
    return out;
}

std::vector<Curve> Path::reversed() const {
    std::vector<Curve> out;
    out.reserve(curves_.size());
    for (auto it = curves_.rbegin(); it != curves_.rend(); ++it) out.push_back(it->reverse());
    return out;
}

std::vector<Curve> Path::conjugated() const {
    std::vector<Curve> out;
    out.reserve(curves_.size());
    for (const auto& c : curves_) out.push_back(c.conj());
    return out;
}

std::vector<Curve> Path::inverted() const {
    std::vector<Curve> out;
    out.reserve(curves_.size());
    for (const auto& c : curves_) out.push_back(c.inv(tol_));
    return out;
}

Path Path::translate(const Point& z) const { return Path(translated(z), tol_, Unchecked{}); }
Path Path::scale(const Point& z) const { return Path(scaled(z), tol_, Unchecked{}); }
Path Path::reverse() const { return Path(reversed(), tol_, Unchecked{}); }
Path Path::conj() const { return Path(conjugated(), tol_, Unchecked{}); }
Path Path::inv() const { return Path(inverted(), tol_, Unchecked{}); }

// ---------------------------------------------------------------- ClosedPath

ClosedPath::ClosedPath(std::vector<Curve> curves, double tol) : Path(std::move(curves), tol) {
    if (!joined(curves_.back().point(1.0), curves_.front().point(0.0))) {
        const std::size_t last = curves_.size() - 1;
        throw PathContinuityError(last, "Curve " + std::to_string(last) + " does not end where curve 0 starts");
    }
}

const Curve& ClosedPath::curve(int k) const {
    const int n = static_cast<int>(curves_.size());
    return curves_[static_cast<std::size_t>(((k % n) + n) % n)];
}

Point ClosedPath::vertex(int k) const { return curve(k).point(0.0); }

std::vector<Point> ClosedPath::vertices() const {
    std::vector<Point> v;
    v.reserve(curves_.size());
    for (const auto& c : curves_) v.push_back(c.point(0.0));
    return v;
}

std::pair<std::size_t, double> ClosedPath::sideArgs(double t) const {
    if (!std::isfinite(t)) throw std::out_of_range("Path parameter must be finite");
    const double n = static_cast<double>(curves_.size());
    const double k = std::floor(t);
    const double s = t - k;
    const double idx = k - n * std::floor(k / n);
    return {static_cast<std::size_t>(idx), s};
}

ClosedPath ClosedPath::translate(const Point& z) const { return ClosedPath(translated(z), tol_, Unchecked{}); }
ClosedPath ClosedPath::scale(const Point& z) const { return ClosedPath(scaled(z), tol_, Unchecked{}); }
ClosedPath ClosedPath::reverse() const { return ClosedPath(reversed(), tol_, Unchecked{}); }
ClosedPath ClosedPath::conj() const { return ClosedPath(conjugated(), tol_, Unchecked{}); }
ClosedPath ClosedPath::inv() const { return ClosedPath(inverted(), tol_, Unchecked{}); }

// ---------------------------------------------------------------- intersections

IntersectionResult intersect(const Path& p, const Curve& c, double tol) {
    const CurveIntersector ix(tol);
    IntersectionResult out;
    for (const auto& side : p.curves()) out.merge(ix.intersect(side, c), tol);
    return out;
}

IntersectionResult intersect(const Path& a, const Path& b, double tol) {
    IntersectionResult out;
    for (const auto& side : b.curves()) out.merge(intersect(a, side, tol), tol);
    return out;
}

} // namespace cregions
