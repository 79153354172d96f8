#include "Region.hxx"

#include <string>

namespace cregions {

bool SimplyConnectedRegion::isApprox(const SimplyConnectedRegion& other, double tol) const {
    if (left_ != other.left_) return boundary_.isApprox(other.boundary_.reverse(), tol);
    return boundary_.isApprox(other.boundary_, tol);
}

ConnectedRegion::ConnectedRegion(std::size_t n, std::optional<JordanCurve> outer, std::vector<JordanCurve> inner,
                                 double tol)
    : n_(n), outer_(std::move(outer)), inner_(std::move(inner)), tol_(tol) {
    if (n_ == 0) throw RegionArityError("Region connectivity must be at least 1");
    const std::size_t expected = outer_ ? n_ - 1 : n_;
    if (inner_.size() != expected) {
        throw RegionArityError("Region of connectivity " + std::to_string(n_) + " needs " +
                               std::to_string(expected) + " inner boundaries, got " + std::to_string(inner_.size()));
    }
}

bool ConnectedRegion::contains(const Point& z) const {
    for (const auto& c : inner_) {
        if (isLeft(z, c, tol_)) return false;
    }
    return !outer_ || isLeft(z, *outer_, tol_);
}

Annulus::Annulus(const Circle& outer, const Circle& inner) : outer_(outer), inner_(inner) {
    if (!(outer.radius() > inner.radius())) {
        throw std::invalid_argument("Annulus outer radius must exceed the inner radius");
    }
}

Annulus::Annulus(const Point& center, double outerRadius, double innerRadius)
    : Annulus(Circle(center, outerRadius), Circle(center, innerRadius)) {}

RegionUnion::RegionUnion(RegionPtr a, RegionPtr b) : a_(std::move(a)), b_(std::move(b)) {
    if (!a_ || !b_) throw std::invalid_argument("Region union needs two regions");
}

RegionIntersection::RegionIntersection(RegionPtr a, RegionPtr b) : a_(std::move(a)), b_(std::move(b)) {
    if (!a_ || !b_) throw std::invalid_argument("Region intersection needs two regions");
}

RegionPtr unite(RegionPtr a, RegionPtr b) { return std::make_shared<const RegionUnion>(std::move(a), std::move(b)); }

RegionPtr intersect(RegionPtr a, RegionPtr b) {
    return std::make_shared<const RegionIntersection>(std::move(a), std::move(b));
}

// ---------------------------------------------------------------- factories

SimplyConnectedRegion region(const JordanCurve& c, bool left, double tol) { return SimplyConnectedRegion(c, left, tol); }
SimplyConnectedRegion interior(const JordanCurve& c, double tol) { return SimplyConnectedRegion(c, true, tol); }
SimplyConnectedRegion exterior(const JordanCurve& c, double tol) { return SimplyConnectedRegion(c, false, tol); }

ConnectedRegion between(const JordanCurve& outer, const JordanCurve& inner, double tol) {
    return ConnectedRegion(2, outer, std::vector<JordanCurve>{inner}, tol);
}

SimplyConnectedRegion disk(const Circle& c) { return interior(c); }
SimplyConnectedRegion disk(const Point& center, double radius) { return interior(Circle(center, radius)); }
SimplyConnectedRegion unitDisk() { return disk(Point(0.0), 1.0); }

SimplyConnectedRegion halfplane(const Line& l) { return interior(l); }
SimplyConnectedRegion halfplane(const Point& a, const Point& b) { return interior(Line::through(a, b)); }
SimplyConnectedRegion upperHalfplane() { return halfplane(Line(Point(0.0), Point(1.0))); }
SimplyConnectedRegion lowerHalfplane() { return halfplane(Line(Point(0.0), Point(-1.0))); }
SimplyConnectedRegion leftHalfplane() { return halfplane(Line(Point(0.0), Point(0.0, 1.0))); }
SimplyConnectedRegion rightHalfplane() { return halfplane(Line(Point(0.0), Point(0.0, -1.0))); }

} // namespace cregions
