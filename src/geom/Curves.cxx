#include "Curves.hxx"

#include <stdexcept>

namespace cregions {

namespace {
// Shortest angular distance between two fractions of a turn.
static double fractionGap(double a, double b) {
    double d = mod1(a - b);
    return std::min(d, 1.0 - d);
}
}

// ---------------------------------------------------------------- Line

Line::Line(const Point& base, const Point& direction) : base_(base) {
    const double len = std::abs(direction);
    if (!(len > 0.0) || !std::isfinite(len)) throw std::invalid_argument("Line direction must be finite and nonzero");
    dir_ = direction / len;
}

Line Line::through(const Point& a, const Point& b) { return Line(a, b - a); }

Point Line::point(double t) const {
    if (t <= 0.0 || t >= 1.0) return infinity();
    return base_ + dir_ * std::tan(kPi * (t - 0.5));
}

Point Line::tangent(double) const { return dir_; }

Line Line::reverse() const { return Line(base_, -dir_); }
Line Line::conj() const { return Line(std::conj(base_), std::conj(dir_)); }
Line Line::translate(const Point& z) const { return Line(base_ + z, dir_); }
Line Line::scale(const Point& z) const { return Line(base_ * z, dir_ * z); }

double Line::dist(const Point& z) const { return std::fabs((std::conj(dir_) * (z - base_)).imag()); }

Point Line::closest(const Point& z) const { return base_ + dir_ * (std::conj(dir_) * (z - base_)).real(); }

double Line::arg(const Point& z) const {
    const double u = (std::conj(dir_) * (z - base_)).real();
    return std::atan(u) / kPi + 0.5;
}

bool Line::isLeft(const Point& z) const { return (std::conj(dir_) * (z - base_)).imag() > 0.0; }

bool Line::isApprox(const Line& other, double tol) const {
    return dist(other.base_) <= tol * (1.0 + std::abs(other.base_)) && cregions::isApprox(dir_, other.dir_, tol);
}

// ---------------------------------------------------------------- Ray

Ray::Ray(const Point& base, double angle, bool reversed) : base_(base), angle_(angle), reversed_(reversed) {
    if (!cregions::isFinite(base)) throw std::invalid_argument("Ray base must be finite");
}

Point Ray::point(double t) const {
    const double s = reversed_ ? 1.0 - t : t;
    if (s >= 1.0) return infinity();
    return base_ + direction() * std::tan(0.5 * kPi * std::max(s, 0.0));
}

Point Ray::tangent(double) const { return reversed_ ? -direction() : direction(); }

Ray Ray::reverse() const { return Ray(base_, angle_, !reversed_); }
Ray Ray::conj() const { return Ray(std::conj(base_), -angle_, reversed_); }
Ray Ray::translate(const Point& z) const { return Ray(base_ + z, angle_, reversed_); }
Ray Ray::scale(const Point& z) const { return Ray(base_ * z, angle_ + std::arg(z), reversed_); }

double Ray::dist(const Point& z) const { return std::abs(z - closest(z)); }

Point Ray::closest(const Point& z) const {
    const Point d = direction();
    const double u = (std::conj(d) * (z - base_)).real();
    return u <= 0.0 ? base_ : base_ + u * d;
}

double Ray::arg(const Point& z) const {
    const double u = std::max(0.0, (std::conj(direction()) * (z - base_)).real());
    const double s = 2.0 * std::atan(u) / kPi;
    return reversed_ ? 1.0 - s : s;
}

bool Ray::isApprox(const Ray& other, double tol) const {
    return reversed_ == other.reversed_ && cregions::isApprox(base_, other.base_, tol) &&
           cregions::isApprox(direction(), other.direction(), tol);
}

// ---------------------------------------------------------------- Segment

Segment::Segment(const Point& za, const Point& zb) : za_(za), zb_(zb) {
    if (!cregions::isFinite(za) || !cregions::isFinite(zb)) throw std::invalid_argument("Segment endpoints must be finite");
    if (za == zb) throw std::invalid_argument("Segment endpoints coincide");
}

Point Segment::closest(const Point& z) const { return point(std::min(1.0, std::max(0.0, arg(z)))); }

double Segment::arg(const Point& z) const {
    const Point s = zb_ - za_;
    return (std::conj(s) * (z - za_)).real() / std::norm(s);
}

bool Segment::isApprox(const Segment& other, double tol) const {
    return cregions::isApprox(za_, other.za_, tol) && cregions::isApprox(zb_, other.zb_, tol);
}

// ---------------------------------------------------------------- Circle

Circle::Circle(const Point& center, double radius, bool ccw) : center_(center), radius_(radius), ccw_(ccw) {
    if (!(radius > 0.0) || !std::isfinite(radius)) throw std::invalid_argument("Circle radius must be positive");
}

Point Circle::point(double t) const {
    const double s = ccw_ ? t : -t;
    return center_ + std::polar(radius_, kTwoPi * s);
}

Point Circle::tangent(double t) const { return kTwoPi * radius_ * unitTangent(t); }

Point Circle::unitTangent(double t) const {
    const double s = ccw_ ? t : -t;
    const Point i(0.0, 1.0);
    return (ccw_ ? i : -i) * std::polar(1.0, kTwoPi * s);
}

Circle Circle::scale(const Point& z) const { return Circle(center_ * z, radius_ * std::abs(z), ccw_); }

Point Circle::closest(const Point& z) const {
    const Point d = z - center_;
    if (std::abs(d) == 0.0) return point(0.0);
    return center_ + radius_ * d / std::abs(d);
}

double Circle::arg(const Point& z) const {
    const double a = angleFraction(z - center_);
    return ccw_ ? a : mod1(-a);
}

bool Circle::isLeft(const Point& z) const {
    const double d = std::abs(z - center_);
    return ccw_ ? d < radius_ : d > radius_;
}

bool Circle::isApprox(const Circle& other, double tol) const {
    return ccw_ == other.ccw_ && cregions::isApprox(center_, other.center_, tol) &&
           cregions::isApprox(radius_, other.radius_, tol);
}

// ---------------------------------------------------------------- Arc

Arc::Arc(const Circle& circle, double start, double delta)
    : circle_(circle.center(), circle.radius()), start_(mod1(start)), delta_(delta) {
    if (!(std::fabs(delta) <= 1.0)) throw std::invalid_argument("Arc span must lie in [-1,1]");
}

Point Arc::point(double t) const { return circle_.point(start_ + t * delta_); }

Point Arc::tangent(double t) const { return delta_ * circle_.tangent(start_ + t * delta_); }

Point Arc::unitTangent(double t) const {
    const Point u = circle_.unitTangent(start_ + t * delta_);
    return delta_ < 0.0 ? -u : u;
}

Arc Arc::scale(const Point& z) const { return Arc(circle_.scale(z), mod1(start_ + angleFraction(z)), delta_); }

double Arc::arg(const Point& z) const {
    const double theta = angleFraction(z - circle_.center());
    const double w = std::fabs(delta_);
    double off = delta_ >= 0.0 ? mod1(theta - start_) : mod1(start_ - theta);
    if (off > w && off - w > 1.0 - off) off -= 1.0;
    return w > 0.0 ? off / w : 0.0;
}

bool Arc::containsAngle(double angle, double tol) const {
    const double w = std::fabs(delta_);
    const double off = delta_ >= 0.0 ? mod1(angle - start_) : mod1(start_ - angle);
    return off <= w + tol || off >= 1.0 - tol;
}

double Arc::dist(const Point& z) const { return std::abs(z - closest(z)); }

Point Arc::closest(const Point& z) const {
    const double t = arg(z);
    if (t >= 0.0 && t <= 1.0) return circle_.closest(z);
    const Point a = point(0.0), b = point(1.0);
    return std::abs(z - a) <= std::abs(z - b) ? a : b;
}

bool Arc::isApprox(const Arc& other, double tol) const {
    return circle_.isApprox(other.circle_, tol) && fractionGap(start_, other.start_) <= tol &&
           cregions::isApprox(delta_, other.delta_, tol);
}

} // namespace cregions
