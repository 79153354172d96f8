#ifndef CREGIONS_CURVES_HXX
#define CREGIONS_CURVES_HXX

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>

// Elementary curves in the complex plane. Every curve is parameterized over
// t in [0,1]; unbounded curves (Line, Ray) reach the point at infinity at the
// ends of that interval. All types are immutable values.
namespace cregions {

using Point = std::complex<double>;

// Default relative tolerance used by every entry point that takes one.
constexpr double kDefaultTol = 1e-12;
constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

inline Point infinity() {
    const double inf = std::numeric_limits<double>::infinity();
    return Point(inf, inf);
}

inline bool isFinite(const Point& z) { return std::isfinite(z.real()) && std::isfinite(z.imag()); }

// x mod 1 in [0,1)
inline double mod1(double x) {
    double r = x - std::floor(x);
    return r >= 1.0 ? 0.0 : r;
}

// Angle of z as a fraction of a full counterclockwise turn, in [0,1).
inline double angleFraction(const Point& z) { return mod1(std::arg(z) / kTwoPi); }

// |a-b| <= tol*(1 + max(|a|,|b|))
inline bool isApprox(double a, double b, double tol = kDefaultTol) {
    return std::fabs(a - b) <= tol * (1.0 + std::max(std::fabs(a), std::fabs(b)));
}
inline bool isApprox(const Point& a, const Point& b, double tol = kDefaultTol) {
    return std::abs(a - b) <= tol * (1.0 + std::max(std::abs(a), std::abs(b)));
}

class Line {
public:
    // Throws std::invalid_argument for a zero direction. The direction is stored normalized.
    Line(const Point& base, const Point& direction);
    static Line through(const Point& a, const Point& b);

    const Point& base() const { return base_; }
    const Point& direction() const { return dir_; }

    Point point(double t) const;
    Point tangent(double t) const;
    Point unitTangent(double t) const { return tangent(t); }
    double arclength() const { return std::numeric_limits<double>::infinity(); }
    bool isFinite() const { return false; }

    Line reverse() const;
    Line conj() const;
    Line translate(const Point& z) const;
    Line scale(const Point& z) const;

    double dist(const Point& z) const;
    Point closest(const Point& z) const;
    // Parameter of the point of the line closest to z.
    double arg(const Point& z) const;
    // True when z lies strictly to the left of the directed line.
    bool isLeft(const Point& z) const;
    bool isApprox(const Line& other, double tol = kDefaultTol) const;

private:
    Point base_;
    Point dir_;
};

// A ray leaves its base along the direction e^{i*angle}. A reversed ray is
// traversed from infinity back to its base.
class Ray {
public:
    Ray(const Point& base, double angle, bool reversed = false);

    const Point& base() const { return base_; }
    double angle() const { return angle_; }
    bool reversed() const { return reversed_; }
    Point direction() const { return std::polar(1.0, angle_); }

    Point point(double t) const;
    Point tangent(double t) const;
    Point unitTangent(double t) const { return tangent(t); }
    double arclength() const { return std::numeric_limits<double>::infinity(); }
    bool isFinite() const { return false; }

    Ray reverse() const;
    Ray conj() const;
    Ray translate(const Point& z) const;
    Ray scale(const Point& z) const;

    double dist(const Point& z) const;
    Point closest(const Point& z) const;
    double arg(const Point& z) const;
    bool isApprox(const Ray& other, double tol = kDefaultTol) const;

private:
    Point base_;
    double angle_;
    bool reversed_;
};

class Segment {
public:
    // Throws std::invalid_argument when the endpoints coincide.
    Segment(const Point& za, const Point& zb);

    const Point& first() const { return za_; }
    const Point& second() const { return zb_; }

    Point point(double t) const { return za_ + t * (zb_ - za_); }
    Point tangent(double) const { return zb_ - za_; }
    Point unitTangent(double) const { return (zb_ - za_) / std::abs(zb_ - za_); }
    double arclength() const { return std::abs(zb_ - za_); }
    bool isFinite() const { return true; }

    Segment reverse() const { return Segment(zb_, za_); }
    Segment conj() const { return Segment(std::conj(za_), std::conj(zb_)); }
    Segment translate(const Point& z) const { return Segment(za_ + z, zb_ + z); }
    Segment scale(const Point& z) const { return Segment(za_ * z, zb_ * z); }

    double dist(const Point& z) const { return std::abs(z - closest(z)); }
    Point closest(const Point& z) const;
    double arg(const Point& z) const;
    bool isApprox(const Segment& other, double tol = kDefaultTol) const;

private:
    Point za_;
    Point zb_;
};

class Circle {
public:
    // Throws std::invalid_argument unless radius > 0.
    Circle(const Point& center, double radius, bool ccw = true);

    const Point& center() const { return center_; }
    double radius() const { return radius_; }
    bool ccw() const { return ccw_; }

    Point point(double t) const;
    Point tangent(double t) const;
    Point unitTangent(double t) const;
    double arclength() const { return kTwoPi * radius_; }
    bool isFinite() const { return true; }

    Circle reverse() const { return Circle(center_, radius_, !ccw_); }
    Circle conj() const { return Circle(std::conj(center_), radius_, !ccw_); }
    Circle translate(const Point& z) const { return Circle(center_ + z, radius_, ccw_); }
    Circle scale(const Point& z) const;

    double dist(const Point& z) const { return std::fabs(std::abs(z - center_) - radius_); }
    Point closest(const Point& z) const;
    double arg(const Point& z) const;
    // Inside for a ccw circle, outside for a cw one.
    bool isLeft(const Point& z) const;
    bool isApprox(const Circle& other, double tol = kDefaultTol) const;

private:
    Point center_;
    double radius_;
    bool ccw_;
};

// Arc of a circle starting at fraction `start` of a ccw turn and sweeping the
// signed fraction `delta` (negative is clockwise), |delta| <= 1.
class Arc {
public:
    Arc(const Circle& circle, double start, double delta);

    // Stored circle is always ccw; the sweep direction is carried by delta.
    const Circle& circle() const { return circle_; }
    double start() const { return start_; }
    double delta() const { return delta_; }

    Point point(double t) const;
    Point tangent(double t) const;
    Point unitTangent(double t) const;
    double arclength() const { return circle_.arclength() * std::fabs(delta_); }
    bool isFinite() const { return true; }

    Arc reverse() const { return Arc(circle_, mod1(start_ + delta_), -delta_); }
    Arc conj() const { return Arc(Circle(std::conj(circle_.center()), circle_.radius()), mod1(-start_), -delta_); }
    Arc translate(const Point& z) const { return Arc(circle_.translate(z), start_, delta_); }
    Arc scale(const Point& z) const;

    double dist(const Point& z) const;
    Point closest(const Point& z) const;
    // Arc parameter of the angular position of z. Positions outside the arc
    // map below 0 or above 1, whichever end is angularly nearer.
    double arg(const Point& z) const;
    // Whether the angular fraction `angle` lies within the arc, with slack tol.
    bool containsAngle(double angle, double tol = kDefaultTol) const;
    bool isApprox(const Arc& other, double tol = kDefaultTol) const;

private:
    Circle circle_;
    double start_;
    double delta_;
};

} // namespace cregions

#endif // CREGIONS_CURVES_HXX
