#ifndef CREGIONS_CURVE_HXX
#define CREGIONS_CURVE_HXX

#include "Curves.hxx"

#include <string>
#include <variant>

namespace cregions {

enum class CurveKind { Line, Ray, Segment, Circle, Arc };

// Tagged union over the elementary curve kinds. Every query dispatches to the
// held curve; the transforms return a Curve of the kind they produce.
class Curve {
public:
    using Variant = std::variant<Line, Ray, Segment, Circle, Arc>;

    Curve(const Line& c) : v_(c) {}
    Curve(const Ray& c) : v_(c) {}
    Curve(const Segment& c) : v_(c) {}
    Curve(const Circle& c) : v_(c) {}
    Curve(const Arc& c) : v_(c) {}

    CurveKind kind() const { return static_cast<CurveKind>(v_.index()); }
    const Variant& variant() const { return v_; }

    template <class T> bool is() const { return std::holds_alternative<T>(v_); }
    // Throws std::bad_variant_access on a kind mismatch
    template <class T> const T& as() const { return std::get<T>(v_); }

    Point point(double t) const;
    Point tangent(double t) const;
    Point unitTangent(double t) const;
    // Left-pointing unit normal
    Point normal(double t) const;
    double arclength() const;
    bool isFinite() const;

    Curve reverse() const;
    Curve conj() const;
    Curve translate(const Point& z) const;
    Curve scale(const Point& z) const;
    // Image under z -> 1/z. Lines and circles through the origin map to
    // lines; any other curve passing through the origin throws std::domain_error.
    Curve inv(double tol = kDefaultTol) const;

    double dist(const Point& z) const;
    Point closest(const Point& z) const;
    double arg(const Point& z) const;
    // False for curves of different kinds.
    bool isApprox(const Curve& other, double tol = kDefaultTol) const;

private:
    Variant v_;
};

std::string kindName(CurveKind kind);

// Circle through three points, ccw when a,b,c turn left. Collinear points, or
// a point at infinity, give the Line through the remaining ones.
Curve circleThrough(const Point& a, const Point& b, const Point& c);

// Arc from a through m to b. Collinear points give Segment(a,b).
Curve arcThrough(const Point& a, const Point& m, const Point& b);

// Counterclockwise arc from a to b about `center`, radius |a - center|.
Arc arcAround(const Point& a, const Point& b, const Point& center);

} // namespace cregions

#endif // CREGIONS_CURVE_HXX
