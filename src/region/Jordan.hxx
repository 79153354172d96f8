#ifndef CREGIONS_JORDAN_HXX
#define CREGIONS_JORDAN_HXX

#include "Polygon.hxx"

#include <variant>

namespace cregions {

// Simple closed curve admissible as a region boundary: a circle, a line
// (closed through infinity) or a circular polygon.
class JordanCurve {
public:
    using Variant = std::variant<Circle, Line, CircularPolygon>;

    JordanCurve(const Circle& c) : v_(c) {}
    JordanCurve(const Line& l) : v_(l) {}
    JordanCurve(const CircularPolygon& p) : v_(p) {}

    template <class T> bool is() const { return std::holds_alternative<T>(v_); }
    template <class T> const T& as() const { return std::get<T>(v_); }
    const Variant& variant() const { return v_; }

    bool isFinite() const;
    JordanCurve reverse() const;
    // False for boundaries of different kinds.
    bool isApprox(const JordanCurve& other, double tol = kDefaultTol) const;

private:
    Variant v_;
};

// Side tests. Points on the curve are neither left nor right (unreliable for polygons).
bool isLeft(const Point& z, const JordanCurve& c, double tol = kDefaultTol);
bool isRight(const Point& z, const JordanCurve& c, double tol = kDefaultTol);

} // namespace cregions

#endif // CREGIONS_JORDAN_HXX
