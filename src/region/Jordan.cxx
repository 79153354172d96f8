#include "Jordan.hxx"
#include "Winding.hxx"

#include <type_traits>

namespace cregions {

bool JordanCurve::isFinite() const {
    return std::visit([](const auto& c) { return c.isFinite(); }, v_);
}

JordanCurve JordanCurve::reverse() const {
    return std::visit([](const auto& c) { return JordanCurve(c.reverse()); }, v_);
}

bool JordanCurve::isApprox(const JordanCurve& other, double tol) const {
    if (v_.index() != other.v_.index()) return false;
    return std::visit([&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        return c.isApprox(other.as<T>(), tol);
    }, v_);
}

bool isLeft(const Point& z, const JordanCurve& c, double tol) {
    if (c.is<Circle>()) return c.as<Circle>().isLeft(z);
    if (c.is<Line>()) return c.as<Line>().isLeft(z);
    return PolygonWinding(tol).isLeft(z, c.as<CircularPolygon>());
}

bool isRight(const Point& z, const JordanCurve& c, double tol) {
    if (c.is<Circle>()) return c.as<Circle>().reverse().isLeft(z);
    if (c.is<Line>()) return c.as<Line>().reverse().isLeft(z);
    return PolygonWinding(tol).isRight(z, c.as<CircularPolygon>());
}

} // namespace cregions
