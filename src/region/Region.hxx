#ifndef CREGIONS_REGION_HXX
#define CREGIONS_REGION_HXX

#include "Jordan.hxx"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace cregions {

class RegionArityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Open set in the plane. Regions form an immutable expression tree; union and
// intersection nodes share their operands.
class Region {
public:
    virtual ~Region() = default;
    virtual bool contains(const Point& z) const = 0;
};

using RegionPtr = std::shared_ptr<const Region>;

inline bool isIn(const Point& z, const Region& r) { return r.contains(z); }

// Points on one side of a Jordan curve.
class SimplyConnectedRegion : public Region {
public:
    explicit SimplyConnectedRegion(const JordanCurve& boundary, bool left = true, double tol = kDefaultTol)
        : boundary_(boundary), left_(left), tol_(tol) {}

    bool contains(const Point& z) const override { return left_ == isLeft(z, boundary_, tol_); }

    const JordanCurve& boundary() const { return boundary_; }
    bool left() const { return left_; }

    // Complement: the other side of the same boundary.
    SimplyConnectedRegion operator!() const { return SimplyConnectedRegion(boundary_, !left_, tol_); }

    // Same boundary and side, or reversed boundary with the opposite side flag.
    bool isApprox(const SimplyConnectedRegion& other, double tol = kDefaultTol) const;

private:
    JordanCurve boundary_;
    bool left_;
    double tol_;
};

// Region of connectivity n: to the left of the optional outer boundary and
// to the right of every inner one.
class ConnectedRegion : public Region {
public:
    // Throws RegionArityError unless inner.size() is n, or n-1 with an outer boundary.
    ConnectedRegion(std::size_t n, std::optional<JordanCurve> outer, std::vector<JordanCurve> inner,
                    double tol = kDefaultTol);

    bool contains(const Point& z) const override;

    std::size_t connectivity() const { return n_; }
    const std::optional<JordanCurve>& outer() const { return outer_; }
    const std::vector<JordanCurve>& inner() const { return inner_; }

private:
    std::size_t n_;
    std::optional<JordanCurve> outer_;
    std::vector<JordanCurve> inner_;
    double tol_;
};

// Points between two circles. Throws std::invalid_argument unless
// outer radius > inner radius > 0.
class Annulus : public Region {
public:
    Annulus(const Circle& outer, const Circle& inner);
    Annulus(const Point& center, double outerRadius, double innerRadius);
    Annulus(double outerRadius, double innerRadius) : Annulus(Point(0.0), outerRadius, innerRadius) {}

    bool contains(const Point& z) const override { return outer_.isLeft(z) && !inner_.isLeft(z); }

    const Circle& outer() const { return outer_; }
    const Circle& inner() const { return inner_; }

private:
    Circle outer_;
    Circle inner_;
};

class RegionUnion : public Region {
public:
    RegionUnion(RegionPtr a, RegionPtr b);
    bool contains(const Point& z) const override { return a_->contains(z) || b_->contains(z); }
    const RegionPtr& first() const { return a_; }
    const RegionPtr& second() const { return b_; }

private:
    RegionPtr a_;
    RegionPtr b_;
};

class RegionIntersection : public Region {
public:
    RegionIntersection(RegionPtr a, RegionPtr b);
    bool contains(const Point& z) const override { return a_->contains(z) && b_->contains(z); }
    const RegionPtr& first() const { return a_; }
    const RegionPtr& second() const { return b_; }

private:
    RegionPtr a_;
    RegionPtr b_;
};

template <class R>
using EnableIfRegion = std::enable_if_t<std::is_base_of<Region, R>::value, int>;

template <class R, EnableIfRegion<R> = 0>
RegionPtr share(const R& r) { return std::make_shared<const R>(r); }

RegionPtr unite(RegionPtr a, RegionPtr b);
RegionPtr intersect(RegionPtr a, RegionPtr b);
inline RegionPtr operator|(RegionPtr a, RegionPtr b) { return unite(std::move(a), std::move(b)); }
inline RegionPtr operator&(RegionPtr a, RegionPtr b) { return intersect(std::move(a), std::move(b)); }

template <class A, class B, EnableIfRegion<A> = 0, EnableIfRegion<B> = 0>
RegionPtr unite(const A& a, const B& b) { return unite(share(a), share(b)); }

template <class A, class B, EnableIfRegion<A> = 0, EnableIfRegion<B> = 0>
RegionPtr intersect(const A& a, const B& b) { return intersect(share(a), share(b)); }

template <class A, class B, EnableIfRegion<A> = 0, EnableIfRegion<B> = 0>
RegionPtr operator|(const A& a, const B& b) { return unite(share(a), share(b)); }

template <class A, class B, EnableIfRegion<A> = 0, EnableIfRegion<B> = 0>
RegionPtr operator&(const A& a, const B& b) { return intersect(share(a), share(b)); }

// Common regions
SimplyConnectedRegion region(const JordanCurve& c, bool left = true, double tol = kDefaultTol);
SimplyConnectedRegion interior(const JordanCurve& c, double tol = kDefaultTol);
SimplyConnectedRegion exterior(const JordanCurve& c, double tol = kDefaultTol);
// Doubly connected region left of outer and right of inner.
ConnectedRegion between(const JordanCurve& outer, const JordanCurve& inner, double tol = kDefaultTol);

SimplyConnectedRegion disk(const Circle& c);
SimplyConnectedRegion disk(const Point& center, double radius);
SimplyConnectedRegion unitDisk();

// Half-plane to the left of the line.
SimplyConnectedRegion halfplane(const Line& l);
// Half-plane to the left of the line from a through b.
SimplyConnectedRegion halfplane(const Point& a, const Point& b);
SimplyConnectedRegion upperHalfplane();
SimplyConnectedRegion lowerHalfplane();
SimplyConnectedRegion leftHalfplane();
SimplyConnectedRegion rightHalfplane();

} // namespace cregions

#endif // CREGIONS_REGION_HXX
