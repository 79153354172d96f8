#ifndef CREGIONS_PATH_HXX
#define CREGIONS_PATH_HXX

#include "Curve.hxx"
#include "Intersection.hxx"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cregions {

// Thrown when curve index() does not end where the next curve starts.
class PathContinuityError : public std::runtime_error {
public:
    PathContinuityError(std::size_t index, const std::string& what) : std::runtime_error(what), index_(index) {}
    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

// Path: ordered sequence of curves, each starting where the previous one ends
// (within a relative tolerance). Global parameter t in [0,n] runs through the
// curves in order, curve k covering [k, k+1].
class Path {
public:
    explicit Path(std::vector<Curve> curves, double tol = kDefaultTol);
    virtual ~Path() = default;

    std::size_t size() const { return curves_.size(); }
    const std::vector<Curve>& curves() const { return curves_; }
    double tol() const { return tol_; }

    // Bounds-checked for open paths, circular for closed ones.
    virtual const Curve& curve(int k) const;
    virtual Point vertex(int k) const;
    // Start of each curve plus the end of the last (open), or start of each curve (closed).
    virtual std::vector<Point> vertices() const;

    // Maps a global parameter to (curve index, local parameter).
    virtual std::pair<std::size_t, double> sideArgs(double t) const;

    Point point(double t) const;
    Point tangent(double t) const;
    Point unitTangent(double t) const;
    Point normal(double t) const;

    bool isFinite() const;
    double arclength() const;
    double dist(const Point& z) const;
    Point closest(const Point& z) const;
    bool isApprox(const Path& other, double tol = kDefaultTol) const;

    Path translate(const Point& z) const;
    Path scale(const Point& z) const;
    Path reverse() const;
    Path conj() const;
    Path inv() const;

protected:
    struct Unchecked {};
    // Used by transforms, which preserve continuity of an already valid path.
    Path(std::vector<Curve> curves, double tol, Unchecked) : curves_(std::move(curves)), tol_(tol) {}

    bool joined(const Point& a, const Point& b) const;

    std::vector<Curve> translated(const Point& z) const;
    std::vector<Curve> scaled(const Point& z) const;
    std::vector<Curve> reversed() const;
    std::vector<Curve> conjugated() const;
    std::vector<Curve> inverted() const;

    std::vector<Curve> curves_;
    double tol_;
};

// Path whose last curve ends where the first one starts. The parameter map is periodic.
class ClosedPath : public Path {
public:
    explicit ClosedPath(std::vector<Curve> curves, double tol = kDefaultTol);
    explicit ClosedPath(const Path& p) : ClosedPath(p.curves(), p.tol()) {}

    const Curve& curve(int k) const override;
    Point vertex(int k) const override;
    std::vector<Point> vertices() const override;
    std::pair<std::size_t, double> sideArgs(double t) const override;

    ClosedPath translate(const Point& z) const;
    ClosedPath scale(const Point& z) const;
    ClosedPath reverse() const;
    ClosedPath conj() const;
    ClosedPath inv() const;

protected:
    ClosedPath(std::vector<Curve> curves, double tol, Unchecked) : Path(std::move(curves), tol, Unchecked{}) {}
};

template <class P>
using EnableIfPath = std::enable_if_t<std::is_base_of<Path, P>::value, int>;

template <class P, EnableIfPath<P> = 0>
P operator+(const P& p, const Point& z) { return p.translate(z); }

template <class P, EnableIfPath<P> = 0>
P operator+(const Point& z, const P& p) { return p.translate(z); }

template <class P, EnableIfPath<P> = 0>
P operator-(const P& p, const Point& z) { return p.translate(-z); }

template <class P, EnableIfPath<P> = 0>
P operator-(const P& p) { return p.scale(Point(-1.0)); }

template <class P, EnableIfPath<P> = 0>
P operator-(const Point& z, const P& p) { return (-p).translate(z); }

template <class P, EnableIfPath<P> = 0>
P operator*(const P& p, const Point& z) { return p.scale(z); }

template <class P, EnableIfPath<P> = 0>
P operator*(const Point& z, const P& p) { return p.scale(z); }

template <class P, EnableIfPath<P> = 0>
P operator/(const P& p, const Point& z) { return p.scale(1.0 / z); }

// z / P: inversion followed by scaling
template <class P, EnableIfPath<P> = 0>
auto operator/(const Point& z, const P& p) { return p.inv().scale(z); }

// Union of the curve-wise intersections, duplicates (e.g. at shared vertices) removed.
IntersectionResult intersect(const Path& p, const Curve& c, double tol = kDefaultTol);
IntersectionResult intersect(const Path& a, const Path& b, double tol = kDefaultTol);

} // namespace cregions

#endif // CREGIONS_PATH_HXX
