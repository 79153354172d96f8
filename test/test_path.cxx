#include <gtest/gtest.h>
#include "Path.hxx"
#include "Polygon.hxx"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace cregions;

static void expectPointNear(const Point& a, const Point& b, double tol = 1e-12) {
    EXPECT_NEAR(a.real(), b.real(), tol);
    EXPECT_NEAR(a.imag(), b.imag(), tol);
}

// Counterclockwise square with corners +-1 +-i.
static std::vector<Curve> squareSides() {
    const Point a(-1.0, -1.0), b(1.0, -1.0), c(1.0, 1.0), d(-1.0, 1.0);
    return {Segment(a, b), Segment(b, c), Segment(c, d), Segment(d, a)};
}

TEST(Path, ContinuityIsChecked) {
    EXPECT_NO_THROW(Path({Segment(Point(0.0), Point(1.0)), Segment(Point(1.0), Point(1.0, 1.0))}));
    // a mismatch within the relative tolerance is accepted
    EXPECT_NO_THROW(Path({Segment(Point(0.0), Point(1.0)), Segment(Point(1.0 + 1e-14), Point(2.0))}));

    try {
        Path({Segment(Point(0.0), Point(1.0)), Segment(Point(1.0), Point(2.0)), Segment(Point(2.0 + 1e-6), Point(3.0))});
        FAIL() << "Expected PathContinuityError";
    } catch (const PathContinuityError& e) {
        EXPECT_EQ(e.index(), 1u);
    }

    // a looser tolerance accepts the same gap
    EXPECT_NO_THROW(Path({Segment(Point(0.0), Point(1.0)), Segment(Point(1.0 + 1e-6), Point(2.0))}, 1e-4));
    EXPECT_THROW(Path(std::vector<Curve>{}), std::invalid_argument);
}

TEST(Path, ClosedPathChecksTheSeam) {
    try {
        ClosedPath({Segment(Point(0.0), Point(1.0)), Segment(Point(1.0), Point(0.0, 1.0))});
        FAIL() << "Expected PathContinuityError";
    } catch (const PathContinuityError& e) {
        EXPECT_EQ(e.index(), 1u);
    }
    EXPECT_NO_THROW(ClosedPath{squareSides()});
    EXPECT_NO_THROW(ClosedPath({Circle(Point(0.0), 1.0)}));
    // rays meet at the point at infinity
    EXPECT_NO_THROW(ClosedPath({Segment(Point(-1.0), Point(1.0)), Ray(Point(1.0), 0.0), Ray(Point(-1.0), kPi, true)}));
}

TEST(Path, OpenParameterMap) {
    Path p({Segment(Point(0.0), Point(1.0)), Segment(Point(1.0), Point(1.0, 1.0))});
    auto [k, s] = p.sideArgs(1.5);
    EXPECT_EQ(k, 1u);
    EXPECT_NEAR(s, 0.5, 1e-15);
    auto last = p.sideArgs(2.0);
    EXPECT_EQ(last.first, 1u);
    EXPECT_EQ(last.second, 1.0);

    expectPointNear(p.point(0.25), Point(0.25));
    expectPointNear(p.point(2.0), Point(1.0, 1.0));
    expectPointNear(p.tangent(1.2), Point(0.0, 1.0));
    expectPointNear(p.normal(0.5), Point(0.0, 1.0));
    EXPECT_THROW(p.point(2.5), std::out_of_range);
    EXPECT_THROW(p.point(-0.1), std::out_of_range);

    EXPECT_EQ(p.vertices().size(), 3u);
    expectPointNear(p.vertex(2), Point(1.0, 1.0));
    EXPECT_THROW(p.vertex(3), std::out_of_range);
    EXPECT_THROW(p.curve(2), std::out_of_range);
    EXPECT_NEAR(p.arclength(), 2.0, 1e-12);
    EXPECT_TRUE(p.isFinite());
}

TEST(Path, ClosedParameterMapWraps) {
    ClosedPath p(squareSides());
    auto [k, s] = p.sideArgs(4.25);
    EXPECT_EQ(k, 0u);
    EXPECT_NEAR(s, 0.25, 1e-12);
    auto back = p.sideArgs(-0.5);
    EXPECT_EQ(back.first, 3u);
    EXPECT_NEAR(back.second, 0.5, 1e-12);

    expectPointNear(p.point(4.5), p.point(0.5));
    EXPECT_TRUE(p.curve(-1).isApprox(p.curve(3)));
    EXPECT_TRUE(p.curve(5).isApprox(p.curve(1)));
    EXPECT_EQ(p.vertices().size(), 4u);
    expectPointNear(p.vertex(5), Point(1.0, -1.0));
    EXPECT_NEAR(p.arclength(), 8.0, 1e-12);
}

TEST(Path, DistanceAndClosest) {
    ClosedPath p(squareSides());
    EXPECT_NEAR(p.dist(Point(0.0)), 1.0, 1e-12);
    EXPECT_NEAR(p.dist(Point(3.0, 0.5)), 2.0, 1e-12);
    expectPointNear(p.closest(Point(3.0, 0.5)), Point(1.0, 0.5));
    expectPointNear(p.closest(Point(2.0, 2.0)), Point(1.0, 1.0));
}

TEST(Path, TransformsPreserveContinuity) {
    const ClosedPath p(squareSides());
    const Point i(0.0, 1.0);

    ClosedPath moved = p + Point(2.0, 1.0);
    expectPointNear(moved.vertex(0), Point(1.0, 0.0));
    ClosedPath moved2 = Point(2.0, 1.0) + p;
    EXPECT_TRUE(moved.isApprox(moved2));
    expectPointNear((p - Point(1.0)).vertex(0), Point(-2.0, -1.0));

    ClosedPath turned = p * i;
    expectPointNear(turned.vertex(0), Point(1.0, -1.0));
    expectPointNear((i * p).vertex(1), Point(1.0, 1.0));
    expectPointNear((p / Point(2.0)).vertex(2), Point(0.5, 0.5));
    expectPointNear((-p).vertex(0), Point(1.0, 1.0));
    expectPointNear((Point(1.0) - p).vertex(0), Point(2.0, 1.0));

    ClosedPath flipped = p.conj();
    expectPointNear(flipped.vertex(0), Point(-1.0, 1.0));

    ClosedPath rev = p.reverse();
    EXPECT_EQ(rev.size(), 4u);
    expectPointNear(rev.vertex(0), Point(-1.0, -1.0));
    expectPointNear(rev.vertex(1), Point(-1.0, 1.0));
    EXPECT_TRUE(rev.reverse().isApprox(p));

    EXPECT_THROW(p * Point(0.0), std::invalid_argument);
}

TEST(Path, Inversion) {
    // square 1 < x < 3, 1 < y < 3 stays clear of the origin
    const Polygon sq = rectangle(Point(1.0, 1.0), Point(3.0, 3.0));
    const CircularPolygon inv = sq.inv();
    ASSERT_EQ(inv.size(), 4u);
    for (int k = 0; k < 4; ++k) {
        expectPointNear(inv.vertex(k), 1.0 / sq.vertex(k));
        EXPECT_TRUE(inv.curve(k).is<Arc>());
    }
    const CircularPolygon scaled = Point(2.0) / sq;
    expectPointNear(scaled.vertex(0), 2.0 / sq.vertex(0));

    // the side from 0 to 1 passes through the origin
    EXPECT_THROW(rectangle(Point(0.0), Point(1.0, 1.0)).inv(), std::domain_error);
}

TEST(Path, IntersectWithCurves) {
    const ClosedPath p(squareSides());
    const IntersectionResult axis = intersect(p, Curve(Line(Point(0.0), Point(1.0))));
    ASSERT_EQ(axis.kind(), IntersectionResult::Kind::PointPair);

    // the diagonal passes through two corners, each shared by two sides
    const IntersectionResult diag = intersect(p, Curve(Line::through(Point(-1.0, -1.0), Point(1.0, 1.0))));
    EXPECT_EQ(diag.points().size(), 2u);

    const IntersectionResult edge = intersect(p, Curve(Line(Point(0.0, 1.0), Point(1.0))));
    EXPECT_EQ(edge.kind(), IntersectionResult::Kind::Overlap);

    const ClosedPath q = p + Point(1.0, 1.0);
    const IntersectionResult both = intersect(p, q);
    EXPECT_EQ(both.points().size(), 2u);
    for (const auto& z : both.points()) {
        EXPECT_TRUE(std::abs(z - Point(1.0, 0.0)) < 1e-12 || std::abs(z - Point(0.0, 1.0)) < 1e-12);
    }
}
