#include <gtest/gtest.h>
#include "Region.hxx"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cregions;

// Points on a grid over [-3, 3]^2, offset so none lands on a boundary used below.
static std::vector<Point> samplePoints() {
    std::vector<Point> pts;
    for (int i = 0; i < 13; ++i) {
        for (int j = 0; j < 13; ++j) pts.emplace_back(-3.0 + 0.5 * i + 0.0137, -3.0 + 0.5 * j + 0.0291);
    }
    return pts;
}

TEST(Region, Disk) {
    const SimplyConnectedRegion d = unitDisk();
    for (const auto& z : samplePoints()) EXPECT_EQ(d.contains(z), std::abs(z) < 1.0);
    EXPECT_TRUE(isIn(Point(0.5, 0.5), d));

    const SimplyConnectedRegion out = !d;
    EXPECT_FALSE(out.left());
    EXPECT_TRUE(out.contains(Point(2.0)));
    EXPECT_FALSE(out.contains(Point(0.0)));

    const Circle c(Point(1.0, 1.0), 2.0);
    EXPECT_TRUE(interior(c).isApprox(exterior(c.reverse())));
    EXPECT_FALSE(interior(c).isApprox(exterior(c)));
    EXPECT_TRUE(disk(Point(1.0, 1.0), 2.0).isApprox(disk(c)));
}

TEST(Region, UnionAndIntersection) {
    const SimplyConnectedRegion a = disk(Point(-0.5), 1.0);
    const SimplyConnectedRegion b = disk(Point(0.5), 1.0);
    const RegionPtr both = a | b;
    const RegionPtr common = a & b;
    for (const auto& z : samplePoints()) {
        EXPECT_EQ(both->contains(z), a.contains(z) || b.contains(z));
        EXPECT_EQ(common->contains(z), a.contains(z) && b.contains(z));
    }
    EXPECT_TRUE(both->contains(Point(1.2)));
    EXPECT_FALSE(common->contains(Point(1.2)));
    EXPECT_TRUE(common->contains(Point(0.0)));

    // expression trees share their operands
    const RegionPtr tree = (share(a) | share(b)) & share(upperHalfplane());
    EXPECT_TRUE(tree->contains(Point(1.2, 0.1)));
    EXPECT_FALSE(tree->contains(Point(1.2, -0.1)));
    const auto* u = dynamic_cast<const RegionIntersection*>(tree.get());
    ASSERT_NE(u, nullptr);
    EXPECT_NE(dynamic_cast<const RegionUnion*>(u->first().get()), nullptr);

    EXPECT_THROW(RegionUnion(share(a), nullptr), std::invalid_argument);
    EXPECT_THROW(RegionIntersection(nullptr, share(b)), std::invalid_argument);
}

TEST(Region, Annulus) {
    const Point c(1.0, 1.0);
    const Annulus ring(c, 2.0, 1.0);
    EXPECT_TRUE(ring.contains(c + 1.5));
    EXPECT_TRUE(ring.contains(c + Point(0.0, -1.5)));
    EXPECT_FALSE(ring.contains(c + 0.5));
    EXPECT_FALSE(ring.contains(c + 2.5));
    EXPECT_FALSE(ring.contains(c));

    const Annulus centered(2.0, 1.0);
    for (const auto& z : samplePoints()) EXPECT_EQ(centered.contains(z), std::abs(z) < 2.0 && std::abs(z) > 1.0);

    EXPECT_THROW(Annulus(1.0, 2.0), std::invalid_argument);
    EXPECT_THROW(Annulus(1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Annulus(1.0, 0.0), std::invalid_argument);
}

TEST(Region, ConnectedRegions) {
    const Circle big(Point(0.0), 3.0);
    const Circle hole1(Point(-1.0), 0.5);
    const Circle hole2(Point(1.0), 0.5);

    const ConnectedRegion r(3, JordanCurve(big), std::vector<JordanCurve>{hole1, hole2});
    EXPECT_EQ(r.connectivity(), 3u);
    EXPECT_TRUE(r.contains(Point(0.0)));
    EXPECT_FALSE(r.contains(Point(-1.0)));
    EXPECT_FALSE(r.contains(Point(1.1)));
    EXPECT_FALSE(r.contains(Point(0.0, 3.5)));

    // without an outer boundary the region is unbounded
    const ConnectedRegion holes(2, std::nullopt, std::vector<JordanCurve>{hole1, hole2});
    EXPECT_FALSE(holes.outer().has_value());
    EXPECT_TRUE(holes.contains(Point(10.0, 10.0)));
    EXPECT_FALSE(holes.contains(Point(1.0)));

    EXPECT_THROW(ConnectedRegion(0, std::nullopt, std::vector<JordanCurve>{}), RegionArityError);
    EXPECT_THROW(ConnectedRegion(3, JordanCurve(big), std::vector<JordanCurve>{hole1}), RegionArityError);
    EXPECT_THROW(ConnectedRegion(1, std::nullopt, std::vector<JordanCurve>{}), RegionArityError);
    try {
        ConnectedRegion(0, JordanCurve(big), std::vector<JordanCurve>{});
        FAIL() << "expected RegionArityError";
    } catch (const RegionArityError& e) {
        EXPECT_NE(std::string(e.what()).find("at least 1"), std::string::npos);
    }

    const ConnectedRegion ring = between(Circle(Point(0.0), 2.0), Circle(Point(0.0), 1.0));
    EXPECT_EQ(ring.inner().size(), 1u);
    for (const auto& z : samplePoints()) EXPECT_EQ(ring.contains(z), Annulus(2.0, 1.0).contains(z));
}

TEST(Region, Polygons) {
    const Polygon sq = rectangle(Point(-1.0, -1.0), Point(1.0, 1.0));
    const SimplyConnectedRegion in = interior(sq);
    const SimplyConnectedRegion out = exterior(sq);
    for (const auto& z : samplePoints()) {
        const bool inside = std::fabs(z.real()) < 1.0 && std::fabs(z.imag()) < 1.0;
        EXPECT_EQ(in.contains(z), inside);
        EXPECT_EQ(out.contains(z), !inside);
    }

    // a clockwise boundary puts the interior on the right
    const SimplyConnectedRegion flipped = region(sq.reverse(), false);
    EXPECT_TRUE(flipped.contains(Point(0.0)));
    EXPECT_TRUE(flipped.isApprox(in));

    // half-strip -1 < x < 1, y > 0
    const Polygon strip(std::vector<PolygonVertex>{Point(-1.0), Point(1.0), PolygonVertex::atInfinity(kPi / 2, kPi / 2)});
    const SimplyConnectedRegion s = interior(strip);
    EXPECT_TRUE(s.contains(Point(0.0, 0.5)));
    EXPECT_TRUE(s.contains(Point(0.0, 100.0)));
    EXPECT_FALSE(s.contains(Point(0.0, -0.5)));
    EXPECT_FALSE(s.contains(Point(2.0, 50.0)));
}

TEST(Region, HalfDisksLevelWithTheirExtremes) {
    const Circle unit(Point(0.0), 1.0);
    const SimplyConnectedRegion upper =
        interior(CircularPolygon(std::vector<Curve>{Segment(Point(-1.0), Point(1.0)), Arc(unit, 0.0, 0.5)}));
    EXPECT_FALSE(upper.contains(Point(-2.0, 1.0)));
    EXPECT_FALSE(upper.contains(Point(2.0, 1.0)));
    EXPECT_TRUE(upper.contains(Point(0.0, 0.5)));

    const SimplyConnectedRegion lower =
        interior(CircularPolygon(std::vector<Curve>{Segment(Point(1.0), Point(-1.0)), Arc(unit, 0.5, 0.5)}));
    EXPECT_FALSE(lower.contains(Point(-2.0, -1.0)));
    EXPECT_TRUE(lower.contains(Point(0.0, -0.5)));
}

TEST(Region, Halfplanes) {
    EXPECT_TRUE(upperHalfplane().contains(Point(0.3, 0.1)));
    EXPECT_FALSE(upperHalfplane().contains(Point(0.3, -0.1)));
    EXPECT_TRUE(lowerHalfplane().contains(Point(0.3, -0.1)));
    EXPECT_TRUE(leftHalfplane().contains(Point(-0.1, 5.0)));
    EXPECT_FALSE(leftHalfplane().contains(Point(0.1, 5.0)));
    EXPECT_TRUE(rightHalfplane().contains(Point(0.1, -5.0)));

    // left of the line from 0 through 1+i
    const SimplyConnectedRegion diag = halfplane(Point(0.0), Point(1.0, 1.0));
    EXPECT_TRUE(diag.contains(Point(0.0, 1.0)));
    EXPECT_FALSE(diag.contains(Point(1.0, 0.0)));
    EXPECT_TRUE(diag.isApprox(halfplane(Line(Point(0.0), Point(1.0, 1.0)))));

    // the quarter plane x > 0, y > 0
    const RegionPtr quarter = rightHalfplane() & upperHalfplane();
    EXPECT_TRUE(quarter->contains(Point(1.0, 1.0)));
    EXPECT_FALSE(quarter->contains(Point(-1.0, 1.0)));
    EXPECT_FALSE(quarter->contains(Point(1.0, -1.0)));
}

TEST(Region, JordanCurves) {
    const JordanCurve c = Circle(Point(0.0), 1.0);
    const JordanCurve l = Line(Point(0.0), Point(1.0));
    const JordanCurve p = rectangle(Point(0.0), Point(1.0, 1.0));
    EXPECT_TRUE(c.isFinite());
    EXPECT_FALSE(l.isFinite());
    EXPECT_TRUE(p.isFinite());
    EXPECT_FALSE(c.isApprox(l));
    EXPECT_TRUE(c.reverse().reverse().isApprox(c));

    EXPECT_TRUE(isLeft(Point(0.5, 0.5), p));
    EXPECT_TRUE(isRight(Point(0.5, 0.5), p.reverse()));
    EXPECT_TRUE(isRight(Point(0.0, -1.0), l));
    EXPECT_FALSE(isLeft(Point(2.0), c));
    EXPECT_TRUE(isRight(Point(2.0), c));
}
