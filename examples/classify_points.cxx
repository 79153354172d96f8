#include "Curve.hxx"
#include "Intersection.hxx"
#include "Polygon.hxx"
#include "Winding.hxx"
#include "Region.hxx"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

using namespace cregions;

struct NamedRegion {
    std::string name;
    RegionPtr region;
};

// Upper half-plane with the square -1<x<0, 0<y<1 cut out. One vertex at infinity.
static Polygon makeNotchedHalfplane() {
    return Polygon(std::vector<PolygonVertex>{
        Point(-2.0, 0.0), Point(-1.0, 0.0), Point(-1.0, 1.0), Point(0.0, 1.0), Point(0.0, 0.0), Point(2.0, 0.0),
        PolygonVertex::atInfinity(0.0, kPi)});
}

// Lens bounded by two arcs of unit circles centered at -0.5 and 0.5.
static CircularPolygon makeLens() {
    const Point top(0.0, std::sqrt(0.75)), bottom(0.0, -std::sqrt(0.75));
    return CircularPolygon(std::vector<Curve>{arcThrough(bottom, Point(0.5), top), arcThrough(top, Point(-0.5), bottom)});
}

static std::vector<NamedRegion> makeRegions() {
    std::vector<NamedRegion> regions;
    regions.push_back({"unit disk", share(unitDisk())});
    regions.push_back({"annulus 1<|z|<2", share(Annulus(2.0, 1.0))});
    regions.push_back({"square |x|,|y|<1", share(interior(rectangle(Point(-1.0, -1.0), Point(1.0, 1.0))))});
    regions.push_back({"pentagon", share(interior(nGon(5)))});
    regions.push_back({"lens", share(interior(makeLens()))});
    regions.push_back({"notched half-plane", share(interior(makeNotchedHalfplane()))});
    regions.push_back({"two disks", disk(Point(-1.0), 1.0) | disk(Point(1.0), 1.0)});
    regions.push_back({"disk and upper half", unitDisk() & upperHalfplane()});
    return regions;
}

int main(int argc, char** argv) {
    if (argc > 1 && (argc - 1) % 2 != 0) {
        std::fprintf(stderr, "Usage: %s [x1 y1 [x2 y2 ...]]\n", argv[0]);
        return 2;
    }

    std::vector<Point> points;
    for (int k = 1; k + 1 < argc; k += 2) {
        char* endX = nullptr;
        char* endY = nullptr;
        const double x = std::strtod(argv[k], &endX);
        const double y = std::strtod(argv[k + 1], &endY);
        if (*endX != '\0' || *endY != '\0') {
            std::fprintf(stderr, "Invalid point: %s %s\n", argv[k], argv[k + 1]);
            return 2;
        }
        points.emplace_back(x, y);
    }
    if (points.empty()) {
        points = {Point(0.0, 0.0), Point(0.5, 0.5), Point(1.5, 0.0), Point(-0.5, 0.5), Point(0.0, 3.0), Point(3.0, -1.0)};
    }

    try {
        const std::vector<NamedRegion> regions = makeRegions();
        for (const auto& z : points) {
            std::printf("z = (%g, %g)\n", z.real(), z.imag());
            for (const auto& r : regions) {
                std::printf("  %-22s %s\n", r.name.c_str(), r.region->contains(z) ? "in" : "out");
            }
        }

        // Crossings of the real axis with the lens boundary
        const IntersectionResult hits = intersect(makeLens(), Curve(Line(Point(0.0), Point(1.0))));
        std::printf("lens meets the real axis at %zu point(s)\n", hits.points().size());
        for (const auto& p : hits.points()) std::printf("  (%g, %g)\n", p.real(), p.imag());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "classify_points failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
