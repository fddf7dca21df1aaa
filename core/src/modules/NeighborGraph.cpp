#include "modules/NeighborGraph.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <utility>

namespace {

// Visitor helper for std::visit over the topology variant
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

NeighborEdge makeEdge(std::uint32_t u, std::uint32_t v) {
    return u < v ? NeighborEdge{u, v} : NeighborEdge{v, u};
}

struct Triangle {
    std::uint32_t v[3];
    double cx = 0.0;
    double cy = 0.0;
    double r2 = 0.0;
};

// Circumcircle of a triangle; a degenerate (flat) triangle gets an unbounded
// circle so the next insertion always replaces it.
Triangle makeTriangle(std::uint32_t a, std::uint32_t b, std::uint32_t c,
                      const std::vector<PlanarPoint>& pts) {
    Triangle t;
    t.v[0] = a;
    t.v[1] = b;
    t.v[2] = c;

    const double ax = pts[a].x, ay = pts[a].y;
    const double bx = pts[b].x, by = pts[b].y;
    const double cx = pts[c].x, cy = pts[c].y;
    const double d = 2.0 * (ax * (by - cy) + bx * (cy - ay) + cx * (ay - by));

    if (std::abs(d) < 1e-18) {
        t.cx = (ax + bx + cx) / 3.0;
        t.cy = (ay + by + cy) / 3.0;
        t.r2 = std::numeric_limits<double>::infinity();
        return t;
    }

    const double a2 = ax * ax + ay * ay;
    const double b2 = bx * bx + by * by;
    const double c2 = cx * cx + cy * cy;
    t.cx = (a2 * (by - cy) + b2 * (cy - ay) + c2 * (ay - by)) / d;
    t.cy = (a2 * (cx - bx) + b2 * (ax - cx) + c2 * (bx - ax)) / d;
    const double dx = ax - t.cx;
    const double dy = ay - t.cy;
    t.r2 = dx * dx + dy * dy;
    return t;
}

double squaredDistance(const PlanarPoint& a, const PlanarPoint& b) {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

// > 0 when c is left of a->b
double orient(const PlanarPoint& a, const PlanarPoint& b, const PlanarPoint& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

// Apex on one side (+1 left, -1 right) of u->v whose circle through u and v
// holds no other point of that side, or -1 when the side is empty
std::int64_t delaunayApex(std::uint32_t u, std::uint32_t v, int side,
                          const std::vector<PlanarPoint>& pts, std::uint32_t n) {
    constexpr double kSideEps = 1e-12;
    const PlanarPoint& p = pts[u];
    const PlanarPoint& q = pts[v];
    const double dx = q.x - p.x;
    const double dy = q.y - p.y;
    const double len = std::sqrt(dx * dx + dy * dy);
    const double nx = -dy * side;
    const double ny = dx * side;
    const double mx = 0.5 * (p.x + q.x);
    const double my = 0.5 * (p.y + q.y);

    std::int64_t best = -1;
    double best_reach = std::numeric_limits<double>::infinity();
    for (std::uint32_t r = 0; r < n; ++r) {
        if (r == u || r == v) continue;
        if (orient(p, q, pts[r]) * side <= kSideEps * len) continue;
        const Triangle t = makeTriangle(u, v, r, pts);
        const double reach = (t.cx - mx) * nx + (t.cy - my) * ny;
        if (reach < best_reach) {
            best_reach = reach;
            best = r;
        }
    }
    return best;
}

// Adds the triangles the super triangle swallowed: every edge with a
// triangle on one side only gets its Delaunay apex on the other side, until
// the open edges left are hull edges
void wrapOpenEdges(std::vector<std::array<std::uint32_t, 3>>& tris,
                   const std::vector<PlanarPoint>& pts, std::uint32_t n) {
    std::map<NeighborEdge, std::vector<std::uint32_t>> apexes;
    std::vector<NeighborEdge> open;
    auto index = [&](const std::array<std::uint32_t, 3>& t) {
        for (int e = 0; e < 3; ++e) {
            const NeighborEdge edge = makeEdge(t[e], t[(e + 1) % 3]);
            auto& list = apexes[edge];
            list.push_back(t[(e + 2) % 3]);
            if (list.size() == 1) open.push_back(edge);
        }
    };

    if (tris.empty()) {
        // The closest pair is always a Delaunay edge
        std::uint32_t a = 0, b = 1;
        double best = std::numeric_limits<double>::infinity();
        for (std::uint32_t i = 0; i < n; ++i) {
            for (std::uint32_t j = i + 1; j < n; ++j) {
                const double d = squaredDistance(pts[i], pts[j]);
                if (d < best) { best = d; a = i; b = j; }
            }
        }
        for (int side : {1, -1}) {
            const std::int64_t r = delaunayApex(a, b, side, pts, n);
            if (r >= 0) {
                tris.push_back({a, b, static_cast<std::uint32_t>(r)});
                break;
            }
        }
        if (tris.empty()) return;
    }

    for (const auto& t : tris) index(t);

    while (!open.empty()) {
        const NeighborEdge e = open.back();
        open.pop_back();
        const auto& list = apexes[e];
        if (list.size() != 1) continue;
        const int side = orient(pts[e.a], pts[e.b], pts[list.front()]) > 0.0 ? -1 : 1;
        const std::int64_t r = delaunayApex(e.a, e.b, side, pts, n);
        if (r < 0) continue;
        const std::array<std::uint32_t, 3> t = {e.a, e.b, static_cast<std::uint32_t>(r)};
        tris.push_back(t);
        index(t);
    }
}

}

std::vector<NeighborEdge> topologyEdges(const NeighborTopology& topology) {
    return std::visit(Overloaded{
        [](const NoPoints&) { return std::vector<NeighborEdge>{}; },
        [](const SinglePoint&) { return std::vector<NeighborEdge>{}; },
        [](const TwoPoints& t) { return std::vector<NeighborEdge>{t.edge}; },
        [](const CollinearChain& t) { return t.edges; },
        [](const TriangulatedGraph& t) { return t.edges; }
    }, topology);
}

const char* topologyName(const NeighborTopology& topology) {
    return std::visit(Overloaded{
        [](const NoPoints&) { return "none"; },
        [](const SinglePoint&) { return "single"; },
        [](const TwoPoints&) { return "pair"; },
        [](const CollinearChain&) { return "collinear"; },
        [](const TriangulatedGraph&) { return "triangulated"; }
    }, topology);
}

NeighborGraphBuilder::NeighborGraphBuilder(double mergeToleranceKm)
    : merge_tolerance_km_(std::max(0.0, mergeToleranceKm)) {}

NeighborTopology NeighborGraphBuilder::build(const std::vector<HexCell>& cells) const {
    std::vector<GeoPoint> centers;
    centers.reserve(cells.size());
    for (const auto& c : cells) {
        centers.push_back({c.centerLat, c.centerLon});
    }

    LocalProjection projection(centers);
    std::vector<PlanarPoint> points;
    points.reserve(centers.size());
    for (const auto& g : centers) {
        points.push_back(projection.project(g));
    }
    return buildFromPoints(points);
}

NeighborTopology NeighborGraphBuilder::buildFromPoints(const std::vector<PlanarPoint>& points) const {
    const std::size_t n = points.size();
    if (n == 0) return NoPoints{};
    if (n == 1) return SinglePoint{0};
    if (n == 2) return TwoPoints{NeighborEdge{0, 1}};

    // Collapse near-duplicate centers onto the first point seen at that spot
    const double tol2 = merge_tolerance_km_ * merge_tolerance_km_;
    std::vector<std::uint32_t> reps;
    std::set<NeighborEdge> edges;
    for (std::uint32_t i = 0; i < n; ++i) {
        bool merged = false;
        for (auto r : reps) {
            if (squaredDistance(points[i], points[r]) <= tol2) {
                edges.insert(makeEdge(r, i));
                merged = true;
                break;
            }
        }
        if (!merged) reps.push_back(i);
    }

    auto chainAlong = [&](std::uint32_t from, std::uint32_t to) {
        const double dx = points[to].x - points[from].x;
        const double dy = points[to].y - points[from].y;
        std::vector<std::pair<double, std::uint32_t>> along;
        along.reserve(reps.size());
        for (auto r : reps) {
            along.emplace_back((points[r].x - points[from].x) * dx + (points[r].y - points[from].y) * dy, r);
        }
        std::sort(along.begin(), along.end());
        for (std::size_t k = 1; k < along.size(); ++k) {
            edges.insert(makeEdge(along[k - 1].second, along[k].second));
        }
        return CollinearChain{std::vector<NeighborEdge>(edges.begin(), edges.end())};
    };

    if (reps.size() == 1) {
        return CollinearChain{std::vector<NeighborEdge>(edges.begin(), edges.end())};
    }

    // Farthest pair approximation: farthest from the first, then farthest from that
    std::uint32_t a = reps.front();
    std::uint32_t b = a;
    double best = -1.0;
    for (auto r : reps) {
        double d = squaredDistance(points[reps.front()], points[r]);
        if (d > best) { best = d; a = r; }
    }
    best = -1.0;
    for (auto r : reps) {
        double d = squaredDistance(points[a], points[r]);
        if (d > best) { best = d; b = r; }
    }

    const double span = std::sqrt(best);
    double max_offset = 0.0;
    for (auto r : reps) {
        const double cross = (points[b].x - points[a].x) * (points[r].y - points[a].y) -
                             (points[b].y - points[a].y) * (points[r].x - points[a].x);
        max_offset = std::max(max_offset, std::abs(cross) / span);
    }
    if (reps.size() == 2 || max_offset <= 1e-9 * span + merge_tolerance_km_) {
        return chainAlong(a, b);
    }

    std::vector<PlanarPoint> rep_points;
    rep_points.reserve(reps.size());
    for (auto r : reps) rep_points.push_back(points[r]);

    auto local_triangles = triangulate(rep_points);
    if (local_triangles.empty()) {
        return chainAlong(a, b);
    }

    TriangulatedGraph graph;
    graph.triangles.reserve(local_triangles.size());
    for (const auto& t : local_triangles) {
        std::array<std::uint32_t, 3> tri = {reps[t[0]], reps[t[1]], reps[t[2]]};
        std::sort(tri.begin(), tri.end());
        edges.insert(makeEdge(tri[0], tri[1]));
        edges.insert(makeEdge(tri[1], tri[2]));
        edges.insert(makeEdge(tri[0], tri[2]));
        graph.triangles.push_back(tri);
    }
    std::sort(graph.triangles.begin(), graph.triangles.end());
    graph.edges.assign(edges.begin(), edges.end());
    return graph;
}

std::vector<std::array<std::uint32_t, 3>>
NeighborGraphBuilder::triangulate(const std::vector<PlanarPoint>& input) const {
    const std::uint32_t n = static_cast<std::uint32_t>(input.size());

    // Normalize into a unit box to keep circumcircle arithmetic well scaled
    double min_x = input[0].x, max_x = input[0].x;
    double min_y = input[0].y, max_y = input[0].y;
    for (const auto& p : input) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    const double scale = std::max(max_x - min_x, max_y - min_y);
    const double mid_x = 0.5 * (min_x + max_x);
    const double mid_y = 0.5 * (min_y + max_y);

    std::vector<PlanarPoint> pts;
    pts.reserve(n + 3);
    for (const auto& p : input) {
        pts.push_back({(p.x - mid_x) / scale, (p.y - mid_y) / scale});
    }

    // Super triangle far outside the unit box
    constexpr double kSuper = 100.0;
    pts.push_back({-kSuper, -kSuper});
    pts.push_back({kSuper, -kSuper});
    pts.push_back({0.0, kSuper});

    std::vector<Triangle> triangles;
    triangles.push_back(makeTriangle(n, n + 1, n + 2, pts));

    for (std::uint32_t i = 0; i < n; ++i) {
        const PlanarPoint& p = pts[i];

        std::vector<Triangle> kept;
        std::vector<NeighborEdge> boundary;
        kept.reserve(triangles.size());
        for (const auto& t : triangles) {
            const double dx = p.x - t.cx;
            const double dy = p.y - t.cy;
            if (dx * dx + dy * dy < t.r2) {
                for (int e = 0; e < 3; ++e) {
                    boundary.push_back(makeEdge(t.v[e], t.v[(e + 1) % 3]));
                }
            } else {
                kept.push_back(t);
            }
        }

        // Cavity outline: edges of removed triangles that only one of them owns
        std::sort(boundary.begin(), boundary.end());
        for (std::size_t k = 0; k < boundary.size();) {
            std::size_t run = k;
            while (run < boundary.size() && boundary[run] == boundary[k]) ++run;
            if (run - k == 1) {
                kept.push_back(makeTriangle(boundary[k].a, boundary[k].b, i, pts));
            }
            k = run;
        }
        triangles = std::move(kept);
    }

    std::vector<std::array<std::uint32_t, 3>> result;
    for (const auto& t : triangles) {
        if (t.v[0] >= n || t.v[1] >= n || t.v[2] >= n) continue;
        if (!std::isfinite(t.r2)) continue;
        result.push_back({t.v[0], t.v[1], t.v[2]});
    }
    wrapOpenEdges(result, pts, n);
    return result;
}

std::vector<NeighborEdge> NeighborGraphBuilder::pruneLongEdges(const std::vector<NeighborEdge>& edges,
                                                               const std::vector<HexCell>& cells,
                                                               double maxKm) {
    if (maxKm <= 0.0) return edges;
    std::vector<NeighborEdge> kept;
    kept.reserve(edges.size());
    for (const auto& e : edges) {
        const HexCell& ca = cells[e.a];
        const HexCell& cb = cells[e.b];
        if (haversineKm({ca.centerLat, ca.centerLon}, {cb.centerLat, cb.centerLon}) <= maxKm) {
            kept.push_back(e);
        }
    }
    return kept;
}

std::vector<std::uint32_t> NeighborGraphBuilder::unconnectedCells(std::size_t cellCount,
                                                                  const std::vector<NeighborEdge>& edges) {
    std::vector<bool> touched(cellCount, false);
    for (const auto& e : edges) {
        if (e.a < cellCount) touched[e.a] = true;
        if (e.b < cellCount) touched[e.b] = true;
    }
    std::vector<std::uint32_t> unconnected;
    for (std::size_t i = 0; i < cellCount; ++i) {
        if (!touched[i]) unconnected.push_back(static_cast<std::uint32_t>(i));
    }
    return unconnected;
}
