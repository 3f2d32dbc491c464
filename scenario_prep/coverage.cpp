#include "coverage.hpp"
#include "annotation.hpp"
#include <cmath>
#include <queue>
#include <stdexcept>
#include <string>
#include <vector>
using namespace std;

unordered_map<int,double> bounded_dijkstra(const Graph& g, int source, double cutoff)
{
    unordered_map<int,double> dist;
    if (!g.hasNode(source)) return dist;
    dist[source] = 0.0;

    using State = pair<double,int>;
    priority_queue<State, vector<State>, greater<State>> pq;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d,u] = pq.top(); pq.pop();
        if (d > dist[u]) continue;

        auto it = g.adj.find(u);
        if (it == g.adj.end()) continue;

        for (const auto &e : it->second) {
            double nd = d + e.weight;
            if (nd > cutoff) continue;
            auto known = dist.find(e.v);
            if (known == dist.end() || nd < known->second) {
                dist[e.v] = nd;
                pq.push({nd, e.v});
            }
        }
    }
    return dist;
}

CoverageMap compute_coverage(const Graph& g, double radius)
{
    if (std::isnan(radius) || radius < 0.0)
        throw invalid_argument("coverage radius must be >= 0, got " + to_string(radius));

    CoverageMap coverage;
    coverage.reserve(g.nodes.size());
    for (int node : g.nodeIds()) {
        auto &reach = coverage[node];
        for (auto &[other, _] : bounded_dijkstra(g, node, radius)) reach.insert(other);
    }
    return coverage;
}

double coverage_radius(double battery_capacity, double factor)
{
    if (!(factor > 0.0) || !std::isfinite(factor))
        throw invalid_argument("radius factor must be positive, got " + to_string(factor));
    return battery_capacity / factor;
}

optional<double> parse_radius_factor(const string &text)
{
    auto factor = parse_number(text);
    if (!factor || !(*factor > 0.0) || !std::isfinite(*factor)) return nullopt;
    return factor;
}
