#include "depot_selection.hpp"
#include <algorithm>
#include <unordered_set>
using namespace std;

// --------------------------------------------------
// Greedy maximum coverage: take the node that covers the most
// still-uncovered nodes until nothing is left or nothing helps.
// Ties keep the first candidate in all_nodes order.
// --------------------------------------------------
DepotSelection select_depots(const CoverageMap &coverage, const vector<int> &all_nodes)
{
    DepotSelection res;
    unordered_set<int> targets(all_nodes.begin(), all_nodes.end());
    unordered_set<int> selected;
    unordered_set<int> covered;

    auto gain_of = [&](int node) {
        auto it = coverage.find(node);
        if (it == coverage.end()) return size_t(0);
        size_t gain = 0;
        for (int c : it->second)
            if (targets.count(c) && !covered.count(c)) gain++;
        return gain;
    };

    while (covered.size() < targets.size()) {
        int best_node = -1;
        size_t best_gain = 0;
        for (int node : all_nodes) {
            if (selected.count(node)) continue;
            size_t gain = gain_of(node);
            if (gain > best_gain) {
                best_gain = gain;
                best_node = node;
            }
        }
        if (best_gain == 0) break;

        selected.insert(best_node);
        res.depots.push_back(best_node);
        for (int c : coverage.at(best_node))
            if (targets.count(c)) covered.insert(c);
        res.covered_after.push_back(covered.size());
    }

    for (int node : all_nodes)
        if (!covered.count(node)) res.uncovered.push_back(node);
    return res;
}

vector<int> sorted_depots(const DepotSelection &selection)
{
    vector<int> out = selection.depots;
    sort(out.begin(), out.end());
    return out;
}
