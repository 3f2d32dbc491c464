#pragma once
#include <string>
#include <vector>

struct RebalanceResult {
    std::vector<std::string> lines;
    int depot_count;
    int vehicle_count;
    int required_count;
    int non_required_count;
};

// Line-level rewrite: required edges become ceil(total/2) of all edge lines.
// Edge lines are moved as opaque text; connectivity of the required set is not checked.
RebalanceResult rebalance_edges(const std::vector<std::string> &lines);
