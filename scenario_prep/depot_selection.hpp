#pragma once
#include "coverage.hpp"
#include <vector>

struct DepotSelection {
    std::vector<int> depots;           // in pick order
    std::vector<size_t> covered_after; // covered node count after each pick
    std::vector<int> uncovered;        // left over when no pick gains anything
};

DepotSelection select_depots(const CoverageMap &coverage, const std::vector<int> &all_nodes);

std::vector<int> sorted_depots(const DepotSelection &selection);
