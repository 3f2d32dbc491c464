#pragma once
#include "graph.hpp"
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <string>

using CoverageMap = std::unordered_map<int, std::unordered_set<int>>;

// Shortest travel time from source to every node reachable within cutoff.
std::unordered_map<int, double> bounded_dijkstra(const Graph &g, int source, double cutoff);

CoverageMap compute_coverage(const Graph &g, double radius);

double coverage_radius(double battery_capacity, double factor);

// Positive finite number, nothing else on the line.
std::optional<double> parse_radius_factor(const std::string &text);
