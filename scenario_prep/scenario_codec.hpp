#pragma once
#include "graph.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

struct ScenarioMetadata {
    double battery_capacity = 0.0;
    std::vector<int> depots;
    int vehicle_count = 0;
};

struct ScenarioDocument {
    std::string name;
    int num_vertices = 0;
    Graph graph;
    ScenarioMetadata meta;
    std::vector<std::string> extra_header;      // unrecognized "KEY: value" lines before the edges
    std::string failure_marker;                 // "FAILURE_SCENARIO:" line as read, empty if absent
    std::vector<std::string> failure_scenario;  // kept verbatim, never interpreted
    int weight_fallbacks = 0;
};

enum class DepotPlacement {
    Append,  // vehicle count and depot line at the end of the file
    Inline   // vehicle count after VEHICLE CAPACITY, depot line before the first edge
};

// One depot still needs two tours; otherwise one vehicle per depot.
int vehicle_count_for(size_t depot_count);

ScenarioDocument parse_scenario(const std::string &text);
std::string serialize_scenario(const ScenarioDocument &doc);

std::vector<std::string> rewrite_depots(const std::vector<std::string> &lines,
                                        const std::vector<int> &depots,
                                        DepotPlacement placement);

std::vector<std::string> split_lines(const std::string &text);
std::string join_lines(const std::vector<std::string> &lines);
std::string format_number(double value);

bool read_text_file(const std::string &path, std::string &out);
bool write_text_file(const std::string &path, const std::string &text);
