#pragma once
#include <string>
#include <vector>
#include <optional>

struct WeightParse {
    double weight;
    bool found_token;  // "weight" or "cost" present in the annotation
    bool parsed;       // the text after the token was a usable number
};

struct EdgeMarker {
    int u, v;
    std::string rest;  // annotation after "(u,v)"
};

std::string trim(const std::string &s);
bool starts_with(const std::string &s, const std::string &prefix);
bool ends_with(const std::string &s, const std::string &suffix);

// Value of "KEY: value" / "KEY : value" lines, everything after the first colon, trimmed.
std::string value_after_colon(const std::string &line);

std::optional<double> parse_number(const std::string &text);
std::optional<int> parse_int(const std::string &text);

WeightParse extract_weight(const std::string &annotation);
std::optional<EdgeMarker> split_edge_marker(const std::string &line);
std::vector<int> split_node_list(const std::string &text);
