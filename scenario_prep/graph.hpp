#pragma once
#include <vector>
#include <string>
#include <unordered_map>
#include "nlohmann/json.hpp"

struct Edge {
    int id;
    int u, v;
    double weight;   // travel time
    bool required;
};

struct Node {
    int id;
};

class Graph {
public:
    std::unordered_map<int, Node> nodes;
    std::unordered_map<int, std::vector<Edge>> adj;
    std::vector<Edge> edges;  // insertion order, one entry per undirected edge

    void addNode(int id);
    int addEdge(int u, int v, double weight, bool required);
    bool hasNode(int id) const;
    std::vector<int> nodeIds() const;
    int requiredCount() const;
    int nonRequiredCount() const;
    nlohmann::json toJson(const std::vector<int> &depots) const;

private:
    std::unordered_map<unsigned long long, int> edge_index;
};
