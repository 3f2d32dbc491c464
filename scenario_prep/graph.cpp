#include "graph.hpp"
#include <algorithm>
#include <unordered_set>
using json = nlohmann::json;

static unsigned long long pair_key(int u, int v) {
    if (u > v) std::swap(u, v);
    return (static_cast<unsigned long long>(static_cast<unsigned int>(u)) << 32) |
           static_cast<unsigned int>(v);
}

void Graph::addNode(int id) {
    if (nodes.count(id)) return;
    nodes[id] = Node{id};
    adj[id];
}

// A repeated pair overwrites the stored edge in place, so the graph stays simple.
int Graph::addEdge(int u, int v, double weight, bool required) {
    addNode(u);
    addNode(v);

    unsigned long long key = pair_key(u, v);
    auto it = edge_index.find(key);
    if (it != edge_index.end()) {
        Edge &e = edges[it->second];
        e.weight = weight;
        e.required = required;
        for (int end : {e.u, e.v}) {
            for (auto &x : adj[end]) {
                if (x.id == e.id) {
                    x.weight = weight;
                    x.required = required;
                }
            }
        }
        return e.id;
    }

    Edge e;
    e.id = static_cast<int>(edges.size());
    e.u = u;
    e.v = v;
    e.weight = weight;
    e.required = required;
    edges.push_back(e);
    edge_index[key] = e.id;

    adj[u].push_back(e);
    if (u != v) {
        Edge er = e;
        std::swap(er.u, er.v);
        adj[er.u].push_back(er);
    }
    return e.id;
}

bool Graph::hasNode(int id) const {
    return nodes.find(id) != nodes.end();
}

std::vector<int> Graph::nodeIds() const {
    std::vector<int> ids;
    ids.reserve(nodes.size());
    for (auto &[id, _] : nodes) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

int Graph::requiredCount() const {
    return static_cast<int>(std::count_if(edges.begin(), edges.end(),
                                          [](const Edge &e){ return e.required; }));
}

int Graph::nonRequiredCount() const {
    return static_cast<int>(edges.size()) - requiredCount();
}

json Graph::toJson(const std::vector<int> &depots) const {
    std::unordered_set<int> depot_set(depots.begin(), depots.end());

    json j;
    j["nodes"] = json::array();
    for (int id : nodeIds()) {
        j["nodes"].push_back({{"id", id}, {"depot", depot_set.count(id) > 0}});
    }
    j["edges"] = json::array();
    for (const auto &e : edges) {
        j["edges"].push_back({
            {"id", e.id},
            {"u", e.u},
            {"v", e.v},
            {"weight", e.weight},
            {"required", e.required}
        });
    }
    j["depots"] = depots;
    return j;
}
