#include "rebalance.hpp"
#include "annotation.hpp"
#include "scenario_codec.hpp"
#include <deque>
#include <stdexcept>
#include <utility>

using namespace std;

enum class Block { Header, Required, NonRequired, Footer };

RebalanceResult rebalance_edges(const vector<string> &lines)
{
    vector<string> header, stray, footer;
    deque<string> req, nonreq;
    Block block = Block::Header;
    bool seen_required_marker = false;

    for (const auto &line : lines) {
        string t = trim(line);

        if (block != Block::Footer && starts_with(t, "LIST_REQUIRED_EDGES:")) {
            block = Block::Required;
            seen_required_marker = true;
            header.push_back(line);
            continue;
        }
        if (block != Block::Footer && starts_with(t, "LIST_NON_REQUIRED_EDGES:")) {
            block = Block::NonRequired;
            continue;
        }
        // next labeled section (FAILURE_SCENARIO: ...) ends the edge blocks
        if ((block == Block::Required || block == Block::NonRequired) && ends_with(t, ":")) {
            block = Block::Footer;
            footer.push_back(line);
            continue;
        }

        switch (block) {
        case Block::Header:
            header.push_back(line);
            break;
        case Block::Required:
        case Block::NonRequired:
            if (starts_with(t, "(")) {
                (block == Block::Required ? req : nonreq).push_back(line);
            } else if (!t.empty()) {
                stray.push_back(line);
            }
            break;
        case Block::Footer:
            footer.push_back(line);
            break;
        }
    }

    if (!seen_required_marker)
        throw FormatError("LIST_REQUIRED_EDGES: not found in file");

    size_t total = req.size() + nonreq.size();
    size_t target = (total + 1) / 2;

    while (req.size() > target) {
        nonreq.push_front(req.back());
        req.pop_back();
    }
    while (req.size() < target && !nonreq.empty()) {
        req.push_back(nonreq.front());
        nonreq.pop_front();
    }

    vector<string> out(header.begin(), header.end());
    out.insert(out.end(), req.begin(), req.end());
    out.push_back("LIST_NON_REQUIRED_EDGES:");
    out.insert(out.end(), nonreq.begin(), nonreq.end());
    out.insert(out.end(), stray.begin(), stray.end());
    out.insert(out.end(), footer.begin(), footer.end());

    RebalanceResult res;
    res.required_count = static_cast<int>(req.size());
    res.non_required_count = static_cast<int>(nonreq.size());
    res.depot_count = 0;
    for (const auto &l : out) {
        string t = trim(l);
        if (!starts_with(t, "DEPOT:")) continue;
        try {
            res.depot_count = static_cast<int>(split_node_list(value_after_colon(t)).size());
        } catch (const invalid_argument &e) {
            throw FormatError(string("bad DEPOT line: ") + e.what());
        }
        break;
    }
    res.vehicle_count = vehicle_count_for(static_cast<size_t>(res.depot_count));

    for (auto &l : out) {
        string t = trim(l);
        if (starts_with(t, "NUMBER OF REQUIRED_EDGES:"))
            l = "NUMBER OF REQUIRED_EDGES: " + to_string(res.required_count);
        else if (starts_with(t, "NUMBER OF NON_REQUIRED_EDGES:"))
            l = "NUMBER OF NON_REQUIRED_EDGES: " + to_string(res.non_required_count);
        else if (starts_with(t, "NUMBER OF VEHICLES:"))
            l = "NUMBER OF VEHICLES: " + to_string(res.vehicle_count);
    }
    res.lines = move(out);
    return res;
}
