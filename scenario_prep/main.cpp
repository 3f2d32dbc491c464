#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include "batch.hpp"
#include "coverage.hpp"
#include "depot_selection.hpp"
#include "scenario_codec.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

static void usage(const char *prog) {
    cerr << "Usage:\n"
         << "  " << prog << " rebalance <config.json> [report.json]\n"
         << "  " << prog << " place-depots <config.json> [report.json]\n"
         << "  " << prog << " export-graph <scenario.txt> <graph.json> [radius_factor]\n";
}

static bool write_json(const string &path, const json &j) {
    ofstream out_file(path);
    if (!out_file) {
        cerr << "Failed to open output file " << path << "\n";
        return false;
    }
    out_file << j.dump(4) << endl;
    return true;
}

static int run_batch_command(const string &command, int argc, char **argv) {
    if (argc < 3 || argc > 4) {
        usage(argv[0]);
        return 1;
    }

    BatchConfig cfg;
    if (!load_batch_config(argv[2], cfg)) return 1;

    cout << "Loaded config with " << cfg.instances.size() << " instance families\n";

    BatchJob job = (command == "rebalance") ? BatchJob::Rebalance : BatchJob::PlaceDepots;
    BatchReport report;
    try {
        report = run_batch(cfg, job);
    } catch (const exception &e) {
        cerr << "Batch aborted: " << e.what() << "\n";
        return 1;
    }

    cout << "Processed " << report.results.size() << " files: " << report.ok << " ok, "
         << report.missing << " missing, " << report.errors << " failed\n";

    if (argc == 4) {
        if (!write_json(argv[3], report.toJson(cfg))) return 1;
        cout << "Report written to " << argv[3] << "\n";
    }
    return 0;
}

static int run_export_graph(int argc, char **argv) {
    if (argc < 4 || argc > 5) {
        usage(argv[0]);
        return 1;
    }

    optional<double> factor;
    if (argc == 5) {
        factor = parse_radius_factor(argv[4]);
        if (!factor) {
            cerr << "Invalid radius factor: " << argv[4] << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    string text;
    if (!read_text_file(argv[2], text)) return 1;

    json out;
    try {
        ScenarioDocument doc = parse_scenario(text);
        cout << "Loaded graph with " << doc.graph.nodes.size() << " nodes and "
             << doc.graph.edges.size() << " edges\n";

        vector<int> depots = doc.meta.depots;
        if (factor) {
            double radius = coverage_radius(doc.meta.battery_capacity, *factor);
            depots = sorted_depots(select_depots(compute_coverage(doc.graph, radius),
                                                 doc.graph.nodeIds()));
            cout << "Placed " << depots.size() << " depots with radius " << radius << "\n";
        }

        out = doc.graph.toJson(depots);
        out["name"] = doc.name;
        out["battery_capacity"] = doc.meta.battery_capacity;
        out["vehicles"] = vehicle_count_for(depots.size());
    } catch (const exception &e) {
        cerr << "Failed to process " << argv[2] << ": " << e.what() << "\n";
        return 1;
    }

    if (!write_json(argv[3], out)) return 1;
    cout << "Output written to " << argv[3] << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    string command = argv[1];
    if (command == "rebalance" || command == "place-depots")
        return run_batch_command(command, argc, argv);
    if (command == "export-graph")
        return run_export_graph(argc, argv);

    cerr << "Unknown command: " << command << "\n";
    usage(argv[0]);
    return 1;
}
