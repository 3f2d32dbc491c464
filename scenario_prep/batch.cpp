#include "batch.hpp"
#include "annotation.hpp"
#include "coverage.hpp"
#include "depot_selection.hpp"
#include "rebalance.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

static const char *FAMILY_DIR_SUFFIX = "_failure_scenarios";

static const std::vector<InstanceFamily> DEFAULT_INSTANCES = {
    {"gdb", 37},
    {"bccm", 108},
    {"eglese", 112}
};

static std::string status_name(FileStatus s) {
    switch (s) {
    case FileStatus::Ok: return "ok";
    case FileStatus::Missing: return "missing";
    case FileStatus::Error: return "error";
    }
    return "unknown";
}

BatchConfig parse_batch_config(const json &j) {
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object");

    BatchConfig cfg;
    cfg.raw = j;
    try {
        if (!j.contains("input_base") || !j.contains("output_base"))
            throw ConfigError("configuration needs input_base and output_base");
        cfg.input_base = j["input_base"].get<std::string>();
        cfg.output_base = j["output_base"].get<std::string>();
        cfg.output_suffix = j.value("output_suffix", "");
        cfg.radius_factor = j.value("radius_factor", 2.0);
        cfg.scan_directory = j.value("scan_directory", false);

        std::string placement = j.value("depot_placement", "append");
        if (placement == "append") cfg.placement = DepotPlacement::Append;
        else if (placement == "inline") cfg.placement = DepotPlacement::Inline;
        else throw ConfigError("unknown depot_placement '" + placement + "'");

        if (!j.contains("instances")) {
            cfg.instances = DEFAULT_INSTANCES;
        } else if (j["instances"].is_array()) {
            for (const auto &ji : j["instances"]) {
                if (!ji.is_object() || !ji.contains("name"))
                    throw ConfigError("instance entry without a name: " + ji.dump());
                cfg.instances.push_back({ji.at("name").get<std::string>(), ji.value("count", 0)});
            }
        } else if (j["instances"].is_object()) {
            for (auto &[name, count] : j["instances"].items())
                cfg.instances.push_back({name, count.get<int>()});
        } else {
            throw ConfigError("instances must be an array or an object");
        }
    } catch (const json::exception &e) {
        throw ConfigError(std::string("bad configuration value: ") + e.what());
    }

    if (!(cfg.radius_factor > 0.0))
        throw ConfigError("radius_factor must be positive");
    for (const auto &fam : cfg.instances) {
        if (fam.name.empty()) throw ConfigError("instance family without a name");
        if (fam.count < 0) throw ConfigError("negative scenario count for " + fam.name);
    }
    return cfg;
}

bool load_batch_config(const std::string &path, BatchConfig &cfg) {
    std::ifstream fin(path);
    if (!fin) {
        std::cerr << "Could not open config file: " << path << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing JSON: " << e.what() << "\n";
        return false;
    }

    try {
        cfg = parse_batch_config(j);
    } catch (const ConfigError &e) {
        std::cerr << "Invalid config " << path << ": " << e.what() << "\n";
        return false;
    }
    return true;
}

static std::vector<std::string> read_lines_or_throw(const std::string &path) {
    std::string text;
    if (!read_text_file(path, text)) throw std::runtime_error("cannot read " + path);
    return split_lines(text);
}

static void write_or_throw(const std::string &path, const std::string &text) {
    if (!write_text_file(path, text)) throw std::runtime_error("cannot write " + path);
}

FileResult rebalance_file(const std::string &in_path, const std::string &out_path) {
    RebalanceResult r = rebalance_edges(read_lines_or_throw(in_path));
    write_or_throw(out_path, join_lines(r.lines));

    FileResult res;
    res.file = in_path;
    res.required_edges = r.required_count;
    res.non_required_edges = r.non_required_count;
    res.vehicles = r.vehicle_count;
    return res;
}

FileResult place_depots_file(const std::string &in_path, const std::string &out_path,
                             double radius_factor, DepotPlacement placement) {
    std::string text;
    if (!read_text_file(in_path, text)) throw std::runtime_error("cannot read " + in_path);

    ScenarioDocument doc = parse_scenario(text);
    double radius = coverage_radius(doc.meta.battery_capacity, radius_factor);
    CoverageMap coverage = compute_coverage(doc.graph, radius);
    DepotSelection sel = select_depots(coverage, doc.graph.nodeIds());
    std::vector<int> depots = sorted_depots(sel);

    write_or_throw(out_path, join_lines(rewrite_depots(split_lines(text), depots, placement)));

    FileResult res;
    res.file = in_path;
    res.required_edges = doc.graph.requiredCount();
    res.non_required_edges = doc.graph.nonRequiredCount();
    res.depots = depots;
    res.vehicles = vehicle_count_for(depots.size());
    res.uncovered = sel.uncovered.size();
    return res;
}

static std::vector<std::string> family_files(const BatchConfig &cfg, const InstanceFamily &fam,
                                             const fs::path &in_dir) {
    std::vector<std::string> names;
    if (!cfg.scan_directory) {
        for (int i = 1; i <= fam.count; ++i)
            names.push_back(fam.name + "." + std::to_string(i) + ".txt");
        return names;
    }

    std::error_code ec;
    if (!fs::is_directory(in_dir, ec)) {
        std::cerr << "[!] Missing directory " << in_dir.string() << ", skipping.\n";
        return names;
    }
    for (const auto &entry : fs::directory_iterator(in_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt")
            names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

BatchReport run_batch(const BatchConfig &cfg, BatchJob job) {
    struct FamilyDirs { fs::path in, out; };
    std::vector<FamilyDirs> dirs;

    // check every family before anything is deleted
    for (const auto &fam : cfg.instances) {
        fs::path in_dir = fs::path(cfg.input_base) / (fam.name + FAMILY_DIR_SUFFIX);
        fs::path out_dir = fs::path(cfg.output_base) / (fam.name + FAMILY_DIR_SUFFIX + cfg.output_suffix);
        if (fs::weakly_canonical(in_dir) == fs::weakly_canonical(out_dir))
            throw ConfigError("output directory would overwrite input: " + out_dir.string());
        dirs.push_back({in_dir, out_dir});
    }

    BatchReport report;
    for (size_t f = 0; f < cfg.instances.size(); ++f) {
        const auto &fam = cfg.instances[f];
        const auto &[in_dir, out_dir] = dirs[f];

        // stale results from earlier runs must not survive
        fs::remove_all(out_dir);
        fs::create_directories(out_dir);

        for (const auto &name : family_files(cfg, fam, in_dir)) {
            fs::path infile = in_dir / name;
            fs::path outfile = out_dir / name;
            std::string label = fs::path(name).stem().string();

            auto start_time = std::chrono::high_resolution_clock::now();
            FileResult result;

            if (!fs::exists(infile)) {
                std::cout << "[!] Missing " << infile.string() << ", skipping.\n";
                result.status = FileStatus::Missing;
                result.file = infile.string();
            } else {
                try {
                    if (job == BatchJob::Rebalance) {
                        result = rebalance_file(infile.string(), outfile.string());
                        std::cout << "Rebalanced " << label << ": now " << result.required_edges
                                  << " required edges; vehicles set to " << result.vehicles << "\n";
                    } else {
                        result = place_depots_file(infile.string(), outfile.string(),
                                                   cfg.radius_factor, cfg.placement);
                        std::cout << "Updated " << label << " -> " << outfile.string() << " ("
                                  << result.depots.size() << " depots, radius = C/"
                                  << format_number(cfg.radius_factor) << ")\n";
                        if (result.uncovered > 0)
                            std::cout << "[!] " << label << ": " << result.uncovered
                                      << " nodes left uncovered\n";
                    }
                } catch (const std::exception &e) {
                    std::cerr << "[!] " << infile.string() << ": " << e.what() << "\n";
                    result = FileResult{};
                    result.status = FileStatus::Error;
                    result.file = infile.string();
                    result.error = e.what();
                }
            }

            auto end_time = std::chrono::high_resolution_clock::now();
            result.family = fam.name;
            result.processing_time = std::chrono::duration<double, std::milli>(end_time - start_time).count();

            switch (result.status) {
            case FileStatus::Ok: report.ok++; break;
            case FileStatus::Missing: report.missing++; break;
            case FileStatus::Error: report.errors++; break;
            }
            report.results.push_back(result);
        }
    }
    return report;
}

json BatchReport::toJson(const BatchConfig &cfg) const {
    json out;
    out["meta"] = cfg.raw;
    out["results"] = json::array();
    for (const auto &r : results) {
        json jr;
        jr["family"] = r.family;
        jr["file"] = r.file;
        jr["status"] = status_name(r.status);
        if (r.status == FileStatus::Ok) {
            jr["required_edges"] = r.required_edges;
            jr["non_required_edges"] = r.non_required_edges;
            jr["vehicles"] = r.vehicles;
            if (!r.depots.empty()) {
                jr["depots"] = r.depots;
                jr["uncovered"] = r.uncovered;
            }
        }
        if (!r.error.empty()) jr["error"] = r.error;
        jr["processing_time"] = r.processing_time;
        out["results"].push_back(jr);
    }
    out["summary"] = {
        {"ok", ok},
        {"missing", missing},
        {"errors", errors}
    };
    return out;
}
