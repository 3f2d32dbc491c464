#pragma once
#include "scenario_codec.hpp"
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

struct InstanceFamily {
    std::string name;
    int count;  // scenarios are <name>.1.txt .. <name>.<count>.txt
};

struct BatchConfig {
    std::string input_base;
    std::string output_base;
    std::string output_suffix;
    std::vector<InstanceFamily> instances;
    double radius_factor = 2.0;
    DepotPlacement placement = DepotPlacement::Append;
    bool scan_directory = false;
    nlohmann::json raw;
};

enum class BatchJob { Rebalance, PlaceDepots };

enum class FileStatus { Ok, Missing, Error };

struct FileResult {
    std::string family;
    std::string file;
    FileStatus status = FileStatus::Ok;
    int required_edges = 0;
    int non_required_edges = 0;
    std::vector<int> depots;
    int vehicles = 0;
    size_t uncovered = 0;
    std::string error;
    double processing_time = 0.0;  // ms
};

struct BatchReport {
    std::vector<FileResult> results;
    int ok = 0;
    int missing = 0;
    int errors = 0;

    nlohmann::json toJson(const BatchConfig &cfg) const;
};

BatchConfig parse_batch_config(const nlohmann::json &j);
bool load_batch_config(const std::string &path, BatchConfig &cfg);

// Both throw FormatError for a malformed scenario and std::runtime_error for I/O failures.
FileResult rebalance_file(const std::string &in_path, const std::string &out_path);
FileResult place_depots_file(const std::string &in_path, const std::string &out_path,
                             double radius_factor, DepotPlacement placement);

BatchReport run_batch(const BatchConfig &cfg, BatchJob job);
