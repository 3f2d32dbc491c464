#pragma once
#include <stdexcept>
#include <string>

// Structural problem in a scenario file; stops processing of that file only.
struct FormatError : std::runtime_error {
    explicit FormatError(const std::string &msg) : std::runtime_error(msg) {}
};

// Bad or incomplete batch configuration.
struct ConfigError : std::runtime_error {
    explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};
