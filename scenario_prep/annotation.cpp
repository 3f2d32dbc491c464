#include "annotation.hpp"
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <stdexcept>

static const char *WHITESPACE = " \t\r\n\f\v";

std::string trim(const std::string &s) {
    size_t b = s.find_first_not_of(WHITESPACE);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(WHITESPACE);
    return s.substr(b, e - b + 1);
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string value_after_colon(const std::string &line) {
    size_t pos = line.find(':');
    if (pos == std::string::npos) return "";
    return trim(line.substr(pos + 1));
}

// Whole-string conversion; leading/trailing whitespace is allowed, anything else is not.
std::optional<double> parse_number(const std::string &text) {
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    const char *begin = t.c_str();
    char *end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    return value;
}

std::optional<int> parse_int(const std::string &text) {
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    const char *begin = t.c_str();
    char *end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    if (value < INT_MIN || value > INT_MAX) return std::nullopt;
    return static_cast<int>(value);
}

WeightParse extract_weight(const std::string &annotation) {
    WeightParse res{1.0, false, false};

    std::string value;
    for (const char *token : {"weight", "cost"}) {
        size_t pos = annotation.find(token);
        if (pos != std::string::npos) {
            res.found_token = true;
            value = annotation.substr(pos + std::char_traits<char>::length(token));
            break;
        }
    }
    if (!res.found_token) return res;

    auto number = parse_number(value);
    if (!number || !std::isfinite(*number) || *number < 0.0) return res;

    res.weight = *number;
    res.parsed = true;
    return res;
}

std::optional<EdgeMarker> split_edge_marker(const std::string &line) {
    std::string t = trim(line);
    if (t.empty() || t[0] != '(') return std::nullopt;

    size_t close = t.find(')');
    if (close == std::string::npos) return std::nullopt;

    std::string inner = t.substr(1, close - 1);
    size_t comma = inner.find(',');
    if (comma == std::string::npos) return std::nullopt;

    auto u = parse_int(inner.substr(0, comma));
    auto v = parse_int(inner.substr(comma + 1));
    if (!u || !v) return std::nullopt;

    return EdgeMarker{*u, *v, trim(t.substr(close + 1))};
}

std::vector<int> split_node_list(const std::string &text) {
    std::vector<int> out;
    std::string token;
    auto flush = [&]() {
        if (token.empty()) return;
        auto id = parse_int(token);
        if (!id) throw std::invalid_argument("not a node id: '" + token + "'");
        out.push_back(*id);
        token.clear();
    };
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) flush();
        else token += c;
    }
    flush();
    return out;
}
