#pragma once

#include <map>
#include <string>

namespace scale_factors {

using FactorMap = std::map<std::string, double>;

constexpr const char* kAllMonitors = "ALL";
constexpr int kBaseCursorSize = 24;

// "name=1.25;name2=2.00" -> map. Malformed pairs are skipped.
FactorMap parse(const std::string& str);

// Pairs formatted as name=%.2f, joined with ';' in name order.
std::string join(const FactorMap& factors);

// Sole value for one monitor, else the "ALL" entry, else 1.
double single_factor(const FactorMap& factors);

// A factor in (1.7, 2) already maps to window scale 2.
int window_scale(double factor);

int cursor_size(double factor);

FactorMap single_to_map(double factor);

}
