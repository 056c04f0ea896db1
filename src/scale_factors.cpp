#include "scale_factors.hpp"
#include "utils.hpp"

#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace scale_factors {

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size() && std::isfinite(out);
}

FactorMap parse(const std::string& str) {
    FactorMap result;
    std::istringstream in(str);
    std::string pair;
    while (std::getline(in, pair, ';')) {
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string value_str = pair.substr(eq + 1);
        double value = 0;
        if (!parse_double(value_str, value)) {
            LOG_WARN("invalid scale factor \"%s\" for %s", value_str.c_str(), pair.substr(0, eq).c_str());
            continue;
        }
        result[pair.substr(0, eq)] = value;
    }
    return result;
}

std::string join(const FactorMap& factors) {
    std::string out;
    char buf[32];
    for (const auto& kv : factors) {
        if (!out.empty()) out += ";";
        std::snprintf(buf, sizeof(buf), "%.2f", kv.second);
        out += kv.first + "=" + buf;
    }
    return out;
}

double single_factor(const FactorMap& factors) {
    if (factors.empty()) {
        return 1;
    }
    if (factors.size() == 1) {
        return factors.begin()->second;
    }
    auto it = factors.find(kAllMonitors);
    if (it != factors.end()) {
        return it->second;
    }
    return 1;
}

// Saturates at INT_MAX instead of overflowing the cast.
static int to_int_saturated(double v) {
    if (!(v < static_cast<double>(INT_MAX))) {
        return INT_MAX;
    }
    if (v < 0) {
        return 0;
    }
    return static_cast<int>(v);
}

int window_scale(double factor) {
    int scale = to_int_saturated(std::trunc((factor + 0.3) * 10) / 10);
    if (scale < 1) {
        scale = 1;
    }
    return scale;
}

int cursor_size(double factor) {
    return to_int_saturated(kBaseCursorSize * factor);
}

FactorMap single_to_map(double factor) {
    return FactorMap{{kAllMonitors, factor}};
}

}
