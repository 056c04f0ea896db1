#include "scale_manager.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace {

const char* const kQtThemeSection = "Theme";
const char* const kQtKeyScreenScaleFactors = "ScreenScaleFactors";
const char* const kQtKeyScaleFactor = "ScaleFactor";
const char* const kQtKeyScaleLogicalDpi = "ScaleLogicalDpi";

const char* const kScaleEnvKeys[] = {
    "QT_SCALE_FACTOR",
    "QT_SCREEN_SCALE_FACTORS",
    "QT_AUTO_SCREEN_SCALE_FACTOR",
    "QT_FONT_DPI",
    "DEEPIN_WINE_SCALE",
};

std::string format_factor(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

bool ensure_parent_dir(const std::string& path, std::string& error) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error = parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

}

ScaleManager::ScaleManager(const AppConfig& config, SettingsStore& settings, ScaleQueue& queue)
    : config(config), settings(settings), queue(queue) {}

bool ScaleManager::set_factors(const scale_factors::FactorMap& factors, bool notify) {
    LOG_DEBUG("set_factors %s", scale_factors::join(factors).c_str());
    for (const auto& kv : factors) {
        if (!std::isfinite(kv.second) || !(kv.second > 0)) {
            LOG_ERROR("invalid scale factor %f for %s", kv.second, kv.first.c_str());
            return false;
        }
    }
    if (factors.empty()) {
        LOG_ERROR("scale factors are empty");
        return false;
    }

    std::lock_guard<std::mutex> lock(set_mutex);
    apply_single_factor(scale_factors::single_factor(factors), notify);

    if (!settings.set_string(kKeyIndividualScaling, scale_factors::join(factors))) {
        LOG_WARN("failed to persist %s", kKeyIndividualScaling);
    }

    if (!write_qt_theme(factors)) {
        return false;
    }

    std::string error;
    if (!clean_up_env(error)) {
        LOG_WARN("failed to clean up session environment: %s", error.c_str());
    }
    return true;
}

bool ScaleManager::set_scale_factor(double factor) {
    return set_factors(scale_factors::single_to_map(factor), true);
}

bool ScaleManager::set_scale_factor_without_notify(double factor) {
    return set_factors(scale_factors::single_to_map(factor), false);
}

void ScaleManager::apply_single_factor(double factor, bool notify) {
    if (!settings.set_double(kKeyScaleFactor, factor)) {
        LOG_WARN("failed to persist %s", kKeyScaleFactor);
    }

    int window_scale = scale_factors::window_scale(factor);
    int old_window_scale = settings.get_int(kKeyWindowScale, 1);
    if (old_window_scale != window_scale) {
        if (!settings.set_int(kKeyWindowScale, window_scale)) {
            LOG_WARN("failed to persist %s", kKeyWindowScale);
        }
    }

    int cursor = scale_factors::cursor_size(factor);
    if (!settings.set_int(kKeyCursorThemeSize, cursor)) {
        LOG_WARN("failed to persist %s", kKeyCursorThemeSize);
    }
    if (!settings.set_int(kKeyCursorSize, cursor)) {
        LOG_WARN("failed to persist %s", kKeyCursorSize);
    }

    queue.submit(window_scale, notify);
}

bool ScaleManager::write_qt_theme(const scale_factors::FactorMap& factors) {
    if (config.qt_theme_path.empty()) {
        return true;
    }

    KeyFile kf;
    std::string error;
    bool not_found = false;
    if (!kf.load_from_file(config.qt_theme_path, error, &not_found) && !not_found) {
        LOG_WARN("failed to load toolkit theme file: %s", error.c_str());
    }

    std::string value;
    if (factors.size() == 1) {
        value = format_factor(factors.begin()->second);
    } else {
        value = quote(scale_factors::join(factors));
    }
    kf.set_value(kQtThemeSection, kQtKeyScreenScaleFactors, value);
    kf.delete_key(kQtThemeSection, kQtKeyScaleFactor);
    kf.set_value(kQtThemeSection, kQtKeyScaleLogicalDpi, "-1,-1");

    if (!ensure_parent_dir(config.qt_theme_path, error) || !kf.save_to_file(config.qt_theme_path, error)) {
        LOG_ERROR("failed to write toolkit theme file: %s", error.c_str());
        return false;
    }

    return write_greeter_theme(std::move(kf));
}

bool ScaleManager::write_greeter_theme(KeyFile kf) {
    if (config.greeter_theme_path.empty()) {
        return true;
    }
    kf.set_value(kQtThemeSection, kQtKeyScaleLogicalDpi, "96,96");

    std::string error;
    if (!ensure_parent_dir(config.greeter_theme_path, error) || !kf.save_to_file(config.greeter_theme_path, error)) {
        LOG_ERROR("failed to write greeter theme file: %s", error.c_str());
        return false;
    }
    return true;
}

bool ScaleManager::clean_up_env(std::string& error) {
    if (config.env_file.empty()) {
        return true;
    }

    std::ifstream in(config.env_file);
    if (!in) {
        if (errno == ENOENT) {
            return true;
        }
        error = config.env_file + ": " + error_to_string(errno);
        return false;
    }

    std::vector<std::string> kept;
    bool need_save = false;
    std::string line;
    while (std::getline(in, line)) {
        bool drop = false;
        for (const char* key : kScaleEnvKeys) {
            std::string prefix = std::string(key) + "=";
            if (line.compare(0, prefix.size(), prefix) == 0) {
                drop = true;
                break;
            }
        }
        if (drop) {
            need_save = true;
        } else {
            kept.push_back(line);
        }
    }
    in.close();

    if (!need_save) {
        return true;
    }

    std::ofstream out(config.env_file, std::ios::trunc);
    if (!out) {
        error = config.env_file + ": " + error_to_string(errno);
        return false;
    }
    for (const auto& l : kept) {
        out << l << "\n";
    }
    if (!out) {
        error = config.env_file + ": write failed";
        return false;
    }
    return true;
}

scale_factors::FactorMap ScaleManager::get_screen_scale_factors() {
    return scale_factors::parse(settings.get_string(kKeyIndividualScaling, ""));
}

double ScaleManager::get_scale_factor() {
    return settings.get_double(kKeyScaleFactor, 1.0);
}

int ScaleManager::get_window_scale() {
    return settings.get_int(kKeyWindowScale, 1);
}
