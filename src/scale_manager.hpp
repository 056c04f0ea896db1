#pragma once

#include "app_config.hpp"
#include "key_file.hpp"
#include "scale_factors.hpp"
#include "scale_queue.hpp"
#include "settings_store.hpp"

#include <mutex>
#include <string>

class ScaleManager {
public:
    ScaleManager(const AppConfig& config, SettingsStore& settings, ScaleQueue& queue);

    // Rejects an empty map or a non-positive factor without touching any
    // state. Theme file failures are reported after the settings were
    // written and the boot splash change was queued.
    bool set_factors(const scale_factors::FactorMap& factors, bool notify);
    bool set_scale_factor(double factor);
    bool set_scale_factor_without_notify(double factor);

    scale_factors::FactorMap get_screen_scale_factors();
    double get_scale_factor();
    int get_window_scale();

private:
    void apply_single_factor(double factor, bool notify);
    bool write_qt_theme(const scale_factors::FactorMap& factors);
    bool write_greeter_theme(KeyFile kf);
    bool clean_up_env(std::string& error);

    AppConfig config;
    SettingsStore& settings;
    ScaleQueue& queue;

    // Serializes whole set_factors calls so settings and theme files agree.
    std::mutex set_mutex;
};
