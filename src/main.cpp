#include "app_config.hpp"
#include "notifier.hpp"
#include "rethemer.hpp"
#include "scale_factors.hpp"
#include "scale_manager.hpp"
#include "scale_queue.hpp"
#include "settings_store.hpp"
#include "signal_handler.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

static bool parse_factor(const std::string& s, double& out) {
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return !s.empty() && end == s.c_str() + s.size();
}

static void print_factors(ScaleManager& manager) {
    auto factors = manager.get_screen_scale_factors();
    std::cout << "scale-factor: " << manager.get_scale_factor() << "\n";
    std::cout << "window-scale: " << manager.get_window_scale() << "\n";
    for (const auto& kv : factors) {
        std::cout << kv.first << ": " << kv.second << "\n";
    }
    std::cout.flush();
}

static bool run_command(ScaleManager& manager, const std::string& command, const std::string& arg, bool notify) {
    if (command == "get") {
        print_factors(manager);
        return true;
    }
    if (command == "set") {
        double factor = 0;
        if (!parse_factor(arg, factor)) {
            LOG_ERROR("invalid scale factor \"%s\"", arg.c_str());
            return false;
        }
        return notify ? manager.set_scale_factor(factor) : manager.set_scale_factor_without_notify(factor);
    }
    if (command == "set-factors" || command == "factors") {
        return manager.set_factors(scale_factors::parse(arg), notify);
    }
    LOG_ERROR("unknown command \"%s\"", command.c_str());
    return false;
}

// One command per line: "set <factor>", "factors <name=f;...>", "get", "quit".
static void serve(ScaleManager& manager, bool notify) {
    std::string line;
    while (!stop_requested() && std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string command, arg;
        in >> command >> arg;
        if (command.empty()) {
            continue;
        }
        if (command == "quit") {
            break;
        }
        run_command(manager, command, arg, notify);
    }
}

int main(int argc, char* argv[]) {
    AppConfig config;
    // First pass: the config file provides defaults for the flags.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (!load_config_file(argv[i + 1], config)) {
                return 1;
            }
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--settings" && i + 1 < argc) {
            config.settings_path = argv[++i];
        } else if (arg == "--qt-theme" && i + 1 < argc) {
            config.qt_theme_path = argv[++i];
        } else if (arg == "--greeter-theme" && i + 1 < argc) {
            config.greeter_theme_path = argv[++i];
        } else if (arg == "--env-file" && i + 1 < argc) {
            config.env_file = argv[++i];
        } else if (arg == "--plymouth-config" && i + 1 < argc) {
            config.plymouth_config = argv[++i];
        } else if (arg == "--retheme-cmd" && i + 1 < argc) {
            config.retheme_command = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (arg == "--min-factor" && i + 1 < argc) {
            config.min_factor = std::atoi(argv[++i]);
        } else if (arg == "--max-factor" && i + 1 < argc) {
            config.max_factor = std::atoi(argv[++i]);
        } else if (arg == "--signal-fd" && i + 1 < argc) {
            config.signal_fd = std::atoi(argv[++i]);
        } else if (arg == "--no-notify") {
            config.notify = false;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (config.command.empty()) {
            config.command = arg;
        } else if (config.command_arg.empty()) {
            config.command_arg = arg;
        }
    }

    if (!config.validate()) {
        std::cerr << "usage: scaled [options] get | set <factor> | set-factors <name=f;...> | serve\n";
        return 1;
    }

    initialize_logging(config.log_file, config.debug);
    setup_signal_handlers();

    JsonSettingsStore settings(config.settings_path);
    if (!settings.open()) {
        LOG_WARN("continuing with empty settings");
    }

    std::unique_ptr<Notifier> notifier;
    if (config.signal_fd >= 0) {
        notifier = std::make_unique<FramedNotifier>(config.signal_fd);
    } else {
        notifier = std::make_unique<NullNotifier>();
    }
    PlymouthRethemer rethemer(config.plymouth_config, config.retheme_command);
    ScaleQueue queue(rethemer, *notifier, config.min_factor, config.max_factor);
    ScaleManager manager(config, settings, queue);

    bool ok = true;
    if (config.command == "serve") {
        serve(manager, config.notify);
    } else {
        ok = run_command(manager, config.command, config.command_arg, config.notify);
    }

    queue.wait_idle();
    return ok ? 0 : 1;
}
