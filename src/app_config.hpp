#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <string>

struct AppConfig {
    std::string command;
    std::string command_arg;
    std::string config_path;
    std::string settings_path;
    std::string qt_theme_path;
    std::string greeter_theme_path;
    std::string env_file;
    std::string plymouth_config = "/etc/plymouth/plymouthd.conf";
    std::string retheme_command;
    std::string log_file;
    int min_factor = 1;
    int max_factor = 2;
    bool notify = true;
    int signal_fd = -1;
    bool debug = false;

    bool validate() const {
        if (command != "get" && command != "set" && command != "set-factors" && command != "serve") {
            return false;
        }
        if ((command == "set" || command == "set-factors") && command_arg.empty()) {
            return false;
        }
        if (min_factor < 1 || min_factor > max_factor) {
            return false;
        }
        return true;
    }
};

// Fills config from a JSON object file. Keys that are absent keep their
// current values so command-line flags can be applied afterwards.
bool load_config_file(const std::string& path, AppConfig& config);

#endif // APP_CONFIG_HPP
