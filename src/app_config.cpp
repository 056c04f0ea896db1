#include "app_config.hpp"
#include "utils.hpp"
#include "nlohmann/json.hpp"

#include <cerrno>
#include <fstream>

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

}

bool load_config_file(const std::string& path, AppConfig& config) {
    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("cannot open config file %s: %s", path.c_str(), error_to_string(errno).c_str());
        return false;
    }

    json obj = json::parse(in, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
        LOG_ERROR("config file %s is not a JSON object", path.c_str());
        return false;
    }

    try {
        read_key(obj, "settings_path", config.settings_path);
        read_key(obj, "qt_theme_path", config.qt_theme_path);
        read_key(obj, "greeter_theme_path", config.greeter_theme_path);
        read_key(obj, "env_file", config.env_file);
        read_key(obj, "plymouth_config", config.plymouth_config);
        read_key(obj, "retheme_command", config.retheme_command);
        read_key(obj, "log_file", config.log_file);
        read_key(obj, "min_factor", config.min_factor);
        read_key(obj, "max_factor", config.max_factor);
        read_key(obj, "signal_fd", config.signal_fd);
        read_key(obj, "debug", config.debug);
    } catch (const json::exception& e) {
        LOG_ERROR("config file %s: %s", path.c_str(), e.what());
        return false;
    }

    config.config_path = path;
    return true;
}
