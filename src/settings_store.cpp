#include "settings_store.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>

using json = nlohmann::json;

JsonSettingsStore::JsonSettingsStore(const std::string& path) : path_(path) {}

bool JsonSettingsStore::open() {
    if (path_.empty()) {
        return true;
    }
    std::ifstream in(path_);
    if (!in) {
        if (errno == ENOENT) {
            LOG_DEBUG("settings file %s does not exist yet", path_.c_str());
            return true;
        }
        LOG_ERROR("cannot open settings file %s: %s", path_.c_str(), error_to_string(errno).c_str());
        return false;
    }

    json parsed = json::parse(in, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_ERROR("settings file %s is not a JSON object", path_.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_ = std::move(parsed);
    return true;
}

template <typename T>
T JsonSettingsStore::get_value(const std::string& key, const T& def) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return def;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        LOG_WARN("settings key %s has unexpected type: %s", key.c_str(), e.what());
        return def;
    }
}

template <typename T>
bool JsonSettingsStore::set_value(const std::string& key, const T& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return flush_locked();
}

bool JsonSettingsStore::flush_locked() {
    if (path_.empty()) {
        return true;
    }
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            LOG_WARN("cannot write settings file %s: %s", tmp.c_str(), error_to_string(errno).c_str());
            return false;
        }
        out << values_.dump(2) << "\n";
        if (!out) {
            LOG_WARN("short write on settings file %s", tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        LOG_WARN("cannot replace settings file %s: %s", path_.c_str(), error_to_string(errno).c_str());
        return false;
    }
    return true;
}

double JsonSettingsStore::get_double(const std::string& key, double def) {
    return get_value<double>(key, def);
}

int JsonSettingsStore::get_int(const std::string& key, int def) {
    return get_value<int>(key, def);
}

std::string JsonSettingsStore::get_string(const std::string& key, const std::string& def) {
    return get_value<std::string>(key, def);
}

bool JsonSettingsStore::set_double(const std::string& key, double value) {
    return set_value(key, value);
}

bool JsonSettingsStore::set_int(const std::string& key, int value) {
    return set_value(key, value);
}

bool JsonSettingsStore::set_string(const std::string& key, const std::string& value) {
    return set_value(key, value);
}
