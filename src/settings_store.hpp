#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include "nlohmann/json.hpp"

#include <mutex>
#include <string>

constexpr const char* kKeyScaleFactor = "scale-factor";
constexpr const char* kKeyWindowScale = "window-scale";
constexpr const char* kKeyCursorThemeSize = "gtk-cursor-theme-size";
constexpr const char* kKeyIndividualScaling = "individual-scaling";
// Cursor size read by the window manager.
constexpr const char* kKeyCursorSize = "cursor-size";

class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual double get_double(const std::string& key, double def) = 0;
    virtual int get_int(const std::string& key, int def) = 0;
    virtual std::string get_string(const std::string& key, const std::string& def) = 0;

    // Setters return false when the value could not be persisted; the
    // in-memory value is updated regardless.
    virtual bool set_double(const std::string& key, double value) = 0;
    virtual bool set_int(const std::string& key, int value) = 0;
    virtual bool set_string(const std::string& key, const std::string& value) = 0;
};

// Keeps settings in a JSON object. With a non-empty path the object is
// loaded on open() and rewritten after every change.
class JsonSettingsStore : public SettingsStore {
public:
    explicit JsonSettingsStore(const std::string& path = "");

    bool open();

    double get_double(const std::string& key, double def) override;
    int get_int(const std::string& key, int def) override;
    std::string get_string(const std::string& key, const std::string& def) override;

    bool set_double(const std::string& key, double value) override;
    bool set_int(const std::string& key, int value) override;
    bool set_string(const std::string& key, const std::string& value) override;

private:
    template <typename T>
    T get_value(const std::string& key, const T& def);
    template <typename T>
    bool set_value(const std::string& key, const T& value);
    bool flush_locked();

    std::string path_;
    nlohmann::json values_ = nlohmann::json::object();
    std::mutex mutex_;
};

#endif // SETTINGS_STORE_HPP
