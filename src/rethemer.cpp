#include "rethemer.hpp"
#include "key_file.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <sys/wait.h>

PlymouthRethemer::PlymouthRethemer(const std::string& config_path, const std::string& command)
    : config_path_(config_path), command_(command) {}

int PlymouthRethemer::theme_scale_factor(const std::string& theme) {
    if (theme == "deepin-logo" || theme == "deepin-ssd-logo" || theme == "uos-ssd-logo") {
        return 1;
    }
    if (theme == "deepin-hidpi-logo" || theme == "deepin-hidpi-ssd-logo" || theme == "uos-hidpi-ssd-logo") {
        return 2;
    }
    return 0;
}

int PlymouthRethemer::current_factor() {
    KeyFile kf;
    std::string error;
    if (!kf.load_from_file(config_path_, error)) {
        LOG_WARN("cannot read boot splash config: %s", error.c_str());
        return 0;
    }
    std::string theme;
    if (!kf.get_string("Daemon", "Theme", theme)) {
        LOG_WARN("%s has no [Daemon] Theme", config_path_.c_str());
        return 0;
    }
    return theme_scale_factor(theme);
}

bool PlymouthRethemer::apply(int factor, std::string& error) {
    if (command_.empty()) {
        error = "no retheme command configured";
        return false;
    }

    std::string cmd = command_;
    const std::string placeholder = "{factor}";
    const std::string value = std::to_string(factor);
    for (size_t pos = cmd.find(placeholder); pos != std::string::npos; pos = cmd.find(placeholder, pos + value.size())) {
        cmd.replace(pos, placeholder.size(), value);
    }

    LOG_DEBUG("running retheme command: %s", cmd.c_str());
    int rc = std::system(cmd.c_str());
    if (rc == -1) {
        error = "cannot run retheme command: " + error_to_string(errno);
        return false;
    }
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        error = "retheme command failed with status " + std::to_string(WIFEXITED(rc) ? WEXITSTATUS(rc) : rc);
        return false;
    }
    return true;
}
