#ifndef RETHEMER_HPP
#define RETHEMER_HPP

#include <string>

// Re-renders the boot splash theme for an integer scale factor. apply() is
// slow and cannot be interrupted once started.
class Rethemer {
public:
    virtual ~Rethemer() = default;

    // Factor the boot splash is currently rendered at, 0 when unknown.
    virtual int current_factor() = 0;

    virtual bool apply(int factor, std::string& error) = 0;
};

class PlymouthRethemer : public Rethemer {
public:
    // command is run through the shell with every "{factor}" replaced.
    PlymouthRethemer(const std::string& config_path, const std::string& command);

    int current_factor() override;
    bool apply(int factor, std::string& error) override;

    static int theme_scale_factor(const std::string& theme);

private:
    std::string config_path_;
    std::string command_;
};

#endif // RETHEMER_HPP
