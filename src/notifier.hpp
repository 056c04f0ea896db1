#ifndef NOTIFIER_HPP
#define NOTIFIER_HPP

#include <mutex>
#include <string>

enum class ScaleSignal {
    STARTED,
    DONE
};

const char* signal_name(ScaleSignal signal);

class Notifier {
public:
    virtual ~Notifier() = default;

    // Best-effort delivery. On failure returns false and fills error.
    virtual bool emit(ScaleSignal signal, std::string& error) = 0;
};

// Writes every signal as a SIGNAL frame carrying {"signal": "<name>"}.
class FramedNotifier : public Notifier {
public:
    explicit FramedNotifier(int fd);

    bool emit(ScaleSignal signal, std::string& error) override;

private:
    int fd_;
    std::mutex write_mutex_;
};

// Used when signal emission is disabled.
class NullNotifier : public Notifier {
public:
    bool emit(ScaleSignal, std::string&) override { return true; }
};

#endif // NOTIFIER_HPP
