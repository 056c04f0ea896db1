#include "notifier.hpp"
#include "framing.hpp"
#include "utils.hpp"
#include "nlohmann/json.hpp"

#include <cerrno>
#include <unistd.h>

using json = nlohmann::json;

const char* signal_name(ScaleSignal signal) {
    switch (signal) {
    case ScaleSignal::STARTED:
        return "SetScaleFactorStarted";
    case ScaleSignal::DONE:
        return "SetScaleFactorDone";
    }
    return "Unknown";
}

FramedNotifier::FramedNotifier(int fd) : fd_(fd) {}

bool FramedNotifier::emit(ScaleSignal signal, std::string& error) {
    json msg = {
        {"signal", signal_name(signal)}
    };
    std::string msg_str = msg.dump();
    std::vector<uint8_t> payload(msg_str.begin(), msg_str.end());
    auto frame = framing::build_frame(framing::FrameType::SIGNAL, payload);

    std::lock_guard<std::mutex> lock(write_mutex_);
    size_t off = 0;
    while (off < frame.size()) {
        ssize_t n = ::write(fd_, frame.data() + off, frame.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = error_to_string(errno);
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}
