#include <gtest/gtest.h>

#include "framing.hpp"
#include "notifier.hpp"
#include "nlohmann/json.hpp"

#include <csignal>
#include <unistd.h>

using json = nlohmann::json;

TEST(FramingTest, BuildsLengthPrefixedFrame) {
    std::vector<uint8_t> payload = {'a', 'b', 'c'};
    auto frame = framing::build_frame(framing::FrameType::SIGNAL, payload);
    EXPECT_EQ(frame, std::vector<uint8_t>({1, 0, 0, 0, 3, 'a', 'b', 'c'}));
}

TEST(FramingTest, ParseWaitsForCompleteFrame) {
    auto frame = framing::build_frame(framing::FrameType::SIGNAL, {'x', 'y'});
    framing::FrameType type;
    std::vector<uint8_t> payload;

    std::vector<uint8_t> partial(frame.begin(), frame.begin() + 3);
    EXPECT_EQ(framing::parse_frame(partial, type, payload), 0u);
    partial.assign(frame.begin(), frame.end() - 1);
    EXPECT_EQ(framing::parse_frame(partial, type, payload), 0u);

    frame.push_back(0xFF);
    EXPECT_EQ(framing::parse_frame(frame, type, payload), 7u);
    EXPECT_EQ(type, framing::FrameType::SIGNAL);
    EXPECT_EQ(payload, std::vector<uint8_t>({'x', 'y'}));
}

TEST(FramedNotifierTest, WritesOneFramePerSignal) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    FramedNotifier notifier(fds[1]);
    std::string error;
    ASSERT_TRUE(notifier.emit(ScaleSignal::STARTED, error)) << error;
    ASSERT_TRUE(notifier.emit(ScaleSignal::DONE, error)) << error;
    close(fds[1]);

    std::vector<uint8_t> data;
    uint8_t buf[256];
    ssize_t n;
    while ((n = read(fds[0], buf, sizeof(buf))) > 0) {
        data.insert(data.end(), buf, buf + n);
    }
    close(fds[0]);

    std::vector<std::string> names;
    framing::FrameType type;
    std::vector<uint8_t> payload;
    size_t used;
    while ((used = framing::parse_frame(data, type, payload)) > 0) {
        EXPECT_EQ(type, framing::FrameType::SIGNAL);
        json msg = json::parse(payload.begin(), payload.end());
        names.push_back(msg.at("signal").get<std::string>());
        data.erase(data.begin(), data.begin() + used);
    }
    EXPECT_TRUE(data.empty());
    EXPECT_EQ(names, std::vector<std::string>({"SetScaleFactorStarted", "SetScaleFactorDone"}));
}

TEST(FramedNotifierTest, ReportsWriteFailure) {
    std::signal(SIGPIPE, SIG_IGN);
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[0]);

    FramedNotifier notifier(fds[1]);
    std::string error;
    EXPECT_FALSE(notifier.emit(ScaleSignal::DONE, error));
    EXPECT_FALSE(error.empty());
    close(fds[1]);
}

TEST(NotifierTest, SignalNames) {
    EXPECT_STREQ(signal_name(ScaleSignal::STARTED), "SetScaleFactorStarted");
    EXPECT_STREQ(signal_name(ScaleSignal::DONE), "SetScaleFactorDone");
}
