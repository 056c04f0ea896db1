#ifndef SCALE_QUEUE_HPP
#define SCALE_QUEUE_HPP

#include "notifier.hpp"
#include "rethemer.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

struct ScaleQueueState {
    bool active = false;
    std::optional<int> pending;
};

// Runs at most one Rethemer::apply at a time. Factors submitted while a
// worker is busy collapse into a single pending slot; the worker picks up
// the latest one when the current apply returns.
class ScaleQueue {
public:
    // Starts the worker thread. If it throws std::system_error the
    // submitting caller runs the worker itself.
    using ThreadFactory = std::function<std::thread(std::function<void()>)>;

    ScaleQueue(Rethemer& rethemer, Notifier& notifier, int min_factor, int max_factor);
    ScaleQueue(Rethemer& rethemer, Notifier& notifier, int min_factor, int max_factor,
               ThreadFactory thread_factory);
    ~ScaleQueue();

    ScaleQueue(const ScaleQueue&) = delete;
    ScaleQueue& operator=(const ScaleQueue&) = delete;

    // Never blocks on apply while a worker thread can be started.
    void submit(int factor, bool notify);

    int clamp(int factor) const;

    // Blocks until no worker is active.
    void wait_idle();

    ScaleQueueState state();

private:
    void worker_loop(int factor, bool notify);
    void process(int factor, bool notify);
    void emit(ScaleSignal signal, bool notify);

    Rethemer& rethemer_;
    Notifier& notifier_;
    int min_factor_;
    int max_factor_;
    ThreadFactory thread_factory_;

    std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool active_ = false;
    std::optional<int> pending_;

    // Guards worker_ only; taken after mutex_ is released.
    std::mutex worker_mutex_;
    std::thread worker_;
};

#endif // SCALE_QUEUE_HPP
