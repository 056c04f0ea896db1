#include "scale_queue.hpp"
#include "utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

static std::thread start_thread(std::function<void()> fn) {
    return std::thread(std::move(fn));
}

ScaleQueue::ScaleQueue(Rethemer& rethemer, Notifier& notifier, int min_factor, int max_factor)
    : ScaleQueue(rethemer, notifier, min_factor, max_factor, start_thread) {}

ScaleQueue::ScaleQueue(Rethemer& rethemer, Notifier& notifier, int min_factor, int max_factor,
                       ThreadFactory thread_factory)
    : rethemer_(rethemer), notifier_(notifier), min_factor_(min_factor), max_factor_(max_factor),
      thread_factory_(std::move(thread_factory)) {}

ScaleQueue::~ScaleQueue() {
    wait_idle();
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

int ScaleQueue::clamp(int factor) const {
    return std::min(std::max(factor, min_factor_), max_factor_);
}

void ScaleQueue::submit(int factor, bool notify) {
    factor = clamp(factor);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            if (pending_) {
                LOG_DEBUG("pending factor %d superseded by %d", *pending_, factor);
            }
            pending_ = factor;
            LOG_DEBUG("worker busy, queued factor %d", factor);
            return;
        }
        active_ = true;
    }

    LOG_DEBUG("starting worker for factor %d", factor);
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        // The previous worker already cleared active_ and is only returning.
        if (worker_.joinable()) {
            worker_.join();
        }
        try {
            worker_ = thread_factory_([this, factor, notify] { worker_loop(factor, notify); });
            started = true;
        } catch (const std::system_error& e) {
            LOG_ERROR("cannot start scale worker: %s; running inline", e.what());
        }
    }

    // Without a thread this caller becomes the worker and blocks until the
    // backlog is drained. worker_mutex_ is not held so other submitters only
    // park their factor in pending_.
    if (!started) {
        worker_loop(factor, notify);
    }
}

void ScaleQueue::worker_loop(int factor, bool notify) {
    for (;;) {
        process(factor, notify);

        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) {
            active_ = false;
            idle_cv_.notify_all();
            return;
        }
        factor = *pending_;
        pending_.reset();
        // A drained value stands for at least one real request.
        notify = true;
        LOG_DEBUG("using last pending factor %d", factor);
    }
}

void ScaleQueue::process(int factor, bool notify) {
    LOG_DEBUG("scale boot splash to %d", factor);
    if (rethemer_.current_factor() == factor) {
        LOG_DEBUG("boot splash already at %d", factor);
        emit(ScaleSignal::STARTED, notify);
        emit(ScaleSignal::DONE, notify);
        return;
    }

    emit(ScaleSignal::STARTED, notify);
    std::string error;
    bool ok = rethemer_.apply(factor, error);
    emit(ScaleSignal::DONE, notify);

    if (!ok) {
        LOG_WARN("scaling boot splash to %d failed: %s", factor, error.c_str());
    } else {
        LOG_INFO("boot splash scaled to %d", factor);
    }
}

void ScaleQueue::emit(ScaleSignal signal, bool notify) {
    if (!notify) {
        return;
    }
    std::string error;
    if (!notifier_.emit(signal, error)) {
        LOG_WARN("emit %s failed: %s", signal_name(signal), error.c_str());
    }
}

void ScaleQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !active_; });
}

ScaleQueueState ScaleQueue::state() {
    std::lock_guard<std::mutex> lock(mutex_);
    ScaleQueueState s;
    s.active = active_;
    s.pending = pending_;
    return s;
}
