#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace cloudbridge::core {

// A timer-driven callback, either one-shot or repeating. The timer lives on a
// private strand over the executor the task was created with, so arming,
// cancelling and the callback never overlap even on a multi-threaded
// io_context. Passing a strand also serializes the callback with that
// strand's other work. cancel() is safe from any thread; once it returns the
// callback will not start again, and the pending wait is released so nothing
// keeps the task alive.
class ScheduledTask : public std::enable_shared_from_this<ScheduledTask> {
public:
    using Callback = std::function<void()>;
    using Duration = std::chrono::steady_clock::duration;

    enum class Mode { Once, Repeating };

    static std::shared_ptr<ScheduledTask> once(boost::asio::any_io_executor ex,
                                               Duration delay, Callback cb);
    static std::shared_ptr<ScheduledTask> every(boost::asio::any_io_executor ex,
                                                Duration interval, Callback cb);

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    void start();
    void cancel();

    // False once cancelled, or after a one-shot task has fired.
    bool active() const noexcept { return !stopped_; }

private:
    ScheduledTask(boost::asio::any_io_executor ex, Mode mode, Duration period, Callback cb);

    void arm();

    boost::asio::steady_timer timer_;
    Mode mode_;
    Duration period_;
    Callback cb_;
    std::atomic<bool> stopped_{false};
};

using ScheduledTaskPtr = std::shared_ptr<ScheduledTask>;

} // namespace cloudbridge::core
