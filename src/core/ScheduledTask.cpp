#include "core/ScheduledTask.h"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <utility>

namespace cloudbridge::core {

namespace asio = boost::asio;

ScheduledTask::ScheduledTask(asio::any_io_executor ex, Mode mode, Duration period, Callback cb)
    : timer_(asio::make_strand(std::move(ex))),
      mode_(mode),
      period_(period),
      cb_(std::move(cb)) {}

std::shared_ptr<ScheduledTask> ScheduledTask::once(asio::any_io_executor ex, Duration delay, Callback cb) {
    return std::shared_ptr<ScheduledTask>(new ScheduledTask(std::move(ex), Mode::Once, delay, std::move(cb)));
}

std::shared_ptr<ScheduledTask> ScheduledTask::every(asio::any_io_executor ex, Duration interval, Callback cb) {
    return std::shared_ptr<ScheduledTask>(new ScheduledTask(std::move(ex), Mode::Repeating, interval, std::move(cb)));
}

void ScheduledTask::start() {
    asio::post(timer_.get_executor(), [self = shared_from_this()] {
        if (!self->stopped_) self->arm();
    });
}

void ScheduledTask::cancel() {
    if (stopped_.exchange(true)) return;

    asio::post(timer_.get_executor(), [self = shared_from_this()] {
        self->timer_.cancel();
    });
}

void ScheduledTask::arm() {
    timer_.expires_after(period_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || self->stopped_) return;

        if (self->mode_ == Mode::Once) self->stopped_ = true;
        self->cb_();

        if (self->mode_ == Mode::Repeating && !self->stopped_) self->arm();
    });
}

} // namespace cloudbridge::core
