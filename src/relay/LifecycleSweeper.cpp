#include "relay/LifecycleSweeper.h"

#include "core/Log.hpp"

#include <utility>
#include <vector>

namespace cloudbridge::relay {

using networking::CloseCode;

LifecycleSweeper::LifecycleSweeper(boost::asio::any_io_executor ex, SessionRegistry& registry, SweepPolicy policy)
    : ex_(std::move(ex)),
      registry_(registry),
      policy_(policy) {}

LifecycleSweeper::~LifecycleSweeper() { stop(); }

void LifecycleSweeper::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_ || sweep_task_) return;

    sweep_task_ = ScheduledTask::every(ex_, policy_.sweep_interval, [this] { sweep_idle(); });
    sweep_task_->start();
}

void LifecycleSweeper::stop() {
    std::unordered_map<std::string, PendingReap> reaps;
    ScheduledTaskPtr sweep;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_ = true;
        reaps.swap(reaps_);
        sweep = std::move(sweep_task_);
    }

    if (sweep) sweep->cancel();
    for (auto& [id, pending] : reaps) pending.task->cancel();
}

void LifecycleSweeper::schedule_reap(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_) return;

    const auto generation = next_generation_++;
    auto task = ScheduledTask::once(ex_, policy_.empty_grace, [this, session_id, generation] {
        on_reap_due(session_id, generation);
    });

    auto it = reaps_.find(session_id);
    if (it != reaps_.end()) {
        it->second.task->cancel();
        it->second = PendingReap{generation, task};
    } else {
        reaps_.emplace(session_id, PendingReap{generation, task});
    }
    task->start();
}

bool LifecycleSweeper::reap(const std::string& session_id) {
    if (!registry_.erase_if_unbound(session_id)) return false;
    log::info("Sweeper", "session ", session_id, " cleaned up");
    return true;
}

std::size_t LifecycleSweeper::sweep_idle(Clock::time_point now) {
    auto evicted = registry_.evict_idle(now, policy_.idle_timeout);

    for (const Session& s : evicted) {
        cancel_reap(s.id);

        for (Role role : {Role::Host, Role::Guest}) {
            if (auto t = s.transport(role)) t->close(CloseCode::Normal, "Session timed out");
        }
        log::info("Sweeper", "session ", s.id, " timed out");
    }
    return evicted.size();
}

std::size_t LifecycleSweeper::pending_reaps() const {
    std::lock_guard<std::mutex> lk(mu_);
    return reaps_.size();
}

void LifecycleSweeper::on_reap_due(const std::string& session_id, std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = reaps_.find(session_id);
        if (it == reaps_.end() || it->second.generation != generation) return;
        reaps_.erase(it);
    }
    reap(session_id);
}

void LifecycleSweeper::cancel_reap(const std::string& session_id) {
    ScheduledTaskPtr task;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = reaps_.find(session_id);
        if (it == reaps_.end()) return;
        task = std::move(it->second.task);
        reaps_.erase(it);
    }
    task->cancel();
}

} // namespace cloudbridge::relay
