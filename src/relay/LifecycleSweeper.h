#pragma once

#include "core/ScheduledTask.h"
#include "relay/SessionRegistry.h"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cloudbridge::relay {

using core::ScheduledTask;
using core::ScheduledTaskPtr;

struct SweepPolicy {
    std::chrono::steady_clock::duration empty_grace    = std::chrono::minutes(5);
    std::chrono::steady_clock::duration idle_timeout   = std::chrono::minutes(30);
    std::chrono::steady_clock::duration sweep_interval = std::chrono::minutes(10);
};

// Reclaims abandoned sessions. Two mechanisms:
//  - a one-shot reaper per session, armed when both roles become unbound and
//    re-checked when it fires (a reconnect in between keeps the session);
//  - a recurring idle sweep that closes the transports of sessions with no
//    activity for idle_timeout and removes them.
class LifecycleSweeper {
public:
    using Clock = SessionRegistry::Clock;

    LifecycleSweeper(boost::asio::any_io_executor ex, SessionRegistry& registry, SweepPolicy policy);
    ~LifecycleSweeper();

    LifecycleSweeper(const LifecycleSweeper&) = delete;
    LifecycleSweeper& operator=(const LifecycleSweeper&) = delete;

    void start();

    // Cancels the sweep and every pending reaper. Later schedule_reap()
    // calls are ignored.
    void stop();

    // Arms (or re-arms) the empty-session reaper for the id.
    void schedule_reap(const std::string& session_id);

    // Deletes the session if neither role is bound.
    bool reap(const std::string& session_id);

    std::size_t sweep_idle() { return sweep_idle(Clock::now()); }
    std::size_t sweep_idle(Clock::time_point now);

    std::size_t pending_reaps() const;
    const SweepPolicy& policy() const noexcept { return policy_; }

private:
    struct PendingReap {
        std::uint64_t generation;
        ScheduledTaskPtr task;
    };

    void on_reap_due(const std::string& session_id, std::uint64_t generation);
    void cancel_reap(const std::string& session_id);

    boost::asio::any_io_executor ex_;
    SessionRegistry& registry_;
    SweepPolicy policy_;

    ScheduledTaskPtr sweep_task_;

    mutable std::mutex mu_;
    bool stopped_ = false;
    std::uint64_t next_generation_ = 1;
    std::unordered_map<std::string, PendingReap> reaps_;
};

} // namespace cloudbridge::relay
