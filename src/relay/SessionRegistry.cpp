#include "relay/SessionRegistry.h"

#include <utility>

namespace cloudbridge::relay {

SessionRegistry::SessionRegistry(IDGenerator& idgen)
    : idgen_(idgen) {}

Session SessionRegistry::create() {
    Session s;
    s.host_secret = idgen_.host_secret();
    s.created_at = Session::WallClock::now();
    s.last_activity = Clock::now();

    std::lock_guard<std::mutex> lk(mu_);
    // 40 random bits; a collision is unlikely but must never alias a live session.
    do {
        s.id = idgen_.session_id();
    } while (sessions_.count(s.id) != 0);

    sessions_.emplace(s.id, s);
    return s;
}

std::optional<Session> SessionRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

bool SessionRegistry::erase(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.erase(id) != 0;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

bool SessionRegistry::update(const std::string& id, const Mutator& fn) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    fn(it->second);
    return true;
}

bool SessionRegistry::erase_if_unbound(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second.unbound()) return false;
    sessions_.erase(it);
    return true;
}

std::vector<Session> SessionRegistry::evict_idle(Clock::time_point now, Clock::duration timeout) {
    std::vector<Session> evicted;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.last_activity > timeout) {
            evicted.push_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

} // namespace cloudbridge::relay
