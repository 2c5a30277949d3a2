#pragma once

#include "networking/Transport.hpp"

#include <boost/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cloudbridge::testing {

// Records everything the relay core does to a connection.
class FakeTransport : public networking::Transport {
public:
    struct CloseCall {
        networking::CloseCode code;
        std::string reason;
    };

    explicit FakeTransport(std::string name = "fake")
        : name_(std::move(name)) {}

    static std::shared_ptr<FakeTransport> make(std::string name = "fake") {
        return std::make_shared<FakeTransport>(std::move(name));
    }

    void send(std::string msg) override {
        std::lock_guard<std::mutex> lk(mu_);
        sent_.push_back(std::move(msg));
    }

    void close(networking::CloseCode code, std::string reason) override {
        std::lock_guard<std::mutex> lk(mu_);
        closes_.push_back(CloseCall{code, std::move(reason)});
        open_ = false;
    }

    bool is_open() const noexcept override { return open_; }
    std::string label() const override { return name_; }

    // Simulates the peer vanishing without a close handshake.
    void drop() noexcept { open_ = false; }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sent_;
    }

    std::vector<boost::json::object> messages() const {
        std::vector<boost::json::object> out;
        for (const auto& s : sent()) out.push_back(boost::json::parse(s).as_object());
        return out;
    }

    std::optional<boost::json::object> last() const {
        auto all = messages();
        if (all.empty()) return std::nullopt;
        return all.back();
    }

    std::size_t count_of(const std::string& type) const {
        std::size_t n = 0;
        for (const auto& m : messages()) {
            if (const auto* t = m.if_contains("type"); t && t->is_string() && std::string(t->get_string().c_str()) == type) ++n;
        }
        return n;
    }

    std::vector<CloseCall> closes() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closes_;
    }

    bool closed_with(networking::CloseCode code) const {
        for (const auto& c : closes()) {
            if (c.code == code) return true;
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mu_);
        sent_.clear();
    }

private:
    std::string name_;
    std::atomic<bool> open_{true};

    mutable std::mutex mu_;
    std::vector<std::string> sent_;
    std::vector<CloseCall> closes_;
};

inline std::string str(const boost::json::object& obj, const char* key) {
    return std::string(obj.at(key).as_string().c_str());
}

} // namespace cloudbridge::testing
