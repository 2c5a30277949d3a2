#pragma once

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace cloudbridge::relay {

// Session ids use Crockford's Base32 (no I, L, O, U): 8 chars carry 40 random
// bits and are upper-case alphanumeric by construction. Secrets and guest ids
// are RFC 4122 version 4 UUIDs drawn from the operating system's entropy
// source, independent of the session id stream.
class IDGenerator {
public:
    static constexpr std::size_t kSessionIdLen = 8;

    IDGenerator()
        : rng_(seed_engine_()) {}

    // Deterministic session ids, for tests. Secrets stay random.
    explicit IDGenerator(std::uint64_t seed)
        : rng_(seed) {}

    std::string session_id() {
        const std::uint64_t bits = next_() & ((std::uint64_t(1) << (5 * kSessionIdLen)) - 1);

        std::string out(kSessionIdLen, '0');
        for (std::size_t i = 0; i < kSessionIdLen; ++i) {
            const auto shift = 5 * (kSessionIdLen - 1 - i);
            out[i] = kAlphabet[(bits >> shift) & 0x1F];
        }
        return out;
    }

    std::string host_secret() { return uuid_v4_(); }
    std::string guest_id()    { return uuid_v4_(); }

    // Canonical form of a client-supplied session id: surrounding whitespace
    // dropped, letters upper-cased.
    static std::string normalize(std::string_view raw) {
        std::size_t start = 0;
        while (start < raw.size() && is_space_(raw[start])) ++start;

        std::size_t end = raw.size();
        while (end > start && is_space_(raw[end - 1])) --end;

        std::string out(raw.substr(start, end - start));
        for (char& c : out) {
            if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        }
        return out;
    }

private:
    static constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    std::uint64_t next_() {
        std::lock_guard<std::mutex> lk(mu_);
        return dist64_(rng_);
    }

    // Secrets never come from rng_: session ids expose its output to anyone
    // who can create a session.
    std::string uuid_v4_() {
        std::lock_guard<std::mutex> lk(uuid_mu_);
        return boost::uuids::to_string(uuid_gen_());
    }

    static bool is_space_(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    static std::mt19937_64 seed_engine_() {
        // Seed with multiple entropy sources
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()),
            static_cast<unsigned>(reinterpret_cast<std::uintptr_t>(&rd))
        };
        return std::mt19937_64(seq);
    }

private:
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;

    boost::uuids::random_generator uuid_gen_;
    std::mutex uuid_mu_;
};

} // namespace cloudbridge::relay
