#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ua {

// Resolves upload hosts to all of their addresses and hands them out
// round-robin, so one bad edge node does not sink a whole job. Addresses
// that fail repeatedly sit out a cooldown; when none are usable, next()
// returns nullopt and the caller falls back to ordinary resolution.
// Shared by all workers; the address table is guarded by one mutex and
// refreshed on an interval or when an address enters its cooldown.
class HostResolver {
public:
    using Clock = std::chrono::steady_clock;
    using ResolveFunction =
        std::function<std::vector<std::string>(const std::string& host, const std::string& port)>;

    struct Options {
        std::chrono::seconds refresh_interval{300};
        int failure_threshold = 2;
        std::chrono::seconds cooldown{60};
    };

    explicit HostResolver(Options options, ResolveFunction resolve = systemResolve);

    std::optional<std::string> next(const std::string& host, const std::string& port);

    void markFailure(const std::string& host, const std::string& address);
    void markSuccess(const std::string& host, const std::string& address);

    // Addresses currently known for host (empty if never resolved)
    std::vector<std::string> addresses(const std::string& host) const;

    // Forces the next call to next() for host to resolve again
    void invalidate(const std::string& host);

    // DNS via Boost.Asio; returns an empty list on failure
    static std::vector<std::string> systemResolve(const std::string& host, const std::string& port);

    // Test hook
    void setClock(std::function<Clock::time_point()> clock) { clock_ = std::move(clock); }

private:
    struct AddressState {
        int consecutive_failures = 0;
        Clock::time_point unusable_until{};
    };

    struct HostEntry {
        std::vector<std::string> addresses;
        std::map<std::string, AddressState> states;
        size_t cursor = 0;
        Clock::time_point resolved_at{};
        bool resolved = false;
    };

    bool needsRefresh(const std::string& host, Clock::time_point now) const;

    Options options_;
    ResolveFunction resolve_;
    std::function<Clock::time_point()> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, HostEntry> hosts_;
};

} // namespace ua
