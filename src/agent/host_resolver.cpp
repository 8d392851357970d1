#include "host_resolver.h"
#include "utils.h"

#include <boost/asio.hpp>

#include <algorithm>

namespace ua {

HostResolver::HostResolver(Options options, ResolveFunction resolve)
    : options_(options),
      resolve_(std::move(resolve)),
      clock_([] { return Clock::now(); }) {
}

std::vector<std::string> HostResolver::systemResolve(const std::string& host, const std::string& port) {
    std::vector<std::string> result;
    try {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(host, port);
        for (const auto& entry : endpoints) {
            std::string address = entry.endpoint().address().to_string();
            if (std::find(result.begin(), result.end(), address) == result.end()) {
                result.push_back(address);
            }
        }
    } catch (const boost::system::system_error& e) {
        Utils::logWarning("DNS lookup of " + host + " failed: " + e.what());
    }
    return result;
}

bool HostResolver::needsRefresh(const std::string& host, Clock::time_point now) const {
    auto it = hosts_.find(host);
    if (it == hosts_.end() || !it->second.resolved) {
        return true;
    }
    return now - it->second.resolved_at >= options_.refresh_interval;
}

std::optional<std::string> HostResolver::next(const std::string& host, const std::string& port) {
    Clock::time_point now = clock_();

    bool refresh;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh = needsRefresh(host, now);
    }
    if (refresh) {
        // Resolve without holding the lock; lookups can be slow
        std::vector<std::string> fresh = resolve_(host, port);
        std::lock_guard<std::mutex> lock(mutex_);
        HostEntry& entry = hosts_[host];
        entry.resolved = true;
        entry.resolved_at = now;
        if (!fresh.empty()) {
            std::map<std::string, AddressState> states;
            for (const std::string& address : fresh) {
                auto it = entry.states.find(address);
                states[address] = it != entry.states.end() ? it->second : AddressState();
            }
            if (fresh != entry.addresses) {
                Utils::logDebug("Resolved " + host + " to " + Utils::joinStrings(fresh, ", "));
            }
            entry.addresses = std::move(fresh);
            entry.states = std::move(states);
            entry.cursor %= entry.addresses.size();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(host);
    if (it == hosts_.end() || it->second.addresses.empty()) {
        return std::nullopt;
    }
    HostEntry& entry = it->second;
    for (size_t i = 0; i < entry.addresses.size(); ++i) {
        const std::string& candidate = entry.addresses[entry.cursor];
        entry.cursor = (entry.cursor + 1) % entry.addresses.size();
        if (entry.states[candidate].unusable_until <= now) {
            return candidate;
        }
    }
    return std::nullopt;
}

void HostResolver::markFailure(const std::string& host, const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(host);
    if (it == hosts_.end()) return;
    auto state_it = it->second.states.find(address);
    if (state_it == it->second.states.end()) return;

    AddressState& state = state_it->second;
    state.consecutive_failures++;
    if (state.consecutive_failures >= options_.failure_threshold) {
        state.unusable_until = clock_() + options_.cooldown;
        state.consecutive_failures = 0;
        // The address set may have moved on; look the host up again
        it->second.resolved = false;
        Utils::logWarning("Address " + address + " of " + host + " failed repeatedly; skipping it for " +
                          std::to_string(options_.cooldown.count()) + "s");
    }
}

void HostResolver::markSuccess(const std::string& host, const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(host);
    if (it == hosts_.end()) return;
    auto state_it = it->second.states.find(address);
    if (state_it != it->second.states.end()) {
        state_it->second.consecutive_failures = 0;
    }
}

std::vector<std::string> HostResolver::addresses(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(host);
    return it != hosts_.end() ? it->second.addresses : std::vector<std::string>();
}

void HostResolver::invalidate(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(host);
    if (it != hosts_.end()) {
        it->second.resolved = false;
    }
}

} // namespace ua
