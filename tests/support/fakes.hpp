/**
 * @file fakes.hpp
 * @brief Test doubles: scripted registration client and capturing log sink.
 */

#pragma once

#include "core/logger.hpp"
#include "network/registration_client.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lan_beacon::test_support {

/**
 * @brief RegistrationClient that succeeds for addresses marked reachable.
 */
class FakeRegistrationClient : public RegistrationClient {
public:
    struct Call {
        std::string url;
        PeerRecord target;
        std::string body;
    };

    Result<void> register_with(const PeerRecord& target, std::string_view body) override {
        std::chrono::milliseconds delay{0};
        bool reachable = false;
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(Call{registration_url(target), target, std::string(body)});
            delay = delay_;
            reachable = reach_all_ || reachable_.count(target.address) > 0;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (!reachable) {
            return Error{ErrorKind::Io, registration_url(target) + ": Couldn't connect to server"};
        }
        return {};
    }

    void set_reachable(const std::string& address) {
        std::lock_guard lock(mutex_);
        reachable_.insert(address);
    }

    void set_reach_all(bool reach_all) {
        std::lock_guard lock(mutex_);
        reach_all_ = reach_all;
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        delay_ = delay;
    }

    [[nodiscard]] std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    [[nodiscard]] size_t call_count() const {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::set<std::string> reachable_;
    bool reach_all_{false};
    std::chrono::milliseconds delay_{0};
};

/**
 * @brief Sink that keeps every line; shares storage so tests can read it
 *        after handing ownership to a Logger.
 */
class CaptureSink : public ILogSink {
public:
    struct Lines {
        std::mutex mutex;
        std::vector<std::string> items;

        [[nodiscard]] std::vector<std::string> copy() {
            std::lock_guard lock(mutex);
            return items;
        }

        [[nodiscard]] bool contains(std::string_view needle) {
            std::lock_guard lock(mutex);
            for (const auto& line : items) {
                if (line.find(needle) != std::string::npos) return true;
            }
            return false;
        }
    };

    explicit CaptureSink(std::shared_ptr<Lines> lines) : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(lines_->mutex);
        lines_->items.emplace_back(json_line);
    }

    void flush() override {}

private:
    std::shared_ptr<Lines> lines_;
};

/// Poll `predicate` until it holds or `timeout` elapses.
inline bool eventually(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

}  // namespace lan_beacon::test_support
