#pragma once
// Expiry Sweeper: periodic housekeeping on its own thread
//
// Not required for correctness. Each pass walks every session with a
// persisted stack and calls sweep_expired, which takes that session's lock,
// so the sweeper never blocks more than one session at a time.

#include "config.hpp"
#include "intent_stack.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>

namespace sandhi {

enum class SweepEvent {
    Started,
    Pass,        // One pass over all sessions finished
    Expired,     // Frames removed from a session
    Failed,      // A session could not be swept
    Stopped,
};

using SweepCallback = std::function<void(SweepEvent, const std::string&)>;

class ExpirySweeper {
public:
    ExpirySweeper(IntentStackStore& stacks, SweeperConfig config = {})
        : stacks_(stacks)
        , config_(config)
        , running_(false)
    {}

    ~ExpirySweeper() {
        stop();
    }

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void on_event(SweepCallback callback) {
        callback_ = std::move(callback);
    }

    void start() {
        if (running_.exchange(true)) return;  // Already running

        thread_ = std::thread([this]() {
            run_loop();
        });

        emit(SweepEvent::Started, "Sweeper started");
    }

    void stop() {
        if (!running_.exchange(false)) return;  // Not running

        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }

        emit(SweepEvent::Stopped, "Sweeper stopped");
    }

    bool is_running() const { return running_; }

    struct Stats {
        size_t passes = 0;
        size_t sessions_swept = 0;
        size_t frames_expired = 0;
        size_t failures = 0;
    };

    Stats stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

    // One pass over every session; callable directly without the thread
    size_t run_once() {
        std::vector<std::string> sessions;
        try {
            sessions = stacks_.sessions();
        } catch (const StoreError& e) {
            std::cerr << "[Sweeper] Cannot list sessions: " << e.what() << "\n";
            record_failure();
            emit(SweepEvent::Failed, e.what());
            return 0;
        }

        Timestamp at = stacks_.current_time();
        size_t expired = 0;
        for (const auto& session : sessions) {
            auto result = stacks_.sweep_expired(session, at);
            if (!result.ok()) {
                record_failure();
                emit(SweepEvent::Failed, session + ": " + result.message);
                continue;
            }
            if (!result.removed.empty()) {
                expired += result.removed.size();
                emit(SweepEvent::Expired, session + ": " +
                     std::to_string(result.removed.size()) + " frame(s)");
            }
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.passes++;
            stats_.sessions_swept += sessions.size();
            stats_.frames_expired += expired;
        }
        emit(SweepEvent::Pass, "Swept " + std::to_string(sessions.size()) + " session(s)");
        return expired;
    }

private:
    void run_loop() {
        while (running_) {
            run_once();

            // Sleep until next pass, waking early on stop()
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                           [this]() { return !running_; });
        }
    }

    void record_failure() {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.failures++;
    }

    void emit(SweepEvent event, const std::string& msg) {
        if (callback_) {
            callback_(event, msg);
        }
    }

    IntentStackStore& stacks_;
    SweeperConfig config_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    mutable std::mutex stats_mutex_;
    Stats stats_;
    SweepCallback callback_;
};

} // namespace sandhi
