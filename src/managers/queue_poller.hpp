#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <pbs/job_view.hpp>

// Jobs from one successful poll. Published whole; never modified.
struct Snapshot {
    std::vector<JobView> jobs;
    std::string taken_at;          // HH:MM:SS, empty before the first poll
};

// Outcome of one refresh cycle, reported to the owner.
struct PollEvent {
    bool ok = false;
    size_t job_count = 0;
    std::string error;
};

// Polls the queue on a background worker.
//
// A cycle runs the fetch function, parses its output and swaps in a new
// Snapshot. While auto-refresh is on, the next cycle is due `interval` after
// the previous one ended; there is never more than one such deadline.
// Turning auto-refresh off clears the deadline and invalidates a timer cycle
// that is already running, so its result is dropped instead of published.
// A failed cycle keeps the previous Snapshot.
class QueuePoller {
public:
    using Clock = std::chrono::steady_clock;
    using FetchFn = std::function<std::string()>;
    using UpdateCallback = std::function<void(const PollEvent&)>;

    QueuePoller(FetchFn fetch, std::chrono::milliseconds interval,
                UpdateCallback on_update = nullptr);
    ~QueuePoller();

    QueuePoller(const QueuePoller&) = delete;
    QueuePoller& operator=(const QueuePoller&) = delete;

    // Start the worker and request an immediate cycle.
    void start(bool auto_refresh);
    // Cancel everything pending and join the worker. Waits for a cycle that
    // is already running the status command.
    void stop();

    // Ask the worker for one immediate cycle (replaces any pending deadline).
    void request_refresh();
    // Enabling requests an immediate cycle; disabling cancels the deadline.
    void set_auto_refresh(bool enabled);
    bool auto_refresh() const;

    // Run one cycle on the calling thread.
    PollEvent poll_once();

    // Current snapshot; never null.
    std::shared_ptr<const Snapshot> snapshot() const;

    bool timer_pending() const;
    // Pending deadline plus queued immediate request. Never more than one.
    int scheduled_cycles() const;
    bool cycle_in_flight() const;
    uint64_t cycles_published() const;
    uint64_t cycles_discarded() const;

    // Block until at least n cycles have been published (or timeout).
    bool wait_for_cycles(uint64_t n, std::chrono::milliseconds timeout) const;

private:
    enum class Trigger { kManual, kTimer };

    void worker_loop();
    // Fetch and parse; no lock held. Fills snapshot on success.
    PollEvent run_cycle(std::shared_ptr<const Snapshot>& out);
    void publish(const PollEvent& event, std::shared_ptr<const Snapshot> snap);

    FetchFn fetch_;
    std::chrono::milliseconds interval_;
    UpdateCallback on_update_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::thread worker_;

    std::shared_ptr<const Snapshot> snapshot_;
    bool auto_refresh_ = false;
    bool refresh_requested_ = false;
    bool in_flight_ = false;
    bool stopping_ = false;
    bool started_ = false;
    std::optional<Clock::time_point> deadline_;
    uint64_t timer_epoch_ = 0;
    uint64_t published_ = 0;
    uint64_t discarded_ = 0;
};
