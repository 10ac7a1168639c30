#include "queue_poller.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <pbs/qstat_parser.hpp>

// ── Construction / Destruction ──────────────────────────────

QueuePoller::QueuePoller(FetchFn fetch, std::chrono::milliseconds interval,
                         UpdateCallback on_update)
    : fetch_(std::move(fetch)), interval_(interval),
      on_update_(std::move(on_update)),
      snapshot_(std::make_shared<const Snapshot>()) {}

QueuePoller::~QueuePoller() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void QueuePoller::start(bool auto_refresh) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return;
        started_ = true;
        stopping_ = false;
        auto_refresh_ = auto_refresh;
        refresh_requested_ = true;
    }
    worker_ = std::thread(&QueuePoller::worker_loop, this);
    qwatch_logf("poller: started (auto refresh {}, interval {}ms)",
                auto_refresh ? "on" : "off", interval_.count());
}

void QueuePoller::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        started_ = false;
        stopping_ = true;
        refresh_requested_ = false;
        deadline_.reset();
        ++timer_epoch_;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    qwatch_log("poller: stopped");
}

// ── Control ─────────────────────────────────────────────────

void QueuePoller::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
        refresh_requested_ = true;
    }
    cv_.notify_all();
}

void QueuePoller::set_auto_refresh(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto_refresh_ = enabled;
        deadline_.reset();
        if (enabled) {
            refresh_requested_ = true;
        } else {
            // Any timer cycle already running is now stale
            ++timer_epoch_;
        }
    }
    cv_.notify_all();
    qwatch_logf("poller: auto refresh {}", enabled ? "on" : "off");
}

bool QueuePoller::auto_refresh() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auto_refresh_;
}

// ── Cycles ──────────────────────────────────────────────────

PollEvent QueuePoller::run_cycle(std::shared_ptr<const Snapshot>& out) {
    PollEvent event;
    try {
        auto snap = std::make_shared<Snapshot>();
        snap->jobs = make_views(parse_qstat_xml(fetch_()));
        snap->taken_at = now_clock();
        event.ok = true;
        event.job_count = snap->jobs.size();
        out = std::move(snap);
    } catch (const QwatchError& e) {
        event.ok = false;
        event.error = e.what();
    } catch (const std::exception& e) {
        event.ok = false;
        event.error = std::string("unexpected error: ") + e.what();
    }
    return event;
}

void QueuePoller::publish(const PollEvent& event, std::shared_ptr<const Snapshot> snap) {
    // Caller holds mutex_
    if (event.ok) {
        snapshot_ = std::move(snap);
    }
    ++published_;
}

PollEvent QueuePoller::poll_once() {
    std::shared_ptr<const Snapshot> snap;
    PollEvent event = run_cycle(snap);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        publish(event, std::move(snap));
    }
    cv_.notify_all();
    if (event.ok) {
        qwatch_logf("poller: {} jobs", event.job_count);
    } else {
        qwatch_logf("poller: refresh failed: {}", event.error);
    }
    return event;
}

void QueuePoller::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        Trigger trigger;
        if (refresh_requested_) {
            trigger = Trigger::kManual;
        } else if (deadline_ && Clock::now() >= *deadline_) {
            trigger = Trigger::kTimer;
        } else if (deadline_) {
            cv_.wait_until(lock, *deadline_);
            continue;
        } else {
            cv_.wait(lock);
            continue;
        }

        uint64_t epoch = timer_epoch_;
        refresh_requested_ = false;
        deadline_.reset();
        in_flight_ = true;

        lock.unlock();
        std::shared_ptr<const Snapshot> snap;
        PollEvent event = run_cycle(snap);
        lock.lock();

        in_flight_ = false;
        bool stale = trigger == Trigger::kTimer && epoch != timer_epoch_;
        if (stale || stopping_) {
            ++discarded_;
            cv_.notify_all();
            qwatch_log("poller: dropped result of cancelled cycle");
            continue;
        }

        publish(event, std::move(snap));
        // Next deadline counts from the end of this cycle
        if (auto_refresh_ && !refresh_requested_) {
            deadline_ = Clock::now() + interval_;
        }
        cv_.notify_all();

        lock.unlock();
        if (event.ok) {
            qwatch_logf("poller: {} jobs", event.job_count);
        } else {
            qwatch_logf("poller: refresh failed: {}", event.error);
        }
        if (on_update_) on_update_(event);
        lock.lock();
    }
}

// ── Observers ───────────────────────────────────────────────

std::shared_ptr<const Snapshot> QueuePoller::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

bool QueuePoller::timer_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_.has_value();
}

int QueuePoller::scheduled_cycles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (deadline_ ? 1 : 0) + (refresh_requested_ ? 1 : 0);
}

bool QueuePoller::cycle_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

uint64_t QueuePoller::cycles_published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

uint64_t QueuePoller::cycles_discarded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

bool QueuePoller::wait_for_cycles(uint64_t n, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return published_ >= n; });
}
