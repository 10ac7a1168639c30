#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <managers/queue_poller.hpp>
#include "screen.hpp"

struct DashboardOptions {
    std::chrono::milliseconds interval;
    bool auto_refresh = true;
    bool only_mine = false;
    std::string user;              // owner compared against when only_mine is on
};

// The two user toggles. Only the dashboard's thread reads or writes them.
struct ViewState {
    bool auto_refresh = true;
    bool only_mine = false;
};

// Interactive queue view.
//
// Keys: a toggles auto refresh, u toggles "only my jobs", r refreshes now,
// q quits. Poll results arrive from the poller's worker as events and are
// drawn on the dashboard's own thread, so every redraw sees the current
// toggles.
class Dashboard {
public:
    Dashboard(Screen& screen, QueuePoller::FetchFn fetch, const DashboardOptions& opts);
    ~Dashboard();

    Dashboard(const Dashboard&) = delete;
    Dashboard& operator=(const Dashboard&) = delete;

    // Draw the header, start polling, then loop on input until q or EOF.
    int run();

    // Draw the header and start the poller (initial immediate refresh).
    void start();
    // Stop polling; no refresh fires afterwards.
    void shutdown();

    // Apply one key. Returns false when the dashboard should exit.
    bool handle_key(int key);

    // Drain poll events posted by the worker and redraw for them.
    // Returns the number of events handled.
    int process_poll_events();

    void redraw();
    void draw_header();
    void draw_body();

    // Current snapshot with the user filter applied.
    std::vector<JobView> visible_jobs() const;

    const ViewState& state() const { return state_; }
    const PollEvent& last_event() const { return last_event_; }
    QueuePoller& poller() { return poller_; }

private:
    void post_event(const PollEvent& event);
    std::string status_text() const;

    Screen& screen_;
    std::string user_;
    ViewState state_;
    PollEvent last_event_;
    bool have_event_ = false;

    std::mutex events_mutex_;
    std::deque<PollEvent> events_;

    // Declared last: its worker calls post_event until stop()
    QueuePoller poller_;
};

// Plain-text table of jobs (no escape sequences), as drawn by the dashboard.
std::string render_job_table(const std::vector<JobView>& jobs);
