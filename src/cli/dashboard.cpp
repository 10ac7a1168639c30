#include "dashboard.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── Table layout ────────────────────────────────────────────

namespace {

struct Column {
    const char* title;
    int col;
    int width;
    std::string (JobView::*get)() const;
};

const Column kColumns[] = {
    {"Owner",    0,  15, &JobView::owner},
    {"JOB ID",   15, 20, &JobView::id},
    {"JOB Name", 35, 20, &JobView::name},
    {"Queue",    55, 10, &JobView::queue},
    {"Node",     65, 10, &JobView::host},
    {"Time",     75, 10, &JobView::time},
    {"Memory",   85, 10, &JobView::memory},
};

// One cell's text. A field a job lacks (queued jobs have no exec_host or
// resources_used) or cannot format shows as a placeholder.
std::string cell_text(const JobView& job, const Column& c) {
    try {
        return (job.*c.get)();
    } catch (const LookupError&) {
        return CELL_PLACEHOLDER;
    } catch (const FormatError&) {
        return CELL_PLACEHOLDER;
    }
}

// Leave one blank between columns
int cell_width(const Column& c) {
    return c.width - 1;
}

std::string checkbox_mark(bool on) {
    return on ? "x" : " ";
}

} // namespace

// ── Construction ────────────────────────────────────────────

Dashboard::Dashboard(Screen& screen, QueuePoller::FetchFn fetch, const DashboardOptions& opts)
    : screen_(screen), user_(opts.user),
      poller_(std::move(fetch), opts.interval,
              [this](const PollEvent& e) { post_event(e); }) {
    state_.auto_refresh = opts.auto_refresh;
    state_.only_mine = opts.only_mine;
}

Dashboard::~Dashboard() {
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────

void Dashboard::start() {
    draw_header();
    screen_.refresh();
    poller_.start(state_.auto_refresh);
}

void Dashboard::shutdown() {
    poller_.stop();
}

int Dashboard::run() {
    start();
    for (;;) {
        int key = screen_.read_char(INPUT_POLL_MS);
        if (key == kKeyEof) {
            qwatch_log("dashboard: input closed");
            break;
        }
        if (key == kKeyResize) {
            redraw();
        } else if (key != kKeyNone && !handle_key(key)) {
            break;
        }
        process_poll_events();
    }
    shutdown();
    return 0;
}

// ── Input ───────────────────────────────────────────────────

bool Dashboard::handle_key(int key) {
    switch (key) {
    case 'a':
        state_.auto_refresh = !state_.auto_refresh;
        draw_header();
        screen_.refresh();
        poller_.set_auto_refresh(state_.auto_refresh);
        return true;
    case 'u':
        state_.only_mine = !state_.only_mine;
        draw_header();
        draw_body();
        screen_.refresh();
        return true;
    case 'r':
        draw_header();
        screen_.refresh();
        poller_.request_refresh();
        return true;
    case 'q':
        poller_.stop();
        return false;
    default:
        return true;
    }
}

// ── Poll events ─────────────────────────────────────────────

void Dashboard::post_event(const PollEvent& event) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(event);
}

int Dashboard::process_poll_events() {
    std::deque<PollEvent> batch;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        batch.swap(events_);
    }
    if (batch.empty()) return 0;

    last_event_ = batch.back();
    have_event_ = true;
    redraw();
    return static_cast<int>(batch.size());
}

// ── Rendering ───────────────────────────────────────────────

std::vector<JobView> Dashboard::visible_jobs() const {
    auto snap = poller_.snapshot();
    if (!state_.only_mine) return snap->jobs;
    return filter_by_owner(snap->jobs, user_);
}

std::string Dashboard::status_text() const {
    if (!have_event_) return "";
    if (!last_event_.ok) return "! " + last_event_.error;
    return "updated " + poller_.snapshot()->taken_at;
}

void Dashboard::redraw() {
    draw_header();
    draw_body();
    screen_.refresh();
}

void Dashboard::draw_header() {
    // Clear the two header rows
    screen_.move(HEADER_ROW, 0);
    screen_.clear_to_eol();
    screen_.move(COLUMN_HEADER_ROW, 0);
    screen_.clear_to_eol();

    screen_.move(HEADER_ROW, 0);
    screen_.write("[ ] ");
    screen_.write("a", kAttrUnderline);
    screen_.write("uto refresh        [ ] ");
    screen_.write("u", kAttrUnderline);
    screen_.write("ser's jobs        ");
    screen_.write("r", kAttrUnderline);
    screen_.write("efresh        ");
    screen_.write("q", kAttrUnderline);
    screen_.write("uit");

    screen_.write_at(HEADER_ROW, AUTO_REFRESH_MARK_COL, checkbox_mark(state_.auto_refresh), 1);
    screen_.write_at(HEADER_ROW, ONLY_MINE_MARK_COL, checkbox_mark(state_.only_mine), 1);

    std::string status = status_text();
    if (!status.empty()) {
        bool failed = have_event_ && !last_event_.ok;
        screen_.write_at(HEADER_ROW, STATUS_COL, status,
                         std::max(0, screen_.cols() - STATUS_COL),
                         failed ? kAttrStandout : kAttrNone);
    }

    for (const auto& c : kColumns) {
        screen_.write_at(COLUMN_HEADER_ROW, c.col, fmt::format("{:<{}}", c.title, c.width),
                         c.width, kAttrStandout);
    }
}

void Dashboard::draw_body() {
    // Clear everything a previous (possibly longer) listing drew
    screen_.move(FIRST_JOB_ROW, 0);
    screen_.clear_to_bottom();

    auto jobs = visible_jobs();
    if (jobs.empty()) {
        screen_.write_at(FIRST_JOB_ROW, EMPTY_MESSAGE_COL, EMPTY_QUEUE_MESSAGE,
                         static_cast<int>(std::string(EMPTY_QUEUE_MESSAGE).size()));
        return;
    }

    int max_rows = std::max(0, screen_.rows() - FIRST_JOB_ROW);
    int shown = std::min(static_cast<int>(jobs.size()), max_rows);
    for (int i = 0; i < shown; ++i) {
        for (const auto& c : kColumns) {
            screen_.write_at(FIRST_JOB_ROW + i, c.col, cell_text(jobs[i], c), cell_width(c));
        }
    }
}

// ── Plain text rendering ────────────────────────────────────

std::string render_job_table(const std::vector<JobView>& jobs) {
    // Columns count characters, not bytes
    auto pad_to = [](std::string& line, int col) {
        size_t len = utf8_length(line);
        if (len < static_cast<size_t>(col)) line.append(col - len, ' ');
    };

    std::string out;
    std::string header;
    for (const auto& c : kColumns) {
        pad_to(header, c.col);
        header += utf8_prefix(c.title, cell_width(c));
    }
    out += header + "\n";

    if (jobs.empty()) {
        out += std::string(EMPTY_MESSAGE_COL, ' ') + EMPTY_QUEUE_MESSAGE + "\n";
        return out;
    }

    for (const auto& job : jobs) {
        std::string line;
        for (const auto& c : kColumns) {
            pad_to(line, c.col);
            line += utf8_prefix(cell_text(job, c), cell_width(c));
        }
        out += line + "\n";
    }
    return out;
}
