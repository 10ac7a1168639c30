#include "job_view.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

// Field paths inside a record (names already lower-cased by the parser)
constexpr const char* kNamePath   = "job_name";
constexpr const char* kIdPath     = "job_id";
constexpr const char* kOwnerPath  = "job_owner";
constexpr const char* kTimePath   = "resources_used.walltime";
constexpr const char* kMemoryPath = "resources_used.mem";
constexpr const char* kQueuePath  = "queue";
constexpr const char* kHostPath   = "exec_host";

constexpr double kKiB = 1024.0;

// True when v prints as 1024.0 or more at one decimal place
bool rounds_past_unit(double v) {
    return std::round(v * 10.0) / 10.0 >= kKiB;
}

} // namespace

JobView::JobView(std::shared_ptr<const JobRecord> record)
    : record_(std::move(record)) {}

std::string JobView::name() const   { return record_->at(kNamePath); }
std::string JobView::id() const     { return record_->at(kIdPath); }
std::string JobView::time() const   { return record_->at(kTimePath); }
std::string JobView::queue() const  { return record_->at(kQueuePath); }
std::string JobView::host() const   { return record_->at(kHostPath); }

std::string JobView::raw_owner() const  { return record_->at(kOwnerPath); }
std::string JobView::raw_memory() const { return record_->at(kMemoryPath); }

std::string JobView::owner() const {
    return strip_owner_host(raw_owner());
}

std::string JobView::memory() const {
    return format_memory_kb(raw_memory());
}

// ── Formatting helpers ──────────────────────────────────────

std::string strip_owner_host(const std::string& owner) {
    auto at = owner.find('@');
    return at == std::string::npos ? owner : owner.substr(0, at);
}

std::string format_memory_kb(const std::string& raw) {
    if (raw.size() <= 2) {
        throw FormatError(fmt::format("memory value '{}' has no number before its unit", raw));
    }
    std::string digits = raw.substr(0, raw.size() - 2);

    // Plain unsigned decimal only: strtod alone would accept "1e3", "inf", " 12"
    bool seen_dot = false;
    bool seen_digit = false;
    for (char c : digits) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            throw FormatError(fmt::format("memory value '{}' is not numeric", raw));
        }
    }
    if (!seen_digit) {
        throw FormatError(fmt::format("memory value '{}' is not numeric", raw));
    }

    // Overflow comes back as HUGE_VAL; underflow to ~0 is harmless
    double kb = std::strtod(digits.c_str(), nullptr);
    if (!std::isfinite(kb)) {
        throw FormatError(fmt::format("memory value '{}' is out of range", raw));
    }

    // Unit is picked on the rounded value: 1048575kb is "1.0 GB", not "1024.0 MB"
    if (kb >= kKiB * kKiB || rounds_past_unit(kb / kKiB)) {
        return fmt::format("{:.1f} GB", kb / (kKiB * kKiB));
    }
    if (kb >= kKiB || rounds_past_unit(kb)) {
        return fmt::format("{:.1f} MB", kb / kKiB);
    }
    return fmt::format("{:.1f} kB", kb);
}

// ── Snapshot helpers ────────────────────────────────────────

std::vector<JobView> make_views(std::vector<JobRecord> records) {
    std::vector<JobView> views;
    views.reserve(records.size());
    for (auto& r : records) {
        views.emplace_back(std::make_shared<const JobRecord>(std::move(r)));
    }
    return views;
}

std::vector<JobView> filter_by_owner(const std::vector<JobView>& jobs,
                                     const std::string& user) {
    std::vector<JobView> out;
    for (const auto& job : jobs) {
        const JobRecord* owner = job.record().find(kOwnerPath);
        if (owner && owner->is_leaf() && strip_owner_host(owner->text()) == user) {
            out.push_back(job);
        }
    }
    return out;
}
