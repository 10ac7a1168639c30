#include <gtest/gtest.h>
#include <pbs/job_view.hpp>
#include <pbs/qstat_parser.hpp>
#include <core/errors.hpp>
#include <support/qstat_docs.hpp>

static std::vector<JobView> views_of(const std::string& doc) {
    return make_views(parse_qstat_xml(doc));
}

static std::vector<std::string> owners(const std::vector<JobView>& jobs) {
    std::vector<std::string> out;
    for (const auto& j : jobs) out.push_back(j.owner());
    return out;
}

// ── Accessors ───────────────────────────────────────────────

TEST(JobView, AccessorsResolveFields) {
    auto jobs = views_of(qstat_docs::data(
        qstat_docs::running_job("101.pbs", "relax", "alice@n1", "2048kb", "01:02:03", "n7/3")));
    ASSERT_EQ(jobs.size(), 1u);
    const auto& job = jobs[0];
    EXPECT_EQ(job.id(), "101.pbs");
    EXPECT_EQ(job.name(), "relax");
    EXPECT_EQ(job.owner(), "alice");
    EXPECT_EQ(job.raw_owner(), "alice@n1");
    EXPECT_EQ(job.queue(), "batch");
    EXPECT_EQ(job.host(), "n7/3");
    EXPECT_EQ(job.time(), "01:02:03");
    EXPECT_EQ(job.memory(), "2.0 MB");
    EXPECT_EQ(job.raw_memory(), "2048kb");
}

TEST(JobView, QueuedJobLacksRuntimeFields) {
    auto jobs = views_of(qstat_docs::data(qstat_docs::queued_job("9.pbs", "wait", "carol@login")));
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].owner(), "carol");
    EXPECT_THROW(jobs[0].host(), LookupError);
    EXPECT_THROW(jobs[0].time(), LookupError);
    EXPECT_THROW(jobs[0].memory(), LookupError);
}

TEST(JobView, ViewsShareTheRecord) {
    auto jobs = views_of(qstat_docs::two_jobs());
    JobView copy = jobs[1];
    EXPECT_EQ(&copy.record(), &jobs[1].record());
}

// ── Owner ───────────────────────────────────────────────────

TEST(JobView, OwnerStripsHost) {
    EXPECT_EQ(strip_owner_host("alice@node03"), "alice");
    EXPECT_EQ(strip_owner_host("alice@node03.cluster@x"), "alice");
}

TEST(JobView, OwnerWithoutHostUnchanged) {
    EXPECT_EQ(strip_owner_host("bob"), "bob");
    EXPECT_EQ(strip_owner_host(""), "");
}

// ── Memory ──────────────────────────────────────────────────

TEST(JobView, MemoryKilobytes) {
    EXPECT_EQ(format_memory_kb("512kb"), "512.0 kB");
    EXPECT_EQ(format_memory_kb("1023kb"), "1023.0 kB");
    EXPECT_EQ(format_memory_kb("0kb"), "0.0 kB");
}

TEST(JobView, MemoryMegabytes) {
    EXPECT_EQ(format_memory_kb("1024kb"), "1.0 MB");
    EXPECT_EQ(format_memory_kb("2048kb"), "2.0 MB");
    EXPECT_EQ(format_memory_kb("1536kb"), "1.5 MB");
}

TEST(JobView, MemoryGigabytes) {
    EXPECT_EQ(format_memory_kb("1048576kb"), "1.0 GB");
    EXPECT_EQ(format_memory_kb("3145728kb"), "3.0 GB");
}

TEST(JobView, MemoryUnitSuffixIsIgnored) {
    EXPECT_EQ(format_memory_kb("2048KB"), "2.0 MB");
    EXPECT_EQ(format_memory_kb("2048xx"), "2.0 MB");
}

TEST(JobView, MemoryDecimalPrefix) {
    EXPECT_EQ(format_memory_kb("1536.5kb"), "1.5 MB");
}

TEST(JobView, MemoryNonNumericThrowsFormatError) {
    EXPECT_THROW(format_memory_kb("lotskb"), FormatError);
    EXPECT_THROW(format_memory_kb("12a4kb"), FormatError);
    EXPECT_THROW(format_memory_kb("-5kb"), FormatError);
    EXPECT_THROW(format_memory_kb("1.2.3kb"), FormatError);
    EXPECT_THROW(format_memory_kb(".kb"), FormatError);
}

TEST(JobView, MemoryTooShortThrowsFormatError) {
    EXPECT_THROW(format_memory_kb("kb"), FormatError);
    EXPECT_THROW(format_memory_kb("5"), FormatError);
    EXPECT_THROW(format_memory_kb(""), FormatError);
}

TEST(JobView, MemoryTooLargeForDoubleThrowsFormatError) {
    std::string huge = "1" + std::string(400, '0') + "kb";
    EXPECT_THROW(format_memory_kb(huge), FormatError);
}

TEST(JobView, MemoryUnitChosenAfterRounding) {
    EXPECT_EQ(format_memory_kb("1048575kb"), "1.0 GB");
    EXPECT_EQ(format_memory_kb("1023.96kb"), "1.0 MB");
    EXPECT_EQ(format_memory_kb("1023.9kb"), "1023.9 kB");
    EXPECT_EQ(format_memory_kb("1048473kb"), "1023.9 MB");
}

TEST(JobView, MemoryAccessorPropagatesFormatError) {
    auto jobs = views_of(qstat_docs::data(
        qstat_docs::running_job("1", "x", "alice@n1", "n/akb")));
    EXPECT_THROW(jobs[0].memory(), FormatError);
    EXPECT_EQ(jobs[0].raw_memory(), "n/akb");
}

// ── Filtering ───────────────────────────────────────────────

TEST(JobView, FilterKeepsMatchingOwnersInOrder) {
    auto jobs = views_of(qstat_docs::data(
        qstat_docs::running_job("1", "a1", "alice@n1") +
        qstat_docs::running_job("2", "b1", "bob@n2") +
        qstat_docs::queued_job("3", "a2", "alice@login") +
        qstat_docs::running_job("4", "b2", "bob@n3") +
        qstat_docs::running_job("5", "a3", "alice")));

    auto mine = filter_by_owner(jobs, "alice");
    ASSERT_EQ(mine.size(), 3u);
    EXPECT_EQ(mine[0].id(), "1");
    EXPECT_EQ(mine[1].id(), "3");
    EXPECT_EQ(mine[2].id(), "5");
}

TEST(JobView, FilterIsIdempotent) {
    auto jobs = views_of(qstat_docs::two_jobs());
    auto once = filter_by_owner(jobs, "bob");
    auto twice = filter_by_owner(once, "bob");
    EXPECT_EQ(owners(once), owners(twice));
    ASSERT_EQ(twice.size(), 1u);
    EXPECT_EQ(twice[0].id(), "102.pbs");
}

TEST(JobView, FilterDoesNotMatchPrefixes) {
    auto jobs = views_of(qstat_docs::data(qstat_docs::running_job("1", "x", "alice2@n1")));
    EXPECT_TRUE(filter_by_owner(jobs, "alice").empty());
}

TEST(JobView, FilterSkipsJobsWithoutOwner) {
    auto jobs = views_of("<Data><Job><Job_Id>1</Job_Id></Job></Data>");
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_TRUE(filter_by_owner(jobs, "alice").empty());
}

TEST(JobView, FilterOfEmptySnapshot) {
    EXPECT_TRUE(filter_by_owner({}, "alice").empty());
}
