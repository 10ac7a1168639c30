#pragma once

#include <memory>
#include <string>
#include <vector>
#include "job_record.hpp"

// Read-only projection over one parsed job. Each accessor resolves a fixed
// path in the record; a field the record lacks throws LookupError.
class JobView {
public:
    explicit JobView(std::shared_ptr<const JobRecord> record);

    std::string name() const;      // Job_Name
    std::string id() const;        // Job_Id
    std::string owner() const;     // Job_Owner without "@host"
    std::string time() const;      // resources_used.walltime
    std::string memory() const;    // resources_used.mem, human scaled; FormatError if unparseable
    std::string queue() const;     // queue
    std::string host() const;      // exec_host

    std::string raw_owner() const;
    std::string raw_memory() const;

    const JobRecord& record() const { return *record_; }

private:
    std::shared_ptr<const JobRecord> record_;
};

// "alice@node03" -> "alice"; a value without '@' comes back unchanged.
std::string strip_owner_host(const std::string& owner);

// "2048kb" -> "2.0 MB". The last two characters are a unit suffix and are
// dropped; the rest is a kilobyte count. Throws FormatError if it is not a
// number.
std::string format_memory_kb(const std::string& raw);

// Wrap parser output as views sharing ownership of each record.
std::vector<JobView> make_views(std::vector<JobRecord> records);

// Views whose owner equals user, in their original order. Jobs without an
// owner never match.
std::vector<JobView> filter_by_owner(const std::vector<JobView>& jobs,
                                     const std::string& user);
