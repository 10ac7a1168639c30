#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

// One node of a job's field tree, as read from the per-job element of
// `qstat -x`. A node is either a leaf holding text, or a mapping from
// lower-cased field names to child nodes. Records are built once by the
// parser and never modified afterwards.
class JobRecord {
public:
    JobRecord() = default;

    static JobRecord leaf(std::string text);

    bool is_leaf() const { return leaf_; }
    const std::string& text() const { return text_; }

    // Insert or replace a field (last write wins).
    void set(const std::string& key, JobRecord value);

    // Direct child, or nullptr.
    const JobRecord* child(const std::string& key) const;

    // Walk a dotted path ("resources_used.mem"). Returns nullptr when any
    // segment is missing or a leaf is reached before the path ends.
    const JobRecord* find(const std::string& dotted_path) const;

    // Text of the leaf at dotted_path. Throws LookupError when the path is
    // missing or names a mapping.
    const std::string& at(const std::string& dotted_path) const;

    bool has(const std::string& dotted_path) const { return find(dotted_path) != nullptr; }

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    std::vector<std::string> keys() const;

private:
    bool leaf_ = false;
    std::string text_;
    std::map<std::string, std::shared_ptr<const JobRecord>> fields_;
};
