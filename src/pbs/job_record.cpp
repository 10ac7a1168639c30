#include "job_record.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>

JobRecord JobRecord::leaf(std::string text) {
    JobRecord r;
    r.leaf_ = true;
    r.text_ = std::move(text);
    return r;
}

void JobRecord::set(const std::string& key, JobRecord value) {
    fields_[key] = std::make_shared<const JobRecord>(std::move(value));
}

const JobRecord* JobRecord::child(const std::string& key) const {
    auto it = fields_.find(key);
    return it == fields_.end() ? nullptr : it->second.get();
}

const JobRecord* JobRecord::find(const std::string& dotted_path) const {
    const JobRecord* node = this;
    size_t start = 0;
    while (node) {
        size_t dot = dotted_path.find('.', start);
        std::string segment = dotted_path.substr(start, dot - start);
        if (node->is_leaf()) return nullptr;
        node = node->child(segment);
        if (dot == std::string::npos) return node;
        start = dot + 1;
    }
    return nullptr;
}

const std::string& JobRecord::at(const std::string& dotted_path) const {
    const JobRecord* node = find(dotted_path);
    if (!node) {
        throw LookupError(fmt::format("no field '{}' in job record", dotted_path));
    }
    if (!node->is_leaf()) {
        throw LookupError(fmt::format("field '{}' is not a text value", dotted_path));
    }
    return node->text();
}

std::vector<std::string> JobRecord::keys() const {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& kv : fields_) out.push_back(kv.first);
    return out;
}
