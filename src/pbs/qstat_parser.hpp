#pragma once

#include <string>
#include <vector>
#include "job_record.hpp"

// Parser for the XML document printed by `qstat -x`.
//
// Every <Job> element in the document, at any depth, becomes one JobRecord,
// in document order. Inside a job, an element holding text becomes a leaf,
// an element holding further elements becomes a nested mapping, and an
// empty element is dropped. Field names are tag names lower-cased; a repeated
// sibling replaces the earlier one.
//
// Throws ParseError when the document is not well-formed. An empty (or
// whitespace-only) document means an empty queue and yields no records.
std::vector<JobRecord> parse_qstat_xml(const std::string& document);
