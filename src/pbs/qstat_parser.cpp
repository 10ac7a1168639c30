#include "qstat_parser.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <fmt/format.h>
#include <cstring>
#include <memory>
#include <mutex>

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

bool is_text(const xmlNode* n) {
    return n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE;
}

bool has_element_children(const xmlNode* node) {
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (c->type == XML_ELEMENT_NODE) return true;
    }
    return false;
}

bool has_text_children(const xmlNode* node) {
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (is_text(c)) return true;
    }
    return false;
}

std::string node_text(const xmlNode* node) {
    std::string out;
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (is_text(c) && c->content) {
            out += reinterpret_cast<const char*>(c->content);
        }
    }
    return out;
}

std::string field_name(const xmlNode* node) {
    return to_lower(reinterpret_cast<const char*>(node->name));
}

JobRecord convert_fields(const xmlNode* parent) {
    JobRecord record;
    for (const xmlNode* c = parent->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;

        if (has_element_children(c)) {
            record.set(field_name(c), convert_fields(c));
        } else if (has_text_children(c)) {
            record.set(field_name(c), JobRecord::leaf(node_text(c)));
        }
        // childless element: no entry
    }
    return record;
}

// Pre-order walk: jobs come out in document order.
void collect_jobs(const xmlNode* node, std::vector<JobRecord>& out) {
    for (const xmlNode* n = node; n; n = n->next) {
        if (n->type != XML_ELEMENT_NODE) continue;
        if (std::strcmp(reinterpret_cast<const char*>(n->name), QSTAT_JOB_ELEMENT) == 0) {
            out.push_back(convert_fields(n));
        }
        collect_jobs(n->children, out);
    }
}

std::string last_xml_error() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) return "unknown error";
    std::string msg = err->message;
    trim(msg);
    return fmt::format("line {}: {}", err->line, msg);
}

} // namespace

std::vector<JobRecord> parse_qstat_xml(const std::string& document) {
    static std::once_flag init_once;
    std::call_once(init_once, [] { xmlInitParser(); });

    std::vector<JobRecord> jobs;
    if (document.find_first_not_of(" \t\r\n") == std::string::npos) {
        return jobs;
    }

    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(document.data(), static_cast<int>(document.size()),
                                "qstat.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        throw ParseError("malformed qstat output: " + last_xml_error());
    }

    collect_jobs(xmlDocGetRootElement(doc.get()), jobs);
    return jobs;
}
