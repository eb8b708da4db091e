#include "report_writer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace deepdive {
namespace io {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

json citations_to_json(const std::vector<Citation>& citations) {
    json array = json::array();
    for (const Citation& citation : citations) {
        array.push_back({{"index", citation.index}, {"url", citation.url}, {"title", citation.title}});
    }
    return array;
}

} // namespace

void write_report_markdown(std::ostream& os, const ResearchOutcome& outcome) {
    if (!outcome.success || !outcome.report) {
        os << "# Research failed\n\n";
        os << "Phase: " << phase_to_string(outcome.failed_phase) << "\n\n";
        os << outcome.error_message << "\n";
        return;
    }

    const Report& report = *outcome.report;
    os << "# " << outcome.session.user_query << "\n\n";
    if (!report.notice.empty()) {
        os << "> " << report.notice << "\n\n";
    }
    os << report.body << "\n";

    if (!report.citations.empty()) {
        os << "\n## Sources\n\n";
        for (const Citation& citation : report.citations) {
            os << citation.index << ". ";
            if (!citation.title.empty()) {
                os << citation.title << " - ";
            }
            os << "<" << citation.url << ">\n";
        }
    }
}

void write_report_json(std::ostream& os, const ResearchOutcome& outcome, bool pretty_print) {
    const ResearchSession& session = outcome.session;

    json doc;
    doc["session_id"] = session.id;
    doc["query"] = session.user_query;
    doc["success"] = outcome.success;
    doc["stop_reason"] = outcome.stop_reason;
    doc["iterations"] = session.iteration_count;
    doc["execution_time_ms"] = outcome.total_time_ms;

    if (outcome.report) {
        const Report& report = *outcome.report;
        json r;
        r["summary"] = report.summary;
        r["findings"] = report.findings;
        r["conclusion"] = report.conclusion;
        r["body"] = report.body;
        r["citations"] = citations_to_json(report.citations);
        r["external_sources_consulted"] = report.external_sources_consulted;
        if (!report.notice.empty()) {
            r["notice"] = report.notice;
        }
        if (report.calculator_result) {
            r["calculator_result"] = *report.calculator_result;
        }
        doc["report"] = r;
    } else {
        doc["failed_phase"] = phase_to_string(outcome.failed_phase);
        doc["error"] = outcome.error_message;
    }

    json subqueries = json::array();
    for (const SubQueryOutcome& sq : session.outcomes) {
        json entry = {
            {"query", sq.subquery.text},
            {"iteration", sq.subquery.origin_iteration},
            {"sources_returned", sq.sources_returned},
            {"usable_sources", sq.usable_sources},
            {"degraded", sq.degraded}
        };
        if (sq.degraded) {
            entry["error"] = sq.error_message;
        }
        subqueries.push_back(entry);
    }
    doc["subqueries"] = subqueries;

    json sources = json::array();
    for (const Source& source : session.sources) {
        json entry = {
            {"url", source.url},
            {"status", fetch_status_to_string(source.fetch_status)},
            {"citation_index", source.citation_index}
        };
        if (!source.error_detail.empty()) {
            entry["detail"] = source.error_detail;
        }
        sources.push_back(entry);
    }
    doc["sources"] = sources;

    if (!outcome.warnings.empty()) {
        doc["warnings"] = outcome.warnings;
    }

    os << doc.dump(pretty_print ? 2 : -1) << "\n";
}

void write_report(const std::string& filepath, const ResearchOutcome& outcome) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    if (ends_with(filepath, ".json")) {
        write_report_json(file, outcome);
    } else {
        write_report_markdown(file, outcome);
    }
}

} // namespace io
} // namespace deepdive
