#ifndef DEEPDIVE_IO_REPORT_WRITER_HPP
#define DEEPDIVE_IO_REPORT_WRITER_HPP

#include <ostream>
#include <string>
#include "../orchestrator.hpp"

namespace deepdive {
namespace io {

// Write the report as Markdown: body followed by a numbered source list.
// A failed outcome is written as a short error section naming the failed phase.
void write_report_markdown(std::ostream& os, const ResearchOutcome& outcome);

// Write the outcome as JSON: report fields, citations, stop reason and
// per-sub-query diagnostics
void write_report_json(std::ostream& os, const ResearchOutcome& outcome, bool pretty_print = true);

// Write to a file; ".json" selects JSON, anything else Markdown
void write_report(const std::string& filepath, const ResearchOutcome& outcome);

} // namespace io
} // namespace deepdive

#endif // DEEPDIVE_IO_REPORT_WRITER_HPP
