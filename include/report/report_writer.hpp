#pragma once

#include <iosfwd>
#include <string>

#include "analysis/analyzer.hpp"

namespace infocode {

struct ReportOptions {
    bool show_bits{false}; // print encoded/decoded text
};

// Human-readable report: frequencies, entropy metrics, code tables,
// round-trip results and the removal experiment.
void write_text_report(std::ostream& os, const AnalysisReport& report, const ReportOptions& opts);

// One row per (alphabet, method); alphabets without a code get one row with
// method "none".
void write_metrics_csv(const std::string& path, const AnalysisReport& report);

} // namespace infocode
