#include "report/report_writer.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace infocode {

namespace {

// Newlines, tabs and spaces would vanish in a table.
std::string printable(const Symbol& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case ' ': out += "' '"; break;
        default: out += c;
        }
    }
    return out;
}

std::string join_set(const std::set<Symbol>& symbols) {
    std::string out = "{";
    bool first = true;
    for (const auto& s : symbols) {
        if (!first) out += ", ";
        out += printable(s);
        first = false;
    }
    return out + "}";
}

void write_alphabet(std::ostream& os, const AlphabetAnalysis& a, const ReportOptions& opts) {
    os << "== " << to_string(a.kind) << " alphabet ==\n";

    std::vector<SymbolCount> sorted = a.counts.items();
    std::sort(sorted.begin(), sorted.end(),
              [](const SymbolCount& x, const SymbolCount& y) { return x.symbol < y.symbol; });
    os << "Frequencies (" << a.metrics.alphabet_size << " symbols, "
       << a.metrics.total << " occurrences):\n";
    for (const auto& sc : sorted) {
        os << "  " << printable(sc.symbol) << ": " << sc.count << "\n";
    }

    os << std::fixed << std::setprecision(6);
    os << "Entropy:          " << a.metrics.entropy << " bits/symbol\n";
    os << "Uniform length:   " << a.metrics.code_length << " bits\n";
    os << "Redundancy:       " << a.metrics.redundancy << "\n";

    if (a.codings.empty()) {
        os << "No code built (alphabet has fewer than two symbols)\n";
    }
    for (const auto& c : a.codings) {
        os << "-- " << to_string(c.method) << " code --\n";
        for (const auto& e : c.codec.entries()) {
            os << "  " << printable(e.symbol) << ": " << e.code << "\n";
        }
        if (opts.show_bits) {
            os << "Encoded:          " << c.encoded << "\n";
            os << "Decoded:          " << c.decoded_text << "\n";
        }
        os << "Encoded bits:     " << c.encoded.size() << " (" << c.packed_bytes << " bytes packed)\n";
        os << "Round trip:       " << (c.round_trip_ok ? "ok" : "MISMATCH") << "\n";
        os << "Average length:   " << c.average_length << " bits/symbol\n";
        os << "Efficiency:       " << c.efficiency << " (" << c.efficiency * 100.0 << "%)\n";
    }
    os << std::defaultfloat;
}

void write_shift(std::ostream& os, const EntropyShift& s, RemovalMode mode, double fraction, bool show_bits) {
    os << "-- remove " << to_string(mode) << " " << fraction * 100.0 << "% --\n";
    os << std::fixed << std::setprecision(6);
    os << "Removed symbols:  " << join_set(s.result.removed) << "\n";
    if (show_bits) {
        os << "Filtered text:    " << join_symbols(s.result.filtered) << "\n";
    }
    os << "Entropy after:    " << s.filtered_entropy << "\n";
    os << "Entropy change:   " << s.delta << "\n";
    os << std::defaultfloat;
}

} // namespace

void write_text_report(std::ostream& os, const AnalysisReport& report, const ReportOptions& opts) {
    for (const auto& a : report.alphabets) {
        write_alphabet(os, a, opts);
    }
    if (report.has_removal) {
        os << "== frequency removal ==\n";
        os << "Baseline entropy: " << std::fixed << std::setprecision(6)
           << report.removal.top.baseline_entropy << std::defaultfloat << "\n";
        write_shift(os, report.removal.top, RemovalMode::Top, report.removal.fraction, opts.show_bits);
        write_shift(os, report.removal.bottom, RemovalMode::Bottom, report.removal.fraction, opts.show_bits);
    }
}

void write_metrics_csv(const std::string& path, const AnalysisReport& report) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + path);
    ofs << "alphabet,method,alphabet_size,total,entropy,code_length,redundancy,avg_length,efficiency,round_trip\n";
    ofs << std::setprecision(10);
    for (const auto& a : report.alphabets) {
        const auto& m = a.metrics;
        if (a.codings.empty()) {
            ofs << to_string(a.kind) << ",none," << m.alphabet_size << "," << m.total << ","
                << m.entropy << "," << m.code_length << "," << m.redundancy << ",0,0,0\n";
            continue;
        }
        for (const auto& c : a.codings) {
            ofs << to_string(a.kind) << "," << to_string(c.method) << ","
                << m.alphabet_size << "," << m.total << ","
                << m.entropy << "," << m.code_length << "," << m.redundancy << ","
                << c.average_length << "," << c.efficiency << ","
                << (c.round_trip_ok ? 1 : 0) << "\n";
        }
    }
    if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + path);
}

} // namespace infocode
