#include "analysis/analyzer.hpp"
#include "cli/cli_parser.hpp"
#include "io/text_loader.hpp"
#include "report/report_writer.hpp"
#include "text/text_cleaner.hpp"

#include <iostream>
#include <stdexcept>

static const char* kUsage =
    "Usage: infocode_report --in <text file> [--method huffman|shannon-fano|both]\n"
    "                       [--clean] [--clean-out <file>] [--bigrams]\n"
    "                       [--remove-frac <0..1>] [--no-removal]\n"
    "                       [--csv <metrics.csv>] [--show-bits]\n";

int main(int argc, char** argv) {
    try {
        infocode::CliParser cli;
        try {
            cli.parse(argc, argv);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << "\n" << kUsage;
            return 1;
        }
        const std::string in = cli.get("in");
        if (in.empty() || cli.has("help")) {
            std::cout << kUsage;
            return 1;
        }

        infocode::AnalysisOptions opts;
        opts.methods = infocode::parse_methods(cli.get("method", "both"));
        opts.bigrams = cli.get_flag("bigrams");
        opts.removal = !cli.get_flag("no-removal");
        opts.removal_fraction = cli.get_double("remove-frac", 0.2);

        std::string text = infocode::load_text(in);
        if (cli.get_flag("clean") || cli.has("clean-out")) {
            text = infocode::clean_text(text);
            const std::string clean_out = cli.get("clean-out");
            if (!clean_out.empty()) {
                infocode::save_text(clean_out, text);
                std::cout << "Wrote cleaned text: " << clean_out << "\n";
            }
        }

        auto report = infocode::run_analysis(text, opts);

        infocode::ReportOptions ropts;
        ropts.show_bits = cli.get_flag("show-bits");
        infocode::write_text_report(std::cout, report, ropts);

        const std::string csv = cli.get("csv");
        if (!csv.empty()) {
            infocode::write_metrics_csv(csv, report);
            std::cout << "Wrote: " << csv << "\n";
        }

        for (const auto& a : report.alphabets) {
            for (const auto& c : a.codings) {
                if (!c.round_trip_ok) {
                    std::cerr << "[ERROR] " << infocode::to_string(a.kind) << "/"
                              << infocode::to_string(c.method) << " round trip mismatch\n";
                    return 3;
                }
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
