// np_regions.cpp: Neyman-Pearson rejection region table
// Enumerates every rejection region of a null/alternative pair and prints
// size, power, dominance and LRT status per region. With --alpha, also
// reports the most powerful LRT region within that size budget.

#include "analysis/analysis_config.hpp"
#include "analysis/distribution_pair.hpp"
#include "analysis/errors.hpp"
#include "analysis/region_evaluator.hpp"
#include "analysis/region_selector.hpp"
#include "analysis/region_table.hpp"
#include "report/region_report.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ===========================================================================
// Argument helpers
// ===========================================================================
namespace {

// "0.1,0.2,0.7" -> {0.1, 0.2, 0.7}
std::vector<double> parse_probability_list(const std::string& text, const std::string& flag) {
    std::vector<double> values;
    std::istringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t consumed = 0;
        double v = 0.0;
        try {
            v = std::stod(item, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(flag + ": cannot parse '" + item + "' as a number");
        }
        if (consumed != item.size()) {
            throw std::invalid_argument(flag + ": cannot parse '" + item + "' as a number");
        }
        values.push_back(v);
    }
    return values;
}

double parse_double(const std::string& text, const std::string& flag) {
    size_t consumed = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": cannot parse '" + text + "' as a number");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(flag + ": cannot parse '" + text + "' as a number");
    }
    return v;
}

int parse_int(const std::string& text, const std::string& flag) {
    size_t consumed = 0;
    int v = 0;
    try {
        v = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": cannot parse '" + text + "' as an integer");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(flag + ": cannot parse '" + text + "' as an integer");
    }
    return v;
}

}  // anonymous namespace

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(std::ostream& out, const char* prog) {
    AnalysisConfig defaults;
    ReportConfig report_defaults;
    out << "Usage: " << prog
        << " --null <p0,p1,...> --alt <q0,q1,...> [options]\n"
        << "\n"
        << "  --null             Null hypothesis probabilities, one per outcome\n"
        << "  --alt              Alternative hypothesis probabilities (missing trailing\n"
        << "                     outcomes are padded with 0)\n"
        << "  --alpha            Size budget; prints the selected LRT region\n"
        << "  --output           Write the table to this file instead of stdout\n"
        << "  --precision        Significant digits (default: " << report_defaults.precision << ")\n"
        << "  --sum-tolerance    Accepted |sum - 1| per distribution (default: "
        << defaults.sum_tolerance << ")\n"
        << "  --ratio-tolerance  Relative tie tolerance for likelihood ratios (default: "
        << defaults.ratio_tolerance << ")\n"
        << "  --max-outcomes     Largest outcome space accepted (default: "
        << defaults.max_outcomes << ")\n"
        << "  --help             Show this message\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string null_str;
    std::string alt_str;
    std::string alpha_str;
    std::string output_path;
    AnalysisConfig config;
    ReportConfig report_config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(std::cout, argv[0]);
                return 0;
            } else if (arg == "--null" && i + 1 < argc) {
                null_str = argv[++i];
            } else if (arg == "--alt" && i + 1 < argc) {
                alt_str = argv[++i];
            } else if (arg == "--alpha" && i + 1 < argc) {
                alpha_str = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--precision" && i + 1 < argc) {
                report_config.precision = parse_int(argv[++i], "--precision");
                if (report_config.precision < 1 || report_config.precision > 17) {
                    throw std::invalid_argument("--precision must be in [1, 17]");
                }
            } else if (arg == "--sum-tolerance" && i + 1 < argc) {
                config.sum_tolerance = parse_double(argv[++i], "--sum-tolerance");
                if (!(config.sum_tolerance >= 0.0 && config.sum_tolerance < 1.0)) {
                    throw std::invalid_argument("--sum-tolerance must be in [0, 1)");
                }
            } else if (arg == "--ratio-tolerance" && i + 1 < argc) {
                config.ratio_tolerance = parse_double(argv[++i], "--ratio-tolerance");
                if (!(config.ratio_tolerance >= 0.0 && config.ratio_tolerance < 1.0)) {
                    throw std::invalid_argument("--ratio-tolerance must be in [0, 1)");
                }
            } else if (arg == "--max-outcomes" && i + 1 < argc) {
                config.max_outcomes = parse_int(argv[++i], "--max-outcomes");
                if (config.max_outcomes < 1 || config.max_outcomes > MAX_REGION_OUTCOMES) {
                    throw std::invalid_argument("--max-outcomes must be in [1, " +
                                                std::to_string(MAX_REGION_OUTCOMES) + "]");
                }
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                print_usage(std::cerr, argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (null_str.empty()) {
        std::cerr << "Missing required argument: --null\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    if (alt_str.empty()) {
        std::cerr << "Missing required argument: --alt\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    try {
        DistributionPair pair(parse_probability_list(null_str, "--null"),
                              parse_probability_list(alt_str, "--alt"), config);
        if (pair.padded_outcomes() > 0) {
            std::cerr << "Note: padded " << pair.padded_outcomes()
                      << " trailing alternative outcome(s) with probability 0\n";
        }

        auto rows = RegionTableBuilder(config).build(pair);
        RegionReport report(report_config);

        std::string selection_line;
        if (!alpha_str.empty()) {
            double alpha = parse_double(alpha_str, "--alpha");
            Region selected = RegionSelector(config).select(pair, alpha);
            RegionStats stats = RegionEvaluator().evaluate(selected, pair);
            selection_line = report.format_selection(selected, stats);
        }

        std::ofstream file;
        if (!output_path.empty()) {
            file.open(output_path);
            if (!file.is_open()) {
                std::cerr << "Cannot open output file: " << output_path << "\n";
                return 1;
            }
        }
        std::ostream& out = output_path.empty() ? std::cout : file;

        report.write(out, rows);
        if (!selection_line.empty()) {
            out << selection_line << "\n";
        }
        out.flush();
        if (!out) {
            std::cerr << "ERROR: failed writing output"
                      << (output_path.empty() ? std::string() : " to " + output_path) << "\n";
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
