#pragma once

#include "analysis/region.hpp"
#include "analysis/region_table.hpp"

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ReportConfig
// ---------------------------------------------------------------------------
struct ReportConfig {
    int precision = 6;
};

// ---------------------------------------------------------------------------
// RegionReport: text rendering of a region table
//
//   region,size,power,dominated,lrt
//   (),0,0,false,true
//   (0),0.001,0.168,false,true
// ---------------------------------------------------------------------------
class RegionReport {
public:
    RegionReport() = default;
    explicit RegionReport(const ReportConfig& config) : config_(config) {}

    std::string header_line() const { return "region,size,power,dominated,lrt"; }

    std::string format_row(const RegionRow& row) const {
        std::ostringstream ss;
        ss.precision(config_.precision);
        ss << row.region.to_string();
        ss << "," << row.stats.size;
        ss << "," << row.stats.power;
        ss << "," << (row.dominated ? "true" : "false");
        ss << "," << (row.lrt ? "true" : "false");
        return ss.str();
    }

    std::string format_selection(const Region& region, const RegionStats& stats) const {
        std::ostringstream ss;
        ss.precision(config_.precision);
        ss << "selected," << region.to_string() << "," << stats.size << "," << stats.power;
        return ss.str();
    }

    void write(std::ostream& out, const std::vector<RegionRow>& rows) const {
        out << header_line() << "\n";
        for (const auto& row : rows) {
            out << format_row(row) << "\n";
        }
    }

private:
    ReportConfig config_;
};
