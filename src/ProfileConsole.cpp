#include "ProfileConsole.h"

#include <algorithm>
#include <iomanip>

namespace {
constexpr size_t kRuleWidth = 108;

std::string joined(const std::vector<std::string>& names) {
    if (names.empty()) return "-";
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

std::string flags(const ColumnProfile& col) {
    std::string out;
    if (col.isIdLike) out += "id ";
    if (col.isEmailLike) out += "email ";
    if (col.isPhoneLike) out += "phone ";
    if (col.isUrlLike) out += "url ";
    if (out.empty()) return "-";
    out.pop_back();
    return out;
}

void banner(std::ostream& os, const std::string& title) {
    const std::string text = " " + title + " ";
    const size_t side = (kRuleWidth > text.size()) ? (kRuleWidth - text.size()) / 2 : 0;
    const size_t right = (kRuleWidth > text.size() + side) ? kRuleWidth - text.size() - side : 0;
    os << "\n" << std::string(side, '=') << text << std::string(right, '=') << "\n";
}
} // namespace

void ProfileConsole::printColumnTable(const DatasetProfile& profile, std::ostream& os) {
    size_t maxNameLen = 15;
    for (const auto& col : profile.columns) maxNameLen = std::max(maxNameLen, col.name.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    banner(os, "COLUMN SUMMARY");
    os << std::left
       << std::setw(w) << "Column"
       << std::setw(13) << "Type"
       << std::setw(10) << "Nulls"
       << std::setw(10) << "Null %"
       << std::setw(10) << "Unique"
       << std::setw(14) << "Mean"
       << "Patterns\n";
    os << std::string(static_cast<size_t>(w) + 13 + 10 * 3 + 14 + 8, '-') << "\n";

    for (const auto& col : profile.columns) {
        os << std::left << std::setw(w) << col.name
           << std::setw(13) << toString(col.type)
           << std::setw(10) << col.nullCount
           << std::setw(10) << std::fixed << std::setprecision(2) << col.nullPercentage
           << std::setw(10) << col.uniqueCount;
        if (col.numeric) {
            os << std::setw(14) << std::setprecision(4) << col.numeric->mean;
        } else {
            os << std::setw(14) << "-";
        }
        os << flags(col) << "\n";
    }
    os << std::string(kRuleWidth, '=') << "\n";
}

void ProfileConsole::printCorrelationMatrix(const DatasetProfile& profile, std::ostream& os) {
    if (profile.correlationMatrix.empty()) return;

    std::vector<std::string> names;
    for (const auto& entry : profile.correlationMatrix) names.push_back(entry.first);

    banner(os, "CORRELATION MATRIX");
    os << std::setw(16) << " ";
    for (const auto& name : names) os << std::right << std::setw(12) << name.substr(0, 11);
    os << "\n" << std::string(16 + 12 * names.size(), '-') << "\n";
    for (const auto& rowName : names) {
        os << std::left << std::setw(16) << rowName.substr(0, 15) << std::right;
        const auto& row = profile.correlationMatrix.at(rowName);
        for (const auto& colName : names) {
            const auto it = row.find(colName);
            if (it == row.end()) {
                os << std::setw(12) << "-";
            } else {
                os << std::setw(12) << std::fixed << std::setprecision(2) << it->second;
            }
        }
        os << "\n";
    }
    os << std::string(kRuleWidth, '=') << "\n";
}

void ProfileConsole::printDatasetFlags(const DatasetProfile& profile, std::ostream& os) {
    os << "\n[Tabsight] Dataset '" << profile.datasetId << "': " << profile.totalRows << " rows x "
       << profile.totalColumns << " columns (" << profile.sampleSize << " rows sampled), "
       << std::fixed << std::setprecision(2) << profile.overallNullPercentage << "% null\n";
    os << "        -> Potential IDs:     " << joined(profile.potentialIdColumns) << "\n";
    os << "        -> Potential targets: " << joined(profile.potentialTargetColumns) << "\n";
    os << "        -> High cardinality:  " << joined(profile.highCardinalityColumns) << "\n";
    os << "        -> Low cardinality:   " << joined(profile.lowCardinalityColumns) << "\n";
    if (profile.cleaning.fallbackApplied) {
        os << "        -> Cleaning failed; the original table was profiled as is\n";
    }
    if (!profile.qualityWarnings.empty()) {
        os << "        -> " << profile.qualityWarnings.size() << " quality warnings:\n";
        for (const auto& w : profile.qualityWarnings) os << "             * " << w << "\n";
    }
}

void ProfileConsole::printSummary(const DatasetProfile& profile, std::ostream& os) {
    printColumnTable(profile, os);
    printCorrelationMatrix(profile, os);
    printDatasetFlags(profile, os);
}
