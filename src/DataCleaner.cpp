#include "DataCleaner.h"
#include "CommonUtils.h"
#include "Sanitizer.h"
#include "Statistics.h"
#include "TabsightExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace {
constexpr const char* kStage = "Cleaner";

struct WorkColumn {
    std::string label;
    std::vector<CellValue> cells;
};

bool isNullCell(const CellValue& cell) {
    if (isAbsent(cell)) return true;
    if (const auto* d = std::get_if<double>(&cell)) return std::isnan(*d);
    return Sanitizer::isNullLike(std::get<std::string>(cell));
}

std::vector<WorkColumn> dropEmptyRowsAndColumns(const RawTable& raw, CleaningReport& report, Diagnostics& diagnostics) {
    const size_t rows = raw.rowCount();
    const size_t cols = raw.colCount();

    MissingMask keepRow(rows, static_cast<uint8_t>(0));
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            if (!isNullCell(raw.column(c).cells[r])) {
                keepRow[r] = 1;
                break;
            }
        }
    }
    report.droppedEmptyRows = static_cast<size_t>(std::count(keepRow.begin(), keepRow.end(), static_cast<uint8_t>(0)));

    std::vector<WorkColumn> out;
    out.reserve(cols);
    for (size_t c = 0; c < cols; ++c) {
        const RawColumn& src = raw.column(c);
        WorkColumn col;
        col.label = src.name;
        col.cells.reserve(rows - report.droppedEmptyRows);
        bool anyValue = false;
        for (size_t r = 0; r < rows; ++r) {
            if (!keepRow[r]) continue;
            col.cells.push_back(src.cells[r]);
            if (!anyValue && !isNullCell(src.cells[r])) anyValue = true;
        }
        if (!anyValue) {
            report.droppedEmptyColumns.push_back(src.name);
            continue;
        }
        out.push_back(std::move(col));
    }

    if (report.droppedEmptyRows > 0) {
        diagnostics.info(kStage, "dropped " + std::to_string(report.droppedEmptyRows) + " all-null rows");
    }
    for (const auto& label : report.droppedEmptyColumns) {
        diagnostics.info(kStage, "dropped all-null column '" + label + "'");
    }
    return out;
}

// Number for every non-null cell, including overflowing literals and infinities.
bool toNumericColumn(const WorkColumn& col, NumericValues& values, MissingMask& missing) {
    values.assign(col.cells.size(), std::nan(""));
    missing.assign(col.cells.size(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < col.cells.size(); ++r) {
        const CellValue& cell = col.cells[r];
        if (isNullCell(cell)) {
            missing[r] = 1;
            continue;
        }
        if (const auto* d = std::get_if<double>(&cell)) {
            values[r] = *d;
            continue;
        }
        const auto parsed = CommonUtils::parseNumber(std::get<std::string>(cell));
        if (!parsed) return false;
        values[r] = *parsed;
    }
    return true;
}

void cleanNumericColumn(CleanedColumn& col,
                        ColumnCleaningStats& stats,
                        const ProfilingThresholds& thresholds,
                        Diagnostics& diagnostics) {
    auto& values = std::get<NumericValues>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.missing[r]) continue;
        if (!std::isfinite(values[r])) {
            col.missing[r] = 1;
            values[r] = std::nan("");
            ++stats.nonFiniteNulled;
        }
    }
    if (stats.nonFiniteNulled > 0) {
        diagnostics.info(kStage, "column '" + col.name + "': nulled " + std::to_string(stats.nonFiniteNulled) +
                                 " non-finite values");
    }

    std::vector<double> observed;
    std::vector<size_t> observedIdx;
    observed.reserve(values.size());
    observedIdx.reserve(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.missing[r]) continue;
        observed.push_back(values[r]);
        observedIdx.push_back(r);
    }
    if (observed.size() <= thresholds.minOutlierSample) return;

    // Detect first, then apply once the share is known to be acceptable.
    const std::vector<bool> flags = Statistics::detectOutliersZ(observed, thresholds.outlierZThreshold);
    const size_t outliers = static_cast<size_t>(std::count(flags.begin(), flags.end(), true));
    if (outliers == 0) return;

    const double share = static_cast<double>(outliers) / static_cast<double>(observed.size());
    if (share > thresholds.maxOutlierFraction) {
        stats.outlierSuppressionSkipped = true;
        diagnostics.info(kStage, "column '" + col.name + "': " + std::to_string(outliers) +
                                 " outliers exceed the suppression limit, column left untouched");
        return;
    }
    for (size_t i = 0; i < flags.size(); ++i) {
        if (!flags[i]) continue;
        col.missing[observedIdx[i]] = 1;
        values[observedIdx[i]] = std::nan("");
    }
    stats.outliersNulled = outliers;
    diagnostics.info(kStage, "column '" + col.name + "': nulled " + std::to_string(outliers) + " outliers");
}

void cleanTextColumn(const WorkColumn& src,
                     CleanedColumn& col,
                     ColumnCleaningStats& stats,
                     const ProfilingThresholds& thresholds,
                     Diagnostics& diagnostics) {
    TextValues values(src.cells.size());
    col.missing.assign(src.cells.size(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < src.cells.size(); ++r) {
        const CellValue& cell = src.cells[r];
        if (isAbsent(cell) || (std::holds_alternative<double>(cell) && std::isnan(std::get<double>(cell)))) {
            col.missing[r] = 1;
            continue;
        }
        std::string text = CommonUtils::trim(cellToString(cell));
        if (Sanitizer::isNullLike(text)) {
            col.missing[r] = 1;
            if (!text.empty()) ++stats.nullTokensMapped;
            continue;
        }
        if (CommonUtils::utf8Length(text) > thresholds.maxTextLength) {
            text = CommonUtils::utf8Truncate(text, thresholds.maxTextLength);
            ++stats.valuesTruncated;
        }
        values[r] = std::move(text);
    }
    col.values = std::move(values);
    if (stats.valuesTruncated > 0) {
        diagnostics.info(kStage, "column '" + col.name + "': truncated " + std::to_string(stats.valuesTruncated) +
                                 " values longer than " + std::to_string(thresholds.maxTextLength) + " characters");
    }
}

bool isDateLike(const CleanedColumn& col, const ProfilingThresholds& thresholds, DateTimeParsing::DateLocaleHint hint) {
    const auto& values = std::get<TextValues>(col.values);
    size_t sampled = 0;
    size_t patternHits = 0;
    size_t parseHits = 0;
    for (size_t r = 0; r < values.size() && sampled < thresholds.dateSampleSize; ++r) {
        if (col.missing[r]) continue;
        ++sampled;
        if (DateTimeParsing::matchesDatePattern(values[r])) ++patternHits;
        if (DateTimeParsing::isDateTime(values[r], hint)) ++parseHits;
    }
    if (sampled == 0 || parseHits == 0) return false;
    const double n = static_cast<double>(sampled);
    return static_cast<double>(patternHits) / n >= thresholds.datePatternRatio ||
           static_cast<double>(parseHits) / n >= thresholds.dateParseRatio;
}

void convertToDatetime(CleanedColumn& col, ColumnCleaningStats& stats, DateTimeParsing::DateLocaleHint hint,
                       Diagnostics& diagnostics) {
    const auto& text = std::get<TextValues>(col.values);
    DatetimeValues converted(text.size(), 0);
    for (size_t r = 0; r < text.size(); ++r) {
        if (col.missing[r]) continue;
        if (const auto ts = DateTimeParsing::parseDateTime(text[r], hint)) {
            converted[r] = *ts;
        } else {
            col.missing[r] = 1;
            ++stats.datetimeParseFailures;
        }
    }
    col.values = std::move(converted);
    stats.convertedToDatetime = true;
    diagnostics.info(kStage, "column '" + col.name + "' converted to datetime (" +
                             std::to_string(stats.datetimeParseFailures) + " unparseable values nulled)");
}

CleanedTable runCleaningSteps(const RawTable& raw,
                              const ProfilingThresholds& thresholds,
                              DateTimeParsing::DateLocaleHint hint,
                              CleaningReport& report,
                              Diagnostics& diagnostics) {
    // 1. all-null rows first, then all-null columns over the surviving rows
    std::vector<WorkColumn> work = dropEmptyRowsAndColumns(raw, report, diagnostics);

    // 2. canonical names
    std::vector<std::string> labels;
    labels.reserve(work.size());
    for (const auto& col : work) labels.push_back(col.label);
    const std::vector<std::string> names = Sanitizer::sanitizeNames(labels);

    // 3-5. per-column coercion
    std::vector<CleanedColumn> columns;
    columns.reserve(work.size());
    report.columns.clear();
    report.columns.reserve(work.size());
    for (size_t c = 0; c < work.size(); ++c) {
        CleanedColumn col;
        col.name = names[c];
        col.originalName = work[c].label;
        ColumnCleaningStats stats;
        stats.column = col.name;

        NumericValues numeric;
        MissingMask missing;
        if (toNumericColumn(work[c], numeric, missing)) {
            col.values = std::move(numeric);
            col.missing = std::move(missing);
            cleanNumericColumn(col, stats, thresholds, diagnostics);
        } else {
            cleanTextColumn(work[c], col, stats, thresholds, diagnostics);
            if (isDateLike(col, thresholds, hint)) convertToDatetime(col, stats, hint, diagnostics);
        }

        columns.push_back(std::move(col));
        report.columns.push_back(std::move(stats));
    }
    work.clear();

    CleanedTable table(std::move(columns));

    // 6. sparse rows
    if (table.colCount() > 0) {
        const double cols = static_cast<double>(table.colCount());
        MissingMask keep(table.rowCount(), static_cast<uint8_t>(1));
        for (size_t r = 0; r < table.rowCount(); ++r) {
            size_t missingCells = 0;
            for (const auto& col : table.columns()) missingCells += col.missing[r] ? 1 : 0;
            if (static_cast<double>(missingCells) / cols > thresholds.sparseRowMissingRatio) keep[r] = 0;
        }
        report.droppedSparseRows = static_cast<size_t>(std::count(keep.begin(), keep.end(), static_cast<uint8_t>(0)));
        if (report.droppedSparseRows > 0) {
            table.removeRows(keep);
            diagnostics.info(kStage, "dropped " + std::to_string(report.droppedSparseRows) +
                                     " rows missing more than " +
                                     std::to_string(static_cast<int>(thresholds.sparseRowMissingRatio * 100.0)) +
                                     "% of columns");
        }
    }
    return table;
}
} // namespace

size_t CleaningReport::totalOutliersNulled() const noexcept {
    size_t total = 0;
    for (const auto& c : columns) total += c.outliersNulled;
    return total;
}

size_t CleaningReport::totalNonFiniteNulled() const noexcept {
    size_t total = 0;
    for (const auto& c : columns) total += c.nonFiniteNulled;
    return total;
}

size_t CleaningReport::totalValuesTruncated() const noexcept {
    size_t total = 0;
    for (const auto& c : columns) total += c.valuesTruncated;
    return total;
}

CleaningResult DataCleaner::clean(const RawTable& raw,
                                  const ProfilingThresholds& thresholds,
                                  DateTimeParsing::DateLocaleHint hint) {
    CleaningResult result;
    result.report.originalRowCount = raw.rowCount();
    result.report.originalColumnCount = raw.colCount();

    try {
        result.table = runCleaningSteps(raw, thresholds, hint, result.report, result.diagnostics);
    } catch (const std::exception& ex) {
        const size_t rows = result.report.originalRowCount;
        const size_t cols = result.report.originalColumnCount;
        result.report = CleaningReport();
        result.report.originalRowCount = rows;
        result.report.originalColumnCount = cols;
        result.report.fallbackApplied = true;
        result.diagnostics.warn(kStage, std::string("cleaning failed, profiling the original table: ") + ex.what());
        result.table = CleanedTable::fromRaw(raw);
    }

    // 7. only an empty result is fatal
    result.report.finalRowCount = result.table.rowCount();
    result.report.finalColumnCount = result.table.colCount();
    if (result.table.colCount() == 0) {
        throw Tabsight::DatasetException("no columns survived cleaning (" + std::to_string(raw.colCount()) +
                                         " columns in input)");
    }
    if (result.table.rowCount() == 0) {
        throw Tabsight::DatasetException("no rows survived cleaning (" + std::to_string(raw.rowCount()) +
                                         " rows in input)");
    }

    const size_t cells = result.table.rowCount() * result.table.colCount();
    const double nullPct = 100.0 * static_cast<double>(result.table.totalNullCount()) / static_cast<double>(cells);
    char pct[32];
    std::snprintf(pct, sizeof(pct), "%.2f", nullPct);
    result.diagnostics.info(kStage, "cleaned " + std::to_string(raw.rowCount()) + "x" + std::to_string(raw.colCount()) +
                                    " -> " + std::to_string(result.table.rowCount()) + "x" +
                                    std::to_string(result.table.colCount()) + ", " + pct + "% null cells");
    if (nullPct > 50.0) {
        result.diagnostics.warn(kStage, std::string("more than half of the cleaned cells are null (") + pct + "%)");
    }
    return result;
}
