#include "Table.h"
#include "CommonUtils.h"
#include "DateTimeParsing.h"
#include "TabsightExceptions.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

const char* toString(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::BOOLEAN: return "boolean";
        case ColumnType::TEXT: return "text";
    }
    return "text";
}

std::string cellToString(const CellValue& cell) {
    if (const auto* s = std::get_if<std::string>(&cell)) return *s;
    if (const auto* d = std::get_if<double>(&cell)) return CommonUtils::formatNumber(*d);
    return "";
}

RawTable::RawTable(std::vector<RawColumn> columns) : columns_(std::move(columns)) {
    rowCount_ = columns_.empty() ? 0 : columns_.front().cells.size();
    for (const auto& col : columns_) {
        if (col.cells.size() != rowCount_) {
            throw Tabsight::DatasetException("Column '" + col.name + "' has " + std::to_string(col.cells.size()) +
                                             " cells, expected " + std::to_string(rowCount_));
        }
    }
}

RawTable RawTable::fromRows(const std::vector<std::string>& header,
                            const std::vector<std::vector<CellValue>>& rows) {
    std::vector<RawColumn> columns(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        columns[c].name = header[c];
        columns[c].cells.reserve(rows.size());
    }
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() > header.size()) {
            throw Tabsight::DatasetException("Row " + std::to_string(r + 1) + " has more cells than the header");
        }
        for (size_t c = 0; c < header.size(); ++c) {
            columns[c].cells.push_back(c < rows[r].size() ? rows[r][c] : CellValue{});
        }
    }
    return RawTable(std::move(columns));
}

StorageKind CleanedColumn::storage() const noexcept {
    if (std::holds_alternative<NumericValues>(values)) return StorageKind::NUMERIC;
    if (std::holds_alternative<DatetimeValues>(values)) return StorageKind::DATETIME;
    return StorageKind::TEXT;
}

size_t CleanedColumn::nullCount() const noexcept {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(1)));
}

std::string CleanedColumn::valueAsString(size_t row) const {
    switch (storage()) {
        case StorageKind::NUMERIC: return CommonUtils::formatNumber(std::get<NumericValues>(values)[row]);
        case StorageKind::DATETIME: return DateTimeParsing::formatIso8601(std::get<DatetimeValues>(values)[row]);
        case StorageKind::TEXT: return std::get<TextValues>(values)[row];
    }
    return "";
}

CleanedTable::CleanedTable(std::vector<CleanedColumn> columns) : columns_(std::move(columns)) {
    rowCount_ = columns_.empty() ? 0 : columns_.front().missing.size();
    for (const auto& col : columns_) {
        const size_t valueCount = std::visit([](const auto& v) { return v.size(); }, col.values);
        if (col.missing.size() != rowCount_ || valueCount != rowCount_) {
            throw Tabsight::DatasetException("Cleaned column '" + col.name + "' is not aligned with the table");
        }
    }
}

CleanedTable CleanedTable::fromRaw(const RawTable& raw) {
    std::vector<CleanedColumn> columns;
    columns.reserve(raw.colCount());
    for (const auto& rawCol : raw.columns()) {
        CleanedColumn col;
        col.name = rawCol.name;
        col.originalName = rawCol.name;
        col.missing.assign(rawCol.cells.size(), static_cast<uint8_t>(0));

        const bool allNumbers = std::all_of(rawCol.cells.begin(), rawCol.cells.end(), [](const CellValue& cell) {
            return isAbsent(cell) || std::holds_alternative<double>(cell);
        });

        if (allNumbers) {
            NumericValues values(rawCol.cells.size(), std::nan(""));
            for (size_t r = 0; r < rawCol.cells.size(); ++r) {
                if (isAbsent(rawCol.cells[r]) || std::isnan(std::get<double>(rawCol.cells[r]))) {
                    col.missing[r] = static_cast<uint8_t>(1);
                } else {
                    values[r] = std::get<double>(rawCol.cells[r]);
                }
            }
            col.values = std::move(values);
        } else {
            TextValues values(rawCol.cells.size());
            for (size_t r = 0; r < rawCol.cells.size(); ++r) {
                if (isAbsent(rawCol.cells[r])) {
                    col.missing[r] = static_cast<uint8_t>(1);
                } else {
                    values[r] = cellToString(rawCol.cells[r]);
                }
            }
            col.values = std::move(values);
        }
        columns.push_back(std::move(col));
    }
    return CleanedTable(std::move(columns));
}

int CleanedTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

void CleanedTable::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Tabsight::DatasetException("Row mask size mismatch");

    for (auto& col : columns_) {
        MissingMask newMissing;
        newMissing.reserve(rowCount_);
        for (size_t i = 0; i < rowCount_; ++i) {
            if (keepMask[i]) newMissing.push_back(col.missing[i]);
        }
        std::visit([&](auto& values) {
            std::decay_t<decltype(values)> next;
            next.reserve(newMissing.size());
            for (size_t i = 0; i < rowCount_; ++i) {
                if (keepMask[i]) next.push_back(std::move(values[i]));
            }
            values = std::move(next);
        }, col.values);
        col.missing = std::move(newMissing);
    }

    rowCount_ = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }));
}

size_t CleanedTable::totalNullCount() const noexcept {
    size_t total = 0;
    for (const auto& col : columns_) total += col.nullCount();
    return total;
}
