#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, DATETIME, BOOLEAN, TEXT };

const char* toString(ColumnType type) noexcept;

// Opaque input cell: absent, text, or an already-typed number.
using CellValue = std::variant<std::monostate, std::string, double>;

inline bool isAbsent(const CellValue& cell) noexcept { return std::holds_alternative<std::monostate>(cell); }

// Canonical text form of a cell; absent renders as "".
std::string cellToString(const CellValue& cell);

struct RawColumn {
    std::string name;
    std::vector<CellValue> cells;
};

/**
 * @brief Immutable caller-owned input table. All columns share one length.
 */
class RawTable {
public:
    RawTable() = default;

    /**
     * @throws Tabsight::DatasetException when column lengths disagree.
     */
    explicit RawTable(std::vector<RawColumn> columns);

    /**
     * @brief Builds a table from a header and row-major string cells.
     * @details Short rows are padded with absent cells; long rows are rejected.
     * @throws Tabsight::DatasetException when a row is wider than the header.
     */
    static RawTable fromRows(const std::vector<std::string>& header,
                             const std::vector<std::vector<CellValue>>& rows);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::vector<RawColumn>& columns() const noexcept { return columns_; }
    const RawColumn& column(size_t idx) const { return columns_.at(idx); }

private:
    std::vector<RawColumn> columns_;
    size_t rowCount_ = 0;
};

using NumericValues = std::vector<double>;
using TextValues = std::vector<std::string>;
using DatetimeValues = std::vector<int64_t>; // Unix seconds, UTC
using ColumnStorage = std::variant<NumericValues, TextValues, DatetimeValues>;
using MissingMask = std::vector<uint8_t>;

enum class StorageKind { NUMERIC, TEXT, DATETIME };

struct CleanedColumn {
    std::string name;          // canonical identifier
    std::string originalName;  // label as supplied by the caller
    ColumnStorage values = TextValues{};
    MissingMask missing;

    StorageKind storage() const noexcept;
    size_t size() const noexcept { return missing.size(); }
    bool isMissing(size_t row) const { return missing[row] != 0; }
    size_t nullCount() const noexcept;

    // Text form of a non-missing cell: numbers via formatNumber, datetimes as ISO-8601.
    std::string valueAsString(size_t row) const;
};

class CleanedTable {
public:
    CleanedTable() = default;
    explicit CleanedTable(std::vector<CleanedColumn> columns);

    /**
     * @brief Pass-through copy of a raw table with no pruning or renaming.
     * @details Columns holding only numbers (or absent cells) keep numeric storage; all others become text.
     */
    static CleanedTable fromRaw(const RawTable& raw);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::vector<CleanedColumn>& columns() const noexcept { return columns_; }
    std::vector<CleanedColumn>& columns() noexcept { return columns_; }

    /**
     * @brief Returns index of the column with this canonical name or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Keeps rows where keepMask is non-zero, preserving order in every column.
     * @throws Tabsight::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    size_t totalNullCount() const noexcept;

private:
    std::vector<CleanedColumn> columns_;
    size_t rowCount_ = 0;
};
