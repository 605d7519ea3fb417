#pragma once

#include "Table.h"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace test_util {

inline std::atomic<uint64_t>& tempCounter() {
    static std::atomic<uint64_t> counter{0};
    return counter;
}

inline std::string uniqueTempPath(const std::string& extension) {
    const uint64_t id = tempCounter().fetch_add(1);
    return "/tmp/tabsight_test_" + std::to_string(getpid()) + "_" + std::to_string(id) + extension;
}

// Writes content to a unique temporary file and removes it on destruction.
class TempCsvFile {
public:
    explicit TempCsvFile(const std::string& content, const std::string& extension = ".csv")
        : path_(uniqueTempPath(extension)) {
        std::ofstream f(path_, std::ios::binary);
        f.write(content.data(), static_cast<std::streamsize>(content.size()));
    }
    ~TempCsvFile() { std::remove(path_.c_str()); }

    TempCsvFile(const TempCsvFile&) = delete;
    TempCsvFile& operator=(const TempCsvFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Unique path for a file the test itself writes; removed on destruction.
class TempOutputFile {
public:
    explicit TempOutputFile(const std::string& extension = ".json") : path_(uniqueTempPath(extension)) {}
    ~TempOutputFile() { std::remove(path_.c_str()); }

    TempOutputFile(const TempOutputFile&) = delete;
    TempOutputFile& operator=(const TempOutputFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Row-major string cells. Short rows are padded with absent cells.
inline RawTable textTable(const std::vector<std::string>& header, const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::vector<CellValue>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<CellValue> r;
        r.reserve(row.size());
        for (const auto& v : row) r.emplace_back(v);
        cells.push_back(std::move(r));
    }
    return RawTable::fromRows(header, cells);
}

inline RawColumn numberColumn(const std::string& name, const std::vector<double>& values) {
    RawColumn col;
    col.name = name;
    for (double v : values) col.cells.emplace_back(v);
    return col;
}

inline RawColumn textColumn(const std::string& name, const std::vector<std::string>& values) {
    RawColumn col;
    col.name = name;
    for (const auto& v : values) col.cells.emplace_back(v);
    return col;
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace test_util
