#pragma once

#include "Diagnostics.h"
#include "Table.h"

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Tokenization and file ingestion for delimited text. No type inference happens here:
// every cell comes back as a string (empty strings included).

constexpr char kAutoDelimiter = 0;

struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;
    size_t maxColumns = 20000;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one RFC-4180 record (quoted fields may span lines, "" escapes a quote).
 * @details Unquoted fields are trimmed of spaces and tabs. A blank line yields an empty vector.
 * @param malformed set when the record ends inside an open quote or hits a limit.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

/**
 * @brief Picks the delimiter among , ; \t | whose per-line count is most consistent.
 * @param confident cleared when no candidate appears in the header line (comma is returned).
 */
char sniffDelimiter(const std::vector<std::string>& lines, bool* confident = nullptr);

struct CsvReadOptions {
    char delimiter = kAutoDelimiter;
    size_t maxRows = 1000; // 0 => read everything
    ParseLimits limits;
};

class CsvTableReader {
public:
    explicit CsvTableReader(CsvReadOptions options = CsvReadOptions{});

    /**
     * @throws Tabsight::IOException when the file cannot be opened.
     * @throws Tabsight::DatasetException when the file is empty or has no header.
     */
    RawTable readFile(const std::string& path, Diagnostics& diagnostics) const;

    /**
     * @pre is must be seekable when the delimiter is auto-detected.
     * @throws Tabsight::DatasetException when the stream is empty or has no header.
     */
    RawTable read(std::istream& is, Diagnostics& diagnostics) const;

private:
    CsvReadOptions options_;
};
} // namespace CSVUtils
