#include "CSVUtils.h"
#include "TabsightExceptions.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <map>

namespace CSVUtils {
namespace {
constexpr const char* kStage = "CSV";
constexpr size_t kSniffLines = 10;
constexpr std::array<char, 4> kCandidateDelimiters = {',', ';', '\t', '|'};

std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

size_t countOutsideQuotes(const std::string& line, char delimiter) {
    size_t count = 0;
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        else if (c == delimiter && !inQuotes) ++count;
    }
    return count;
}

std::string delimiterName(char d) {
    if (d == '\t') return "\\t";
    return std::string(1, d);
}
} // namespace

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3 || matched == 0) return;

    // Partial match: restore the consumed bytes.
    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed, const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawAnything = false;
    bool overLimit = false;

    const auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) overLimit = true;
    };

    char c;
    while (!overLimit && is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                field += '\n';
            } else {
                field += c;
            }
        } else if (c == '"' && trimUnquotedField(field).empty() && !fieldQuoted) {
            inQuotes = true;
            fieldQuoted = true;
            field.clear();
            sawAnything = true;
        } else if (c == delimiter) {
            pushField();
            sawAnything = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            // Text after a closing quote is kept verbatim.
            field += c;
            sawAnything = true;
        }
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) overLimit = true;
    }

    if (overLimit) {
        // Skip the rest of the record so the next call starts on a record boundary.
        bool atFieldStart = field.empty() && !inQuotes;
        while (is.get(c)) {
            if (inQuotes) {
                if (c == '"') {
                    if (is.peek() == '"') is.get();
                    else inQuotes = false;
                }
            } else if (c == '"' && atFieldStart) {
                inQuotes = true;
            } else if (c == '\n' || c == '\r') {
                if (c == '\r' && is.peek() == '\n') is.get();
                break;
            }
            atFieldStart = !inQuotes && c == delimiter;
        }
    }

    if (inQuotes || overLimit) {
        if (malformed) *malformed = true;
    }
    if (!sawAnything) return {};
    pushField();
    return row;
}

char sniffDelimiter(const std::vector<std::string>& lines, bool* confident) {
    if (confident) *confident = false;
    if (lines.empty()) return ',';

    char best = ',';
    size_t bestConsistent = 0;
    for (char candidate : kCandidateDelimiters) {
        const size_t headerCount = countOutsideQuotes(lines.front(), candidate);
        if (headerCount == 0) continue;
        size_t consistent = 0;
        for (const auto& line : lines) {
            if (countOutsideQuotes(line, candidate) == headerCount) ++consistent;
        }
        // Strictly better only: earlier candidates win ties.
        if (consistent > bestConsistent) {
            best = candidate;
            bestConsistent = consistent;
        }
    }
    if (confident) *confident = bestConsistent > 0;
    return best;
}

CsvTableReader::CsvTableReader(CsvReadOptions options) : options_(options) {}

RawTable CsvTableReader::readFile(const std::string& path, Diagnostics& diagnostics) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Tabsight::IOException("Could not open file: " + path);
    return read(in, diagnostics);
}

RawTable CsvTableReader::read(std::istream& is, Diagnostics& diagnostics) const {
    skipBOM(is);
    if (is.peek() == EOF) throw Tabsight::DatasetException("input is empty");

    char delimiter = options_.delimiter;
    if (delimiter == kAutoDelimiter) {
        const std::streampos start = is.tellg();
        std::vector<std::string> sample;
        std::string line;
        while (sample.size() < kSniffLines && std::getline(is, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) sample.push_back(line);
        }
        is.clear();
        is.seekg(start);
        if (!is) throw Tabsight::IOException("input stream is not seekable; pass an explicit delimiter");

        bool confident = false;
        delimiter = sniffDelimiter(sample, &confident);
        if (!confident) {
            diagnostics.warn(kStage, "could not detect a delimiter, assuming ','");
        } else {
            diagnostics.info(kStage, "detected delimiter '" + delimiterName(delimiter) + "'");
        }
    }

    std::vector<std::string> header;
    while (header.empty() && is.peek() != EOF) {
        bool malformed = false;
        header = parseCSVLine(is, delimiter, &malformed, options_.limits);
        if (malformed) throw Tabsight::DatasetException("header row is malformed");
    }
    if (header.empty()) throw Tabsight::DatasetException("missing header row");

    std::vector<std::vector<CellValue>> rows;
    size_t malformedRows = 0;
    size_t truncatedRows = 0;
    bool hitRowLimit = false;
    while (is.peek() != EOF) {
        if (options_.maxRows > 0 && rows.size() >= options_.maxRows) {
            hitRowLimit = true;
            break;
        }
        bool malformed = false;
        std::vector<std::string> fields = parseCSVLine(is, delimiter, &malformed, options_.limits);
        if (malformed) ++malformedRows;
        if (fields.empty()) continue;
        if (fields.size() > header.size()) {
            fields.resize(header.size());
            ++truncatedRows;
        }

        std::vector<CellValue> row;
        row.reserve(header.size());
        for (auto& f : fields) row.emplace_back(std::move(f));
        rows.push_back(std::move(row));
    }

    if (malformedRows > 0) {
        diagnostics.warn(kStage, std::to_string(malformedRows) + " malformed records (unterminated quote or oversized field)");
    }
    if (truncatedRows > 0) {
        diagnostics.warn(kStage, std::to_string(truncatedRows) + " rows had more fields than the header and were truncated");
    }
    if (hitRowLimit) {
        diagnostics.info(kStage, "stopped after " + std::to_string(options_.maxRows) + " rows");
    }
    diagnostics.info(kStage, "read " + std::to_string(rows.size()) + " rows x " + std::to_string(header.size()) + " columns");
    return RawTable::fromRows(header, rows);
}
} // namespace CSVUtils
