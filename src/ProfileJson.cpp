#include "ProfileJson.h"
#include "CommonUtils.h"
#include "TabsightExceptions.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace {
std::string quoted(const std::string& s) {
    return "\"" + ProfileJson::escapeJsonString(s) + "\"";
}

std::string number(double v) {
    if (!std::isfinite(v)) return "null";
    return CommonUtils::formatNumber(v);
}

std::string boolean(bool v) {
    return v ? "true" : "false";
}

std::string indent(int level) {
    return std::string(static_cast<size_t>(level) * 2, ' ');
}

std::string stringArray(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += quoted(values[i]);
    }
    return out + "]";
}

// Emits `"key": value` members with commas placed between them.
class ObjectWriter {
public:
    ObjectWriter(std::ostringstream& os, int level) : os_(os), level_(level) { os_ << "{\n"; }

    void member(const std::string& key, const std::string& rawValue) {
        if (!first_) os_ << ",\n";
        first_ = false;
        os_ << indent(level_ + 1) << quoted(key) << ": " << rawValue;
    }

    void close() {
        if (!first_) os_ << "\n";
        os_ << indent(level_) << "}";
    }

private:
    std::ostringstream& os_;
    int level_;
    bool first_ = true;
};

std::string topValuesJson(const std::vector<TopValue>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += "{\"value\": " + quoted(values[i].value) +
               ", \"count\": " + std::to_string(values[i].count) +
               ", \"percentage\": " + number(values[i].percentage) + "}";
    }
    return out + "]";
}

std::string columnJson(const ColumnProfile& col, int level) {
    std::ostringstream os;
    ObjectWriter w(os, level);
    w.member("name", quoted(col.name));
    w.member("original_name", quoted(col.originalName));
    w.member("data_type", quoted(toString(col.type)));
    w.member("null_count", std::to_string(col.nullCount));
    w.member("non_null_count", std::to_string(col.nonNullCount));
    w.member("null_percentage", number(col.nullPercentage));
    w.member("unique_count", std::to_string(col.uniqueCount));
    w.member("cardinality", std::to_string(col.cardinality));
    w.member("sample_values", stringArray(col.sampleValues));
    w.member("top_values", topValuesJson(col.topValues));

    if (col.numeric) {
        w.member("min_value", number(col.numeric->min));
        w.member("max_value", number(col.numeric->max));
        w.member("mean_value", number(col.numeric->mean));
        w.member("median_value", number(col.numeric->median));
        w.member("std_value", number(col.numeric->stddev));
    } else if (col.datetime) {
        w.member("min_value", quoted(col.datetime->min));
        w.member("max_value", quoted(col.datetime->max));
        w.member("mean_value", "null");
        w.member("median_value", "null");
        w.member("std_value", "null");
    } else {
        for (const char* key : {"min_value", "max_value", "mean_value", "median_value", "std_value"}) {
            w.member(key, "null");
        }
    }

    if (col.text) {
        w.member("min_length", std::to_string(col.text->minLength));
        w.member("max_length", std::to_string(col.text->maxLength));
        w.member("avg_length", number(col.text->avgLength));
    } else {
        w.member("min_length", "null");
        w.member("max_length", "null");
        w.member("avg_length", "null");
    }

    w.member("is_id_like", boolean(col.isIdLike));
    w.member("is_email_like", boolean(col.isEmailLike));
    w.member("is_phone_like", boolean(col.isPhoneLike));
    w.member("is_url_like", boolean(col.isUrlLike));
    w.member("warnings", stringArray(col.warnings));
    w.close();
    return os.str();
}

std::string correlationJson(const CorrelationMatrix& matrix, int level) {
    std::ostringstream os;
    ObjectWriter outer(os, level);
    for (const auto& [row, cols] : matrix) {
        std::string inner = "{";
        bool first = true;
        for (const auto& [col, r] : cols) {
            if (!std::isfinite(r)) continue;
            if (!first) inner += ", ";
            first = false;
            inner += quoted(col) + ": " + number(r);
        }
        outer.member(row, inner + "}");
    }
    outer.close();
    return os.str();
}

std::string cleaningJson(const CleaningSummary& c, int level) {
    std::ostringstream os;
    ObjectWriter w(os, level);
    w.member("original_rows", std::to_string(c.originalRows));
    w.member("original_columns", std::to_string(c.originalColumns));
    w.member("dropped_empty_rows", std::to_string(c.droppedEmptyRows));
    w.member("dropped_empty_columns", stringArray(c.droppedEmptyColumns));
    w.member("dropped_sparse_rows", std::to_string(c.droppedSparseRows));
    w.member("outliers_nulled", std::to_string(c.outliersNulled));
    w.member("non_finite_nulled", std::to_string(c.nonFiniteNulled));
    w.member("values_truncated", std::to_string(c.valuesTruncated));
    w.member("datetime_converted_columns", stringArray(c.datetimeConvertedColumns));
    w.member("fallback_applied", boolean(c.fallbackApplied));
    w.close();
    return os.str();
}
} // namespace

std::string ProfileJson::escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    escaped += buf;
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string ProfileJson::toJson(const DatasetProfile& profile) {
    std::ostringstream os;
    ObjectWriter w(os, 0);
    w.member("dataset_id", quoted(profile.datasetId));
    w.member("total_rows", std::to_string(profile.totalRows));
    w.member("total_columns", std::to_string(profile.totalColumns));

    std::string columns = "[";
    for (size_t i = 0; i < profile.columns.size(); ++i) {
        columns += (i ? ",\n" : "\n") + indent(2) + columnJson(profile.columns[i], 2);
    }
    columns += profile.columns.empty() ? "]" : "\n" + indent(1) + "]";
    w.member("columns", columns);

    w.member("numeric_columns", stringArray(profile.numericColumns));
    w.member("categorical_columns", stringArray(profile.categoricalColumns));
    w.member("datetime_columns", stringArray(profile.datetimeColumns));
    w.member("text_columns", stringArray(profile.textColumns));
    w.member("boolean_columns", stringArray(profile.booleanColumns));
    w.member("has_datetime", boolean(profile.hasDatetime));
    w.member("has_numeric", boolean(profile.hasNumeric));
    w.member("has_categorical", boolean(profile.hasCategorical));
    w.member("potential_id_columns", stringArray(profile.potentialIdColumns));
    w.member("potential_target_columns", stringArray(profile.potentialTargetColumns));
    w.member("overall_null_percentage", number(profile.overallNullPercentage));
    w.member("high_cardinality_columns", stringArray(profile.highCardinalityColumns));
    w.member("low_cardinality_columns", stringArray(profile.lowCardinalityColumns));
    w.member("correlation_matrix", correlationJson(profile.correlationMatrix, 1));
    w.member("quality_warnings", stringArray(profile.qualityWarnings));
    w.member("cleaning", cleaningJson(profile.cleaning, 1));
    w.member("profiled_at", quoted(profile.profiledAt));
    w.member("sample_size", std::to_string(profile.sampleSize));
    w.close();
    os << "\n";
    return os.str();
}

void ProfileJson::save(const DatasetProfile& profile, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Tabsight::IOException("Failed to open output file: " + path);
    out << toJson(profile);
    out.flush();
    if (!out.good()) throw Tabsight::IOException("Failed while writing output file: " + path);
}
