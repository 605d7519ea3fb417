#include "DatasetAggregator.h"
#include "CommonUtils.h"
#include "Logger.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>

namespace {
const std::vector<std::string>& targetKeywords() {
    static const std::vector<std::string> keywords = {"target", "label", "class", "outcome", "result", "prediction"};
    return keywords;
}

const std::vector<std::string>& idKeywords() {
    static const std::vector<std::string> keywords = {"id", "key", "identifier", "uuid", "guid"};
    return keywords;
}

struct NumericView {
    std::vector<double> values;
    MissingMask missing;
};

// Numeric storage is used as is; other storages are coerced cell by cell.
NumericView numericView(const CleanedColumn& col) {
    NumericView view;
    if (col.storage() == StorageKind::NUMERIC) {
        view.values = std::get<NumericValues>(col.values);
        view.missing = col.missing;
        return view;
    }
    view.values.assign(col.size(), 0.0);
    view.missing.assign(col.size(), static_cast<uint8_t>(1));
    for (size_t r = 0; r < col.size(); ++r) {
        if (col.isMissing(r)) continue;
        if (const auto num = CommonUtils::parseFiniteNumber(col.valueAsString(r))) {
            view.values[r] = *num;
            view.missing[r] = 0;
        }
    }
    return view;
}

void appendUnique(std::vector<std::string>& list, const std::string& name) {
    if (std::find(list.begin(), list.end(), name) == list.end()) list.push_back(name);
}
} // namespace

bool DatasetAggregator::isTargetName(const std::string& originalName) {
    return CommonUtils::containsAny(CommonUtils::toLower(originalName), targetKeywords());
}

bool DatasetAggregator::isIdName(const std::string& originalName) {
    return CommonUtils::containsAny(CommonUtils::toLower(originalName), idKeywords());
}

CorrelationMatrix DatasetAggregator::correlations(const CleanedTable& cleaned, const std::vector<std::string>& numericColumns) {
    CorrelationMatrix matrix;
    if (numericColumns.size() < 2) return matrix;

    std::vector<NumericView> views;
    std::vector<std::string> names;
    views.reserve(numericColumns.size());
    for (const auto& name : numericColumns) {
        const int idx = cleaned.findColumnIndex(name);
        if (idx < 0) continue;
        views.push_back(numericView(cleaned.columns()[static_cast<size_t>(idx)]));
        names.push_back(name);
    }

    for (size_t i = 0; i < views.size(); ++i) {
        for (size_t j = i; j < views.size(); ++j) {
            const auto r = Statistics::pearson(views[i].values, views[i].missing, views[j].values, views[j].missing);
            if (!r) continue;
            matrix[names[i]][names[j]] = *r;
            matrix[names[j]][names[i]] = *r;
        }
    }
    return matrix;
}

DatasetProfile DatasetAggregator::aggregate(const std::string& datasetId,
                                            std::vector<ColumnProfile> profiles,
                                            const CleanedTable& cleaned,
                                            const ProfilingThresholds& thresholds) {
    DatasetProfile out;
    out.datasetId = datasetId;
    out.totalRows = cleaned.rowCount();
    out.totalColumns = cleaned.colCount();
    out.columns = std::move(profiles);

    for (const auto& col : out.columns) {
        switch (col.type) {
            case ColumnType::NUMERIC: out.numericColumns.push_back(col.name); break;
            case ColumnType::CATEGORICAL: out.categoricalColumns.push_back(col.name); break;
            case ColumnType::DATETIME: out.datetimeColumns.push_back(col.name); break;
            case ColumnType::BOOLEAN: out.booleanColumns.push_back(col.name); break;
            case ColumnType::TEXT: out.textColumns.push_back(col.name); break;
        }
    }
    out.hasNumeric = !out.numericColumns.empty();
    out.hasCategorical = !out.categoricalColumns.empty();
    out.hasDatetime = !out.datetimeColumns.empty();

    const size_t cells = out.totalRows * out.totalColumns;
    out.overallNullPercentage = cells > 0
        ? 100.0 * static_cast<double>(cleaned.totalNullCount()) / static_cast<double>(cells)
        : 0.0;

    if (out.totalRows > 0) {
        const double rows = static_cast<double>(out.totalRows);
        for (const auto& col : out.columns) {
            const double ratio = static_cast<double>(col.uniqueCount) / rows;
            if (ratio > thresholds.highCardinalityRatio) {
                out.highCardinalityColumns.push_back(col.name);
            } else if (ratio < thresholds.lowCardinalityRatio) {
                out.lowCardinalityColumns.push_back(col.name);
            }
        }
    }

    try {
        out.correlationMatrix = correlations(cleaned, out.numericColumns);
    } catch (const std::exception& ex) {
        out.correlationMatrix.clear();
        out.qualityWarnings.push_back(std::string("Aggregator: correlation matrix skipped: ") + ex.what());
        Logger::warn("Aggregator", std::string("correlation matrix skipped: ") + ex.what());
    }

    for (const auto& col : out.columns) {
        if (isTargetName(col.originalName)) {
            out.potentialTargetColumns.push_back(col.name);
        } else if (col.type == ColumnType::CATEGORICAL && col.uniqueCount == 2 &&
                   col.nullPercentage < thresholds.binaryTargetMaxNullPercentage) {
            out.potentialTargetColumns.push_back(col.name);
        }

        if (col.isIdLike) appendUnique(out.potentialIdColumns, col.name);
        if (isIdName(col.originalName) &&
            static_cast<double>(col.uniqueCount) > static_cast<double>(col.cardinality) * thresholds.idUniqueRatio) {
            appendUnique(out.potentialIdColumns, col.name);
        }
    }
    return out;
}
