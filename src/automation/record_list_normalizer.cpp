#include "record_list_normalizer.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <unordered_set>

namespace exportflow {
namespace automation {

using utils::StringUtils;

RecordListNormalizer::RecordListNormalizer(std::vector<std::string> acceptedHeaders, std::string measureMarker)
    : m_acceptedHeaders(std::move(acceptedHeaders)), m_measureMarker(std::move(measureMarker)) {
    for (const auto& header : m_acceptedHeaders) {
        m_acceptedKeys.push_back(StringUtils::compactKey(header));
    }
}

int RecordListNormalizer::resolveColumn(const std::vector<std::string>& headers) const {
    for (size_t i = 0; i < headers.size(); ++i) {
        std::string key = StringUtils::compactKey(headers[i]);
        if (!key.empty() && std::find(m_acceptedKeys.begin(), m_acceptedKeys.end(), key) != m_acceptedKeys.end()) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

RecordIdList RecordListNormalizer::normalize(const std::vector<std::string>& rawValues) const {
    RecordIdList ids;
    std::unordered_set<std::string> seen;

    for (const auto& raw : rawValues) {
        if (!m_measureMarker.empty() && raw.find(m_measureMarker) != std::string::npos) {
            continue;
        }
        std::string id = StringUtils::canonicalInteger(StringUtils::digitsOnly(raw));
        if (id.empty()) {
            continue;
        }
        if (seen.insert(id).second) {
            ids.push_back(id);
        }
    }
    return ids;
}

RecordIdList RecordListNormalizer::extract(const spreadsheet::Table& table) const {
    if (table.empty()) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Export artifact has no data rows",
                              "header columns: " + std::to_string(table.headers.size()));
    }

    int column = resolveColumn(table.headers);
    if (column < 0) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "Identifier column not found",
                              "expected one of [" + StringUtils::join(m_acceptedHeaders, ", ") +
                              "], found [" + StringUtils::join(table.headers, ", ") + "]");
    }

    std::vector<std::string> values;
    values.reserve(table.rows.size());
    size_t withoutMarker = 0;
    for (const auto& row : table.rows) {
        const std::string& value = row[static_cast<size_t>(column)];
        values.push_back(value);
        if (m_measureMarker.empty() || value.find(m_measureMarker) == std::string::npos) {
            ++withoutMarker;
        }
    }

    RecordIdList ids = normalize(values);

    SLOG_INFO().message("Record identifiers extracted")
        .context("column", table.headers[static_cast<size_t>(column)])
        .context("total_rows", values.size())
        .context("valid_rows", withoutMarker)
        .context("unique_ids", ids.size());

    if (ids.empty()) {
        throw AutomationError(ErrorType::EXPORT_CONTENT, "No valid record identifiers in export",
                              std::to_string(values.size()) + " rows, " + std::to_string(withoutMarker) +
                              " without marker " + m_measureMarker);
    }
    return ids;
}

} // namespace automation
} // namespace exportflow
