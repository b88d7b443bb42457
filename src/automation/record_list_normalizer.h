#ifndef EXPORTFLOW_RECORD_LIST_NORMALIZER_H
#define EXPORTFLOW_RECORD_LIST_NORMALIZER_H

#include <string>
#include <vector>
#include "../common/types.h"
#include "../spreadsheet/sheet_reader.h"

namespace exportflow {
namespace automation {

/**
 * @brief Turns the identifier column of the first export into a RecordIdList
 *
 * Rows whose raw value contains the measure marker are discarded, the rest
 * are reduced to their digits and rewritten in canonical integer form, and
 * duplicates are dropped keeping the first occurrence.
 */
class RecordListNormalizer {
public:
    RecordListNormalizer(std::vector<std::string> acceptedHeaders, std::string measureMarker);

    // Index of the first header whose compact key equals an accepted spelling's, or -1
    int resolveColumn(const std::vector<std::string>& headers) const;

    // Pure; empty input gives empty output
    RecordIdList normalize(const std::vector<std::string>& rawValues) const;

    /**
     * @brief Column resolution plus normalize, with summary logging
     * @throws AutomationError(EXPORT_CONTENT) when the table is empty, the
     *         column is missing, or no identifier survives
     */
    RecordIdList extract(const spreadsheet::Table& table) const;

private:
    std::vector<std::string> m_acceptedKeys;
    std::vector<std::string> m_acceptedHeaders;
    std::string m_measureMarker;
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_RECORD_LIST_NORMALIZER_H
