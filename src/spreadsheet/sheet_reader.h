#ifndef EXPORTFLOW_SHEET_READER_H
#define EXPORTFLOW_SHEET_READER_H

#include <string>
#include <vector>
#include <cstdint>

namespace exportflow {
namespace spreadsheet {

/**
 * @brief First worksheet of an export artifact as text cells
 *
 * headers is the first row; every row in rows has headers.size() cells,
 * missing cells are empty strings.
 */
struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    bool empty() const { return rows.empty(); }
    // Index of the header equal to name, or -1
    int columnIndex(const std::string& name) const;
};

/**
 * @brief Reads export artifacts written by the application
 *
 * .xlsx files are opened as Office Open XML workbooks; any other extension
 * is treated as delimited text. Unreadable or malformed files raise
 * AutomationError(EXPORT_CONTENT) naming the path.
 */
class SheetReader {
public:
    static Table read(const std::string& path);

    static Table readWorkbook(const std::string& path);

    // Tab-separated when the header line holds a tab, else ';', else ','
    static Table parseDelimited(const std::string& text);

    // "B12" -> 1; -1 when the reference has no column letters or more than three
    static int columnFromReference(const std::string& reference);

private:
    static Table fromRows(std::vector<std::vector<std::string>> rows);
};

} // namespace spreadsheet
} // namespace exportflow

#endif // EXPORTFLOW_SHEET_READER_H
