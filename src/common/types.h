#ifndef EXPORTFLOW_TYPES_H
#define EXPORTFLOW_TYPES_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace exportflow {

struct CalendarDate {
    int year;
    int month;
    int day;

    CalendarDate() : year(1970), month(1), day(1) {}
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    // Accepts YYYY-MM-DD; throws ValidationError naming the field
    static CalendarDate parseIso(const std::string& text, const std::string& field);
    static bool isValid(int year, int month, int day);

    std::string toIso() const;
    // DD.MM.YYYY, the entry format of the application's date fields
    std::string toFieldFormat() const;

    bool operator<(const CalendarDate& other) const;
    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

/**
 * @brief Validated run input; created once and consumed by the Orchestrator
 */
struct RunCommand {
    CalendarDate startDate;
    CalendarDate endDate;

    RunCommand() = default;
    RunCommand(const CalendarDate& start, const CalendarDate& end) : startDate(start), endDate(end) {}

    // Throws ValidationError when endDate precedes startDate
    void validate() const;
};

struct RunResult {
    std::string exportPathA;
    std::string exportPathB;
    std::string auditCopyPath;
    size_t recordCount;
    std::string runId;

    RunResult() : recordCount(0) {}

    nlohmann::json toJson() const;
};

// Normalized identifiers in first-seen order, no duplicates
using RecordIdList = std::vector<std::string>;

} // namespace exportflow

#endif // EXPORTFLOW_TYPES_H
