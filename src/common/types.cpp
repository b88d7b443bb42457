#include "types.h"
#include "error_handler.h"
#include <cctype>
#include <cstdio>
#include <tuple>

namespace exportflow {

bool CalendarDate::isValid(int year, int month, int day) {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = kDaysInMonth[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        limit = 29;
    }
    return day <= limit;
}

CalendarDate CalendarDate::parseIso(const std::string& text, const std::string& field) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw ValidationError(field, field + " must be formatted as YYYY-MM-DD: '" + text + "'");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw ValidationError(field, field + " must be formatted as YYYY-MM-DD: '" + text + "'");
        }
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));
    if (!isValid(year, month, day)) {
        throw ValidationError(field, field + " is not a calendar date: '" + text + "'");
    }
    return CalendarDate(year, month, day);
}

std::string CalendarDate::toIso() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::string CalendarDate::toFieldFormat() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d.%02d.%04d", day, month, year);
    return buffer;
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

void RunCommand::validate() const {
    if (!CalendarDate::isValid(startDate.year, startDate.month, startDate.day)) {
        throw ValidationError("start_date", "start_date is not a calendar date");
    }
    if (!CalendarDate::isValid(endDate.year, endDate.month, endDate.day)) {
        throw ValidationError("end_date", "end_date is not a calendar date");
    }
    if (endDate < startDate) {
        throw ValidationError("end_date", "end_date must be on or after start_date (" +
                              endDate.toIso() + " < " + startDate.toIso() + ")");
    }
}

nlohmann::json RunResult::toJson() const {
    nlohmann::json j;
    j["status"] = "success";
    j["run_id"] = runId;
    j["export_path_a"] = exportPathA;
    j["export_path_b"] = exportPathB;
    j["audit_copy_path"] = auditCopyPath;
    j["record_count"] = recordCount;
    return j;
}

} // namespace exportflow
