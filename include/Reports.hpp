// Reports.hpp
#pragma once

#include <string>
#include <vector>
#include <QDateTime>
#include <QString>
#include "AttendanceDatabase.hpp"

struct RecordStatistics {
    int uniqueStudents = 0;
    int daysRecorded = 0;
    int totalRecords = 0;
};

namespace Reports {

// Fixed-width listing shared by the CLI, the text export and the GUI summary
QString formatRecordsTable(const std::vector<AttendanceRecord>& records);
QString formatSummaryTable(const std::vector<AttendanceSummary>& summaries);

RecordStatistics recordStatistics(const std::vector<AttendanceRecord>& records);

// Both write <dir>/attendance_report_<yyyyMMdd_HHmmss>.<ext> and return its path,
// or an empty string when there is nothing to export or the file cannot be written.
std::string exportTextReport(const std::string& dir, const std::vector<AttendanceRecord>& records, const QDateTime& now);
std::string exportCsvReport(const std::string& dir, const std::vector<AttendanceRecord>& records, const QDateTime& now);

} // namespace Reports
