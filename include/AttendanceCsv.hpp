// AttendanceCsv.hpp
#pragma once

#include <string>
#include <vector>
#include <QString>
#include "AttendanceDatabase.hpp"

// Append-only attendance CSV (Name,Student ID,Date,Time). I/O failures are logged, never thrown.
class AttendanceCsv {
public:
    explicit AttendanceCsv(std::string path);

    // Writes the header first when the file does not exist yet
    bool append(const AttendanceRecord& record);

    const std::string& path() const { return csvPath; }

    // Full report: header plus every record, replacing anything at path
    static bool writeReport(const std::string& path, const std::vector<AttendanceRecord>& records);

    // Quotes a field containing a delimiter, quote or line break
    static QString escapeField(const QString& field);
    static QString formatRow(const AttendanceRecord& record);

    static const char* const kHeader;

private:
    std::string csvPath;
};
