// Reports.cpp
#include "Reports.hpp"
#include "AttendanceCsv.hpp"
#include <QDir>
#include <QFile>
#include <QTextStream>
#include <QDebug>
#include <set>

namespace Reports {

static const QString kRule = QString(70, '-');

static QString col(const std::string& value, int width)
{
    // Pads but never truncates
    return QString::fromStdString(value).leftJustified(width, ' ', false);
}

QString formatRecordsTable(const std::vector<AttendanceRecord>& records)
{
    if (records.empty()) {
        return "No records found.\n";
    }
    QString out;
    QTextStream s(&out);
    s << "Name                           | Student ID       | Date       | Time\n";
    s << kRule << "\n";
    for (const auto& r : records) {
        s << col(r.name, 30) << " | " << col(r.studentId, 15) << " | " << col(r.date, 10) << " | "
          << QString::fromStdString(r.time) << "\n";
    }
    s << kRule << "\n";
    s << "Total records: " << records.size() << "\n";
    return out;
}

QString formatSummaryTable(const std::vector<AttendanceSummary>& summaries)
{
    if (summaries.empty()) {
        return "No attendance data to summarize.\n";
    }
    QString out;
    QTextStream s(&out);
    s << "Name                           | Student ID       | Total Present\n";
    s << kRule << "\n";
    for (const auto& r : summaries) {
        s << col(r.name, 30) << " | " << col(r.studentId, 15) << " | " << r.totalPresent << "\n";
    }
    s << kRule << "\n";
    s << "Total students with records: " << summaries.size() << "\n";
    return out;
}

RecordStatistics recordStatistics(const std::vector<AttendanceRecord>& records)
{
    std::set<std::string> students;
    std::set<std::string> days;
    for (const auto& r : records) {
        students.insert(r.studentId);
        days.insert(r.date);
    }
    return {static_cast<int>(students.size()), static_cast<int>(days.size()), static_cast<int>(records.size())};
}

static QString reportPath(const std::string& dir, const QDateTime& now, const char* extension)
{
    QDir target(QString::fromStdString(dir));
    if (!target.exists() && !target.mkpath(".")) {
        qWarning() << "Cannot create report directory" << target.path();
        return QString();
    }
    return target.filePath(QString("attendance_report_%1.%2").arg(now.toString("yyyyMMdd_HHmmss"), extension));
}

std::string exportTextReport(const std::string& dir, const std::vector<AttendanceRecord>& records, const QDateTime& now)
{
    if (records.empty()) return {};
    QString path = reportPath(dir, now, "txt");
    if (path.isEmpty()) return {};

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "Could not write report" << path << file.errorString();
        return {};
    }
    QTextStream stream(&file);
    stream << formatRecordsTable(records);
    stream.flush();
    if (stream.status() != QTextStream::Ok) {
        qWarning() << "Write to report failed:" << path;
        return {};
    }
    return path.toStdString();
}

std::string exportCsvReport(const std::string& dir, const std::vector<AttendanceRecord>& records, const QDateTime& now)
{
    if (records.empty()) return {};
    QString path = reportPath(dir, now, "csv");
    if (path.isEmpty()) return {};
    if (!AttendanceCsv::writeReport(path.toStdString(), records)) {
        return {};
    }
    return path.toStdString();
}

} // namespace Reports
