// AttendanceCsv.cpp
#include "AttendanceCsv.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QTextStream>
#include <QDebug>

const char* const AttendanceCsv::kHeader = "Name,Student ID,Date,Time";

static bool ensureParentDir(const QString& path)
{
    QDir parent = QFileInfo(path).absoluteDir();
    return parent.exists() || parent.mkpath(".");
}

AttendanceCsv::AttendanceCsv(std::string path)
    : csvPath(std::move(path))
{
}

QString AttendanceCsv::escapeField(const QString& field)
{
    if (!field.contains(',') && !field.contains('"') && !field.contains('\n') && !field.contains('\r')) {
        return field;
    }
    QString quoted = field;
    quoted.replace("\"", "\"\"");
    return "\"" + quoted + "\"";
}

QString AttendanceCsv::formatRow(const AttendanceRecord& record)
{
    return QStringList{
        escapeField(QString::fromStdString(record.name)),
        escapeField(QString::fromStdString(record.studentId)),
        escapeField(QString::fromStdString(record.date)),
        escapeField(QString::fromStdString(record.time))
    }.join(',');
}

bool AttendanceCsv::append(const AttendanceRecord& record)
{
    const QString path = QString::fromStdString(csvPath);
    if (!ensureParentDir(path)) {
        qWarning() << "Could not create directory for attendance CSV:" << path;
        return false;
    }

    const bool isNew = !QFile::exists(path);
    QFile file(path);
    if (!file.open(QIODevice::Append | QIODevice::Text)) {
        qWarning() << "Could not open attendance CSV for writing:" << path << file.errorString();
        return false;
    }
    QTextStream stream(&file);
    if (isNew) {
        stream << kHeader << "\n";
    }
    stream << formatRow(record) << "\n";
    stream.flush();
    if (stream.status() != QTextStream::Ok) {
        qWarning() << "Write to attendance CSV failed:" << path << file.errorString();
        return false;
    }
    return true;
}

bool AttendanceCsv::writeReport(const std::string& path, const std::vector<AttendanceRecord>& records)
{
    const QString qpath = QString::fromStdString(path);
    if (!ensureParentDir(qpath)) {
        qWarning() << "Could not create directory for report:" << qpath;
        return false;
    }
    QFile file(qpath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "Could not open report for writing:" << qpath << file.errorString();
        return false;
    }
    QTextStream stream(&file);
    stream << kHeader << "\n";
    for (const auto& record : records) {
        stream << formatRow(record) << "\n";
    }
    stream.flush();
    return stream.status() == QTextStream::Ok;
}
