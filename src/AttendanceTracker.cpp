// AttendanceTracker.cpp
#include "AttendanceTracker.hpp"
#include <QDebug>

AttendanceTracker::AttendanceTracker(AttendanceDatabase& db, AttendanceCsv& csv, Clock clock)
    : db(db), csv(csv), clock(std::move(clock))
{
}

void AttendanceTracker::loadDay(const QDate& date)
{
    auto stored = db.studentsMarkedOn(date.toString("yyyy-MM-dd").toStdString());
    markedToday.clear();
    markedToday.insert(stored.begin(), stored.end());
    day = date;
}

void AttendanceTracker::reload()
{
    loadDay(clock().date());
    qInfo() << "Already marked on" << day.toString(Qt::ISODate) << ":" << markedToday.size() << "student(s)";
}

bool AttendanceTracker::isMarkedToday(const std::string& studentId) const
{
    return markedToday.count(studentId) > 0;
}

MarkOutcome AttendanceTracker::process(const MatchResult& match)
{
    if (!match.found) {
        return MarkOutcome::Unknown;
    }

    const QDateTime now = clock();
    if (now.date() != day) {
        // Camera left running past midnight
        loadDay(now.date());
    }

    if (markedToday.count(match.studentId)) {
        return MarkOutcome::AlreadyMarked;
    }

    AttendanceRecord record{match.name,
                            match.studentId,
                            now.toString("yyyy-MM-dd").toStdString(),
                            now.toString("HH:mm:ss").toStdString()};

    db.insertAttendance(record.studentId, record.date, record.time);
    if (!csv.append(record)) {
        qWarning() << "Attendance for" << QString::fromStdString(record.studentId)
                   << "stored in the database but not in" << QString::fromStdString(csv.path());
    }

    markedToday.insert(match.studentId);
    lastRecord = record;
    qInfo().noquote() << QString("[MARKED] %1 (%2) at %3 %4")
                             .arg(QString::fromStdString(record.name),
                                  QString::fromStdString(record.studentId),
                                  QString::fromStdString(record.date),
                                  QString::fromStdString(record.time));
    return MarkOutcome::Marked;
}
