// AttendanceTracker.hpp
#pragma once

#include <functional>
#include <string>
#include <unordered_set>
#include <QDate>
#include <QDateTime>
#include "AttendanceCsv.hpp"
#include "AttendanceDatabase.hpp"
#include "FaceGallery.hpp"

enum class MarkOutcome {
    Unknown,       // no gallery match
    AlreadyMarked, // matched, but already present today
    Marked         // new attendance row written
};

// Same-day dedup: the first match of a student each day writes one database row and one CSV row,
// later matches that day write nothing.
class AttendanceTracker {
public:
    using Clock = std::function<QDateTime()>;

    AttendanceTracker(AttendanceDatabase& db, AttendanceCsv& csv, Clock clock = [] { return QDateTime::currentDateTime(); });

    // Seeds the marked set from rows already stored for today
    void reload();

    // Throws DatabaseError if the row cannot be inserted; the student then stays unmarked
    MarkOutcome process(const MatchResult& match);

    bool isMarkedToday(const std::string& studentId) const;
    size_t markedCount() const { return markedToday.size(); }
    QDate currentDay() const { return day; }

    // Row written by the most recent Marked outcome
    const AttendanceRecord& lastMarked() const { return lastRecord; }

private:
    AttendanceDatabase& db;
    AttendanceCsv& csv;
    Clock clock;
    QDate day;
    std::unordered_set<std::string> markedToday;
    AttendanceRecord lastRecord;

    void loadDay(const QDate& date);
};
