// AttendanceDatabase.hpp
#pragma once

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <QSqlDatabase>
#include <QString>

class QSqlQuery;

class DatabaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Student {
    std::string studentId;
    std::string name;
    std::string imagePath;
    std::vector<float> embedding; // empty when never computed
};

struct AttendanceRecord {
    std::string name;
    std::string studentId;
    std::string date; // yyyy-MM-dd
    std::string time; // HH:mm:ss
};

struct AttendanceSummary {
    std::string name;
    std::string studentId;
    int totalPresent = 0;
};

// Optional filters for records(); both set means both must hold
struct RecordQuery {
    std::optional<std::string> date;
    std::optional<std::string> studentId;
    bool newestFirst = false;
};

// SQLite store for students and attendance rows, through Qt SQL.
// Every statement failure throws DatabaseError.
class AttendanceDatabase {
public:
    explicit AttendanceDatabase(const std::string& path);
    ~AttendanceDatabase();

    AttendanceDatabase(const AttendanceDatabase&) = delete;
    AttendanceDatabase& operator=(const AttendanceDatabase&) = delete;

    void upsertStudent(const Student& student);
    void updateStudentEmbedding(const std::string& studentId, const std::vector<float>& embedding);
    bool renameStudent(const std::string& studentId, const std::string& name);
    // Removes the student and their attendance history
    bool deleteStudent(const std::string& studentId);
    std::optional<Student> findStudent(const std::string& studentId) const;
    std::vector<Student> students() const;

    qint64 insertAttendance(const std::string& studentId, const std::string& date, const std::string& time);
    std::set<std::string> studentsMarkedOn(const std::string& date) const;
    std::vector<AttendanceRecord> records(const RecordQuery& query = {}) const;
    std::vector<AttendanceSummary> summary() const;

    const std::string& path() const { return dbPath; }

private:
    std::string dbPath;
    QString connectionName;
    QSqlDatabase db;

    void initSchema();
    QSqlQuery prepare(const QString& sql) const;
    void exec(QSqlQuery& query) const;
};
