// tests/attendance_tracker_test.cpp
#include <memory>
#include <QDate>
#include <QDateTime>
#include <QFile>
#include <QTemporaryDir>
#include <QTime>
#include "AttendanceTracker.hpp"
#include "gtest/gtest.h"

class TestAttendanceTracker : public testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir.isValid());
    db = std::make_unique<AttendanceDatabase>(dir.filePath("attendance.db").toStdString());
    db->upsertStudent({"S001", "Alice", "students/S001_Alice.jpg", {}});
    db->upsertStudent({"S002", "Bob", "students/S002_Bob.jpg", {}});
    csv = std::make_unique<AttendanceCsv>(dir.filePath("attendance/attendance.csv").toStdString());
    now = QDateTime(QDate(2024, 3, 1), QTime(9, 0, 0));
  }

  std::unique_ptr<AttendanceTracker> makeTracker() {
    auto tracker = std::make_unique<AttendanceTracker>(*db, *csv, [this] { return now; });
    tracker->reload();
    return tracker;
  }

  static MatchResult matchOf(const std::string& id, const std::string& name) {
    MatchResult m;
    m.found = true;
    m.studentId = id;
    m.name = name;
    m.distance = 0.2f;
    return m;
  }

  QTemporaryDir dir;
  std::unique_ptr<AttendanceDatabase> db;
  std::unique_ptr<AttendanceCsv> csv;
  QDateTime now;
};

TEST_F(TestAttendanceTracker, FirstMatchOfTheDayMarks) {
  auto tracker = makeTracker();
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);
  now = now.addSecs(30);
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::AlreadyMarked);

  auto rows = db->records();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].date, "2024-03-01");
  EXPECT_EQ(rows[0].time, "09:00:00");
  EXPECT_TRUE(tracker->isMarkedToday("S001"));
  EXPECT_EQ(tracker->markedCount(), 1u);
  EXPECT_EQ(tracker->lastMarked().name, "Alice");
}

TEST_F(TestAttendanceTracker, MarkWritesCsvRow) {
  auto tracker = makeTracker();
  tracker->process(matchOf("S001", "Alice"));
  tracker->process(matchOf("S002", "Bob"));

  QFile file(QString::fromStdString(csv->path()));
  ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
  QList<QByteArray> lines = file.readAll().split('\n');
  ASSERT_GE(lines.size(), 3);
  EXPECT_EQ(lines[0], "Name,Student ID,Date,Time");
  EXPECT_EQ(lines[1], "Alice,S001,2024-03-01,09:00:00");
  EXPECT_EQ(lines[2], "Bob,S002,2024-03-01,09:00:00");
}

TEST_F(TestAttendanceTracker, UnknownWritesNothing) {
  auto tracker = makeTracker();
  MatchResult unknown;
  unknown.distance = 0.9f;
  EXPECT_EQ(tracker->process(unknown), MarkOutcome::Unknown);
  EXPECT_TRUE(db->records().empty());
  EXPECT_FALSE(QFile::exists(QString::fromStdString(csv->path())));
}

TEST_F(TestAttendanceTracker, ReloadHonorsRowsAlreadyStored) {
  db->insertAttendance("S001", "2024-03-01", "08:00:00");
  db->insertAttendance("S002", "2024-02-29", "08:00:00");

  auto tracker = makeTracker();
  EXPECT_EQ(tracker->markedCount(), 1u);
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::AlreadyMarked);
  EXPECT_EQ(tracker->process(matchOf("S002", "Bob")), MarkOutcome::Marked);
  EXPECT_EQ(db->records().size(), 3u);
}

TEST_F(TestAttendanceTracker, NewDayResetsMarks) {
  now = QDateTime(QDate(2024, 3, 1), QTime(23, 59, 50));
  auto tracker = makeTracker();
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);

  now = QDateTime(QDate(2024, 3, 2), QTime(0, 0, 5));
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);
  EXPECT_EQ(tracker->currentDay(), QDate(2024, 3, 2));
  EXPECT_EQ(tracker->lastMarked().date, "2024-03-02");

  RecordQuery today;
  today.date = "2024-03-02";
  EXPECT_EQ(db->records(today).size(), 1u);
}

TEST_F(TestAttendanceTracker, DatabaseFailureLeavesStudentUnmarked) {
  auto tracker = makeTracker();
  // Not registered, so the foreign key rejects the row
  EXPECT_THROW(tracker->process(matchOf("S404", "Ghost")), DatabaseError);
  EXPECT_FALSE(tracker->isMarkedToday("S404"));
  EXPECT_FALSE(QFile::exists(QString::fromStdString(csv->path())));
}

TEST_F(TestAttendanceTracker, DatabaseFailureDoesNotBlockOtherStudents) {
  auto tracker = makeTracker();
  EXPECT_THROW(tracker->process(matchOf("S404", "Ghost")), DatabaseError);
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);
  EXPECT_EQ(tracker->process(matchOf("S002", "Bob")), MarkOutcome::Marked);
  EXPECT_EQ(db->records().size(), 2u);
}

TEST_F(TestAttendanceTracker, DeletedStudentCanBeMarkedAgainAfterReload) {
  auto tracker = makeTracker();
  ASSERT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);

  ASSERT_TRUE(db->deleteStudent("S001"));
  tracker->reload();
  EXPECT_FALSE(tracker->isMarkedToday("S001"));
  EXPECT_EQ(tracker->markedCount(), 0u);

  db->upsertStudent({"S001", "Alice", "students/S001_Alice.jpg", {}});
  now = now.addSecs(600);
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);

  RecordQuery today;
  today.date = "2024-03-01";
  today.studentId = "S001";
  auto rows = db->records(today);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].time, "09:10:00");
}

TEST_F(TestAttendanceTracker, CsvFailureStillMarks) {
  const QString blocker = dir.filePath("blocker");
  QFile file(blocker);
  ASSERT_TRUE(file.open(QIODevice::WriteOnly));
  file.close();
  csv = std::make_unique<AttendanceCsv>((blocker + "/attendance.csv").toStdString());

  auto tracker = makeTracker();
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::Marked);
  EXPECT_EQ(db->records().size(), 1u);
  EXPECT_EQ(tracker->process(matchOf("S001", "Alice")), MarkOutcome::AlreadyMarked);
}
