// tests/attendance_database_test.cpp
#include <memory>
#include <QDir>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include "AttendanceDatabase.hpp"
#include "gtest/gtest.h"

class TestAttendanceDatabase : public testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir.isValid());
    db = std::make_unique<AttendanceDatabase>(dbPath());
  }

  std::string dbPath() const { return dir.filePath("attendance.db").toStdString(); }

  void addStudent(const std::string& id, const std::string& name) {
    db->upsertStudent({id, name, "students/" + id + ".jpg", {}});
  }

  QTemporaryDir dir;
  std::unique_ptr<AttendanceDatabase> db;
};

TEST_F(TestAttendanceDatabase, UpsertInsertsThenUpdates) {
  db->upsertStudent({"S001", "Alice", "students/S001_Alice.jpg", {0.5f, 0.25f}});
  db->upsertStudent({"S001", "Alice Smith", "students/S001_Alice_Smith.jpg", {1.0f, 0.0f}});

  auto students = db->students();
  ASSERT_EQ(students.size(), 1u);
  EXPECT_EQ(students[0].name, "Alice Smith");
  EXPECT_EQ(students[0].imagePath, "students/S001_Alice_Smith.jpg");
  EXPECT_EQ(students[0].embedding, (std::vector<float>{1.0f, 0.0f}));
}

TEST_F(TestAttendanceDatabase, EmbeddingRoundTripsAndCanBeMissing) {
  addStudent("S001", "Alice");
  auto found = db->findStudent("S001");
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->embedding.empty());

  db->updateStudentEmbedding("S001", {0.1f, 0.2f, 0.3f});
  found = db->findStudent("S001");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->embedding, (std::vector<float>{0.1f, 0.2f, 0.3f}));

  EXPECT_FALSE(db->findStudent("S404").has_value());
}

TEST_F(TestAttendanceDatabase, StudentsOrderedByName) {
  addStudent("S003", "Carol");
  addStudent("S001", "Alice");
  addStudent("S002", "Bob");

  auto students = db->students();
  ASSERT_EQ(students.size(), 3u);
  EXPECT_EQ(students[0].name, "Alice");
  EXPECT_EQ(students[1].name, "Bob");
  EXPECT_EQ(students[2].name, "Carol");
}

TEST_F(TestAttendanceDatabase, RecordsFilterAndOrder) {
  addStudent("S001", "Alice");
  addStudent("S002", "Bob");
  db->insertAttendance("S002", "2024-03-02", "09:00:00");
  db->insertAttendance("S001", "2024-03-01", "10:30:00");
  db->insertAttendance("S002", "2024-03-01", "08:15:00");

  auto all = db->records();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].studentId, "S002");
  EXPECT_EQ(all[0].time, "08:15:00");
  EXPECT_EQ(all[1].name, "Alice");
  EXPECT_EQ(all[2].date, "2024-03-02");

  RecordQuery newest;
  newest.newestFirst = true;
  EXPECT_EQ(db->records(newest).front().date, "2024-03-02");

  RecordQuery byDate;
  byDate.date = "2024-03-01";
  EXPECT_EQ(db->records(byDate).size(), 2u);

  RecordQuery byStudent;
  byStudent.studentId = "S002";
  auto bob = db->records(byStudent);
  ASSERT_EQ(bob.size(), 2u);
  EXPECT_EQ(bob[0].name, "Bob");

  RecordQuery both;
  both.date = "2024-03-02";
  both.studentId = "S001";
  EXPECT_TRUE(db->records(both).empty());
}

TEST_F(TestAttendanceDatabase, SummaryCountsPerStudent) {
  addStudent("S001", "Alice");
  addStudent("S002", "Bob");
  addStudent("S003", "Carol");
  db->insertAttendance("S002", "2024-03-01", "09:00:00");
  db->insertAttendance("S002", "2024-03-02", "09:00:00");
  db->insertAttendance("S001", "2024-03-01", "09:05:00");

  auto summary = db->summary();
  ASSERT_EQ(summary.size(), 2u); // Carol has no rows
  EXPECT_EQ(summary[0].name, "Alice");
  EXPECT_EQ(summary[0].totalPresent, 1);
  EXPECT_EQ(summary[1].studentId, "S002");
  EXPECT_EQ(summary[1].totalPresent, 2);
}

TEST_F(TestAttendanceDatabase, StudentsMarkedOnDate) {
  addStudent("S001", "Alice");
  addStudent("S002", "Bob");
  db->insertAttendance("S001", "2024-03-01", "09:00:00");
  db->insertAttendance("S002", "2024-03-02", "09:00:00");

  auto marked = db->studentsMarkedOn("2024-03-01");
  EXPECT_EQ(marked, (std::set<std::string>{"S001"}));
  EXPECT_TRUE(db->studentsMarkedOn("2024-01-01").empty());
}

TEST_F(TestAttendanceDatabase, AttendanceForUnknownStudentFails) {
  EXPECT_THROW(db->insertAttendance("S404", "2024-03-01", "09:00:00"), DatabaseError);
}

TEST_F(TestAttendanceDatabase, InsertReturnsIncreasingIds) {
  addStudent("S001", "Alice");
  qint64 first = db->insertAttendance("S001", "2024-03-01", "09:00:00");
  qint64 second = db->insertAttendance("S001", "2024-03-02", "09:00:00");
  EXPECT_GT(second, first);
}

TEST_F(TestAttendanceDatabase, DeleteRemovesHistory) {
  addStudent("S001", "Alice");
  addStudent("S002", "Bob");
  db->insertAttendance("S001", "2024-03-01", "09:00:00");
  db->insertAttendance("S002", "2024-03-01", "09:00:00");

  EXPECT_TRUE(db->deleteStudent("S001"));
  EXPECT_FALSE(db->deleteStudent("S001"));
  EXPECT_FALSE(db->findStudent("S001").has_value());

  auto rows = db->records();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].studentId, "S002");
}

TEST_F(TestAttendanceDatabase, RenameStudent) {
  addStudent("S001", "Alice");
  EXPECT_TRUE(db->renameStudent("S001", "Alicia"));
  EXPECT_FALSE(db->renameStudent("S404", "Nobody"));
  EXPECT_FALSE(db->renameStudent("S001", ""));
  EXPECT_EQ(db->findStudent("S001")->name, "Alicia");
}

TEST_F(TestAttendanceDatabase, DataSurvivesReopen) {
  addStudent("S001", "Alice");
  db->insertAttendance("S001", "2024-03-01", "09:00:00");
  db.reset();

  AttendanceDatabase reopened(dbPath());
  EXPECT_EQ(reopened.students().size(), 1u);
  EXPECT_EQ(reopened.records().size(), 1u);
}

TEST(AttendanceDatabaseMigration, AddsEmbeddingColumnToOldSchema) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = dir.filePath("old.db");
  {
    QSqlDatabase legacy = QSqlDatabase::addDatabase("QSQLITE", "legacy");
    legacy.setDatabaseName(path);
    ASSERT_TRUE(legacy.open());
    QSqlQuery query(legacy);
    ASSERT_TRUE(query.exec("CREATE TABLE students (student_id TEXT PRIMARY KEY, name TEXT NOT NULL, "
                           "image_path TEXT NOT NULL)"));
    ASSERT_TRUE(query.exec("INSERT INTO students VALUES ('S001', 'Alice', 'students/S001_Alice.jpg')"));
    legacy.close();
  }
  QSqlDatabase::removeDatabase("legacy");

  AttendanceDatabase db(path.toStdString());
  auto alice = db.findStudent("S001");
  ASSERT_TRUE(alice.has_value());
  EXPECT_TRUE(alice->embedding.empty());

  db.updateStudentEmbedding("S001", {1.0f, 0.0f});
  EXPECT_EQ(db.findStudent("S001")->embedding.size(), 2u);
}

TEST(AttendanceDatabaseOpen, UnwritableLocationThrows) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const std::string path = dir.filePath("missing/sub/dir/attendance.db").toStdString();
  EXPECT_THROW(AttendanceDatabase db(path), DatabaseError);
}
