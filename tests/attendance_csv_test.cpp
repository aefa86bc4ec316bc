// tests/attendance_csv_test.cpp
#include <QFile>
#include <QStringList>
#include <QTemporaryDir>
#include <QTextStream>
#include "AttendanceCsv.hpp"
#include "gtest/gtest.h"

static QStringList readLines(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return {};
    QStringList lines;
    QTextStream stream(&file);
    while (!stream.atEnd()) lines << stream.readLine();
    return lines;
}

class TestAttendanceCsv : public testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(dir.isValid()); }

  QTemporaryDir dir;
};

TEST_F(TestAttendanceCsv, HeaderWrittenOnce) {
  const QString path = dir.filePath("attendance/attendance.csv");
  AttendanceCsv csv(path.toStdString());

  EXPECT_TRUE(csv.append({"Alice", "S001", "2024-03-01", "09:00:00"}));
  EXPECT_TRUE(csv.append({"Bob", "S002", "2024-03-01", "09:01:30"}));

  QStringList lines = readLines(path);
  ASSERT_EQ(lines.size(), 3);
  EXPECT_EQ(lines[0], "Name,Student ID,Date,Time");
  EXPECT_EQ(lines[1], "Alice,S001,2024-03-01,09:00:00");
  EXPECT_EQ(lines[2], "Bob,S002,2024-03-01,09:01:30");
}

TEST_F(TestAttendanceCsv, ExistingFileIsAppendedTo) {
  const QString path = dir.filePath("attendance.csv");
  AttendanceCsv(path.toStdString()).append({"Alice", "S001", "2024-03-01", "09:00:00"});
  AttendanceCsv(path.toStdString()).append({"Alice", "S001", "2024-03-02", "09:00:00"});

  QStringList lines = readLines(path);
  ASSERT_EQ(lines.size(), 3);
  EXPECT_EQ(lines.filter("Name,Student ID").size(), 1);
}

TEST_F(TestAttendanceCsv, FieldsWithDelimitersAreQuoted) {
  EXPECT_EQ(AttendanceCsv::escapeField("Alice"), "Alice");
  EXPECT_EQ(AttendanceCsv::escapeField("Smith, Alice"), "\"Smith, Alice\"");
  EXPECT_EQ(AttendanceCsv::escapeField("The \"Ace\""), "\"The \"\"Ace\"\"\"");
  EXPECT_EQ(AttendanceCsv::formatRow({"Smith, Alice", "S001", "2024-03-01", "09:00:00"}),
            "\"Smith, Alice\",S001,2024-03-01,09:00:00");
}

TEST_F(TestAttendanceCsv, UnwritablePathReportsFailure) {
  // A regular file where the parent directory should be
  const QString blocker = dir.filePath("blocker");
  QFile file(blocker);
  ASSERT_TRUE(file.open(QIODevice::WriteOnly));
  file.close();

  AttendanceCsv csv((blocker + "/attendance.csv").toStdString());
  EXPECT_FALSE(csv.append({"Alice", "S001", "2024-03-01", "09:00:00"}));
}

TEST_F(TestAttendanceCsv, WriteReportReplacesFile) {
  const QString path = dir.filePath("report.csv");
  std::vector<AttendanceRecord> records{{"Alice", "S001", "2024-03-01", "09:00:00"},
                                        {"Bob", "S002", "2024-03-01", "09:05:00"}};
  ASSERT_TRUE(AttendanceCsv::writeReport(path.toStdString(), records));
  ASSERT_TRUE(AttendanceCsv::writeReport(path.toStdString(), {records[1]}));

  QStringList lines = readLines(path);
  ASSERT_EQ(lines.size(), 2);
  EXPECT_EQ(lines[1], "Bob,S002,2024-03-01,09:05:00");
}
