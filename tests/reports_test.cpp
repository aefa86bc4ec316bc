// tests/reports_test.cpp
#include <QDate>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTime>
#include "Reports.hpp"
#include "gtest/gtest.h"

class TestReports : public testing::Test {
 protected:
  std::vector<AttendanceRecord> records{
      {"Alice", "S001", "2024-03-01", "09:00:00"},
      {"Bob", "S002", "2024-03-01", "09:05:00"},
      {"Alice", "S001", "2024-03-02", "08:55:00"},
  };
  QDateTime now{QDate(2024, 3, 2), QTime(17, 30, 5)};
};

TEST_F(TestReports, RecordsTableLayout) {
  QStringList lines = Reports::formatRecordsTable(records).split('\n');
  ASSERT_GE(lines.size(), 7);
  EXPECT_TRUE(lines[0].startsWith("Name"));
  EXPECT_TRUE(lines[0].contains("| Student ID"));
  EXPECT_EQ(lines[1], QString(70, '-'));
  EXPECT_EQ(lines[2], QString("Alice").leftJustified(30) + " | " + QString("S001").leftJustified(15) +
                          " | 2024-03-01 | 09:00:00");
  EXPECT_EQ(lines[5], QString(70, '-'));
  EXPECT_EQ(lines[6], "Total records: 3");
}

TEST_F(TestReports, EmptyTables) {
  EXPECT_EQ(Reports::formatRecordsTable({}), "No records found.\n");
  EXPECT_EQ(Reports::formatSummaryTable({}), "No attendance data to summarize.\n");
}

TEST_F(TestReports, SummaryTable) {
  QString table = Reports::formatSummaryTable({{"Alice", "S001", 2}, {"Bob", "S002", 1}});
  EXPECT_TRUE(table.contains(QString("Alice").leftJustified(30) + " | " + QString("S001").leftJustified(15) + " | 2"));
  EXPECT_TRUE(table.endsWith("Total students with records: 2\n"));
}

TEST_F(TestReports, Statistics) {
  RecordStatistics stats = Reports::recordStatistics(records);
  EXPECT_EQ(stats.uniqueStudents, 2);
  EXPECT_EQ(stats.daysRecorded, 2);
  EXPECT_EQ(stats.totalRecords, 3);

  RecordStatistics none = Reports::recordStatistics({});
  EXPECT_EQ(none.totalRecords, 0);
}

TEST_F(TestReports, TextExportNamedByTimestamp) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const std::string out = dir.filePath("reports").toStdString();

  std::string path = Reports::exportTextReport(out, records, now);
  ASSERT_FALSE(path.empty());
  EXPECT_EQ(QFileInfo(QString::fromStdString(path)).fileName(), "attendance_report_20240302_173005.txt");

  QFile file(QString::fromStdString(path));
  ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
  EXPECT_EQ(QString::fromUtf8(file.readAll()), Reports::formatRecordsTable(records));
}

TEST_F(TestReports, CsvExport) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());

  std::string path = Reports::exportCsvReport(dir.path().toStdString(), records, now);
  ASSERT_FALSE(path.empty());
  EXPECT_EQ(QFileInfo(QString::fromStdString(path)).fileName(), "attendance_report_20240302_173005.csv");

  QFile file(QString::fromStdString(path));
  ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
  QList<QByteArray> lines = file.readAll().split('\n');
  EXPECT_EQ(lines[0], "Name,Student ID,Date,Time");
  EXPECT_EQ(lines[3], "Alice,S001,2024-03-02,08:55:00");
}

TEST_F(TestReports, NothingToExport) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  EXPECT_TRUE(Reports::exportTextReport(dir.path().toStdString(), {}, now).empty());
  EXPECT_TRUE(Reports::exportCsvReport(dir.path().toStdString(), {}, now).empty());
  EXPECT_TRUE(QDir(dir.path()).entryList(QDir::Files).isEmpty());
}
