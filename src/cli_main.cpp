// src/cli_main.cpp
// rollcall-cli: registration and reporting without the camera UI
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <cstdio>
#include <memory>
#include "AttendanceDatabase.hpp"
#include "FaceAnalyzer.hpp"
#include "FaceGallery.hpp"
#include "RegistrationService.hpp"
#include "Reports.hpp"
#include "config.h"

static QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

static int fail(const QString& message)
{
    QTextStream err(stderr);
    err << "[ERROR] " << message << "\n";
    return 1;
}

static int runRegister(const AppConfig& config, AttendanceDatabase& db, const QCommandLineParser& parser)
{
    if (!parser.isSet("id") || !parser.isSet("name") || !parser.isSet("image")) {
        return fail("register needs --id, --name and --image");
    }

    // Models are only needed here
    OnnxFaceAnalyzer analyzer(config.modelPath, config.arcfaceModelPath,
                              config.maxDetections, config.confThresh, config.iouThresh);
    FaceGallery gallery(analyzer.embeddingDimension(), config.maxGallerySize, config.matchTolerance);
    RegistrationService registration(db, &analyzer, gallery, config.studentsDir);

    Student student = registration.registerFromFile(parser.value("id").toStdString(),
                                                    parser.value("name").toStdString(),
                                                    parser.value("image").toStdString());
    out() << "[SUCCESS] Student " << QString::fromStdString(student.name)
          << " (" << QString::fromStdString(student.studentId) << ") registered/updated. Photo: "
          << QString::fromStdString(student.imagePath) << "\n";
    return 0;
}

static int runStudents(AttendanceDatabase& db)
{
    std::vector<Student> students = db.students();
    if (students.empty()) {
        out() << "[INFO] No registered students.\n";
        return 0;
    }
    for (const auto& s : students) {
        out() << QString::fromStdString(s.studentId).leftJustified(16) << " "
              << QString::fromStdString(s.name).leftJustified(30) << " "
              << QString::fromStdString(s.imagePath)
              << (s.embedding.empty() ? "  (embedding pending)" : "") << "\n";
    }
    out() << "Total students: " << students.size() << "\n";
    return 0;
}

static int runRecords(AttendanceDatabase& db, const QCommandLineParser& parser)
{
    RecordQuery query;
    if (parser.isSet("today")) {
        query.date = QDate::currentDate().toString("yyyy-MM-dd").toStdString();
        out() << "[INFO] Showing attendance for today: " << QString::fromStdString(*query.date) << "\n";
    } else if (parser.isSet("date")) {
        QDate date = QDate::fromString(parser.value("date"), "yyyy-MM-dd");
        if (!date.isValid()) {
            return fail("Date must be in YYYY-MM-DD format.");
        }
        query.date = date.toString("yyyy-MM-dd").toStdString();
        out() << "[INFO] Showing attendance for date: " << QString::fromStdString(*query.date) << "\n";
    } else if (parser.isSet("student")) {
        QString id = parser.value("student").trimmed();
        if (id.isEmpty()) {
            return fail("Student ID cannot be empty.");
        }
        query.studentId = id.toStdString();
        out() << "[INFO] Showing attendance history for: " << id << "\n";
    }
    out() << Reports::formatRecordsTable(db.records(query));
    return 0;
}

static int runExport(const AppConfig& config, AttendanceDatabase& db, const QCommandLineParser& parser)
{
    const bool csv = parser.isSet("csv");
    RecordQuery query;
    query.newestFirst = csv;
    std::vector<AttendanceRecord> records = db.records(query);
    if (records.empty()) {
        out() << "[INFO] No records to export.\n";
        return 0;
    }
    const QDateTime now = QDateTime::currentDateTime();
    std::string path = csv ? Reports::exportCsvReport(config.attendanceDir, records, now)
                           : Reports::exportTextReport(config.attendanceDir, records, now);
    if (path.empty()) {
        return fail("Could not write the report to " + QString::fromStdString(config.attendanceDir));
    }
    out() << "[SUCCESS] Exported attendance report to: " << QString::fromStdString(path) << "\n";
    return 0;
}

int main(int argc, char *argv[])
{
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss} [%{type}] %{message}");

    QCoreApplication app(argc, argv);
    app.setOrganizationName(kSettingsOrganization);
    app.setApplicationName(kSettingsApplication);

    QCommandLineParser parser;
    parser.setApplicationDescription("RollCall attendance: register students and view attendance records.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "register | students | records | summary | export");
    parser.addOptions({
        {"id", "Student ID / roll number (register).", "id"},
        {"name", "Student name (register).", "name"},
        {"image", "Path to a photo showing exactly one face (register).", "path"},
        {"today", "Only today's attendance (records)."},
        {"date", "Only attendance on this date, YYYY-MM-DD (records).", "date"},
        {"student", "Only this student's history (records).", "id"},
        {"csv", "Export as CSV instead of a text report (export)."},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(1);
    }
    const QString command = args.first();

    AppConfig config;
    config.loadInitialConfig();

    try {
        QDir().mkpath(QString::fromStdString(config.studentsDir));
        QDir().mkpath(QString::fromStdString(config.attendanceDir));
        AttendanceDatabase db(config.databasePath);

        if (command == "register") return runRegister(config, db, parser);
        if (command == "students") return runStudents(db);
        if (command == "records") return runRecords(db, parser);
        if (command == "summary") {
            out() << Reports::formatSummaryTable(db.summary());
            return 0;
        }
        if (command == "export") return runExport(config, db, parser);
        return fail("Unknown command: " + command);
    } catch (const RegistrationError& e) {
        return fail(e.what());
    } catch (const DatabaseError& e) {
        return fail(QString("Database error: %1").arg(e.what()));
    } catch (const Ort::Exception& e) {
        return fail(QString("ONNX Runtime error: %1").arg(e.what()));
    } catch (const std::runtime_error& e) {
        return fail(e.what());
    }
}
