// AttendanceDatabase.cpp
#include "AttendanceDatabase.hpp"
#include <QByteArray>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>
#include <QVariant>
#include <QDebug>
#include <cstring>

static int s_connectionCounter = 0;

static QByteArray packEmbedding(const std::vector<float>& embedding)
{
    return QByteArray(reinterpret_cast<const char*>(embedding.data()),
                      static_cast<int>(embedding.size() * sizeof(float)));
}

static std::vector<float> unpackEmbedding(const QVariant& value)
{
    if (value.isNull()) return {};
    QByteArray bytes = value.toByteArray();
    if (bytes.size() % static_cast<int>(sizeof(float)) != 0) {
        qWarning() << "Ignoring stored embedding with odd byte length" << bytes.size();
        return {};
    }
    std::vector<float> embedding(bytes.size() / sizeof(float));
    std::memcpy(embedding.data(), bytes.constData(), static_cast<size_t>(bytes.size()));
    return embedding;
}

AttendanceDatabase::AttendanceDatabase(const std::string& path)
    : dbPath(path),
      connectionName(QString("rollcall-%1").arg(++s_connectionCounter))
{
    db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
    db.setDatabaseName(QString::fromStdString(path));
    if (!db.open()) {
        QString reason = db.lastError().text();
        db = QSqlDatabase();
        QSqlDatabase::removeDatabase(connectionName);
        throw DatabaseError("Cannot open attendance database " + path + ": " + reason.toStdString());
    }
    try {
        initSchema();
    } catch (const DatabaseError&) {
        db.close();
        db = QSqlDatabase();
        QSqlDatabase::removeDatabase(connectionName);
        throw;
    }
}

AttendanceDatabase::~AttendanceDatabase()
{
    db.close();
    db = QSqlDatabase(); // drop our handle before the connection is removed
    QSqlDatabase::removeDatabase(connectionName);
}

QSqlQuery AttendanceDatabase::prepare(const QString& sql) const
{
    QSqlQuery query(db);
    if (!query.prepare(sql)) {
        throw DatabaseError("Failed to prepare statement: " + query.lastError().text().toStdString());
    }
    return query;
}

void AttendanceDatabase::exec(QSqlQuery& query) const
{
    if (!query.exec()) {
        throw DatabaseError(query.lastError().text().toStdString());
    }
}

void AttendanceDatabase::initSchema()
{
    QSqlQuery query(db);
    const char* statements[] = {
        "PRAGMA foreign_keys = ON",
        "CREATE TABLE IF NOT EXISTS students ("
        "    student_id TEXT PRIMARY KEY,"
        "    name       TEXT NOT NULL,"
        "    image_path TEXT NOT NULL,"
        "    embedding  BLOB"
        ")",
        "CREATE TABLE IF NOT EXISTS attendance ("
        "    id         INTEGER PRIMARY KEY AUTOINCREMENT,"
        "    student_id TEXT NOT NULL,"
        "    date       TEXT NOT NULL,"
        "    time       TEXT NOT NULL,"
        "    FOREIGN KEY (student_id) REFERENCES students(student_id)"
        ")",
        "CREATE INDEX IF NOT EXISTS attendance_date ON attendance(date)"
    };
    for (const char* sql : statements) {
        if (!query.exec(sql)) {
            throw DatabaseError(std::string("Schema setup failed: ") + query.lastError().text().toStdString());
        }
    }

    // Databases from before embeddings were stored lack the column
    bool hasEmbedding = false;
    if (!query.exec("PRAGMA table_info(students)")) {
        throw DatabaseError("Cannot inspect students table: " + query.lastError().text().toStdString());
    }
    while (query.next()) {
        if (query.value(1).toString() == "embedding") hasEmbedding = true;
    }
    if (!hasEmbedding) {
        qInfo() << "Adding embedding column to students table in" << QString::fromStdString(dbPath);
        if (!query.exec("ALTER TABLE students ADD COLUMN embedding BLOB")) {
            throw DatabaseError("Schema migration failed: " + query.lastError().text().toStdString());
        }
    }
}

void AttendanceDatabase::upsertStudent(const Student& student)
{
    QSqlQuery query = prepare(
        "INSERT INTO students (student_id, name, image_path, embedding) "
        "VALUES (:id, :name, :image, :embedding) "
        "ON CONFLICT(student_id) DO UPDATE SET "
        "    name = excluded.name,"
        "    image_path = excluded.image_path,"
        "    embedding = excluded.embedding");
    query.bindValue(":id", QString::fromStdString(student.studentId));
    query.bindValue(":name", QString::fromStdString(student.name));
    query.bindValue(":image", QString::fromStdString(student.imagePath));
    if (student.embedding.empty()) {
        query.bindValue(":embedding", QVariant(QMetaType(QMetaType::QByteArray)));
    } else {
        query.bindValue(":embedding", packEmbedding(student.embedding));
    }
    exec(query);
}

void AttendanceDatabase::updateStudentEmbedding(const std::string& studentId, const std::vector<float>& embedding)
{
    QSqlQuery query = prepare("UPDATE students SET embedding = :embedding WHERE student_id = :id");
    query.bindValue(":embedding", packEmbedding(embedding));
    query.bindValue(":id", QString::fromStdString(studentId));
    exec(query);
}

bool AttendanceDatabase::renameStudent(const std::string& studentId, const std::string& name)
{
    if (name.empty()) return false;
    QSqlQuery query = prepare("UPDATE students SET name = :name WHERE student_id = :id");
    query.bindValue(":name", QString::fromStdString(name));
    query.bindValue(":id", QString::fromStdString(studentId));
    exec(query);
    return query.numRowsAffected() > 0;
}

bool AttendanceDatabase::deleteStudent(const std::string& studentId)
{
    if (!db.transaction()) {
        throw DatabaseError("Cannot start transaction: " + db.lastError().text().toStdString());
    }
    try {
        QSqlQuery history = prepare("DELETE FROM attendance WHERE student_id = :id");
        history.bindValue(":id", QString::fromStdString(studentId));
        exec(history);

        QSqlQuery student = prepare("DELETE FROM students WHERE student_id = :id");
        student.bindValue(":id", QString::fromStdString(studentId));
        exec(student);
        bool removed = student.numRowsAffected() > 0;

        if (!db.commit()) {
            throw DatabaseError("Commit failed: " + db.lastError().text().toStdString());
        }
        return removed;
    } catch (const DatabaseError&) {
        db.rollback();
        throw;
    }
}

std::optional<Student> AttendanceDatabase::findStudent(const std::string& studentId) const
{
    QSqlQuery query = prepare(
        "SELECT student_id, name, image_path, embedding FROM students WHERE student_id = :id");
    query.bindValue(":id", QString::fromStdString(studentId));
    exec(query);
    if (!query.next()) {
        return std::nullopt;
    }
    return Student{query.value(0).toString().toStdString(),
                   query.value(1).toString().toStdString(),
                   query.value(2).toString().toStdString(),
                   unpackEmbedding(query.value(3))};
}

std::vector<Student> AttendanceDatabase::students() const
{
    QSqlQuery query = prepare(
        "SELECT student_id, name, image_path, embedding FROM students ORDER BY name, student_id");
    exec(query);
    std::vector<Student> out;
    while (query.next()) {
        out.push_back({query.value(0).toString().toStdString(),
                       query.value(1).toString().toStdString(),
                       query.value(2).toString().toStdString(),
                       unpackEmbedding(query.value(3))});
    }
    return out;
}

qint64 AttendanceDatabase::insertAttendance(const std::string& studentId, const std::string& date, const std::string& time)
{
    QSqlQuery query = prepare("INSERT INTO attendance (student_id, date, time) VALUES (:id, :date, :time)");
    query.bindValue(":id", QString::fromStdString(studentId));
    query.bindValue(":date", QString::fromStdString(date));
    query.bindValue(":time", QString::fromStdString(time));
    exec(query);
    return query.lastInsertId().toLongLong();
}

std::set<std::string> AttendanceDatabase::studentsMarkedOn(const std::string& date) const
{
    QSqlQuery query = prepare("SELECT DISTINCT student_id FROM attendance WHERE date = :date");
    query.bindValue(":date", QString::fromStdString(date));
    exec(query);
    std::set<std::string> marked;
    while (query.next()) {
        marked.insert(query.value(0).toString().toStdString());
    }
    return marked;
}

std::vector<AttendanceRecord> AttendanceDatabase::records(const RecordQuery& filter) const
{
    QString sql =
        "SELECT s.name, a.student_id, a.date, a.time "
        "FROM attendance a JOIN students s ON a.student_id = s.student_id ";
    QStringList where;
    if (filter.date) where << "a.date = :date";
    if (filter.studentId) where << "a.student_id = :id";
    if (!where.isEmpty()) {
        sql += "WHERE " + where.join(" AND ") + " ";
    }
    sql += filter.newestFirst ? "ORDER BY a.date DESC, a.time DESC, a.id DESC"
                              : "ORDER BY a.date, a.time, a.id";

    QSqlQuery query = prepare(sql);
    if (filter.date) query.bindValue(":date", QString::fromStdString(*filter.date));
    if (filter.studentId) query.bindValue(":id", QString::fromStdString(*filter.studentId));
    exec(query);

    std::vector<AttendanceRecord> out;
    while (query.next()) {
        out.push_back({query.value(0).toString().toStdString(),
                       query.value(1).toString().toStdString(),
                       query.value(2).toString().toStdString(),
                       query.value(3).toString().toStdString()});
    }
    return out;
}

std::vector<AttendanceSummary> AttendanceDatabase::summary() const
{
    QSqlQuery query = prepare(
        "SELECT s.name, a.student_id, COUNT(*) AS total_present "
        "FROM attendance a JOIN students s ON a.student_id = s.student_id "
        "GROUP BY a.student_id "
        "ORDER BY s.name, a.student_id");
    exec(query);
    std::vector<AttendanceSummary> out;
    while (query.next()) {
        out.push_back({query.value(0).toString().toStdString(),
                       query.value(1).toString().toStdString(),
                       query.value(2).toInt()});
    }
    return out;
}
