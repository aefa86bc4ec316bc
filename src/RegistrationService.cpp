// RegistrationService.cpp
#include "RegistrationService.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QString>
#include <QDebug>

static std::string trimmed(const std::string& s)
{
    return QString::fromStdString(s).trimmed().toStdString();
}

RegistrationService::RegistrationService(AttendanceDatabase& db, FaceAnalyzer* analyzer,
                                         FaceGallery& gallery, std::string studentsDir)
    : db(db), analyzer(analyzer), gallery(gallery), studentsDir(std::move(studentsDir))
{
}

std::string RegistrationService::imageFileName(const std::string& studentId, const std::string& name,
                                               const std::string& extension)
{
    QString safeName = QString::fromStdString(name).trimmed().replace(' ', '_');
    QString ext = QString::fromStdString(extension);
    if (ext.isEmpty()) ext = ".jpg";
    if (!ext.startsWith('.')) ext.prepend('.');
    return (QString::fromStdString(studentId) + "_" + safeName + ext).toStdString();
}

void RegistrationService::validateIdentity(const std::string& studentId, const std::string& name) const
{
    if (studentId.empty() || name.empty()) {
        throw RegistrationError("Student ID and Name cannot be empty.");
    }
    if (studentId.find('/') != std::string::npos || studentId.find('\\') != std::string::npos) {
        throw RegistrationError("Student ID cannot contain path separators.");
    }
}

std::vector<float> RegistrationService::embedSingleFace(const QImage& image)
{
    if (!analyzer) {
        throw RegistrationError("Face models are not loaded, registration is unavailable.");
    }
    std::vector<FaceDetection> faces;
    std::vector<float> embedding;
    try {
        faces = analyzer->detect(image);
        if (faces.size() == 1) {
            embedding = analyzer->embed(image, faces.front());
        }
    } catch (const std::runtime_error& e) {
        throw RegistrationError(std::string("Face analysis failed: ") + e.what());
    }
    if (faces.empty()) {
        throw RegistrationError("No face detected in the image. Please use a clear photo with a visible face.");
    }
    if (faces.size() > 1) {
        throw RegistrationError("Multiple faces detected. Please use a photo with only one person.");
    }
    if (embedding.empty()) {
        throw RegistrationError("Could not extract face features from the image. Please try another photo.");
    }
    return embedding;
}

std::string RegistrationService::destinationFor(const std::string& studentId, const std::string& name,
                                                const std::string& extension) const
{
    QDir dir(QString::fromStdString(studentsDir));
    if (!dir.exists() && !dir.mkpath(".")) {
        throw RegistrationError("Cannot create students directory: " + studentsDir);
    }
    return dir.filePath(QString::fromStdString(imageFileName(studentId, name, extension))).toStdString();
}

Student RegistrationService::store(const std::string& studentId, const std::string& name,
                                   const std::string& imagePath, const std::vector<float>& embedding)
{
    Student student{studentId, name, imagePath, embedding};
    db.upsertStudent(student);
    try {
        gallery.upsert(studentId, name, embedding);
    } catch (const std::runtime_error& e) {
        throw RegistrationError(std::string("Student saved, but could not be added to the face gallery: ") + e.what());
    }
    qInfo() << "Registered student" << QString::fromStdString(studentId) << QString::fromStdString(name)
            << "image" << QString::fromStdString(imagePath);
    return student;
}

Student RegistrationService::registerFromFile(const std::string& rawId, const std::string& rawName,
                                               const std::string& rawSourcePath)
{
    const std::string studentId = trimmed(rawId);
    const std::string name = trimmed(rawName);
    validateIdentity(studentId, name);

    // Paths pasted from a file manager often arrive quoted
    QString source = QString::fromStdString(rawSourcePath).trimmed();
    while (source.size() >= 1 && (source.startsWith('"') || source.startsWith('\''))) source.remove(0, 1);
    while (source.size() >= 1 && (source.endsWith('"') || source.endsWith('\''))) source.chop(1);
    if (source.isEmpty()) {
        throw RegistrationError("Image path cannot be empty.");
    }

    QFileInfo sourceInfo(source);
    if (!sourceInfo.exists() || !sourceInfo.isFile()) {
        throw RegistrationError("Image file not found: " + source.toStdString());
    }

    QImageReader reader(source);
    QImage image = reader.read();
    if (image.isNull()) {
        throw RegistrationError("Failed to load image. Make sure it's a valid image file (jpg, png, etc.). Error: " +
                                reader.errorString().toStdString());
    }

    std::vector<float> embedding = embedSingleFace(image);

    const std::string suffix = sourceInfo.suffix().isEmpty() ? "" : "." + sourceInfo.suffix().toStdString();
    const std::string dest = destinationFor(studentId, name, suffix);
    const QString qdest = QString::fromStdString(dest);
    if (QFileInfo(qdest).absoluteFilePath() != sourceInfo.absoluteFilePath()) {
        if (QFile::exists(qdest) && !QFile::remove(qdest)) {
            throw RegistrationError("Cannot replace existing photo: " + dest);
        }
        if (!QFile::copy(source, qdest)) {
            throw RegistrationError("Failed to copy image to " + dest);
        }
    }

    return store(studentId, name, dest, embedding);
}

Student RegistrationService::registerFromFrame(const std::string& rawId, const std::string& rawName, const QImage& frame)
{
    const std::string studentId = trimmed(rawId);
    const std::string name = trimmed(rawName);
    validateIdentity(studentId, name);

    if (frame.isNull()) {
        throw RegistrationError("No camera frame available to register.");
    }

    std::vector<float> embedding = embedSingleFace(frame);

    const std::string dest = destinationFor(studentId, name, ".jpg");
    if (!frame.save(QString::fromStdString(dest), "JPG")) {
        throw RegistrationError("Failed to save captured photo to " + dest);
    }

    return store(studentId, name, dest, embedding);
}

int RegistrationService::loadGallery()
{
    gallery.clear();

    std::vector<Student> roster = db.students();
    if (roster.empty()) {
        qWarning() << "No registered students found. Register students before taking attendance.";
        return 0;
    }
    qInfo() << "Loading" << roster.size() << "registered student(s)...";

    const size_t dim = static_cast<size_t>(gallery.dimension());
    int loaded = 0;
    for (const auto& student : roster) {
        const QString label = QString::fromStdString(student.studentId + " - " + student.name);

        if (student.embedding.size() == dim) {
            gallery.upsert(student.studentId, student.name, student.embedding);
            ++loaded;
            continue;
        }

        if (!analyzer) {
            qWarning() << "No stored embedding for" << label << "and no face models loaded. Skipping.";
            continue;
        }

        const QString imagePath = QString::fromStdString(student.imagePath);
        if (!QFile::exists(imagePath)) {
            qWarning() << "Image file not found for" << label << ":" << imagePath;
            continue;
        }
        QImage image(imagePath);
        if (image.isNull()) {
            qWarning() << "Could not decode image for" << label << ":" << imagePath;
            continue;
        }
        std::vector<FaceDetection> faces = analyzer->detect(image);
        if (faces.empty()) {
            qWarning() << "No face found in image for" << label << ". Skipping.";
            continue;
        }
        std::vector<float> embedding = analyzer->embed(image, faces.front());
        if (embedding.size() != dim) {
            qWarning() << "Could not compute an embedding for" << label << ". Skipping.";
            continue;
        }

        db.updateStudentEmbedding(student.studentId, embedding);
        gallery.upsert(student.studentId, student.name, embedding);
        ++loaded;
    }

    qInfo() << "Loaded embeddings for" << loaded << "student(s).";
    return loaded;
}
