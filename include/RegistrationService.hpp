// RegistrationService.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <QImage>
#include "AttendanceDatabase.hpp"
#include "FaceAnalyzer.hpp"
#include "FaceGallery.hpp"

// User-facing validation failure; what() is shown as-is
class RegistrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Enrolls students (one photo, exactly one face) and fills the gallery from the database.
class RegistrationService {
public:
    // analyzer may be null: loadGallery() then only uses stored embeddings and registration throws
    RegistrationService(AttendanceDatabase& db, FaceAnalyzer* analyzer, FaceGallery& gallery, std::string studentsDir);

    Student registerFromFile(const std::string& studentId, const std::string& name, const std::string& sourcePath);
    Student registerFromFrame(const std::string& studentId, const std::string& name, const QImage& frame);

    // Returns the number of students placed in the gallery
    int loadGallery();

    // <id>_<name with spaces as underscores><ext>, ext defaulting to .jpg
    static std::string imageFileName(const std::string& studentId, const std::string& name, const std::string& extension);

private:
    AttendanceDatabase& db;
    FaceAnalyzer* analyzer;
    FaceGallery& gallery;
    std::string studentsDir;

    void validateIdentity(const std::string& studentId, const std::string& name) const;
    std::vector<float> embedSingleFace(const QImage& image);
    Student store(const std::string& studentId, const std::string& name,
                  const std::string& imagePath, const std::vector<float>& embedding);
    std::string destinationFor(const std::string& studentId, const std::string& name, const std::string& extension) const;
};
