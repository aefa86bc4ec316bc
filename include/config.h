//include/config.h
#pragma once
#include <string>

class QSettings;

struct AppConfig {
    int maxDetections = 25;
    float confThresh = 0.5f;
    float iouThresh = 0.3f;
    std::string modelPath = "assets/models/blaze.onnx";
    std::string arcfaceModelPath = "assets/models/arc.onnx";
    std::string databasePath = "attendance.db";
    std::string studentsDir = "students";
    std::string attendanceDir = "attendance";
    float matchTolerance = 0.5f; // max L2 distance between unit embeddings
    int maxGallerySize = 10000;

    // Loads config from QSettings, then environment, with defaults and validation
    void loadInitialConfig();
    void loadInitialConfig(QSettings& settings);

    // Writes the detector and matching parameters only; paths may come from the
    // environment and are never persisted
    void saveSettings(QSettings& settings) const;

    std::string attendanceCsvPath() const;
};

// QSettings organization/application names shared by both executables
extern const char* const kSettingsOrganization;
extern const char* const kSettingsApplication;
