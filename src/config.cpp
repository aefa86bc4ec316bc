//src/config.cpp
#include "config.h"
#include <cstdlib>
#include <QDir>
#include <QSettings>
#include <QString> // For QSettings string conversions
#include <QDebug>
#include <QtGlobal>

const char* const kSettingsOrganization = "RollCall";
const char* const kSettingsApplication = "RollCall";

// Helper to read string from QSettings or fallback
static std::string getStringSetting(QSettings& settings, const QString& key, const std::string& fallback) {
    if (settings.contains(key)) {
        return settings.value(key).toString().toStdString();
    }
    return fallback;
}

static int getIntSetting(QSettings& settings, const QString& key, int fallback) {
    if (settings.contains(key)) {
        bool ok;
        int val = settings.value(key).toInt(&ok);
        if (ok) return val;
    }
    return fallback;
}

static float getFloatSetting(QSettings& settings, const QString& key, float fallback) {
    if (settings.contains(key)) {
        bool ok;
        float val = settings.value(key).toFloat(&ok);
        if (ok) return val;
    }
    return fallback;
}

// Whole value must parse, in the C locale; anything else is logged and ignored
static float getFloatEnv(const char* name, float fallback) {
    if (!qEnvironmentVariableIsSet(name)) return fallback;
    const QString val = qEnvironmentVariable(name).trimmed();
    bool ok = false;
    float parsed = val.toFloat(&ok);
    if (ok) return parsed;
    qWarning() << "Ignoring non-numeric value for" << name << ":" << val;
    return fallback;
}

static int getIntEnv(const char* name, int fallback) {
    if (!qEnvironmentVariableIsSet(name)) return fallback;
    const QString val = qEnvironmentVariable(name).trimmed();
    bool ok = false;
    int parsed = val.toInt(&ok);
    if (ok) return parsed;
    qWarning() << "Ignoring non-integer value for" << name << ":" << val;
    return fallback;
}

// Empty values never override a path
static void applyPathEnv(const char* name, std::string& target) {
    const char* val = std::getenv(name);
    if (val && val[0]) target = val;
}

void AppConfig::loadInitialConfig() {
    QSettings settings(kSettingsOrganization, kSettingsApplication);
    loadInitialConfig(settings);
}

void AppConfig::loadInitialConfig(QSettings& settings) {
    // Default values are already set by member initializers in AppConfig struct

    // 1. Load from QSettings
    maxDetections = getIntSetting(settings, "maxDetections", maxDetections);
    confThresh = getFloatSetting(settings, "confThresh", confThresh);
    iouThresh = getFloatSetting(settings, "iouThresh", iouThresh);
    modelPath = getStringSetting(settings, "modelPath", modelPath);
    arcfaceModelPath = getStringSetting(settings, "arcfaceModelPath", arcfaceModelPath);
    databasePath = getStringSetting(settings, "databasePath", databasePath);
    studentsDir = getStringSetting(settings, "studentsDir", studentsDir);
    attendanceDir = getStringSetting(settings, "attendanceDir", attendanceDir);
    matchTolerance = getFloatSetting(settings, "matchTolerance", matchTolerance);
    maxGallerySize = getIntSetting(settings, "maxGallerySize", maxGallerySize);

    // 2. Override with Environment Variables if set
    maxDetections = getIntEnv("MAX_DETECTIONS", maxDetections);
    confThresh = getFloatEnv("CONF_THRESH", confThresh);
    iouThresh = getFloatEnv("IOU_THRESH", iouThresh);
    applyPathEnv("MODEL_PATH", modelPath);
    applyPathEnv("ARCFACE_MODEL_PATH", arcfaceModelPath);
    applyPathEnv("DATABASE_PATH", databasePath);
    applyPathEnv("STUDENTS_DIR", studentsDir);
    applyPathEnv("ATTENDANCE_DIR", attendanceDir);
    matchTolerance = getFloatEnv("MATCH_TOLERANCE", matchTolerance);
    maxGallerySize = getIntEnv("MAX_GALLERY_SIZE", maxGallerySize);

    // 3. Validate (and apply hardcoded defaults if validation fails)
    if (maxDetections <= 0 || maxDetections > 1000) maxDetections = 25;
    if (confThresh <= 0.0f || confThresh > 1.0f) confThresh = 0.5f;
    if (iouThresh < 0.0f || iouThresh > 1.0f) iouThresh = 0.3f;
    // Unit vectors are at most 2 apart
    if (matchTolerance <= 0.0f || matchTolerance > 2.0f) matchTolerance = 0.5f;
    if (maxGallerySize < 100 || maxGallerySize > 1000000) maxGallerySize = 10000;
}

void AppConfig::saveSettings(QSettings& settings) const {
    settings.setValue("maxDetections", maxDetections);
    settings.setValue("confThresh", confThresh);
    settings.setValue("iouThresh", iouThresh);
    settings.setValue("matchTolerance", matchTolerance);
    settings.setValue("maxGallerySize", maxGallerySize);
}

std::string AppConfig::attendanceCsvPath() const {
    return QDir(QString::fromStdString(attendanceDir)).filePath("attendance.csv").toStdString();
}
