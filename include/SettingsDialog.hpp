#pragma once

#include <QDialog>
#include <QSpinBox>
#include <QDoubleSpinBox>
#include <QDialogButtonBox>
#include "config.h" // For AppConfig

class SettingsDialog : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(AppConfig& config, QWidget *parent = nullptr);

private slots:
    void accept() override; // To save settings

private:
    AppConfig& currentConfig; // Reference to the main AppConfig

    QSpinBox* maxDetectionsSpinBox;
    QDoubleSpinBox* confThreshDoubleSpinBox;
    QDoubleSpinBox* iouThreshDoubleSpinBox;
    QDoubleSpinBox* matchToleranceDoubleSpinBox;
    QSpinBox* maxGallerySizeSpinBox;

    QDialogButtonBox* buttonBox;

    void loadSettings(); // Load AppConfig into dialog widgets
    void saveSettings(); // Save dialog widget values to AppConfig & QSettings
};
