#include "SettingsDialog.hpp"
#include <QVBoxLayout>
#include <QFormLayout>
#include <QSettings>
#include <QPushButton>

SettingsDialog::SettingsDialog(AppConfig& config, QWidget *parent)
    : QDialog(parent), currentConfig(config) {
    setWindowTitle("Application Settings");

    QVBoxLayout *mainLayout = new QVBoxLayout(this);
    QFormLayout *formLayout = new QFormLayout();

    maxDetectionsSpinBox = new QSpinBox(this);
    maxDetectionsSpinBox->setRange(1, 1000);
    formLayout->addRow(tr("Max Detections:"), maxDetectionsSpinBox);

    confThreshDoubleSpinBox = new QDoubleSpinBox(this);
    confThreshDoubleSpinBox->setRange(0.01, 1.0);
    confThreshDoubleSpinBox->setSingleStep(0.01);
    confThreshDoubleSpinBox->setDecimals(2);
    formLayout->addRow(tr("Detector Confidence Threshold:"), confThreshDoubleSpinBox);

    iouThreshDoubleSpinBox = new QDoubleSpinBox(this);
    iouThreshDoubleSpinBox->setRange(0.0, 1.0);
    iouThreshDoubleSpinBox->setSingleStep(0.01);
    iouThreshDoubleSpinBox->setDecimals(2);
    formLayout->addRow(tr("Detector IOU Threshold:"), iouThreshDoubleSpinBox);

    // Lower is stricter; distances between unit embeddings range over [0, 2]
    matchToleranceDoubleSpinBox = new QDoubleSpinBox(this);
    matchToleranceDoubleSpinBox->setRange(0.01, 2.0);
    matchToleranceDoubleSpinBox->setSingleStep(0.01);
    matchToleranceDoubleSpinBox->setDecimals(2);
    formLayout->addRow(tr("Match Tolerance (max distance):"), matchToleranceDoubleSpinBox);

    maxGallerySizeSpinBox = new QSpinBox(this);
    maxGallerySizeSpinBox->setRange(100, 1000000); // Consistent with config.cpp validation
    maxGallerySizeSpinBox->setSingleStep(100);
    formLayout->addRow(tr("Max Registered Faces:"), maxGallerySizeSpinBox);

    mainLayout->addLayout(formLayout);

    buttonBox = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(buttonBox, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);
    mainLayout->addWidget(buttonBox);

    loadSettings();
}

void SettingsDialog::loadSettings() {
    maxDetectionsSpinBox->setValue(currentConfig.maxDetections);
    confThreshDoubleSpinBox->setValue(currentConfig.confThresh);
    iouThreshDoubleSpinBox->setValue(currentConfig.iouThresh);
    matchToleranceDoubleSpinBox->setValue(currentConfig.matchTolerance);
    maxGallerySizeSpinBox->setValue(currentConfig.maxGallerySize);
    // Paths come from QSettings/environment and are not edited here
}

void SettingsDialog::saveSettings() {
    currentConfig.maxDetections = maxDetectionsSpinBox->value();
    currentConfig.confThresh = static_cast<float>(confThreshDoubleSpinBox->value());
    currentConfig.iouThresh = static_cast<float>(iouThreshDoubleSpinBox->value());
    currentConfig.matchTolerance = static_cast<float>(matchToleranceDoubleSpinBox->value());
    currentConfig.maxGallerySize = maxGallerySizeSpinBox->value();

    QSettings settings(kSettingsOrganization, kSettingsApplication);
    currentConfig.saveSettings(settings);
}

void SettingsDialog::accept() {
    saveSettings();
    QDialog::accept();
}
