// src/MainWindow.cpp
#include "MainWindow.hpp"
#include "ui_MainWindow.h"
#include "Reports.hpp"
#include "SettingsDialog.hpp"
#include <QAction>
#include <QComboBox>
#include <QDateEdit>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMediaDevices>
#include <QMenuBar>
#include <QMessageBox>
#include <QPainter>
#include <QPixmap>
#include <QPushButton>
#include <QScrollBar>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QTabWidget>
#include <QTableWidget>
#include <QTimer>
#include <QVBoxLayout>
#include <QVideoFrame>
#include <QDebug>
#include <algorithm>

enum RecordFilter { AllRecords = 0, TodayRecords, DateRecords, StudentRecords };

static QTableWidgetItem *readOnlyItem(const QString &text)
{
    QTableWidgetItem *item = new QTableWidgetItem(text);
    item->setFlags(item->flags() & ~Qt::ItemIsEditable);
    return item;
}

static void setupTable(QTableWidget *table, const QStringList &headers)
{
    table->setColumnCount(headers.size());
    table->setHorizontalHeaderLabels(headers);
    table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    table->setSelectionBehavior(QAbstractItemView::SelectRows);
    table->setSelectionMode(QAbstractItemView::SingleSelection);
    table->verticalHeader()->setVisible(false);
    table->horizontalHeader()->setStretchLastSection(true);
}

MainWindow::MainWindow(const AppConfig &config, QWidget *parent)
    : QMainWindow(parent),
      ui(new Ui::MainWindow),
      m_appConfig(config)
{
    ui->setupUi(this);

    // The .ui central widget is the live view; it becomes the first tab
    mainTabWidget = new QTabWidget(this);
    QWidget *liveViewTab = takeCentralWidget();
    mainTabWidget->addTab(liveViewTab, tr("Live Attendance"));
    buildRegisterTab();
    buildStudentsTab();
    buildRecordsTab();
    setCentralWidget(mainTabWidget);

    fileMenu = menuBar()->addMenu(tr("&File"));
    settingsAction = new QAction(tr("&Settings..."), this);
    connect(settingsAction, &QAction::triggered, this, &MainWindow::openSettingsDialog);
    fileMenu->addAction(settingsAction);
    QAction *quitAction = new QAction(tr("&Quit"), this);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);
    fileMenu->addAction(quitAction);

    try {
        QDir().mkpath(QString::fromStdString(m_appConfig.studentsDir));
        QDir().mkpath(QString::fromStdString(m_appConfig.attendanceDir));
        database = std::make_unique<AttendanceDatabase>(m_appConfig.databasePath);
        attendanceCsv = std::make_unique<AttendanceCsv>(m_appConfig.attendanceCsvPath());
        tracker = std::make_unique<AttendanceTracker>(*database, *attendanceCsv);
        tracker->reload();
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Critical Error", QString("Database Error: %1\nApplication will now exit.").arg(err.what()));
        QTimer::singleShot(0, this, &QWidget::close);
        return;
    }

    initPipeline();

    connect(ui->StartCameraButton, &QPushButton::clicked, this, &MainWindow::onStartCamera);
    connect(ui->StopCameraButton, &QPushButton::clicked, this, &MainWindow::onStopCamera);
    connect(ui->RegisterFaceButton, &QPushButton::clicked, this, &MainWindow::onRegisterFace);

    camera = new QCamera(this);
    captureSession = new QMediaCaptureSession(this);
    videoSink = new QVideoSink(this);
    captureSession->setCamera(camera);
    captureSession->setVideoSink(videoSink);
    connect(videoSink, &QVideoSink::videoFrameChanged, this, &MainWindow::onVideoFrame);

    updateMarkedCount();
    populateStudentTable();
    populateRecordsTable();
    populateSummaryTable();
}

MainWindow::~MainWindow()
{
    if (camera) camera->stop();
    delete ui;
}

void MainWindow::buildRegisterTab()
{
    QWidget *tab = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(tab);

    QGroupBox *infoBox = new QGroupBox(tr("Student Information"), tab);
    QFormLayout *form = new QFormLayout(infoBox);
    studentIdEdit = new QLineEdit(infoBox);
    studentIdEdit->setPlaceholderText(tr("e.g., BTech001"));
    studentNameEdit = new QLineEdit(infoBox);
    studentNameEdit->setPlaceholderText(tr("e.g., John Doe"));
    form->addRow(tr("Student ID / Roll Number:"), studentIdEdit);
    form->addRow(tr("Full Name:"), studentNameEdit);
    layout->addWidget(infoBox);

    QGroupBox *photoBox = new QGroupBox(tr("Photo (exactly one face visible)"), tab);
    QVBoxLayout *photoLayout = new QVBoxLayout(photoBox);
    QHBoxLayout *pathLayout = new QHBoxLayout();
    photoPathEdit = new QLineEdit(photoBox);
    photoPathEdit->setReadOnly(true);
    QPushButton *browseButton = new QPushButton(tr("Browse..."), photoBox);
    connect(browseButton, &QPushButton::clicked, this, &MainWindow::onBrowsePhoto);
    pathLayout->addWidget(photoPathEdit);
    pathLayout->addWidget(browseButton);
    photoLayout->addLayout(pathLayout);
    photoPreviewLabel = new QLabel(tr("No photo selected"), photoBox);
    photoPreviewLabel->setAlignment(Qt::AlignCenter);
    photoPreviewLabel->setMinimumSize(300, 300);
    photoLayout->addWidget(photoPreviewLabel);
    layout->addWidget(photoBox);

    registerStudentButton = new QPushButton(tr("Register Student"), tab);
    connect(registerStudentButton, &QPushButton::clicked, this, &MainWindow::onRegisterStudent);
    layout->addWidget(registerStudentButton);
    layout->addStretch();

    mainTabWidget->addTab(tab, tr("Register Student"));
}

void MainWindow::buildStudentsTab()
{
    QWidget *tab = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(tab);

    studentTableWidget = new QTableWidget(tab);
    setupTable(studentTableWidget, {tr("Student ID"), tr("Name"), tr("Photo")});

    QPushButton *refreshButton = new QPushButton(tr("Refresh List"), tab);
    connect(refreshButton, &QPushButton::clicked, this, &MainWindow::populateStudentTable);
    QPushButton *deleteButton = new QPushButton(tr("Delete Selected Student"), tab);
    connect(deleteButton, &QPushButton::clicked, this, &MainWindow::onDeleteStudentClicked);
    QPushButton *editButton = new QPushButton(tr("Edit Selected Name"), tab);
    connect(editButton, &QPushButton::clicked, this, &MainWindow::onEditStudentNameClicked);

    QHBoxLayout *buttons = new QHBoxLayout();
    buttons->addWidget(refreshButton);
    buttons->addWidget(deleteButton);
    buttons->addWidget(editButton);
    buttons->addStretch();

    layout->addLayout(buttons);
    layout->addWidget(studentTableWidget);
    mainTabWidget->addTab(tab, tr("Students"));
}

void MainWindow::buildRecordsTab()
{
    QWidget *tab = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(tab);

    QHBoxLayout *filters = new QHBoxLayout();
    recordFilterCombo = new QComboBox(tab);
    recordFilterCombo->addItems({tr("All Records"), tr("Today"), tr("Specific Date"), tr("Specific Student")});
    recordDateEdit = new QDateEdit(QDate::currentDate(), tab);
    recordDateEdit->setCalendarPopup(true);
    recordDateEdit->setDisplayFormat("yyyy-MM-dd");
    recordDateEdit->setVisible(false);
    recordStudentCombo = new QComboBox(tab);
    recordStudentCombo->setVisible(false);
    QPushButton *refreshButton = new QPushButton(tr("Refresh"), tab);
    QPushButton *exportButton = new QPushButton(tr("Export Report"), tab);
    QPushButton *exportCsvButton = new QPushButton(tr("Export CSV"), tab);

    filters->addWidget(new QLabel(tr("Filter by:"), tab));
    filters->addWidget(recordFilterCombo);
    filters->addWidget(recordDateEdit);
    filters->addWidget(recordStudentCombo);
    filters->addWidget(refreshButton);
    filters->addStretch();
    filters->addWidget(exportButton);
    filters->addWidget(exportCsvButton);
    layout->addLayout(filters);

    recordsTableWidget = new QTableWidget(tab);
    setupTable(recordsTableWidget, {tr("Name"), tr("Student ID"), tr("Date"), tr("Time")});
    layout->addWidget(recordsTableWidget, 3);

    recordsTotalLabel = new QLabel(tab);
    recordsStatsLabel = new QLabel(tab);
    layout->addWidget(recordsTotalLabel);
    layout->addWidget(recordsStatsLabel);

    layout->addWidget(new QLabel(tr("Summary (days present per student):"), tab));
    summaryTableWidget = new QTableWidget(tab);
    setupTable(summaryTableWidget, {tr("Name"), tr("Student ID"), tr("Total Present")});
    layout->addWidget(summaryTableWidget, 2);

    connect(recordFilterCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onRecordFilterChanged);
    connect(recordDateEdit, &QDateEdit::dateChanged, this, &MainWindow::populateRecordsTable);
    connect(recordStudentCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::populateRecordsTable);
    connect(refreshButton, &QPushButton::clicked, this, &MainWindow::populateRecordsTable);
    connect(refreshButton, &QPushButton::clicked, this, &MainWindow::populateSummaryTable);
    connect(exportButton, &QPushButton::clicked, this, &MainWindow::onExportReport);
    connect(exportCsvButton, &QPushButton::clicked, this, &MainWindow::onExportCsv);

    mainTabWidget->addTab(tab, tr("Attendance Records"));
}

// (Re)creates analyzer, gallery and registration from the current config, then loads the gallery
void MainWindow::initPipeline()
{
    registration.reset();
    gallery.reset();
    analyzer.reset();
    faceCache.clear();

    try {
        analyzer = std::make_unique<OnnxFaceAnalyzer>(m_appConfig.modelPath, m_appConfig.arcfaceModelPath,
                                                      m_appConfig.maxDetections, m_appConfig.confThresh,
                                                      m_appConfig.iouThresh);
    } catch (const Ort::Exception &ort_err) {
        QMessageBox::warning(this, "Model Error", QString("ONNX Runtime Error: %1\nLive attendance and registration are disabled.").arg(ort_err.what()));
    } catch (const std::runtime_error &err) {
        QMessageBox::warning(this, "Model Error", QString("Initialization Error: %1\nLive attendance and registration are disabled.").arg(err.what()));
    }

    const int dim = analyzer ? analyzer->embeddingDimension() : kDefaultEmbeddingDim;
    gallery = std::make_unique<FaceGallery>(dim, m_appConfig.maxGallerySize, m_appConfig.matchTolerance);
    registration = std::make_unique<RegistrationService>(*database, analyzer.get(), *gallery, m_appConfig.studentsDir);

    try {
        int loaded = registration->loadGallery();
        appendStatus(QString("[INFO] Loaded embeddings for %1 student(s).").arg(loaded));
        if (loaded == 0) {
            appendStatus("[WARN] No registered students found. Register students first.");
        }
    } catch (const std::exception &ex) {
        QMessageBox::warning(this, "Gallery Error", QString("Could not load registered faces: %1").arg(ex.what()));
    }

    const bool modelsReady = analyzer != nullptr;
    ui->StartCameraButton->setEnabled(modelsReady && !(camera && camera->isActive()));
    registerStudentButton->setEnabled(modelsReady);
}

void MainWindow::appendStatus(const QString &line)
{
    ui->StatusLog->appendPlainText(line);
    ui->StatusLog->verticalScrollBar()->setValue(ui->StatusLog->verticalScrollBar()->maximum());
}

void MainWindow::updateMarkedCount()
{
    int count = tracker ? static_cast<int>(tracker->markedCount()) : 0;
    ui->MarkedCountLabel->setText(tr("Marked today: %1").arg(count));
}

void MainWindow::onStartCamera()
{
    if (!analyzer) {
        QMessageBox::warning(this, "Camera", "Face models are not loaded. Check the model paths in Settings.");
        return;
    }
    if (gallery->size() == 0) {
        QMessageBox::information(this, "Camera", "No registered students are loaded. Faces will show as Unknown until students are registered.");
    }
    if (QMediaDevices::defaultVideoInput().isNull()) {
        QMessageBox::warning(this, "Camera Error", "No default camera found. Please ensure a camera is connected and configured.");
        return;
    }

    tracker->reload();
    updateMarkedCount();
    frameCount = 0;
    faceCache.clear();
    camera->start();
    if (camera->error() != QCamera::NoError) {
        QMessageBox::warning(this, "Camera Error", "Could not start camera: " + camera->errorString());
        return;
    }
    ui->StartCameraButton->setEnabled(false);
    ui->StopCameraButton->setEnabled(true);
    appendStatus("[INFO] Attendance started. Recognized faces are marked automatically.");
}

void MainWindow::onStopCamera()
{
    camera->stop();
    faceCache.clear();
    ui->RegisterFaceButton->setVisible(false);
    ui->StartCameraButton->setEnabled(analyzer != nullptr);
    ui->StopCameraButton->setEnabled(false);
    ui->CameraLabel->setPixmap(QPixmap());
    ui->CameraLabel->setText(tr("Camera stopped"));
    appendStatus("[INFO] Attendance stopped.");
    populateRecordsTable();
    populateSummaryTable();
}

void MainWindow::onVideoFrame(const QVideoFrame &frame)
{
    QImage image = frame.toImage();
    if (image.isNull())
        return;
    lastFrame = image;
    frameCount++;

    // 1. Age/expire cache
    for (auto it = faceCache.begin(); it != faceCache.end(); ) {
        if (--(it->ttl) <= 0) it = faceCache.erase(it);
        else ++it;
    }

    // 2. Models run every kFrameSkip-th frame, or straight away when nothing is cached
    bool doDetect = (frameCount % kFrameSkip == 0) || faceCache.empty();
    if (analyzer && doDetect) {
        faceCache.clear();
        try {
            for (const auto &face : analyzer->analyze(image)) {
                MatchResult match = gallery->match(face.embedding);

                CachedFace cf;
                const FaceDetection &f = face.detection;
                cf.box = QRect(QPoint(int(f.x1), int(f.y1)), QPoint(int(f.x2), int(f.y2)));
                cf.recognized = match.found;
                cf.studentId = match.studentId;
                cf.name = match.found ? match.name : "Unknown";
                cf.distance = match.distance;
                cf.conf = f.confidence;
                cf.ttl = kCacheTTL;
                faceCache.push_back(cf);

                // A failed insert only costs this face; the rest of the frame is still marked
                try {
                    if (tracker->process(match) == MarkOutcome::Marked) {
                        const AttendanceRecord &rec = tracker->lastMarked();
                        appendStatus(QString("[MARKED] %1 (%2) at %3")
                                         .arg(QString::fromStdString(rec.name),
                                              QString::fromStdString(rec.studentId),
                                              QString::fromStdString(rec.time)));
                        statusBar()->showMessage(tr("Marked %1").arg(QString::fromStdString(rec.name)), 5000);
                        updateMarkedCount();
                    }
                } catch (const DatabaseError &err) {
                    qWarning() << "Could not record attendance:" << err.what();
                    appendStatus(QString("[ERROR] Could not record attendance for %1: %2")
                                     .arg(QString::fromStdString(match.studentId), err.what()));
                }
            }
        } catch (const Ort::Exception &ort_err) {
            qWarning() << "Inference failed:" << ort_err.what();
        } catch (const std::exception &ex) {
            qWarning() << "Frame processing failed:" << ex.what();
        }
    }

    // 3. Draw overlays from cache on every frame: green = recognized, red = unknown
    QImage display = image.convertToFormat(QImage::Format_RGB32);
    QPainter painter(&display);
    painter.setFont(QFont("Arial", 12, QFont::Bold));
    for (const auto &cf : faceCache) {
        QColor color = cf.recognized ? QColor(0, 200, 0) : QColor(220, 0, 0);
        painter.setPen(QPen(color, 2));
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(cf.box);

        QRect labelBar(cf.box.left(), cf.box.bottom() - 25, cf.box.width(), 25);
        painter.fillRect(labelBar, color);
        painter.setPen(Qt::white);
        QString label = QString::fromStdString(cf.name);
        if (cf.recognized) {
            label += QString(" (%1)").arg(cf.distance, 0, 'f', 2);
        }
        painter.drawText(labelBar.adjusted(6, 0, 0, 0), Qt::AlignVCenter | Qt::AlignLeft, label);
    }
    if (faceCache.empty()) {
        painter.setPen(QPen(Qt::red, 2));
        painter.setFont(QFont("Arial", 24, QFont::Bold));
        painter.drawText(display.rect(), Qt::AlignCenter, "No Face Detected");
    }
    painter.end();

    ui->CameraLabel->setPixmap(QPixmap::fromImage(display).scaled(
        ui->CameraLabel->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));

    // Registration from the camera only makes sense with a single unknown face in view
    long unknown = std::count_if(faceCache.begin(), faceCache.end(),
                                 [](const CachedFace &cf) { return !cf.recognized; });
    ui->RegisterFaceButton->setVisible(unknown == 1);
}

void MainWindow::onRegisterFace()
{
    long unknown = std::count_if(faceCache.begin(), faceCache.end(),
                                 [](const CachedFace &cf) { return !cf.recognized; });
    if (unknown == 0) {
        QMessageBox::information(this, "Info", "No unknown face detected to register. Please ensure an unknown person is in view.");
        return;
    }
    if (unknown > 1) {
        QMessageBox::warning(this, "Registration Ambiguity", "Multiple unknown faces detected. Please ensure only ONE unknown person is clearly in view and try again.");
        return;
    }

    QImage snapshot = lastFrame;
    bool ok;
    QString studentId = QInputDialog::getText(this, "Register Face", "Student ID / Roll Number:", QLineEdit::Normal, "", &ok);
    if (!ok || studentId.trimmed().isEmpty()) return;
    QString name = QInputDialog::getText(this, "Register Face", "Student Name:", QLineEdit::Normal, "", &ok);
    if (!ok || name.trimmed().isEmpty()) return;

    try {
        Student student = registration->registerFromFrame(studentId.toStdString(), name.toStdString(), snapshot);
        QMessageBox::information(this, "Success", QString("Student '%1' registered successfully!").arg(QString::fromStdString(student.name)));
        populateStudentTable();
    } catch (const RegistrationError &err) {
        QMessageBox::warning(this, "Registration Failed", err.what());
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Registration Failed", QString("Database Error: %1").arg(err.what()));
    } catch (const Ort::Exception &ort_err) {
        QMessageBox::critical(this, "Registration Failed", QString("ONNX Runtime Error: %1").arg(ort_err.what()));
    } catch (const std::runtime_error &err) {
        QMessageBox::critical(this, "Registration Failed", err.what());
    }
}

void MainWindow::onBrowsePhoto()
{
    QString path = QFileDialog::getOpenFileName(this, tr("Select Student Photo"), QString(),
                                                tr("Images (*.jpg *.jpeg *.png *.bmp);;All files (*)"));
    if (path.isEmpty()) return;
    photoPathEdit->setText(path);
    QPixmap preview(path);
    if (preview.isNull()) {
        photoPreviewLabel->setText(tr("Cannot preview this file"));
    } else {
        photoPreviewLabel->setPixmap(preview.scaled(300, 300, Qt::KeepAspectRatio, Qt::SmoothTransformation));
    }
}

void MainWindow::onRegisterStudent()
{
    if (studentIdEdit->text().trimmed().isEmpty() || studentNameEdit->text().trimmed().isEmpty()) {
        QMessageBox::warning(this, "Register Student", "Please enter both Student ID and Name.");
        return;
    }
    if (photoPathEdit->text().isEmpty()) {
        QMessageBox::warning(this, "Register Student", "Please select a student photo.");
        return;
    }

    try {
        Student student = registration->registerFromFile(studentIdEdit->text().toStdString(),
                                                         studentNameEdit->text().toStdString(),
                                                         photoPathEdit->text().toStdString());
        QMessageBox::information(this, "Register Student",
                                 QString("Student '%1' (%2) registered successfully!")
                                     .arg(QString::fromStdString(student.name), QString::fromStdString(student.studentId)));
        studentIdEdit->clear();
        studentNameEdit->clear();
        photoPathEdit->clear();
        photoPreviewLabel->setPixmap(QPixmap());
        photoPreviewLabel->setText(tr("No photo selected"));
        populateStudentTable();
    } catch (const RegistrationError &err) {
        QMessageBox::warning(this, "Register Student", err.what());
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Register Student", QString("Database Error: %1").arg(err.what()));
    } catch (const Ort::Exception &ort_err) {
        QMessageBox::critical(this, "Register Student", QString("ONNX Runtime Error: %1").arg(ort_err.what()));
    } catch (const std::runtime_error &err) {
        QMessageBox::critical(this, "Register Student", err.what());
    }
}

void MainWindow::openSettingsDialog()
{
    SettingsDialog dialog(m_appConfig, this);
    if (dialog.exec() == QDialog::Accepted) {
        // Detector thresholds and gallery capacity are construction parameters, so rebuild
        initPipeline();
        QMessageBox::information(this, "Settings Applied", "Settings have been applied and the face gallery was reloaded.");
    }
}

void MainWindow::populateStudentTable()
{
    if (!database) return;

    studentTableWidget->setSortingEnabled(false);
    studentTableWidget->setRowCount(0);
    try {
        for (const auto &student : database->students()) {
            int row = studentTableWidget->rowCount();
            studentTableWidget->insertRow(row);
            studentTableWidget->setItem(row, 0, readOnlyItem(QString::fromStdString(student.studentId)));
            studentTableWidget->setItem(row, 1, readOnlyItem(QString::fromStdString(student.name)));
            studentTableWidget->setItem(row, 2, readOnlyItem(QString::fromStdString(student.imagePath)));
        }
    } catch (const DatabaseError &err) {
        qWarning() << "Could not list students:" << err.what();
    }
    studentTableWidget->resizeColumnsToContents();
    studentTableWidget->setSortingEnabled(true);
    refreshStudentChoices();
}

bool MainWindow::selectedStudent(QString &studentId, QString &name, const QString &title)
{
    if (studentTableWidget->selectionModel()->selectedRows().isEmpty()) {
        QMessageBox::information(this, title, "Please select a student from the list.");
        return false;
    }
    int row = studentTableWidget->selectionModel()->selectedRows().first().row();
    QTableWidgetItem *idItem = studentTableWidget->item(row, 0);
    QTableWidgetItem *nameItem = studentTableWidget->item(row, 1);
    if (!idItem || !nameItem) {
        QMessageBox::warning(this, title, "Could not retrieve student details from selection.");
        return false;
    }
    studentId = idItem->text();
    name = nameItem->text();
    return true;
}

void MainWindow::onDeleteStudentClicked()
{
    QString studentId, name;
    if (!database || !selectedStudent(studentId, name, "Delete Student")) return;

    auto reply = QMessageBox::question(this, "Confirm Delete",
                                       QString("Are you sure you want to delete '%1' (ID: %2) and their attendance history? This action cannot be undone.")
                                           .arg(name, studentId),
                                       QMessageBox::Yes | QMessageBox::No);
    if (reply != QMessageBox::Yes) return;

    try {
        bool deleted = database->deleteStudent(studentId.toStdString());
        gallery->remove(studentId.toStdString());
        // Today's rows went with the student; the marked set must follow
        tracker->reload();
        updateMarkedCount();
        if (deleted) {
            QMessageBox::information(this, "Delete Student", QString("Student '%1' (ID: %2) deleted.").arg(name, studentId));
        } else {
            QMessageBox::warning(this, "Delete Student", QString("Student '%1' (ID: %2) no longer exists.").arg(name, studentId));
        }
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Delete Student", QString("Database Error: %1").arg(err.what()));
    }
    populateStudentTable();
    populateRecordsTable();
    populateSummaryTable();
}

void MainWindow::onEditStudentNameClicked()
{
    QString studentId, currentName;
    if (!database || !selectedStudent(studentId, currentName, "Edit Student Name")) return;

    bool ok;
    QString newName = QInputDialog::getText(this, "Edit Student Name",
                                            QString("Enter new name for %1 (ID: %2):").arg(currentName, studentId),
                                            QLineEdit::Normal, currentName, &ok).trimmed();
    if (!ok) return;
    if (newName.isEmpty()) {
        QMessageBox::warning(this, "Edit Student Name", "Student name cannot be empty.");
        return;
    }
    if (newName == currentName) {
        QMessageBox::information(this, "Edit Student Name", "Name not changed.");
        return;
    }

    try {
        if (database->renameStudent(studentId.toStdString(), newName.toStdString())) {
            gallery->rename(studentId.toStdString(), newName.toStdString());
            QMessageBox::information(this, "Edit Student Name",
                                     QString("Name for ID %1 updated from '%2' to '%3'.").arg(studentId, currentName, newName));
        } else {
            QMessageBox::warning(this, "Edit Student Name", QString("Student ID %1 no longer exists.").arg(studentId));
        }
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Edit Student Name", QString("Database Error: %1").arg(err.what()));
    }
    populateStudentTable();
}

void MainWindow::refreshStudentChoices()
{
    QString previous = recordStudentCombo->currentData().toString();
    QSignalBlocker blocker(recordStudentCombo);
    recordStudentCombo->clear();
    for (int row = 0; row < studentTableWidget->rowCount(); ++row) {
        QString id = studentTableWidget->item(row, 0)->text();
        QString name = studentTableWidget->item(row, 1)->text();
        recordStudentCombo->addItem(QString("%1 (%2)").arg(name, id), id);
    }
    int index = recordStudentCombo->findData(previous);
    if (index >= 0) recordStudentCombo->setCurrentIndex(index);
}

void MainWindow::onRecordFilterChanged(int index)
{
    recordDateEdit->setVisible(index == DateRecords);
    recordStudentCombo->setVisible(index == StudentRecords);
    populateRecordsTable();
}

RecordQuery MainWindow::currentRecordQuery() const
{
    RecordQuery query;
    query.newestFirst = true;
    switch (recordFilterCombo->currentIndex()) {
    case TodayRecords:
        query.date = QDate::currentDate().toString("yyyy-MM-dd").toStdString();
        break;
    case DateRecords:
        query.date = recordDateEdit->date().toString("yyyy-MM-dd").toStdString();
        break;
    case StudentRecords:
        query.studentId = recordStudentCombo->currentData().toString().toStdString();
        break;
    default:
        break;
    }
    return query;
}

void MainWindow::populateRecordsTable()
{
    if (!database) return;

    recordsTableWidget->setSortingEnabled(false);
    recordsTableWidget->setRowCount(0);

    if (recordFilterCombo->currentIndex() == StudentRecords && recordStudentCombo->count() == 0) {
        recordsTotalLabel->setText(tr("No students registered."));
        recordsStatsLabel->clear();
        return;
    }

    std::vector<AttendanceRecord> records;
    try {
        records = database->records(currentRecordQuery());
    } catch (const DatabaseError &err) {
        qWarning() << "Could not load attendance records:" << err.what();
        recordsTotalLabel->setText(tr("Could not load records: %1").arg(err.what()));
        return;
    }

    for (const auto &r : records) {
        int row = recordsTableWidget->rowCount();
        recordsTableWidget->insertRow(row);
        recordsTableWidget->setItem(row, 0, readOnlyItem(QString::fromStdString(r.name)));
        recordsTableWidget->setItem(row, 1, readOnlyItem(QString::fromStdString(r.studentId)));
        recordsTableWidget->setItem(row, 2, readOnlyItem(QString::fromStdString(r.date)));
        recordsTableWidget->setItem(row, 3, readOnlyItem(QString::fromStdString(r.time)));
    }
    recordsTableWidget->resizeColumnsToContents();
    recordsTableWidget->setSortingEnabled(true);

    if (records.empty()) {
        recordsTotalLabel->setText(tr("No attendance records found"));
        recordsStatsLabel->clear();
        return;
    }
    recordsTotalLabel->setText(tr("Total Records: %1").arg(records.size()));
    if (recordFilterCombo->currentIndex() != StudentRecords) {
        RecordStatistics stats = Reports::recordStatistics(records);
        recordsStatsLabel->setText(tr("Unique Students: %1    Days Recorded: %2    Total Records: %3")
                                       .arg(stats.uniqueStudents).arg(stats.daysRecorded).arg(stats.totalRecords));
    } else {
        recordsStatsLabel->clear();
    }
}

void MainWindow::populateSummaryTable()
{
    if (!database) return;

    summaryTableWidget->setSortingEnabled(false);
    summaryTableWidget->setRowCount(0);
    try {
        for (const auto &s : database->summary()) {
            int row = summaryTableWidget->rowCount();
            summaryTableWidget->insertRow(row);
            summaryTableWidget->setItem(row, 0, readOnlyItem(QString::fromStdString(s.name)));
            summaryTableWidget->setItem(row, 1, readOnlyItem(QString::fromStdString(s.studentId)));
            QTableWidgetItem *count = new QTableWidgetItem();
            count->setData(Qt::DisplayRole, s.totalPresent); // numeric sort
            count->setFlags(count->flags() & ~Qt::ItemIsEditable);
            summaryTableWidget->setItem(row, 2, count);
        }
    } catch (const DatabaseError &err) {
        qWarning() << "Could not load attendance summary:" << err.what();
    }
    summaryTableWidget->resizeColumnsToContents();
    summaryTableWidget->setSortingEnabled(true);
}

void MainWindow::onExportReport()
{
    if (!database) return;
    try {
        std::string path = Reports::exportTextReport(m_appConfig.attendanceDir, database->records(),
                                                     QDateTime::currentDateTime());
        if (path.empty()) {
            QMessageBox::warning(this, "Export Report", "No records to export, or the report could not be written.");
        } else {
            QMessageBox::information(this, "Export Report", QString("Report exported to: %1").arg(QString::fromStdString(path)));
        }
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Export Report", QString("Database Error: %1").arg(err.what()));
    }
}

void MainWindow::onExportCsv()
{
    if (!database) return;
    try {
        RecordQuery newestFirst;
        newestFirst.newestFirst = true;
        std::string path = Reports::exportCsvReport(m_appConfig.attendanceDir, database->records(newestFirst),
                                                    QDateTime::currentDateTime());
        if (path.empty()) {
            QMessageBox::warning(this, "Export CSV", "No records to export, or the file could not be written.");
        } else {
            QMessageBox::information(this, "Export CSV", QString("Report exported to: %1").arg(QString::fromStdString(path)));
        }
    } catch (const DatabaseError &err) {
        QMessageBox::critical(this, "Export CSV", QString("Database Error: %1").arg(err.what()));
    }
}
