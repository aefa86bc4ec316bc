// include/MainWindow.hpp
#pragma once

#include <QMainWindow>
#include <QImage>
#include <QRect>
#include <QCamera>
#include <QMediaCaptureSession>
#include <QVideoSink>
#include <memory>
#include <string>
#include <vector>
#include "config.h"
#include "AttendanceCsv.hpp"
#include "AttendanceDatabase.hpp"
#include "AttendanceTracker.hpp"
#include "FaceAnalyzer.hpp"
#include "FaceGallery.hpp"
#include "RegistrationService.hpp"

class QAction;
class QComboBox;
class QDateEdit;
class QLabel;
class QLineEdit;
class QMenu;
class QPushButton;
class QTabWidget;
class QTableWidget;

QT_BEGIN_NAMESPACE
namespace Ui
{
    class MainWindow;
}
QT_END_NAMESPACE

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const AppConfig &config, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    void onVideoFrame(const QVideoFrame &frame);
    void onStartCamera();
    void onStopCamera();
    void onRegisterFace();
    void onBrowsePhoto();
    void onRegisterStudent();
    void openSettingsDialog();
    void populateStudentTable();
    void onDeleteStudentClicked();
    void onEditStudentNameClicked();
    void onRecordFilterChanged(int index);
    void populateRecordsTable();
    void populateSummaryTable();
    void onExportReport();
    void onExportCsv();

private:
    Ui::MainWindow *ui;
    AppConfig m_appConfig;

    std::unique_ptr<AttendanceDatabase> database;
    std::unique_ptr<AttendanceCsv> attendanceCsv;
    std::unique_ptr<AttendanceTracker> tracker;
    std::unique_ptr<FaceAnalyzer> analyzer;     // null when the models failed to load
    std::unique_ptr<FaceGallery> gallery;
    std::unique_ptr<RegistrationService> registration;

    QTabWidget *mainTabWidget = nullptr;
    QMenu *fileMenu = nullptr;
    QAction *settingsAction = nullptr;

    // Register Student tab
    QLineEdit *studentIdEdit = nullptr;
    QLineEdit *studentNameEdit = nullptr;
    QLineEdit *photoPathEdit = nullptr;
    QLabel *photoPreviewLabel = nullptr;
    QPushButton *registerStudentButton = nullptr;

    // Students tab
    QTableWidget *studentTableWidget = nullptr;

    // Attendance Records tab
    QComboBox *recordFilterCombo = nullptr;
    QDateEdit *recordDateEdit = nullptr;
    QComboBox *recordStudentCombo = nullptr;
    QTableWidget *recordsTableWidget = nullptr;
    QLabel *recordsTotalLabel = nullptr;
    QLabel *recordsStatsLabel = nullptr;
    QTableWidget *summaryTableWidget = nullptr;

    QCamera *camera = nullptr;
    QMediaCaptureSession *captureSession = nullptr;
    QVideoSink *videoSink = nullptr;
    QImage lastFrame;

    struct CachedFace {
        QRect box;
        std::string studentId;
        std::string name;
        bool recognized = false;
        float distance = 0.0f;
        float conf = 0.0f;
        int ttl = 0; // frames left
    };

    int frameCount = 0;
    static constexpr int kFrameSkip = 3; // run the models every 3rd frame
    static constexpr int kCacheTTL = 3;  // frames a detection stays drawn
    static constexpr int kDefaultEmbeddingDim = 512;
    std::vector<CachedFace> faceCache;

    void buildRegisterTab();
    void buildStudentsTab();
    void buildRecordsTab();
    void initPipeline();
    void refreshStudentChoices();
    void appendStatus(const QString &line);
    void updateMarkedCount();
    bool selectedStudent(QString &studentId, QString &name, const QString &title);
    RecordQuery currentRecordQuery() const;
};
