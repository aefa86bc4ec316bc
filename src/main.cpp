// src/main.cpp
#include <QApplication>
#include "MainWindow.hpp"
#include "config.h"

int main(int argc, char *argv[]) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss} [%{type}] %{message}");

    QApplication app(argc, argv);
    app.setOrganizationName(kSettingsOrganization);
    app.setApplicationName(kSettingsApplication);

    AppConfig config;
    config.loadInitialConfig();

    MainWindow w(config);
    w.show();
    return app.exec();
}
