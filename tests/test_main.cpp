// tests/test_main.cpp
#include <QGuiApplication>
#include <QtGlobal>
#include "gtest/gtest.h"

int main(int argc, char** argv)
{
    // Image decoding and QPainter need a Gui application, but never a display
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
