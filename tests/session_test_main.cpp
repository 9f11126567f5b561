#include <gtest/gtest.h>

#include <QtCore/QCoreApplication>

// QTimer and queued signals need an application object
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
