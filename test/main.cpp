#include <gtest/gtest.h>

#include <QCoreApplication>

// QtSql loads the SQLite driver as a plugin; that needs an application object.
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
