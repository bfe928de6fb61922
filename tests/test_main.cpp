#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QStandardPaths>

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QStandardPaths::setTestModeEnabled(true);
    QLoggingCategory::setFilterRules("*.debug=false\n*.info=false");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
