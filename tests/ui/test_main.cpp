#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("pagetree");
    QCoreApplication::setOrganizationDomain("pagetree.app");
    QCoreApplication::setApplicationName("pagetree_ui_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/pagetree_ui_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);
    Catch::Session session;
    return session.run(argc, argv);
}
