#include <catch2/catch_test_macros.hpp>

#include <QDateTime>
#include <QFile>
#include <QStringList>

#include "ui/logging.hpp"

using namespace pagetree::ui;

namespace {

QStringList console_lines;

void capture_console(QtMsgType, const QMessageLogContext&, const QString& msg) {
    console_lines.append(msg);
}

} // namespace

TEST_CASE("Logging: log file lives under the app data directory", "[ui][logging]") {
    const auto path = default_log_file_path();

    REQUIRE_FALSE(path.isEmpty());
    REQUIRE(path.endsWith(QStringLiteral("logs/pagetree.log")));
}

TEST_CASE("Logging: category messages reach the log file", "[ui][logging]") {
    const auto marker = QStringLiteral("log-check-%1").arg(QDateTime::currentMSecsSinceEpoch());

    install_file_logging();
    qCWarning(lcHistory) << marker;
    qInstallMessageHandler(nullptr);

    QFile file(default_log_file_path());
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());

    REQUIRE(contents.contains(marker));
    REQUIRE(contents.contains(QStringLiteral(" W pagetree.history ")));
}

TEST_CASE("Logging: warnings still reach the previous handler", "[ui][logging]") {
    console_lines.clear();
    const auto stamp = QDateTime::currentMSecsSinceEpoch();
    const auto warning = QStringLiteral("chained-warning-%1").arg(stamp);
    const auto info = QStringLiteral("chained-info-%1").arg(stamp);

    qInstallMessageHandler(capture_console);
    install_file_logging();
    qCWarning(lcStorage) << warning;
    qCInfo(lcStorage) << info;
    qInstallMessageHandler(nullptr);

    REQUIRE(console_lines.size() == 1);
    REQUIRE(console_lines.front().contains(warning));

    QFile file(default_log_file_path());
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());
    REQUIRE(contents.contains(warning));
    REQUIRE(contents.contains(info));
}
