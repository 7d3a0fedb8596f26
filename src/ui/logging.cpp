#include "ui/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

namespace pagetree::ui {

Q_LOGGING_CATEGORY(lcTree, "pagetree.tree")
Q_LOGGING_CATEGORY(lcHistory, "pagetree.history")
Q_LOGGING_CATEGORY(lcStorage, "pagetree.storage")

namespace {

constexpr auto kLogFileName = "logs/pagetree.log";

/**
 * LogSink - the log file, opened on first write. A file that cannot be
 * created is not retried; messages then only reach the chained handler.
 */
class LogSink {
public:
    void append(QtMsgType type, const char* category, const QString& msg) {
        QMutexLocker lock(&mutex_);
        if (!attempted_) {
            attempted_ = true;
            open();
        }
        if (!file_.isOpen()) return;

        QByteArray line = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toUtf8();
        line += ' ';
        line += severity(type);
        line += ' ';
        line += category ? category : "default";
        line += ' ';
        line += msg.toUtf8();
        line += '\n';
        file_.write(line);
        file_.flush();
    }

    QtMessageHandler chained = nullptr;

private:
    QMutex mutex_;
    QFile file_;
    bool attempted_ = false;

    void open() {
        const auto path = default_log_file_path();
        if (path.isEmpty() || !QFileInfo(path).dir().mkpath(QStringLiteral("."))) return;
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            file_.setFileName(QString{});
        }
    }

    static char severity(QtMsgType type) {
        switch (type) {
            case QtDebugMsg: return 'D';
            case QtInfoMsg: return 'I';
            case QtWarningMsg: return 'W';
            case QtCriticalMsg: return 'C';
            case QtFatalMsg: return 'F';
        }
        return '?';
    }
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

void write_to_sink(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    s.append(type, ctx.category, msg);
    // Warnings and worse still reach the console.
    if (type != QtDebugMsg && type != QtInfoMsg && s.chained) {
        s.chained(type, ctx, msg);
    }
}

} // namespace

void install_file_logging() {
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    const auto previous = qInstallMessageHandler(write_to_sink);
    if (previous != write_to_sink) sink().chained = previous;
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) return QString{};
    return QDir(base).filePath(QString::fromLatin1(kLogFileName));
}

} // namespace pagetree::ui
