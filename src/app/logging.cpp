#include "app/logging.hpp"

#include "app/config.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

namespace tether {

Q_LOGGING_CATEGORY(tetherContextLog, "tether.context")
Q_LOGGING_CATEGORY(tetherStoreLog, "tether.store")
Q_LOGGING_CATEGORY(tetherBusLog, "tether.bus")
Q_LOGGING_CATEGORY(tetherRepositoryLog, "tether.repository")

namespace app {
namespace {

char level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

/**
 * LogSink - The file the handler appends to. Opened lazily on the first
 * message so that installing the handler never touches the disk.
 */
struct LogSink {
    QMutex mu;
    QFile file;
    QString path;
    bool opened = false;

    void reset(QString next) {
        if (file.isOpen()) file.close();
        path = std::move(next);
        opened = false;
    }

    void open_once() {
        if (opened) return;
        opened = true;
        if (path.isEmpty()) return;

        QDir().mkpath(QFileInfo(path).absolutePath());
        file.setFileName(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "tether: cannot open log file %s\n", qPrintable(path));
        }
    }
};

LogSink& sink() {
    static LogSink s;
    return s;
}

QString format_line(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
             QString(QLatin1Char(level_tag(type))),
             ctx.category ? QString::fromLatin1(ctx.category) : QString{},
             msg);
}

void write_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto line = format_line(type, ctx, msg);

    auto& s = sink();
    QMutexLocker lock(&s.mu);
    s.open_once();
    if (!s.file.isOpen()) {
        std::fputs(qPrintable(line), stderr);
        return;
    }
    s.file.write(line.toUtf8());
    s.file.flush();
}

} // namespace

void install_file_logging(const QString& path) {
    {
        auto& s = sink();
        QMutexLocker lock(&s.mu);
        s.reset(path.isEmpty() ? default_log_file_path() : path);
    }
    qInstallMessageHandler(write_message);
}

void configure_logging(const StoreConfig& config) {
    if (config.log_file_path.isEmpty()) {
        qInstallMessageHandler(nullptr);
        return;
    }
    install_file_logging(config.log_file_path);
    qCInfo(tetherStoreLog) << "logging to" << config.log_file_path;
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) return QString{};
    return QDir(base).filePath(QStringLiteral("logs/tether.log"));
}

} // namespace app
} // namespace tether
