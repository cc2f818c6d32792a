#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

Q_LOGGING_CATEGORY(tabsyncStorageLog, "tabsync.storage", QtInfoMsg)

namespace tabsync {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fputs(bytes.constData(), stderr);
}

} // namespace

bool install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }

        QDir dir(QFileInfo(path).absolutePath());
        if (!dir.mkpath(QStringLiteral("."))) {
            return false;
        }

        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
    }

    qInstallMessageHandler(message_handler);
    return true;
}

void set_storage_debug_logging(bool enabled) {
    QLoggingCategory::setFilterRules(enabled
        ? QStringLiteral("tabsync.storage.debug=true\n")
        : QStringLiteral("tabsync.storage.debug=false\n"));
}

} // namespace tabsync
