#include "core/logging.hpp"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lumenDiscoveryLog, "lumen.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(lumenConnectionLog, "lumen.connection", QtInfoMsg)

namespace lumen {
namespace {

constexpr QLatin1String kOwnPrefix("lumen.");

QLatin1String level_name(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return QLatin1String("debug");
        case QtInfoMsg: return QLatin1String("info");
        case QtWarningMsg: return QLatin1String("warning");
        case QtCriticalMsg: return QLatin1String("critical");
        case QtFatalMsg: return QLatin1String("fatal");
    }
    return QLatin1String("unknown");
}

class LogSink {
public:
    void reset(const QString& path) {
        QMutexLocker lock(&mutex_);
        clock_.start();
        if (file_.isOpen()) {
            file_.close();
        }
        if (path.isEmpty()) {
            return;
        }

        QDir().mkpath(QFileInfo(path).absolutePath());
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "lumen: cannot open log file %s: %s\n",
                         qPrintable(path), qPrintable(file_.errorString()));
        }
    }

    void write(QtMsgType type, const char* category, const QString& message) {
        QMutexLocker lock(&mutex_);
        const auto elapsed = clock_.isValid() ? clock_.elapsed() : 0;
        const auto bytes = format_log_line(type, category, message, elapsed).toUtf8();

        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
        if (file_.isOpen()) {
            file_.write(bytes);
            file_.flush();
        }
    }

private:
    QMutex mutex_;
    QFile file_;
    QElapsedTimer clock_;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    sink().write(type, ctx.category, msg);
}

} // namespace

QString format_log_line(QtMsgType type,
                        const char* category,
                        const QString& message,
                        qint64 elapsed_ms) {
    auto name = category ? QString::fromLatin1(category) : QStringLiteral("default");
    if (name.startsWith(kOwnPrefix)) {
        name.remove(0, kOwnPrefix.size());
    }
    return QStringLiteral("+%1ms %2 %3: %4\n")
        .arg(elapsed_ms, 6)
        .arg(QString(level_name(type)), name, message);
}

void install_log_handler() {
    sink().reset(log_file_path());
    qInstallMessageHandler(message_handler);
    if (qEnvironmentVariableIntValue("LUMEN_DEBUG_DISCOVERY") != 0) {
        enable_debug_logging();
    }
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("lumen.*.debug=true\n"));
}

QString log_file_path() {
    return qEnvironmentVariable("LUMEN_LOG_FILE");
}

} // namespace lumen
