#include "log_manager.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QStandardPaths>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_debugEnabled = qEnvironmentVariableIsSet("RETUNE432_DEBUG");
}

LogManager::~LogManager() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
    }
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

QString LogManager::filePath() const {
    QMutexLocker locker(&m_mutex);
    return m_file.fileName();
}

bool LogManager::open(const QString& path) {
    QString target = path;
    if (target.isEmpty()) {
        const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        target = QDir(dir).filePath("retune432.log");
    }
    QDir().mkpath(QFileInfo(target).absolutePath());

    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();

    m_file.setFileName(target);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "[LogManager] cannot open log file %s: %s\n",
                target.toLocal8Bit().constData(), m_file.errorString().toLocal8Bit().constData());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    m_unflushed = 0;
    return true;
}

QtMessageHandler LogManager::installMessageHandler() {
    return qInstallMessageHandler(customMessageHandler);
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk; warnings and errors hit the disk right away
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            if (shouldFlushImmediately(level) || ++m_unflushed >= FLUSH_EVERY) {
                m_ts.flush();
                m_unflushed = 0;
            }
        }
    } // unlock before emitting

    emit logAdded(logEntry);
}

void LogManager::flush() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
        m_unflushed = 0;
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    LogManager& lm = LogManager::instance();
    QString level;
    switch (type) {
        case QtDebugMsg:
            if (!lm.debugEnabled()) return;
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    lm.addLog(msg, level);

    if (lm.echoToStderr()) {
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        fprintf(stderr, "[%s] [%s] %s\n",
                timestamp.toLocal8Bit().constData(),
                level.toLocal8Bit().constData(),
                msg.toLocal8Bit().constData());
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        lm.flush();
        abort();
    }
}
