#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <atomic>

class LogManager : public QObject {
    Q_OBJECT
public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;

    // Opens (appends to) the persistent log file; empty path = <AppDataLocation>/retune432.log
    bool open(const QString& path = QString());
    QString filePath() const;

    // Routes qDebug/qWarning/qCritical into the log and mirrors them to stderr.
    // Returns the previously installed handler.
    QtMessageHandler installMessageHandler();

    void setDebugEnabled(bool on) { m_debugEnabled = on; }
    bool debugEnabled() const { return m_debugEnabled; }

    void setEchoToStderr(bool on) { m_echo = on; }
    bool echoToStderr() const { return m_echo; }

    // Thread-safe; may be called from worker threads
    void addLog(const QString& message, const QString& level = "INFO");
    void clear();
    void flush();

signals:
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    bool shouldFlushImmediately(const QString& level) const;

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    int m_unflushed = 0;
    std::atomic_bool m_debugEnabled{false};
    std::atomic_bool m_echo{true};
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_EVERY = 20;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
