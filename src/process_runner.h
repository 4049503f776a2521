#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <atomic>

struct ProcessOutcome {
    bool started = false;
    bool timedOut = false;
    bool cancelled = false;
    bool crashed = false;
    int exitCode = -1;
    qint64 elapsedMs = 0;
    QByteArray stdOut;
    QByteArray stdErr;
    QString errorString;   // QProcess error when the program could not be started

    bool ok() const { return started && !timedOut && !cancelled && !crashed && exitCode == 0; }

    // Tail of stderr (or the start/timeout reason) capped at maxChars, for user-facing messages
    QString diagnosticExcerpt(int maxChars = 300) const;
};

// Synchronous QProcess execution usable from worker threads (no event loop required).
// Polls the cancel flag while waiting and kills the child when it is raised or when
// timeoutMs (<= 0 means no limit) elapses.
namespace ProcessRunner {

ProcessOutcome run(const QString& program, const QStringList& args, int timeoutMs,
                   const std::atomic_bool* cancel = nullptr);

}
