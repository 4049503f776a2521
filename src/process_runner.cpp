#include "process_runner.h"

#include <QProcess>
#include <QElapsedTimer>
#include <QDebug>

namespace {
constexpr int kStartTimeoutMs = 10000;
constexpr int kPollIntervalMs = 100;
constexpr int kKillGraceMs = 3000;
}

QString ProcessOutcome::diagnosticExcerpt(int maxChars) const
{
    QString text;
    if (!started) {
        text = errorString.isEmpty() ? QStringLiteral("failed to start") : errorString;
    } else if (cancelled) {
        text = QStringLiteral("cancelled");
    } else if (timedOut) {
        text = QString("timed out after %1 s").arg(elapsedMs / 1000);
    } else {
        text = QString::fromUtf8(stdErr).trimmed();
        if (text.isEmpty()) text = QString::fromUtf8(stdOut).trimmed();
        if (text.isEmpty() && crashed) text = QStringLiteral("process crashed");
        if (text.isEmpty()) text = QString("exit code %1").arg(exitCode);
    }
    // ffmpeg prints the actual error last; keep the tail, marker included in maxChars
    text = text.simplified();
    if (maxChars > 3 && text.size() > maxChars) text = QStringLiteral("...") + text.right(maxChars - 3);
    return text;
}

namespace ProcessRunner {

ProcessOutcome run(const QString& program, const QStringList& args, int timeoutMs,
                   const std::atomic_bool* cancel)
{
    ProcessOutcome out;
    if (cancel && cancel->load()) {
        out.cancelled = true;
        return out;
    }

    QProcess p;
    p.setProgram(program);
    p.setArguments(args);
    p.setProcessChannelMode(QProcess::SeparateChannels);

    QElapsedTimer timer;
    timer.start();
    p.start();
    if (!p.waitForStarted(kStartTimeoutMs)) {
        out.errorString = p.errorString();
        out.elapsedMs = timer.elapsed();
        qWarning() << "[ProcessRunner] failed to start" << program << ":" << out.errorString;
        return out;
    }
    out.started = true;

    while (!p.waitForFinished(kPollIntervalMs)) {
        if (p.state() == QProcess::NotRunning) break;
        if (cancel && cancel->load()) { out.cancelled = true; break; }
        if (timeoutMs > 0 && timer.elapsed() >= timeoutMs) { out.timedOut = true; break; }
    }

    if (out.cancelled || out.timedOut) {
        p.kill();
        if (!p.waitForFinished(kKillGraceMs)) {
            qWarning() << "[ProcessRunner] child did not exit after kill:" << program;
        }
    }

    out.stdOut = p.readAllStandardOutput();
    out.stdErr = p.readAllStandardError();
    out.elapsedMs = timer.elapsed();
    out.crashed = !out.cancelled && !out.timedOut && p.exitStatus() == QProcess::CrashExit;
    out.exitCode = p.exitCode();
    return out;
}

} // namespace ProcessRunner
