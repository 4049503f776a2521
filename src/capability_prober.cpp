#include "capability_prober.h"
#include "process_runner.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>

CapabilityProber::CapabilityProber()
    : m_searchDirs(wellKnownDirectories())
{
}

QStringList CapabilityProber::wellKnownDirectories()
{
    QStringList dirs;
    const QString root = qEnvironmentVariable("FFMPEG_ROOT");
    if (!root.isEmpty()) {
        dirs << QDir(root).filePath("bin") << root;
    }
    if (QCoreApplication::instance()) {
        dirs << QCoreApplication::applicationDirPath();
    }
    const QString home = QDir::homePath();
    dirs << QDir(home).filePath(".spotdl")
         << QDir(home).filePath("AppData/Local/spotdl");
#ifdef Q_OS_WIN
    dirs << "C:/ffmpeg/bin"
         << "C:/Program Files/ffmpeg/bin"
         << "C:/Program Files (x86)/ffmpeg/bin"
         << "C:/ProgramData/chocolatey/bin"
         << QDir(home).filePath("AppData/Local/Programs/ffmpeg/bin")
         << QDir(home).filePath("scoop/apps/ffmpeg/current/bin");
#else
    dirs << QDir(home).filePath(".local/bin")
         << "/usr/local/bin"
         << "/usr/bin"
         << "/opt/homebrew/bin"
         << "/opt/local/bin"
         << "/snap/bin";
#endif
    return dirs;
}

QString CapabilityProber::locate(const QString& name, const QString& configured, const QStringList& preferredDirs) const
{
    if (!configured.isEmpty()) {
        const QFileInfo fi(configured);
        if (fi.exists() && fi.isFile() && fi.isExecutable()) return fi.absoluteFilePath();
        // Bare program names in the config are looked up on PATH
        const QString onPath = QStandardPaths::findExecutable(configured);
        if (!onPath.isEmpty()) return QFileInfo(onPath).absoluteFilePath();
        qWarning() << "[CapabilityProber] configured" << name << "is not executable:" << configured;
    }

    if (!preferredDirs.isEmpty()) {
        const QString found = QStandardPaths::findExecutable(name, preferredDirs);
        if (!found.isEmpty()) return QFileInfo(found).absoluteFilePath();
    }

    const QString onPath = QStandardPaths::findExecutable(name);
    if (!onPath.isEmpty()) return QFileInfo(onPath).absoluteFilePath();

    if (!m_searchDirs.isEmpty()) {
        const QString found = QStandardPaths::findExecutable(name, m_searchDirs);
        if (!found.isEmpty()) return QFileInfo(found).absoluteFilePath();
    }
    return QString();
}

QString CapabilityProber::locateFfmpeg() const
{
    return locate(QStringLiteral("ffmpeg"), m_configuredFfmpeg, QStringList());
}

QString CapabilityProber::locateFfprobe(const QString& ffmpegPath) const
{
    QStringList sibling;
    if (!ffmpegPath.isEmpty()) sibling << QFileInfo(ffmpegPath).absolutePath();
    return locate(QStringLiteral("ffprobe"), m_configuredFfprobe, sibling);
}

bool CapabilityProber::filterListContains(const QString& filtersOutput, const QString& filterName)
{
    // Rows look like " TSC rubberband        A->A       Apply time-stretching and pitch-shifting."
    const QStringList lines = filtersOutput.split('\n');
    for (const QString& line : lines) {
        const QStringList cols = line.simplified().split(' ', Qt::SkipEmptyParts);
        if (cols.size() >= 2 && cols.at(1) == filterName) return true;
        if (!cols.isEmpty() && cols.at(0) == filterName) return true;
    }
    return false;
}

bool CapabilityProber::hasFilter(const QString& ffmpegPath, const QString& filterName) const
{
    if (ffmpegPath.isEmpty()) return false;
    const ProcessOutcome out = ProcessRunner::run(ffmpegPath, {"-hide_banner", "-filters"}, m_timeoutMs);
    if (!out.ok()) {
        qWarning() << "[CapabilityProber] filter query failed:" << out.diagnosticExcerpt(200);
        return false;
    }
    return filterListContains(QString::fromUtf8(out.stdOut), filterName);
}

ToolCapabilities CapabilityProber::probe() const
{
    ToolCapabilities caps;
    caps.ffmpegPath = locateFfmpeg();
    caps.ffprobePath = locateFfprobe(caps.ffmpegPath);
    if (caps.ffmpegFound()) {
        caps.hasRubberband = hasFilter(caps.ffmpegPath, QStringLiteral("rubberband"));
    }
    qDebug() << "[CapabilityProber] ffmpeg=" << caps.ffmpegPath
             << "ffprobe=" << caps.ffprobePath
             << "rubberband=" << caps.hasRubberband;
    return caps;
}
