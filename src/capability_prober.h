#pragma once
#include <QString>
#include <QStringList>

struct ToolCapabilities {
    QString ffmpegPath;      // absolute path, empty when not found
    QString ffprobePath;     // absolute path, empty when not found
    bool hasRubberband = false;

    bool ffmpegFound() const { return !ffmpegPath.isEmpty(); }
    bool ffprobeFound() const { return !ffprobePath.isEmpty(); }
};

// Resolves ffmpeg/ffprobe and checks whether ffmpeg was built with the rubberband filter.
// Search order for each tool: configured path, sibling of ffmpeg (ffprobe only), PATH,
// then the well-known installation directories.
class CapabilityProber {
public:
    CapabilityProber();

    void setConfiguredFfmpeg(const QString& path) { m_configuredFfmpeg = path; }
    void setConfiguredFfprobe(const QString& path) { m_configuredFfprobe = path; }
    void setSearchDirectories(const QStringList& dirs) { m_searchDirs = dirs; }
    void setTimeoutMs(int ms) { m_timeoutMs = ms; }

    ToolCapabilities probe() const;

    QString locateFfmpeg() const;
    QString locateFfprobe(const QString& ffmpegPath) const;

    // Runs "<ffmpeg> -hide_banner -filters" and looks for filterName
    bool hasFilter(const QString& ffmpegPath, const QString& filterName) const;

    // Matches the filter name column of "ffmpeg -filters" output
    static bool filterListContains(const QString& filtersOutput, const QString& filterName);

    static QStringList wellKnownDirectories();

private:
    QString locate(const QString& name, const QString& configured, const QStringList& preferredDirs) const;

    QString m_configuredFfmpeg;
    QString m_configuredFfprobe;
    QStringList m_searchDirs;
    int m_timeoutMs = 15000;
};
