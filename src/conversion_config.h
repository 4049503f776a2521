#pragma once
#include <QString>
#include <QStringList>
#include "capability_prober.h"
#include "conversion_types.h"

class QSettings;

// User-adjustable values, persisted with QSettings and overridable from the command line
struct ConversionSettings {
    QString ffmpegPath;                 // empty = auto-detect
    QString ffprobePath;                // empty = auto-detect
    int workers = 4;
    bool preserveFormants = true;
    QString mp3Codec = "libmp3lame";
    int vbrQuality = 0;
    QString suffix = "_432hz";
    QStringList extensions = {"mp3", "flac", "ogg", "opus", "m4a", "wav"};
    QString batchSubdir = "432hz";
    int jobTimeoutSec = 600;
    int probeTimeoutSec = 30;
    QString logFile;                    // empty = app data location

    // Timeouts in milliseconds; seconds are clamped so the product fits an int
    int jobTimeoutMs() const;           // 0 = no limit
    int probeTimeoutMs() const;         // at least one second

    static ConversionSettings load(QSettings& s);
    void save(QSettings& s) const;
};

// Resolved, immutable configuration handed to every component at startup
class ConversionConfig {
public:
    ConversionConfig(const ConversionSettings& settings, const ToolCapabilities& caps);

    const ToolCapabilities& tools() const { return m_tools; }
    const QString& ffmpegPath() const { return m_tools.ffmpegPath; }
    const QString& ffprobePath() const { return m_tools.ffprobePath; }
    ConversionStrategy strategy() const { return m_strategy; }
    Pitch::Ratio ratio() const { return m_ratio; }
    bool preserveFormants() const { return m_preserveFormants; }
    const QString& mp3Codec() const { return m_mp3Codec; }
    int vbrQuality() const { return m_vbrQuality; }
    const QString& suffix() const { return m_suffix; }
    const QStringList& extensions() const { return m_extensions; }
    const QString& batchSubdir() const { return m_batchSubdir; }
    int workers() const { return m_workers; }
    int jobTimeoutMs() const { return m_jobTimeoutMs; }
    int probeTimeoutMs() const { return m_probeTimeoutMs; }

    bool isExtensionEligible(const QString& suffix) const;

private:
    ToolCapabilities m_tools;
    ConversionStrategy m_strategy;
    Pitch::Ratio m_ratio;
    bool m_preserveFormants;
    QString m_mp3Codec;
    int m_vbrQuality;
    QString m_suffix;
    QStringList m_extensions;
    QString m_batchSubdir;
    int m_workers;
    int m_jobTimeoutMs;
    int m_probeTimeoutMs;
};
