#include "conversion_config.h"
#include "conversion_strategy.h"

#include <QSettings>
#include <algorithm>
#include <limits>

namespace {
constexpr int kMaxWorkers = 64;
constexpr int kMaxTimeoutSec = std::numeric_limits<int>::max() / 1000;

QStringList normalizedExtensions(const QStringList& in)
{
    QStringList out;
    for (QString e : in) {
        e = e.trimmed().toLower();
        while (e.startsWith('.')) e.remove(0, 1);
        if (!e.isEmpty() && !out.contains(e)) out << e;
    }
    return out;
}
}

ConversionSettings ConversionSettings::load(QSettings& s)
{
    ConversionSettings c;
    c.ffmpegPath = s.value("Tools/FfmpegPath", c.ffmpegPath).toString();
    c.ffprobePath = s.value("Tools/FfprobePath", c.ffprobePath).toString();
    c.workers = s.value("Convert/Workers", c.workers).toInt();
    c.preserveFormants = s.value("Convert/PreserveFormants", c.preserveFormants).toBool();
    c.mp3Codec = s.value("Convert/Mp3Codec", c.mp3Codec).toString();
    c.vbrQuality = s.value("Convert/VbrQuality", c.vbrQuality).toInt();
    c.suffix = s.value("Convert/Suffix", c.suffix).toString();
    c.extensions = s.value("Convert/Extensions", c.extensions).toStringList();
    c.batchSubdir = s.value("Convert/BatchSubdir", c.batchSubdir).toString();
    c.jobTimeoutSec = s.value("Convert/JobTimeoutSec", c.jobTimeoutSec).toInt();
    c.probeTimeoutSec = s.value("Convert/ProbeTimeoutSec", c.probeTimeoutSec).toInt();
    c.logFile = s.value("Log/File", c.logFile).toString();
    return c;
}

void ConversionSettings::save(QSettings& s) const
{
    s.setValue("Tools/FfmpegPath", ffmpegPath);
    s.setValue("Tools/FfprobePath", ffprobePath);
    s.setValue("Convert/Workers", workers);
    s.setValue("Convert/PreserveFormants", preserveFormants);
    s.setValue("Convert/Mp3Codec", mp3Codec);
    s.setValue("Convert/VbrQuality", vbrQuality);
    s.setValue("Convert/Suffix", suffix);
    s.setValue("Convert/Extensions", extensions);
    s.setValue("Convert/BatchSubdir", batchSubdir);
    s.setValue("Convert/JobTimeoutSec", jobTimeoutSec);
    s.setValue("Convert/ProbeTimeoutSec", probeTimeoutSec);
    s.setValue("Log/File", logFile);
}

int ConversionSettings::jobTimeoutMs() const
{
    return std::clamp(jobTimeoutSec, 0, kMaxTimeoutSec) * 1000;
}

int ConversionSettings::probeTimeoutMs() const
{
    return std::clamp(probeTimeoutSec, 1, kMaxTimeoutSec) * 1000;
}

ConversionConfig::ConversionConfig(const ConversionSettings& settings, const ToolCapabilities& caps)
    : m_tools(caps)
    , m_strategy(Strategy::select(caps))
    , m_ratio(Pitch::standard())
    , m_preserveFormants(settings.preserveFormants)
    , m_mp3Codec(settings.mp3Codec.isEmpty() ? QStringLiteral("libmp3lame") : settings.mp3Codec)
    , m_vbrQuality(std::clamp(settings.vbrQuality, 0, 9))
    , m_suffix(settings.suffix.isEmpty() ? QStringLiteral("_432hz") : settings.suffix)
    , m_extensions(normalizedExtensions(settings.extensions))
    , m_batchSubdir(settings.batchSubdir.isEmpty() ? QStringLiteral("432hz") : settings.batchSubdir)
    , m_workers(std::clamp(settings.workers, 1, kMaxWorkers))
    , m_jobTimeoutMs(settings.jobTimeoutMs())
    , m_probeTimeoutMs(settings.probeTimeoutMs())
{
    if (m_extensions.isEmpty()) m_extensions << "mp3";
}

bool ConversionConfig::isExtensionEligible(const QString& suffix) const
{
    return m_extensions.contains(suffix.toLower());
}
