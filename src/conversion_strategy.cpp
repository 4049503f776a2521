#include "conversion_strategy.h"

#include <QFileInfo>

namespace Strategy {

ConversionStrategy select(const ToolCapabilities& caps)
{
    return caps.hasRubberband ? ConversionStrategy::HighQuality : ConversionStrategy::Fallback;
}

ConversionStrategy other(ConversionStrategy s)
{
    return s == ConversionStrategy::HighQuality ? ConversionStrategy::Fallback : ConversionStrategy::HighQuality;
}

QString name(ConversionStrategy s)
{
    return s == ConversionStrategy::HighQuality ? QStringLiteral("rubberband") : QStringLiteral("asetrate");
}

QString label(ConversionStrategy s)
{
    return s == ConversionStrategy::HighQuality ? QStringLiteral("HighQuality") : QStringLiteral("Fallback");
}

QString highQualityFilter(const Pitch::Ratio& ratio, bool preserveFormants)
{
    QString f = QString("rubberband=pitch=%1").arg(Pitch::format(ratio.value()));
    if (preserveFormants) f += QStringLiteral(":formant=preserved");
    return f;
}

QString fallbackFilter(const Pitch::Ratio& ratio, int sourceRate)
{
    const int rate = sourceRate > 0 ? sourceRate : kDefaultSampleRate;
    // asetrate lowers pitch and slows playback by the same factor; atempo undoes the slowdown
    return QString("asetrate=%1*%2,"
                   "aresample=%1:resampler=soxr:precision=28:cutoff=1:dither_method=triangular,"
                   "atempo=%3")
        .arg(rate)
        .arg(Pitch::format(ratio.value()))
        .arg(Pitch::format(ratio.tempoCompensation()));
}

QString filterGraph(ConversionStrategy s, const Pitch::Ratio& ratio, bool preserveFormants, int sourceRate)
{
    return s == ConversionStrategy::HighQuality ? highQualityFilter(ratio, preserveFormants)
                                                : fallbackFilter(ratio, sourceRate);
}

QStringList encoderArguments(const QString& outputPath, const QString& mp3Codec, int vbrQuality)
{
    const QString ext = QFileInfo(outputPath).suffix().toLower();
    if (ext == "flac") return {"-acodec", "flac"};
    if (ext == "wav") return {"-acodec", "pcm_s16le"};
    if (ext == "ogg") return {"-acodec", "libvorbis", "-q:a", "10"};
    if (ext == "opus") return {"-acodec", "libopus", "-b:a", "256k"};
    if (ext == "m4a") return {"-acodec", "aac", "-b:a", "320k"};
    return {"-acodec", mp3Codec.isEmpty() ? QStringLiteral("libmp3lame") : mp3Codec,
            "-q:a", QString::number(vbrQuality)};
}

} // namespace Strategy
