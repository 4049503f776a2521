#pragma once
#include <QString>
#include <QStringList>
#include "conversion_types.h"
#include "capability_prober.h"

namespace Strategy {

// Sample rate assumed when the source rate cannot be probed
constexpr int kDefaultSampleRate = 44100;

// HighQuality when ffmpeg has rubberband, Fallback otherwise
ConversionStrategy select(const ToolCapabilities& caps);

ConversionStrategy other(ConversionStrategy s);

QString name(ConversionStrategy s);    // "rubberband" / "asetrate"
QString label(ConversionStrategy s);   // "HighQuality" / "Fallback"

// rubberband=pitch=<ratio>[:formant=preserved]
QString highQualityFilter(const Pitch::Ratio& ratio, bool preserveFormants);

// asetrate=<rate>*<ratio>,aresample=<rate>:resampler=soxr...,atempo=<1/ratio>
QString fallbackFilter(const Pitch::Ratio& ratio, int sourceRate);

QString filterGraph(ConversionStrategy s, const Pitch::Ratio& ratio, bool preserveFormants, int sourceRate);

// Encoder arguments for the output container. MP3 gets "-acodec <mp3Codec> -q:a <vbrQuality>".
QStringList encoderArguments(const QString& outputPath, const QString& mp3Codec, int vbrQuality);

} // namespace Strategy
