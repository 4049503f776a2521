#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "audio_probe.h"
#include "conversion_types.h"

struct VerificationCheck {
    QString label;
    bool passed = false;
    QString detail;
};

struct VerificationReport {
    ErrorKind error = ErrorKind::None;   // SameFileSelected/IdenticalFiles/InputNotFound/ToolNotFound
    QString message;                     // human-readable reason when error is set
    QVector<VerificationCheck> checks;   // in evaluation order
    bool allPassed = false;
    QStringList warnings;
    double durationRatio = 0.0;          // converted / original, 0 when undetermined
    MediaInfo::AudioMetadata original;
    MediaInfo::AudioMetadata converted;
    QString originalPath;
    QString convertedPath;
    QString pitchInfo;

    bool hasError() const { return error != ErrorKind::None; }
    const VerificationCheck* check(const QString& label) const;

    QString toText() const;
    QJsonObject toJson() const;
};

// Compares an original file with its converted counterpart through ffprobe metadata.
class VerificationEngine {
public:
    explicit VerificationEngine(const QString& ffprobePath,
                                int probeTimeoutMs = MediaInfo::kDefaultProbeTimeoutMs);

    VerificationReport verify(const QString& originalPath, const QString& convertedPath) const;

    // Pure check evaluation over already extracted metadata
    static VerificationReport evaluate(const MediaInfo::AudioMetadata& original,
                                       const MediaInfo::AudioMetadata& converted);

    // Reference note table for the 440 -> 432 shift
    static QString pitchShiftNote();

private:
    QString m_ffprobe;
    int m_timeoutMs;
};
