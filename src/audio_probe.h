#pragma once
#include <QString>
#include <QByteArray>

namespace MediaInfo {
struct AudioMetadata {
    double durationSec = 0.0;  // 0 = undetermined
    int sampleRate = 0;        // Hz, 0 = undetermined
    int channels = 0;
    int bitrateKbps = 0;
    QString codec;             // e.g. "mp3"
    QString formatName;        // e.g. "mp3"
    qint64 fileSize = 0;

    bool hasDuration() const { return durationSec > 0.0; }
};

constexpr int kDefaultProbeTimeoutMs = 30000;

// Probes an audio file through ffprobe's JSON output (format + streams); when the
// container reports no duration the single-field duration query is tried as well.
// Returns true on success. On failure, returns false and optionally fills errorMessage;
// fileSize is filled either way.
bool probeAudioFile(const QString& ffprobe, const QString& filePath, AudioMetadata& out,
                    QString* errorMessage = nullptr, int timeoutMs = kDefaultProbeTimeoutMs);

// "<ffprobe> -v error -show_entries format=duration -of default=noprint_wrappers=1:nokey=1 <file>"
// Non-numeric or empty output yields 0.
double probeDurationSec(const QString& ffprobe, const QString& filePath, int timeoutMs = kDefaultProbeTimeoutMs);

// Sample rate of the first audio stream, 0 when unknown
int probeSampleRate(const QString& ffprobe, const QString& filePath, int timeoutMs = kDefaultProbeTimeoutMs);

bool parseProbeJson(const QByteArray& json, AudioMetadata& out, QString* errorMessage = nullptr);
double parseDurationOutput(const QByteArray& output);

// "3:07", "1:02:03"
QString formatDuration(double seconds);
// "4.25 MB"
QString formatFileSize(qint64 bytes);
}
