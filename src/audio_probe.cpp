#include "audio_probe.h"
#include "process_runner.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>
#include <cmath>

namespace MediaInfo {

namespace {
// ffprobe emits numbers as JSON strings ("44100", "187.34")
double jsonNumber(const QJsonValue& v)
{
    if (v.isDouble()) return v.toDouble();
    bool ok = false;
    const double d = v.toString().trimmed().toDouble(&ok);
    return (ok && std::isfinite(d)) ? d : 0.0;
}
}

double parseDurationOutput(const QByteArray& output)
{
    bool ok = false;
    const double sec = QString::fromUtf8(output).trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(sec) || sec < 0.0) return 0.0;
    return sec;
}

bool parseProbeJson(const QByteArray& json, AudioMetadata& out, QString* errorMessage)
{
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) *errorMessage = QString("invalid ffprobe JSON: %1").arg(perr.errorString());
        return false;
    }
    const QJsonObject root = doc.object();
    const QJsonObject fmt = root.value("format").toObject();

    out.durationSec = jsonNumber(fmt.value("duration"));
    out.formatName = fmt.value("format_name").toString();
    const double bitRate = jsonNumber(fmt.value("bit_rate"));
    if (bitRate > 0.0) out.bitrateKbps = int(bitRate / 1000.0);

    bool haveAudio = false;
    const QJsonArray streams = root.value("streams").toArray();
    for (const QJsonValue& sv : streams) {
        const QJsonObject s = sv.toObject();
        if (s.value("codec_type").toString() != QLatin1String("audio")) continue;
        haveAudio = true;
        out.sampleRate = int(jsonNumber(s.value("sample_rate")));
        out.channels = s.value("channels").toInt();
        out.codec = s.value("codec_name").toString();
        if (out.bitrateKbps <= 0) {
            const double sb = jsonNumber(s.value("bit_rate"));
            if (sb > 0.0) out.bitrateKbps = int(sb / 1000.0);
        }
        if (!out.hasDuration()) out.durationSec = jsonNumber(s.value("duration"));
        break;
    }

    if (!haveAudio) {
        if (errorMessage) *errorMessage = QStringLiteral("no audio stream");
        return false;
    }
    return true;
}

double probeDurationSec(const QString& ffprobe, const QString& filePath, int timeoutMs)
{
    if (ffprobe.isEmpty()) return 0.0;
    const QStringList a{"-v", "error", "-show_entries", "format=duration",
                        "-of", "default=noprint_wrappers=1:nokey=1", filePath};
    const ProcessOutcome p = ProcessRunner::run(ffprobe, a, timeoutMs);
    if (!p.ok()) return 0.0;
    return parseDurationOutput(p.stdOut);
}

int probeSampleRate(const QString& ffprobe, const QString& filePath, int timeoutMs)
{
    if (ffprobe.isEmpty()) return 0;
    const QStringList a{"-v", "error", "-select_streams", "a:0", "-show_entries", "stream=sample_rate",
                        "-of", "default=noprint_wrappers=1:nokey=1", filePath};
    const ProcessOutcome p = ProcessRunner::run(ffprobe, a, timeoutMs);
    if (!p.ok()) return 0;
    bool ok = false;
    const int rate = QString::fromUtf8(p.stdOut).trimmed().section('\n', 0, 0).trimmed().toInt(&ok);
    return (ok && rate > 0) ? rate : 0;
}

bool probeAudioFile(const QString& ffprobe, const QString& filePath, AudioMetadata& out,
                    QString* errorMessage, int timeoutMs)
{
    out = AudioMetadata();
    const QFileInfo fi(filePath);
    if (!fi.exists()) {
        if (errorMessage) *errorMessage = QString("file not found: %1").arg(filePath);
        return false;
    }
    out.fileSize = fi.size();

    if (ffprobe.isEmpty()) {
        if (errorMessage) *errorMessage = QStringLiteral("ffprobe path not set");
        return false;
    }

    const QStringList a{"-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", filePath};
    const ProcessOutcome p = ProcessRunner::run(ffprobe, a, timeoutMs);
    QString err;
    bool ok = false;
    if (p.ok()) {
        ok = parseProbeJson(p.stdOut, out, &err);
    } else {
        err = p.diagnosticExcerpt(200);
    }
    if (!out.hasDuration()) {
        out.durationSec = probeDurationSec(ffprobe, filePath, timeoutMs);
    }
    if (!ok) {
        qWarning() << "[MediaInfo] probe failed for" << filePath << ":" << err;
        if (errorMessage) *errorMessage = err;
    }
    return ok;
}

QString formatDuration(double seconds)
{
    if (!(seconds > 0.0)) return QStringLiteral("0:00");
    const qint64 total = qint64(seconds);
    const qint64 h = total / 3600;
    const qint64 m = (total % 3600) / 60;
    const qint64 s = total % 60;
    if (h > 0) {
        return QString("%1:%2:%3").arg(h).arg(m, 2, 10, QChar('0')).arg(s, 2, 10, QChar('0'));
    }
    return QString("%1:%2").arg(m).arg(s, 2, 10, QChar('0'));
}

QString formatFileSize(qint64 bytes)
{
    if (bytes <= 0) return QStringLiteral("0 B");
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double v = double(bytes);
    for (const char* u : units) {
        if (v < 1024.0) return QString("%1 %2").arg(v, 0, 'f', 2).arg(QLatin1String(u));
        v /= 1024.0;
    }
    return QString("%1 TB").arg(v, 0, 'f', 2);
}

} // namespace MediaInfo
