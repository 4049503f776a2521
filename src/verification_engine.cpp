#include "verification_engine.h"
#include "file_utils.h"
#include "pitch.h"

#include <QJsonArray>
#include <QDebug>

namespace {
constexpr double kMinSizeRatio = 0.8;
constexpr double kMaxSizeRatio = 1.2;

QJsonObject metadataJson(const MediaInfo::AudioMetadata& m, const QString& path)
{
    QJsonObject o;
    o["path"] = path;
    o["duration"] = m.durationSec;
    o["durationText"] = MediaInfo::formatDuration(m.durationSec);
    o["sampleRate"] = m.sampleRate;
    o["channels"] = m.channels;
    o["bitrateKbps"] = m.bitrateKbps;
    o["codec"] = m.codec;
    o["format"] = m.formatName;
    o["fileSize"] = double(m.fileSize);
    o["fileSizeText"] = MediaInfo::formatFileSize(m.fileSize);
    return o;
}
}

const VerificationCheck* VerificationReport::check(const QString& label) const
{
    for (const VerificationCheck& c : checks) {
        if (c.label == label) return &c;
    }
    return nullptr;
}

QString VerificationReport::toText() const
{
    if (hasError()) return QString("[%1] %2").arg(errorKindName(error), message);

    QStringList lines;
    lines << QString("Original:  %1").arg(originalPath);
    lines << QString("  %1, %2 Hz, %3 ch, %4 kbps, %5")
                 .arg(MediaInfo::formatDuration(original.durationSec))
                 .arg(original.sampleRate).arg(original.channels).arg(original.bitrateKbps)
                 .arg(MediaInfo::formatFileSize(original.fileSize));
    lines << QString("Converted: %1").arg(convertedPath);
    lines << QString("  %1, %2 Hz, %3 ch, %4 kbps, %5")
                 .arg(MediaInfo::formatDuration(converted.durationSec))
                 .arg(converted.sampleRate).arg(converted.channels).arg(converted.bitrateKbps)
                 .arg(MediaInfo::formatFileSize(converted.fileSize));
    lines << QString();
    for (const VerificationCheck& c : checks) {
        lines << QString("  [%1] %2: %3").arg(c.passed ? QStringLiteral("PASS") : QStringLiteral("FAIL"), c.label, c.detail);
    }
    for (const QString& w : warnings) lines << QString("  Warning: %1").arg(w);
    lines << QString();
    lines << (allPassed ? QStringLiteral("Result: PASSED") : QStringLiteral("Result: FAILED"));
    lines << pitchInfo;
    return lines.join('\n');
}

QJsonObject VerificationReport::toJson() const
{
    QJsonObject o;
    if (hasError()) {
        o["error"] = errorKindName(error);
        o["message"] = message;
        o["allPassed"] = false;
        return o;
    }
    QJsonArray arr;
    for (const VerificationCheck& c : checks) {
        QJsonObject jc;
        jc["label"] = c.label;
        jc["passed"] = c.passed;
        jc["detail"] = c.detail;
        arr.append(jc);
    }
    o["checks"] = arr;
    o["allPassed"] = allPassed;
    o["warnings"] = QJsonArray::fromStringList(warnings);
    o["durationRatio"] = durationRatio;
    o["original"] = metadataJson(original, originalPath);
    o["converted"] = metadataJson(converted, convertedPath);
    o["pitchInfo"] = pitchInfo;
    return o;
}

VerificationEngine::VerificationEngine(const QString& ffprobePath, int probeTimeoutMs)
    : m_ffprobe(ffprobePath)
    , m_timeoutMs(probeTimeoutMs)
{
}

QString VerificationEngine::pitchShiftNote()
{
    const QString r = Pitch::format(Pitch::standard().value());
    return QString("Pitch shift applied: %1/%2 = %3\n"
                   "All frequencies are multiplied by %3\n"
                   "Example note frequencies:\n"
                   "  A4: 440 Hz -> 432 Hz (the standard reference)\n"
                   "  C4: 261.63 Hz -> 256.87 Hz\n"
                   "  E4: 329.63 Hz -> 323.63 Hz")
        .arg(Pitch::kTargetFrequency).arg(Pitch::kSourceFrequency).arg(r);
}

VerificationReport VerificationEngine::evaluate(const MediaInfo::AudioMetadata& orig,
                                                const MediaInfo::AudioMetadata& conv)
{
    VerificationReport rep;
    rep.original = orig;
    rep.converted = conv;
    rep.pitchInfo = pitchShiftNote();

    // Duration
    bool durationOk = false;
    if (orig.hasDuration() && conv.hasDuration()) {
        rep.durationRatio = conv.durationSec / orig.durationSec;
        durationOk = Pitch::durationWithinTolerance(rep.durationRatio);
        rep.checks.append(VerificationCheck{QStringLiteral("Duration Match"), durationOk,
                           durationOk ? QString("%1 (tempo preserved)").arg(Pitch::format(rep.durationRatio))
                                      : QString("%1 (should be ~1.0)").arg(Pitch::format(rep.durationRatio))});
    } else {
        rep.checks.append(VerificationCheck{QStringLiteral("Duration Match"), false, QStringLiteral("could not determine duration")});
    }

    // Sample rate
    bool rateOk = false;
    if (orig.sampleRate > 0 && conv.sampleRate > 0) {
        rateOk = orig.sampleRate == conv.sampleRate;
        rep.checks.append(VerificationCheck{QStringLiteral("Sample Rate"), rateOk,
                           rateOk ? QString("%1 Hz").arg(conv.sampleRate)
                                  : QString("Changed: %1 -> %2").arg(orig.sampleRate).arg(conv.sampleRate)});
    } else {
        rep.checks.append(VerificationCheck{QStringLiteral("Sample Rate"), false, QStringLiteral("could not determine sample rate")});
    }

    rep.checks.append(VerificationCheck{QStringLiteral("Files Different"), true, QStringLiteral("Content verified as different")});

    // Size only warns
    if (orig.fileSize > 0) {
        const double sizeRatio = double(conv.fileSize) / double(orig.fileSize);
        const QString ratioText = QString::number(sizeRatio, 'f', 2);
        if (sizeRatio >= kMinSizeRatio && sizeRatio <= kMaxSizeRatio) {
            rep.checks.append(VerificationCheck{QStringLiteral("File Size"), true, QString("%1x original").arg(ratioText)});
        } else {
            rep.checks.append(VerificationCheck{QStringLiteral("File Size"), false, QString("%1x (unusual)").arg(ratioText)});
            rep.warnings << QString("File size changed significantly (%1x)").arg(ratioText);
        }
    }

    const bool validOk = conv.hasDuration();
    rep.checks.append(VerificationCheck{QStringLiteral("File Valid"), validOk,
                       validOk ? QString("%1s").arg(conv.durationSec, 0, 'f', 2)
                               : QStringLiteral("Could not read file")});

    rep.allPassed = durationOk && rateOk && validOk;
    return rep;
}

VerificationReport VerificationEngine::verify(const QString& originalPath, const QString& convertedPath) const
{
    VerificationReport rep;
    rep.originalPath = originalPath;
    rep.convertedPath = convertedPath;

    for (const QString& p : {originalPath, convertedPath}) {
        if (!FileUtils::fileExists(p)) {
            rep.error = ErrorKind::InputNotFound;
            rep.message = QString("File not found: %1").arg(p);
            return rep;
        }
    }

    if (FileUtils::sameFile(originalPath, convertedPath)) {
        rep.error = ErrorKind::SameFileSelected;
        rep.message = QStringLiteral("The same file was selected twice. Select the original and the converted file.");
        return rep;
    }

    const QByteArray ha = FileUtils::hashPrefix(originalPath);
    const QByteArray hb = FileUtils::hashPrefix(convertedPath);
    if (!ha.isEmpty() && ha == hb) {
        rep.error = ErrorKind::IdenticalFiles;
        rep.message = QStringLiteral("The files are identical. The converted file should differ from the original.");
        return rep;
    }

    if (m_ffprobe.isEmpty()) {
        rep.error = ErrorKind::ToolNotFound;
        rep.message = QStringLiteral("FFprobe not found");
        return rep;
    }

    MediaInfo::AudioMetadata orig, conv;
    QString err;
    if (!MediaInfo::probeAudioFile(m_ffprobe, originalPath, orig, &err, m_timeoutMs)) {
        qWarning() << "[VerificationEngine]" << errorKindName(ErrorKind::ProbeFailed) << originalPath << ":" << err;
    }
    if (!MediaInfo::probeAudioFile(m_ffprobe, convertedPath, conv, &err, m_timeoutMs)) {
        qWarning() << "[VerificationEngine]" << errorKindName(ErrorKind::ProbeFailed) << convertedPath << ":" << err;
    }

    VerificationReport evaluated = evaluate(orig, conv);
    evaluated.originalPath = originalPath;
    evaluated.convertedPath = convertedPath;
    return evaluated;
}
