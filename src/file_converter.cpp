#include "file_converter.h"
#include "audio_probe.h"
#include "conversion_strategy.h"
#include "file_utils.h"
#include "process_runner.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

namespace {
constexpr int kDiagnosticChars = 300;

// Prevent paths starting with '-' from being read as options
QString safePath(const QString& p)
{
    if (!QFileInfo(p).isAbsolute() && p.startsWith('-')) return QStringLiteral("./") + p;
    return p;
}
}

FileConverter::FileConverter(const ConversionConfig& config)
    : m_config(config)
{
}

void FileConverter::log(const QString& line) const
{
    if (m_log) m_log(line);
}

ConversionRequest FileConverter::makeRequest(const QString& inputPath, const QString& outputPath) const
{
    ConversionRequest r;
    r.inputPath = inputPath;
    r.outputPath = outputPath;
    r.ratio = m_config.ratio();
    r.vbrQuality = m_config.vbrQuality();
    return r;
}

QStringList FileConverter::buildArguments(ConversionStrategy strategy, const ConversionRequest& request,
                                          const QString& outPath, int sourceRate) const
{
    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-y";
    args << "-i" << safePath(QFileInfo(request.inputPath).absoluteFilePath());
    args << "-af" << Strategy::filterGraph(strategy, request.ratio, m_config.preserveFormants(), sourceRate);
    args << Strategy::encoderArguments(request.outputPath, m_config.mp3Codec(), request.vbrQuality);
    args << safePath(outPath);
    return args;
}

ProcessOutcome FileConverter::runAttempt(ConversionStrategy strategy, const ConversionRequest& request,
                                         const QString& partialPath, int& sourceRate,
                                         const std::atomic_bool* cancel) const
{
    // The fallback graph needs the real source rate; probe it once, lazily
    if (strategy == ConversionStrategy::Fallback && sourceRate <= 0) {
        sourceRate = MediaInfo::probeSampleRate(m_config.ffprobePath(), request.inputPath, m_config.probeTimeoutMs());
        if (sourceRate <= 0) {
            qDebug() << "[FileConverter] sample rate unknown, assuming" << Strategy::kDefaultSampleRate
                     << "for" << request.inputPath;
            sourceRate = Strategy::kDefaultSampleRate;
        }
    }

    const QStringList args = buildArguments(strategy, request, partialPath, sourceRate);
    log(QString("%1 %2").arg(QFileInfo(m_config.ffmpegPath()).fileName(), args.join(' ')));
    return ProcessRunner::run(m_config.ffmpegPath(), args, m_config.jobTimeoutMs(), cancel);
}

bool FileConverter::promotePartial(const QString& partialPath, const QString& outputPath, QString& err)
{
    if (QFileInfo::exists(outputPath) && !QFile::remove(outputPath)) {
        err = QString("cannot replace existing output %1").arg(outputPath);
        return false;
    }
    if (!QFile::rename(partialPath, outputPath)) {
        err = QString("cannot move %1 to %2").arg(partialPath, outputPath);
        return false;
    }
    return true;
}

ConversionResult FileConverter::convert(const ConversionRequest& request, const std::atomic_bool* cancel) const
{
    ConversionResult result;
    result.inputPath = request.inputPath;
    result.outputPath = request.outputPath;
    result.strategy = m_config.strategy();

    QElapsedTimer timer;
    timer.start();

    if (!FileUtils::fileExists(request.inputPath)) {
        result.error = ErrorKind::InputNotFound;
        result.diagnostic = QString("Source not found: %1").arg(request.inputPath);
        return result;
    }
    if (m_config.ffmpegPath().isEmpty()) {
        result.error = ErrorKind::ToolNotFound;
        result.diagnostic = QStringLiteral("FFmpeg path not set");
        return result;
    }

    const QString outDir = QFileInfo(request.outputPath).absolutePath();
    if (!QDir().mkpath(outDir)) {
        result.error = ErrorKind::ConversionFailed;
        result.diagnostic = QString("Cannot create output directory %1").arg(outDir);
        return result;
    }

    const QString partial = FileUtils::partialPathFor(request.outputPath);
    const ConversionStrategy order[] = {m_config.strategy(), Strategy::other(m_config.strategy())};
    int sourceRate = 0;
    ErrorKind lastError = ErrorKind::ConversionFailed;

    for (ConversionStrategy strategy : order) {
        if (cancel && cancel->load()) {
            lastError = ErrorKind::Cancelled;
            break;
        }
        if (result.attempts > 0) {
            log(QString("[Retry] %1 failed for %2, trying %3")
                    .arg(Strategy::name(result.strategy), QFileInfo(request.inputPath).fileName(),
                         Strategy::name(strategy)));
        }
        result.strategy = strategy;
        ++result.attempts;

        QFile::remove(partial);
        const ProcessOutcome out = runAttempt(strategy, request, partial, sourceRate, cancel);

        if (out.ok() && FileUtils::fileExists(partial)) {
            QString err;
            if (!promotePartial(partial, request.outputPath, err)) {
                QFile::remove(partial);
                result.error = ErrorKind::ConversionFailed;
                result.diagnostic = err;
                result.elapsedMs = timer.elapsed();
                return result;
            }
            result.success = true;
            result.error = ErrorKind::None;
            result.diagnostic.clear();
            result.elapsedMs = timer.elapsed();
            return result;
        }

        QFile::remove(partial);
        if (out.ok()) {
            result.diagnostic = QStringLiteral("ffmpeg reported success but wrote no output");
        } else {
            result.diagnostic = out.diagnosticExcerpt(kDiagnosticChars);
        }
        if (out.cancelled) {
            lastError = ErrorKind::Cancelled;
            break;
        }
        lastError = out.timedOut ? ErrorKind::TimedOut : ErrorKind::ConversionFailed;
        qWarning() << "[FileConverter]" << Strategy::label(strategy) << "attempt failed for"
                   << request.inputPath << ":" << result.diagnostic;
    }

    result.error = lastError;
    result.elapsedMs = timer.elapsed();
    return result;
}
