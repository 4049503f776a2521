#include "batch_scheduler.h"
#include "file_converter.h"
#include "file_utils.h"

#include <QDir>
#include <QFileInfo>
#include <QFuture>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

QString BatchEvent::toText() const
{
    const QString name = QFileInfo(inputPath).fileName();
    switch (kind) {
    case Kind::BatchStarted:
        return QString("Found %1 audio files to convert").arg(total);
    case Kind::FileSkipped:
        return QString("[SKIP] %1 (already converted)").arg(name);
    case Kind::FileStarted:
        return QString("[%1/%2] Converting %3...").arg(index).arg(total).arg(name);
    case Kind::FileFinished:
        return QString("[%1/%2] %3").arg(index).arg(total).arg(result.message());
    case Kind::BatchFinished:
        return QString("Done: %1 converted, %2 skipped, %3 failed, %4 cancelled. Output: %5")
            .arg(summary.converted).arg(summary.skipped).arg(summary.failed).arg(summary.cancelled)
            .arg(summary.outputDir);
    case Kind::BatchFailed:
        return QString("[ERROR] %1").arg(message);
    }
    return message;
}

BatchScheduler::BatchScheduler(const ConversionConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    qRegisterMetaType<BatchEvent>("BatchEvent");
    qRegisterMetaType<ConversionResult>("ConversionResult");
    qRegisterMetaType<BatchSummary>("BatchSummary");
    m_pool.setMaxThreadCount(m_config.workers());
}

BatchScheduler::~BatchScheduler()
{
    m_cancel.store(true);
    m_pool.waitForDone();
}

void BatchScheduler::cancelAll()
{
    m_cancel.store(true);
}

BatchSummary BatchScheduler::summary() const
{
    QMutexLocker locker(&m_summaryMutex);
    return m_summary;
}

QStringList BatchScheduler::collectCandidates(const QString& inputDir) const
{
    QStringList out;
    QDir dir(inputDir);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& fi : entries) {
        if (fi.fileName().startsWith('.')) continue;
        if (!m_config.isExtensionEligible(fi.suffix())) continue;
        if (FileUtils::isConvertedName(fi.fileName(), m_config.suffix())) continue;
        out << fi.absoluteFilePath();
    }
    return out;
}

QString BatchScheduler::outputPathFor(const QString& inputPath, const QString& outputDir) const
{
    return QDir(outputDir).filePath(FileUtils::outputFileName(inputPath, m_config.suffix()));
}

void BatchScheduler::post(const BatchEvent& event)
{
    QMutexLocker locker(&m_queueMutex);
    m_queue.enqueue(event);
    m_queueCond.wakeOne();
}

void BatchScheduler::publish(const BatchEvent& event)
{
    emit batchEvent(event);
    emit logLine(event.toText());
}

BatchSummary BatchScheduler::fail(ErrorKind kind, const QString& message)
{
    BatchSummary s;
    {
        QMutexLocker locker(&m_summaryMutex);
        m_summary.error = kind;
        m_summary.message = message;
        s = m_summary;
    }
    qWarning() << "[BatchScheduler]" << message;

    BatchEvent ev;
    ev.kind = BatchEvent::Kind::BatchFailed;
    ev.summary = s;
    ev.message = message;
    publish(ev);
    return s;
}

void BatchScheduler::record(const ConversionResult& result)
{
    QMutexLocker locker(&m_summaryMutex);
    if (result.success) {
        ++m_summary.converted;
    } else if (result.error == ErrorKind::Cancelled) {
        ++m_summary.cancelled;
    } else {
        ++m_summary.failed;
    }
}

BatchSummary BatchScheduler::run(const QString& inputDir, const QString& outputDir)
{
    {
        QMutexLocker locker(&m_summaryMutex);
        m_summary = BatchSummary();
    }
    {
        QMutexLocker locker(&m_queueMutex);
        m_queue.clear();
    }

    if (!FileUtils::dirExists(inputDir)) {
        return fail(ErrorKind::InputNotFound, QString("Input path does not exist: %1").arg(inputDir));
    }
    if (m_config.ffmpegPath().isEmpty()) {
        return fail(ErrorKind::ToolNotFound, QStringLiteral("FFmpeg not found"));
    }

    const QStringList candidates = collectCandidates(inputDir);
    if (candidates.isEmpty()) {
        return fail(ErrorKind::NoFilesFound, QString("No audio files found in %1").arg(inputDir));
    }

    const QString outDir = outputDir.isEmpty()
        ? QDir(inputDir).filePath(m_config.batchSubdir())
        : outputDir;
    {
        QMutexLocker locker(&m_summaryMutex);
        m_summary.outputDir = QDir(outDir).absolutePath();
        m_summary.total = candidates.size();
    }
    if (!QDir().mkpath(outDir)) {
        return fail(ErrorKind::ConversionFailed, QString("Cannot create output directory %1").arg(outDir));
    }

    const int total = candidates.size();
    BatchEvent started;
    started.kind = BatchEvent::Kind::BatchStarted;
    started.total = total;
    started.summary = summary();
    publish(started);

    FileConverter converter(m_config);
    converter.setLogger([](const QString& line) { qDebug().noquote() << "[FileConverter]" << line; });

    int dispatched = 0;
    int done = 0;
    QList<QFuture<void>> futures;

    for (int i = 0; i < total; ++i) {
        const QString& input = candidates.at(i);
        const QString output = outputPathFor(input, outDir);
        if (QFileInfo::exists(output)) {
            {
                QMutexLocker locker(&m_summaryMutex);
                ++m_summary.skipped;
            }
            ++done;
            BatchEvent ev;
            ev.kind = BatchEvent::Kind::FileSkipped;
            ev.index = i + 1;
            ev.total = total;
            ev.inputPath = input;
            ev.outputPath = output;
            publish(ev);
            continue;
        }

        const ConversionRequest request = converter.makeRequest(input, output);
        const int index = i + 1;
        ++dispatched;
        futures << QtConcurrent::run(&m_pool, [this, converter, request, index, total]() {
            BatchEvent ev;
            ev.index = index;
            ev.total = total;
            ev.inputPath = request.inputPath;
            ev.outputPath = request.outputPath;

            if (m_cancel.load()) {
                ev.result.inputPath = request.inputPath;
                ev.result.outputPath = request.outputPath;
                ev.result.error = ErrorKind::Cancelled;
            } else {
                ev.kind = BatchEvent::Kind::FileStarted;
                post(ev);
                ev.result = converter.convert(request, &m_cancel);
            }
            ev.kind = BatchEvent::Kind::FileFinished;
            post(ev);
        });
    }

    int finishedJobs = 0;
    while (finishedJobs < dispatched) {
        QQueue<BatchEvent> batch;
        {
            QMutexLocker locker(&m_queueMutex);
            while (m_queue.isEmpty()) m_queueCond.wait(&m_queueMutex);
            batch.swap(m_queue);
        }
        while (!batch.isEmpty()) {
            const BatchEvent ev = batch.dequeue();
            if (ev.kind == BatchEvent::Kind::FileFinished) {
                record(ev.result);
                ++finishedJobs;
                ++done;
                if (!ev.result.success && ev.result.error != ErrorKind::Cancelled) {
                    qWarning() << "[BatchScheduler]" << errorKindName(ev.result.error) << ev.inputPath
                               << ":" << ev.result.diagnostic;
                }
            }
            publish(ev);
            emit overallProgress(total > 0 ? done * 100 / total : 100);
        }
    }
    for (QFuture<void>& f : futures) f.waitForFinished();

    BatchEvent finished;
    finished.kind = BatchEvent::Kind::BatchFinished;
    finished.total = total;
    finished.summary = summary();
    if (dispatched == 0) emit overallProgress(100);
    publish(finished);
    return finished.summary;
}
