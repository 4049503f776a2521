#pragma once

#include <QObject>
#include <QMutex>
#include <QQueue>
#include <QStringList>
#include <QThreadPool>
#include <QWaitCondition>
#include <atomic>

#include "conversion_config.h"
#include "conversion_types.h"

// Progress notification emitted by the scheduler; every event also has a text form
struct BatchEvent {
    enum class Kind { BatchStarted, FileSkipped, FileStarted, FileFinished, BatchFinished, BatchFailed };

    Kind kind = Kind::BatchStarted;
    int index = 0;          // 1-based position in the sorted candidate list
    int total = 0;
    QString inputPath;
    QString outputPath;
    ConversionResult result;    // FileFinished only
    BatchSummary summary;       // BatchStarted/BatchFinished/BatchFailed
    QString message;

    QString toText() const;
};

Q_DECLARE_METATYPE(BatchEvent)

class BatchScheduler : public QObject {
    Q_OBJECT
public:
    explicit BatchScheduler(const ConversionConfig& config, QObject* parent = nullptr);
    ~BatchScheduler() override;

    // Converts every eligible file of inputDir into outputDir (default <inputDir>/<batchSubdir>).
    // Blocks until all dispatched jobs are done; signals are emitted from the calling thread.
    BatchSummary run(const QString& inputDir, const QString& outputDir = QString());

    // Non-recursive, sorted by file name, eligible extensions only. Hidden files and
    // previous outputs (names ending in the output suffix) are ignored.
    QStringList collectCandidates(const QString& inputDir) const;

    QString outputPathFor(const QString& inputPath, const QString& outputDir) const;

    BatchSummary summary() const;
    bool isCancelled() const { return m_cancel.load(); }

signals:
    void batchEvent(const BatchEvent& event);
    void logLine(const QString& line);
    void overallProgress(int percent);

public slots:
    // Async-signal-safe: only raises the shared flag. Stays raised for the scheduler's lifetime.
    void cancelAll();

private:
    void post(const BatchEvent& event);
    void publish(const BatchEvent& event);
    BatchSummary fail(ErrorKind kind, const QString& message);
    void record(const ConversionResult& result);

    ConversionConfig m_config;
    QThreadPool m_pool;
    std::atomic_bool m_cancel{false};

    mutable QMutex m_summaryMutex;
    BatchSummary m_summary;

    // Worker -> dispatcher channel
    QMutex m_queueMutex;
    QWaitCondition m_queueCond;
    QQueue<BatchEvent> m_queue;
};
