#pragma once
#include <QString>
#include <QMetaType>
#include "pitch.h"

enum class ErrorKind {
    None,
    ToolNotFound,      // ffmpeg/ffprobe unresolvable: fatal to the run
    InputNotFound,     // input file/directory missing: fatal to the batch
    NoFilesFound,      // directory has no eligible files: fatal to the batch
    ConversionFailed,  // both strategies exhausted for one file
    TimedOut,          // tool exceeded the per-job timeout
    Cancelled,         // cancellation requested before/while the job ran
    ProbeFailed,       // metadata extraction failed for one file
    SameFileSelected,  // verification: both paths resolve to the same file
    IdenticalFiles     // verification: equal content prefix
};

QString errorKindName(ErrorKind kind);

// Process exit status of the command-line tool
enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitUsage = 2 };

// Environment and input problems are usage errors; everything else fails the run
ExitCode exitCodeFor(ErrorKind kind);

enum class ConversionStrategy { HighQuality, Fallback };

struct ConversionRequest {
    QString inputPath;
    QString outputPath;
    Pitch::Ratio ratio;
    int vbrQuality = 0;   // libmp3lame -q:a, 0 = highest
};

struct ConversionResult {
    bool success = false;
    // Strategy that produced the file on success, last one attempted on failure
    ConversionStrategy strategy = ConversionStrategy::HighQuality;
    int attempts = 0;
    ErrorKind error = ErrorKind::None;
    QString diagnostic;   // truncated stderr excerpt of the last failed attempt
    QString inputPath;
    QString outputPath;
    qint64 elapsedMs = 0;

    bool usedFallbackRetry() const { return success && attempts > 1; }
    QString message() const;
};

struct BatchSummary {
    int total = 0;        // eligible candidates found
    int converted = 0;
    int skipped = 0;
    int failed = 0;
    int cancelled = 0;
    QString outputDir;
    ErrorKind error = ErrorKind::None;   // only set for batch-level failures
    QString message;

    int finished() const { return converted + skipped + failed + cancelled; }
    bool ok() const { return error == ErrorKind::None && failed == 0 && cancelled == 0; }
};

Q_DECLARE_METATYPE(ConversionResult)
Q_DECLARE_METATYPE(BatchSummary)
