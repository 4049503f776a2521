#pragma once

#include <QString>
#include <QStringList>
#include <functional>
#include <atomic>

#include "conversion_config.h"
#include "conversion_types.h"

struct ProcessOutcome;

// Converts one file with the configured strategy, retrying once with the other strategy
// when the first ffmpeg run fails. Output is encoded into a hidden partial file and only
// renamed onto the requested path after a successful run. Safe to call from worker threads.
class FileConverter {
public:
    using LogFn = std::function<void(const QString&)>;

    explicit FileConverter(const ConversionConfig& config);

    void setLogger(LogFn fn) { m_log = std::move(fn); }

    ConversionRequest makeRequest(const QString& inputPath, const QString& outputPath) const;

    ConversionResult convert(const ConversionRequest& request, const std::atomic_bool* cancel = nullptr) const;

    // Full ffmpeg argument list for one attempt writing to outPath
    QStringList buildArguments(ConversionStrategy strategy, const ConversionRequest& request,
                               const QString& outPath, int sourceRate) const;

private:
    ProcessOutcome runAttempt(ConversionStrategy strategy, const ConversionRequest& request,
                              const QString& partialPath, int& sourceRate,
                              const std::atomic_bool* cancel) const;
    static bool promotePartial(const QString& partialPath, const QString& outputPath, QString& err);
    void log(const QString& line) const;

    ConversionConfig m_config;
    LogFn m_log;
};
