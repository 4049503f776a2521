#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTextStream>
#include <atomic>
#include <csignal>

#include "batch_scheduler.h"
#include "capability_prober.h"
#include "conversion_config.h"
#include "conversion_strategy.h"
#include "file_converter.h"
#include "file_utils.h"
#include "log_manager.h"
#include "verification_engine.h"

namespace {

std::atomic_bool g_interrupted{false};
std::atomic<BatchScheduler*> g_scheduler{nullptr};

void signalHandler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
        if (BatchScheduler* s = g_scheduler.load()) s->cancelAll();
    }
}

QTextStream& out()
{
    static QTextStream ts(stdout);
    return ts;
}

QTextStream& err()
{
    static QTextStream ts(stderr);
    return ts;
}

void emitLine(const QString& line)
{
    out() << line << Qt::endl;
    LogManager::instance().addLog(line);
}

QJsonObject summaryJson(const BatchSummary& s)
{
    QJsonObject o;
    o["total"] = s.total;
    o["converted"] = s.converted;
    o["skipped"] = s.skipped;
    o["failed"] = s.failed;
    o["cancelled"] = s.cancelled;
    o["outputDir"] = s.outputDir;
    if (s.error != ErrorKind::None) {
        o["error"] = errorKindName(s.error);
        o["message"] = s.message;
    }
    return o;
}

QJsonObject resultJson(const ConversionResult& r)
{
    QJsonObject o;
    o["success"] = r.success;
    o["input"] = r.inputPath;
    o["output"] = r.outputPath;
    o["strategy"] = Strategy::name(r.strategy);
    o["attempts"] = r.attempts;
    o["elapsedMs"] = double(r.elapsedMs);
    if (!r.success) {
        o["error"] = errorKindName(r.error);
        o["diagnostic"] = r.diagnostic;
    }
    return o;
}

void printJson(const QJsonObject& o)
{
    out() << QJsonDocument(o).toJson(QJsonDocument::Indented);
    out().flush();
}

int runProbe(const ConversionConfig& config, bool json)
{
    const ToolCapabilities& t = config.tools();
    if (json) {
        QJsonObject o;
        o["ffmpeg"] = t.ffmpegPath;
        o["ffprobe"] = t.ffprobePath;
        o["rubberband"] = t.hasRubberband;
        o["strategy"] = Strategy::label(config.strategy());
        o["ratio"] = Pitch::format(config.ratio().value());
        printJson(o);
    } else {
        out() << "ffmpeg:     " << (t.ffmpegFound() ? t.ffmpegPath : QStringLiteral("not found")) << Qt::endl;
        out() << "ffprobe:    " << (t.ffprobeFound() ? t.ffprobePath : QStringLiteral("not found")) << Qt::endl;
        out() << "rubberband: " << (t.hasRubberband ? "available" : "not available") << Qt::endl;
        out() << "strategy:   " << Strategy::label(config.strategy())
              << " (" << Strategy::name(config.strategy()) << ")" << Qt::endl;
        out() << "ratio:      " << Pitch::format(config.ratio().value()) << Qt::endl;
    }
    return t.ffmpegFound() ? ExitOk : ExitUsage;
}

int runVerify(const ConversionConfig& config, const QString& original, const QString& converted, bool json)
{
    VerificationEngine engine(config.ffprobePath(), config.probeTimeoutMs());
    const VerificationReport rep = engine.verify(original, converted);
    if (json) {
        printJson(rep.toJson());
    } else {
        out() << rep.toText() << Qt::endl;
    }
    if (rep.hasError()) {
        LogManager::instance().addLog(rep.message, "ERROR");
        return exitCodeFor(rep.error);
    }
    return rep.allPassed ? ExitOk : ExitFailure;
}

int runConvertFile(const ConversionConfig& config, const QString& input, const QString& outputOpt,
                   bool verify, bool json)
{
    const QString output = FileUtils::singleOutputPath(input, outputOpt, config.suffix());
    if (FileUtils::sameFile(input, output)) {
        err() << "Output would overwrite the input: " << output << Qt::endl;
        return ExitUsage;
    }

    FileConverter converter(config);
    converter.setLogger([](const QString& line) { qDebug().noquote() << "[FileConverter]" << line; });
    if (!json) emitLine(QString("Converting %1 (%2)...").arg(QFileInfo(input).fileName(),
                                                         Strategy::label(config.strategy())));
    const ConversionResult result = converter.convert(converter.makeRequest(input, output), &g_interrupted);

    QJsonObject jo;
    if (json) {
        jo["result"] = resultJson(result);
    } else {
        emitLine(result.message());
        if (result.success) emitLine(QString("Output: %1").arg(result.outputPath));
    }
    if (!result.success) {
        LogManager::instance().addLog(QString("%1: %2").arg(errorKindName(result.error), result.diagnostic), "ERROR");
        if (json) printJson(jo);
        return exitCodeFor(result.error);
    }

    int code = ExitOk;
    if (verify) {
        VerificationEngine engine(config.ffprobePath(), config.probeTimeoutMs());
        const VerificationReport rep = engine.verify(input, result.outputPath);
        if (json) {
            jo["verification"] = rep.toJson();
        } else {
            out() << rep.toText() << Qt::endl;
        }
        if (rep.hasError() || !rep.allPassed) code = ExitFailure;
    }
    if (json) printJson(jo);
    return code;
}

int runConvertDir(const ConversionConfig& config, const QString& input, const QString& outputOpt, bool json)
{
    BatchScheduler scheduler(config);
    if (!json) {
        QObject::connect(&scheduler, &BatchScheduler::logLine, [](const QString& line) { emitLine(line); });
    } else {
        QObject::connect(&scheduler, &BatchScheduler::logLine,
                         [](const QString& line) { LogManager::instance().addLog(line); });
    }

    g_scheduler.store(&scheduler);
    if (g_interrupted.load()) scheduler.cancelAll();
    const BatchSummary summary = scheduler.run(input, outputOpt);
    g_scheduler.store(nullptr);

    if (json) printJson(summaryJson(summary));
    if (summary.error != ErrorKind::None) return exitCodeFor(summary.error);
    return summary.ok() ? ExitOk : ExitFailure;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Retune432");
    QCoreApplication::setApplicationName("Retune432");
    QCoreApplication::setApplicationVersion("1.0.0");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Retune audio from A=440 Hz to A=432 Hz while preserving tempo.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "convert <file|dir> | verify <original> <converted> | probe");
    parser.addPositionalArgument("paths", "Input paths for the command.", "[paths...]");

    QCommandLineOption outputOpt({"o", "output"}, "Output file or directory.", "path");
    QCommandLineOption jobsOpt({"j", "jobs"}, "Parallel conversions in batch mode.", "n");
    QCommandLineOption noFormantOpt("no-formant", "Do not preserve formants (rubberband only).");
    QCommandLineOption timeoutOpt("timeout", "Per-file conversion timeout in seconds.", "sec");
    QCommandLineOption verifyOpt("verify", "Verify the output after a single-file conversion.");
    QCommandLineOption ffmpegOpt("ffmpeg", "Path to the ffmpeg executable.", "path");
    QCommandLineOption ffprobeOpt("ffprobe", "Path to the ffprobe executable.", "path");
    QCommandLineOption logFileOpt("log-file", "Log file path.", "path");
    QCommandLineOption jsonOpt("json", "Print results as JSON.");
    QCommandLineOption saveOpt("save-settings", "Persist the given options as defaults.");
    parser.addOptions({outputOpt, jobsOpt, noFormantOpt, timeoutOpt, verifyOpt, ffmpegOpt, ffprobeOpt,
                       logFileOpt, jsonOpt, saveOpt});
    parser.process(app);

    QSettings settingsStore("Retune432", "Retune432");
    ConversionSettings settings = ConversionSettings::load(settingsStore);

    bool ok = true;
    if (parser.isSet(jobsOpt)) {
        settings.workers = parser.value(jobsOpt).toInt(&ok);
        if (!ok || settings.workers < 1) {
            err() << "Invalid --jobs value: " << parser.value(jobsOpt) << Qt::endl;
            return ExitUsage;
        }
    }
    if (parser.isSet(timeoutOpt)) {
        settings.jobTimeoutSec = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || settings.jobTimeoutSec < 1) {
            err() << "Invalid --timeout value: " << parser.value(timeoutOpt) << Qt::endl;
            return ExitUsage;
        }
    }
    if (parser.isSet(noFormantOpt)) settings.preserveFormants = false;
    if (parser.isSet(ffmpegOpt)) settings.ffmpegPath = parser.value(ffmpegOpt);
    if (parser.isSet(ffprobeOpt)) settings.ffprobePath = parser.value(ffprobeOpt);
    if (parser.isSet(logFileOpt)) settings.logFile = parser.value(logFileOpt);
    if (parser.isSet(saveOpt)) {
        settings.save(settingsStore);
        settingsStore.sync();
    }

    LogManager& log = LogManager::instance();
    log.open(settings.logFile);
    log.installMessageHandler();

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        if (parser.isSet(saveOpt)) return ExitOk;
        parser.showHelp(ExitUsage);
    }
    const QString command = positional.first();
    const QStringList paths = positional.mid(1);
    const bool json = parser.isSet(jsonOpt);

    CapabilityProber prober;
    prober.setConfiguredFfmpeg(settings.ffmpegPath);
    prober.setConfiguredFfprobe(settings.ffprobePath);
    prober.setTimeoutMs(settings.probeTimeoutMs());
    const ToolCapabilities caps = prober.probe();
    const ConversionConfig config(settings, caps);

    qDebug() << "[main] ffmpeg" << caps.ffmpegPath << "ffprobe" << caps.ffprobePath
             << "strategy" << Strategy::label(config.strategy());

    if (command == QLatin1String("probe")) {
        return runProbe(config, json);
    }

    if (command == QLatin1String("verify")) {
        if (paths.size() != 2) {
            err() << "verify expects <original> <converted>" << Qt::endl;
            return ExitUsage;
        }
        return runVerify(config, paths.at(0), paths.at(1), json);
    }

    if (command == QLatin1String("convert")) {
        if (paths.size() != 1) {
            err() << "convert expects exactly one input file or directory" << Qt::endl;
            return ExitUsage;
        }
        const QString input = paths.first();
        if (!caps.ffmpegFound()) {
            qCritical().noquote() << "FFmpeg not found. Install ffmpeg or pass --ffmpeg <path>.";
            return ExitUsage;
        }
        if (FileUtils::dirExists(input)) {
            return runConvertDir(config, input, parser.value(outputOpt), json);
        }
        if (FileUtils::fileExists(input)) {
            return runConvertFile(config, input, parser.value(outputOpt), parser.isSet(verifyOpt), json);
        }
        qCritical().noquote() << "Input path does not exist:" << input;
        return ExitUsage;
    }

    err() << "Unknown command: " << command << Qt::endl;
    return ExitUsage;
}
