#pragma once

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QString>
#include <QStringList>

// Small /bin/sh stand-ins for ffmpeg and ffprobe so conversion paths run end to end.
//
// fake ffmpeg: answers "-filters", records every -af graph in <dir>/ffmpeg_calls.log and
// copies the -i input to the last argument with a marker appended. With trackActive it
// also appends "+" on entry and "-" on exit to <dir>/ffmpeg_active.log.
// fake ffprobe: answers from sidecar files next to the probed media:
// <file>.json (print_format json), <file>.duration (format=duration), <file>.rate (sample_rate).
namespace FakeTools {

struct FfmpegBehavior {
    bool listRubberband = true;
    bool failRubberband = false;   // exit 1 for rubberband graphs
    bool failAll = false;          // exit 1 for every conversion
    QString failInputPattern;      // exit 1 when the input path contains this text
    int sleepSec = 0;
    bool trackActive = false;
};

inline bool writeFile(const QString& path, const QByteArray& content)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    return f.write(content) == content.size();
}

inline QString writeScript(const QString& path, const QByteArray& body)
{
    if (!writeFile(path, body)) return QString();
    QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner |
                                QFile::ReadGroup | QFile::ExeGroup | QFile::ReadOther | QFile::ExeOther);
    return path;
}

inline QString callLogPath(const QString& dir)
{
    return QDir(dir).filePath("ffmpeg_calls.log");
}

inline QStringList calls(const QString& dir)
{
    QFile f(callLogPath(dir));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return QStringList();
    return QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
}

inline QString activeLogPath(const QString& dir)
{
    return QDir(dir).filePath("ffmpeg_active.log");
}

// Highest number of fake ffmpeg conversions that were running at the same time
inline int peakActive(const QString& dir)
{
    QFile f(activeLogPath(dir));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return 0;
    int running = 0;
    int peak = 0;
    const QStringList marks = QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
    for (const QString& m : marks) {
        running += m == QLatin1String("+") ? 1 : -1;
        peak = qMax(peak, running);
    }
    return peak;
}

inline QString writeFakeFfmpeg(const QString& dir, const FfmpegBehavior& b = FfmpegBehavior())
{
    QByteArray s;
    s += "#!/bin/sh\n";
    s += "for a in \"$@\"; do\n";
    s += "  if [ \"$a\" = \"-filters\" ]; then\n";
    s += "    echo 'Filters:'\n";
    s += "    echo ' ..S atempo            A->A       Adjust audio tempo.'\n";
    if (b.listRubberband) {
        s += "    echo ' ... rubberband        A->A       Apply time-stretching and pitch-shifting.'\n";
    }
    s += "    echo ' ... asetrate          A->A       Change the sample rate without altering the data.'\n";
    s += "    exit 0\n";
    s += "  fi\n";
    s += "done\n";
    s += "graph=''; in=''; prev=''; last=''\n";
    s += "for a in \"$@\"; do\n";
    s += "  [ \"$prev\" = \"-af\" ] && graph=\"$a\"\n";
    s += "  [ \"$prev\" = \"-i\" ] && in=\"$a\"\n";
    s += "  prev=\"$a\"; last=\"$a\"\n";
    s += "done\n";
    s += "echo \"$graph\" >> '" + callLogPath(dir).toUtf8() + "'\n";
    if (b.trackActive) {
        s += "echo + >> '" + activeLogPath(dir).toUtf8() + "'\n";
        s += "trap \"echo - >> '" + activeLogPath(dir).toUtf8() + "'\" EXIT\n";
    }
    if (b.sleepSec > 0) {
        s += "sleep " + QByteArray::number(b.sleepSec) + "\n";
    }
    if (b.failAll) {
        s += "printf '%0400d\\n' 0 >&2\n";
        s += "echo 'Error initializing filter graph: boom' >&2\n";
        s += "exit 1\n";
    }
    if (b.failRubberband) {
        s += "case \"$graph\" in rubberband=*) echo 'No such filter: rubberband' >&2; exit 1;; esac\n";
    }
    if (!b.failInputPattern.isEmpty()) {
        s += "case \"$in\" in *" + b.failInputPattern.toUtf8() + "*) echo 'Invalid data found when processing input' >&2; exit 1;; esac\n";
    }
    s += "cp \"$in\" \"$last\" || exit 1\n";
    s += "printf 'retuned' >> \"$last\"\n";
    s += "exit 0\n";
    return writeScript(QDir(dir).filePath("ffmpeg"), s);
}

inline QString writeFakeFfprobe(const QString& dir)
{
    QByteArray s;
    s += "#!/bin/sh\n";
    s += "last=''\n";
    s += "for a in \"$@\"; do last=\"$a\"; done\n";
    s += "f=''\n";
    s += "case \"$*\" in\n";
    s += "  *print_format*) f=\"$last.json\";;\n";
    s += "  *stream=sample_rate*) f=\"$last.rate\";;\n";
    s += "  *format=duration*) f=\"$last.duration\";;\n";
    s += "esac\n";
    s += "if [ -n \"$f\" ] && [ -f \"$f\" ]; then cat \"$f\"; exit 0; fi\n";
    s += "echo \"$last: Invalid data found when processing input\" >&2\n";
    s += "exit 1\n";
    return writeScript(QDir(dir).filePath("ffprobe"), s);
}

inline QByteArray probeJson(double durationSec, int sampleRate, int channels = 2, const QString& codec = "mp3")
{
    return QString("{\"streams\":[{\"codec_type\":\"audio\",\"codec_name\":\"%1\",\"sample_rate\":\"%2\","
                   "\"channels\":%3,\"bit_rate\":\"320000\"}],"
                   "\"format\":{\"format_name\":\"%1\",\"duration\":\"%4\",\"bit_rate\":\"320000\"}}")
        .arg(codec).arg(sampleRate).arg(channels).arg(durationSec, 0, 'f', 6)
        .toUtf8();
}

// Metadata the fake ffprobe reports for mediaPath
inline void writeProbeSidecars(const QString& mediaPath, double durationSec, int sampleRate)
{
    writeFile(mediaPath + ".json", probeJson(durationSec, sampleRate));
    writeFile(mediaPath + ".duration", QByteArray::number(durationSec, 'f', 6) + "\n");
    writeFile(mediaPath + ".rate", QByteArray::number(sampleRate) + "\n");
}

} // namespace FakeTools
