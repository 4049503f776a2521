#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDir>
#include <QCryptographicHash>

/**
 * FileUtils - path and file helpers shared by the converter, the batch scheduler
 * and the verification engine.
 */
namespace FileUtils {

// Content-identity checks only look at this many leading bytes
constexpr qint64 kHashPrefixBytes = 1024 * 1024;

/**
 * Check if a regular file exists at the given path.
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

/**
 * Check if a directory exists at the given path.
 */
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Output file name for an input: "<stem><suffix>.<ext>".
 * "song.mp3" with suffix "_432hz" becomes "song_432hz.mp3".
 */
inline QString outputFileName(const QString& inputPath, const QString& suffix)
{
    const QFileInfo fi(inputPath);
    const QString ext = fi.suffix();
    return ext.isEmpty() ? fi.completeBaseName() + suffix
                         : fi.completeBaseName() + suffix + '.' + ext;
}

/**
 * True when the file name already carries the output suffix (a previous result),
 * so batch runs over a shared input/output folder don't convert their own output.
 */
inline bool isConvertedName(const QString& filePath, const QString& suffix)
{
    return !suffix.isEmpty() && QFileInfo(filePath).completeBaseName().endsWith(suffix);
}

/**
 * Output path for a single-file conversion.
 * An empty outputOpt gives "<stem><suffix>.<ext>" beside the input. An existing
 * directory, or any path ending in '/', receives that same file name. Anything
 * else is taken as the output file itself.
 */
inline QString singleOutputPath(const QString& inputPath, const QString& outputOpt, const QString& suffix)
{
    if (outputOpt.isEmpty()) {
        return QFileInfo(inputPath).absoluteDir().filePath(outputFileName(inputPath, suffix));
    }
    if (dirExists(outputOpt) || outputOpt.endsWith('/')) {
        return QDir(outputOpt).filePath(outputFileName(inputPath, suffix));
    }
    return outputOpt;
}

/**
 * Hidden sibling used while the encoder is writing. The extension is kept last so
 * ffmpeg still picks the right muxer; the leading dot keeps it out of directory scans.
 */
inline QString partialPathFor(const QString& outputPath)
{
    const QFileInfo fi(outputPath);
    QString name = QStringLiteral(".") + fi.completeBaseName() + QStringLiteral(".part");
    if (!fi.suffix().isEmpty()) name += '.' + fi.suffix();
    return fi.dir().filePath(name);
}

/**
 * True when both paths resolve to the same file on disk (symlinks and relative
 * components included). Missing files never compare equal.
 */
inline bool sameFile(const QString& a, const QString& b)
{
    const QString ca = QFileInfo(a).canonicalFilePath();
    const QString cb = QFileInfo(b).canonicalFilePath();
    return !ca.isEmpty() && ca == cb;
}

/**
 * MD5 of the first maxBytes of a file. Returns an empty array when the file cannot be read.
 */
inline QByteArray hashPrefix(const QString& filePath, qint64 maxBytes = kHashPrefixBytes)
{
    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    QCryptographicHash h(QCryptographicHash::Md5);
    h.addData(f.read(maxBytes));
    return h.result();
}

} // namespace FileUtils
