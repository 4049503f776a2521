#include <QtTest>
#include <QTemporaryDir>
#include <QSettings>
#include <limits>
#include "../src/conversion_config.h"

class TestConversionConfig : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testClamping();
    void testExtensionNormalization();
    void testSettingsRoundTrip();
};

void TestConversionConfig::testDefaults()
{
    ToolCapabilities caps;
    caps.ffmpegPath = "/opt/ffmpeg/bin/ffmpeg";
    caps.ffprobePath = "/opt/ffmpeg/bin/ffprobe";
    caps.hasRubberband = true;
    const ConversionConfig cfg(ConversionSettings(), caps);

    QCOMPARE(cfg.ffmpegPath(), QString("/opt/ffmpeg/bin/ffmpeg"));
    QCOMPARE(cfg.strategy(), ConversionStrategy::HighQuality);
    QCOMPARE(cfg.workers(), 4);
    QCOMPARE(cfg.suffix(), QString("_432hz"));
    QCOMPARE(cfg.batchSubdir(), QString("432hz"));
    QCOMPARE(cfg.vbrQuality(), 0);
    QCOMPARE(cfg.jobTimeoutMs(), 600000);
    QCOMPARE(cfg.probeTimeoutMs(), 30000);
    QVERIFY(cfg.preserveFormants());
    QCOMPARE(cfg.extensions(), QStringList({"mp3", "flac", "ogg", "opus", "m4a", "wav"}));
    QCOMPARE(cfg.ratio().target, 432);
    QCOMPARE(cfg.ratio().source, 440);
}

void TestConversionConfig::testClamping()
{
    ConversionSettings s;
    s.workers = 0;
    s.vbrQuality = 42;
    s.suffix.clear();
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).workers(), 1);
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).vbrQuality(), 9);
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).suffix(), QString("_432hz"));
    s.workers = 1000;
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).workers(), 64);
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).strategy(), ConversionStrategy::Fallback);

    // Huge timeouts saturate instead of wrapping into "no limit"
    const int maxMs = (std::numeric_limits<int>::max() / 1000) * 1000;
    s.jobTimeoutSec = 3000000;
    s.probeTimeoutSec = std::numeric_limits<int>::max();
    QCOMPARE(s.jobTimeoutMs(), maxMs);
    QCOMPARE(s.probeTimeoutMs(), maxMs);
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).jobTimeoutMs(), maxMs);
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).probeTimeoutMs(), maxMs);
    QVERIFY(ConversionConfig(s, ToolCapabilities()).jobTimeoutMs() > 0);

    s.jobTimeoutSec = -5;
    s.probeTimeoutSec = 0;
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).jobTimeoutMs(), 0);
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).probeTimeoutMs(), 1000);
    QCOMPARE(s.probeTimeoutMs(), 1000);
}

void TestConversionConfig::testExtensionNormalization()
{
    ConversionSettings s;
    s.extensions = QStringList({" .MP3", "flac", "mp3", ""});
    const ConversionConfig cfg(s, ToolCapabilities());
    QCOMPARE(cfg.extensions(), QStringList({"mp3", "flac"}));
    QVERIFY(cfg.isExtensionEligible("Mp3"));
    QVERIFY(cfg.isExtensionEligible("flac"));
    QVERIFY(!cfg.isExtensionEligible("wav"));

    s.extensions.clear();
    QCOMPARE(ConversionConfig(s, ToolCapabilities()).extensions(), QStringList({"mp3"}));
}

void TestConversionConfig::testSettingsRoundTrip()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString ini = tmp.filePath("retune432.ini");

    ConversionSettings s;
    s.ffmpegPath = "/custom/ffmpeg";
    s.workers = 7;
    s.preserveFormants = false;
    s.extensions = QStringList({"mp3", "wav"});
    s.jobTimeoutSec = 120;
    {
        QSettings store(ini, QSettings::IniFormat);
        s.save(store);
        store.sync();
    }

    QSettings store(ini, QSettings::IniFormat);
    const ConversionSettings loaded = ConversionSettings::load(store);
    QCOMPARE(loaded.ffmpegPath, QString("/custom/ffmpeg"));
    QCOMPARE(loaded.workers, 7);
    QCOMPARE(loaded.preserveFormants, false);
    QCOMPARE(loaded.extensions, QStringList({"mp3", "wav"}));
    QCOMPARE(loaded.jobTimeoutSec, 120);
    QCOMPARE(loaded.suffix, QString("_432hz"));
}

QTEST_GUILESS_MAIN(TestConversionConfig)
#include "test_conversion_config.moc"
