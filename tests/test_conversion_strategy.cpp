#include <QtTest>
#include "../src/conversion_strategy.h"

class TestConversionStrategy : public QObject {
    Q_OBJECT
private slots:
    void testSelect();
    void testOther();
    void testNames();
    void testHighQualityFilter();
    void testFallbackFilter();
    void testFallbackFilterUnknownRate();
    void testEncoderArguments();
};

void TestConversionStrategy::testSelect()
{
    ToolCapabilities caps;
    caps.ffmpegPath = "/usr/bin/ffmpeg";
    caps.hasRubberband = true;
    QCOMPARE(Strategy::select(caps), ConversionStrategy::HighQuality);
    caps.hasRubberband = false;
    QCOMPARE(Strategy::select(caps), ConversionStrategy::Fallback);
}

void TestConversionStrategy::testOther()
{
    QCOMPARE(Strategy::other(ConversionStrategy::HighQuality), ConversionStrategy::Fallback);
    QCOMPARE(Strategy::other(ConversionStrategy::Fallback), ConversionStrategy::HighQuality);
}

void TestConversionStrategy::testNames()
{
    QCOMPARE(Strategy::name(ConversionStrategy::HighQuality), QString("rubberband"));
    QCOMPARE(Strategy::name(ConversionStrategy::Fallback), QString("asetrate"));
    QCOMPARE(Strategy::label(ConversionStrategy::HighQuality), QString("HighQuality"));
    QCOMPARE(Strategy::label(ConversionStrategy::Fallback), QString("Fallback"));
}

void TestConversionStrategy::testHighQualityFilter()
{
    QCOMPARE(Strategy::highQualityFilter(Pitch::standard(), true),
             QString("rubberband=pitch=0.981818:formant=preserved"));
    QCOMPARE(Strategy::highQualityFilter(Pitch::standard(), false),
             QString("rubberband=pitch=0.981818"));
}

void TestConversionStrategy::testFallbackFilter()
{
    QCOMPARE(Strategy::fallbackFilter(Pitch::standard(), 48000),
             QString("asetrate=48000*0.981818,"
                     "aresample=48000:resampler=soxr:precision=28:cutoff=1:dither_method=triangular,"
                     "atempo=1.018519"));
    QCOMPARE(Strategy::filterGraph(ConversionStrategy::Fallback, Pitch::standard(), true, 44100),
             Strategy::fallbackFilter(Pitch::standard(), 44100));
    QCOMPARE(Strategy::filterGraph(ConversionStrategy::HighQuality, Pitch::standard(), true, 44100),
             Strategy::highQualityFilter(Pitch::standard(), true));
}

void TestConversionStrategy::testFallbackFilterUnknownRate()
{
    const QString f = Strategy::fallbackFilter(Pitch::standard(), 0);
    QVERIFY(f.startsWith("asetrate=44100*0.981818,aresample=44100:"));
}

void TestConversionStrategy::testEncoderArguments()
{
    QCOMPARE(Strategy::encoderArguments("/out/song_432hz.mp3", "libmp3lame", 0),
             QStringList({"-acodec", "libmp3lame", "-q:a", "0"}));
    QCOMPARE(Strategy::encoderArguments("/out/SONG_432hz.MP3", "libmp3lame", 2),
             QStringList({"-acodec", "libmp3lame", "-q:a", "2"}));
    QCOMPARE(Strategy::encoderArguments("/out/song_432hz.flac", "libmp3lame", 0),
             QStringList({"-acodec", "flac"}));
    QCOMPARE(Strategy::encoderArguments("/out/song_432hz.wav", "libmp3lame", 0),
             QStringList({"-acodec", "pcm_s16le"}));
    QCOMPARE(Strategy::encoderArguments("/out/song_432hz.ogg", "libmp3lame", 0).at(1), QString("libvorbis"));
    QCOMPARE(Strategy::encoderArguments("/out/song_432hz.opus", "libmp3lame", 0).at(1), QString("libopus"));
    QCOMPARE(Strategy::encoderArguments("/out/song_432hz.m4a", "libmp3lame", 0).at(1), QString("aac"));
}

QTEST_APPLESS_MAIN(TestConversionStrategy)
#include "test_conversion_strategy.moc"
