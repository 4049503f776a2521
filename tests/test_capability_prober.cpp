#include <QtTest>
#include <QTemporaryDir>
#include "fake_tools.h"
#include "../src/capability_prober.h"

class TestCapabilityProber : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanup();
    void testFilterListParsing();
    void testConfiguredFfmpegWithRubberband();
    void testConfiguredFfmpegWithoutRubberband();
    void testFfprobeSiblingOfFfmpeg();
    void testSearchDirectories();
    void testNotFound();
    void testWellKnownDirectoriesHonourFfmpegRoot();

private:
    QByteArray m_savedPath;
};

void TestCapabilityProber::initTestCase()
{
#ifdef Q_OS_WIN
    QSKIP("fake tools are POSIX shell scripts");
#endif
    m_savedPath = qgetenv("PATH");
}

void TestCapabilityProber::cleanup()
{
    qputenv("PATH", m_savedPath);
    qunsetenv("FFMPEG_ROOT");
}

void TestCapabilityProber::testFilterListParsing()
{
    const QString listing =
        "Filters:\n"
        "  T.. = Timeline support\n"
        " ..S atempo            A->A       Adjust audio tempo.\n"
        " ... rubberband        A->A       Apply time-stretching and pitch-shifting.\n";
    QVERIFY(CapabilityProber::filterListContains(listing, "rubberband"));
    QVERIFY(CapabilityProber::filterListContains(listing, "atempo"));
    QVERIFY(!CapabilityProber::filterListContains(listing, "rubber"));
    QVERIFY(!CapabilityProber::filterListContains(listing, "pitch-shifting."));
    QVERIFY(!CapabilityProber::filterListContains(QString(), "rubberband"));
}

void TestCapabilityProber::testConfiguredFfmpegWithRubberband()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString ffmpeg = FakeTools::writeFakeFfmpeg(tmp.path());
    QVERIFY(!ffmpeg.isEmpty());

    CapabilityProber prober;
    prober.setConfiguredFfmpeg(ffmpeg);
    const ToolCapabilities caps = prober.probe();
    QCOMPARE(caps.ffmpegPath, QFileInfo(ffmpeg).absoluteFilePath());
    QVERIFY(caps.hasRubberband);
}

void TestCapabilityProber::testConfiguredFfmpegWithoutRubberband()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    FakeTools::FfmpegBehavior b;
    b.listRubberband = false;
    const QString ffmpeg = FakeTools::writeFakeFfmpeg(tmp.path(), b);

    CapabilityProber prober;
    prober.setConfiguredFfmpeg(ffmpeg);
    const ToolCapabilities caps = prober.probe();
    QVERIFY(caps.ffmpegFound());
    QVERIFY(!caps.hasRubberband);
    QVERIFY(prober.hasFilter(ffmpeg, "atempo"));
}

void TestCapabilityProber::testFfprobeSiblingOfFfmpeg()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString ffmpeg = FakeTools::writeFakeFfmpeg(tmp.path());
    const QString ffprobe = FakeTools::writeFakeFfprobe(tmp.path());

    CapabilityProber prober;
    prober.setConfiguredFfmpeg(ffmpeg);
    QCOMPARE(prober.locateFfprobe(ffmpeg), QFileInfo(ffprobe).absoluteFilePath());
}

void TestCapabilityProber::testSearchDirectories()
{
    QTemporaryDir empty;
    QTemporaryDir tools;
    QVERIFY(empty.isValid() && tools.isValid());
    FakeTools::writeFakeFfmpeg(tools.path());
    qputenv("PATH", empty.path().toLocal8Bit());

    CapabilityProber prober;
    prober.setSearchDirectories(QStringList() << tools.path());
    QCOMPARE(prober.locateFfmpeg(), QDir(tools.path()).filePath("ffmpeg"));
}

void TestCapabilityProber::testNotFound()
{
    QTemporaryDir empty;
    QVERIFY(empty.isValid());
    qputenv("PATH", empty.path().toLocal8Bit());

    CapabilityProber prober;
    prober.setSearchDirectories(QStringList());
    prober.setConfiguredFfmpeg(empty.filePath("missing-ffmpeg"));
    const ToolCapabilities caps = prober.probe();
    QVERIFY(!caps.ffmpegFound());
    QVERIFY(!caps.ffprobeFound());
    QVERIFY(!caps.hasRubberband);
}

void TestCapabilityProber::testWellKnownDirectoriesHonourFfmpegRoot()
{
    qputenv("FFMPEG_ROOT", "/opt/custom-ffmpeg");
    const QStringList dirs = CapabilityProber::wellKnownDirectories();
    QVERIFY(!dirs.isEmpty());
    QCOMPARE(dirs.first(), QString("/opt/custom-ffmpeg/bin"));
}

QTEST_GUILESS_MAIN(TestCapabilityProber)
#include "test_capability_prober.moc"
