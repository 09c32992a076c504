#include <QString>
#include <QtTest>

#include "compiler/canvas_resolver.hpp"
#include "scene/errors.hpp"

using namespace vcomp;
using namespace vcomp::compiler;
using namespace vcomp::scene;

static MediaInfo media(int width, int height, double duration = 10.0, FrameRate fps = FrameRate(30))
{
    MediaInfo info;
    info.width = width;
    info.height = height;
    info.fps = fps;
    info.duration = duration;
    return info;
}

static Foreground clip(int width, int height, double duration = 10.0)
{
    return Foreground::native_alpha("fg.mov", media(width, height, duration));
}

class TestCanvas : public QObject
{
    Q_OBJECT

public:
    TestCanvas()
    {
        defaults.log_diagnostics = false;
        defaults.fps = FrameRate(25);
        defaults.image_fps = FrameRate(24);
    }

private:
    config::Defaults defaults;

private Q_SLOTS:
    void ExplicitCanvasWins()
    {
        Composition comp(Background::video("bg.mp4", media(3840, 2160, 20.0, FrameRate(60))));
        comp.set_canvas(1920, 1080, FrameRate(30));
        Diagnostics diagnostics;
        CanvasResolution res = resolve_canvas(comp.snapshot(), defaults, diagnostics);
        QCOMPARE(res.canvas.width, 1920);
        QCOMPARE(res.canvas.height, 1080);
        QVERIFY(res.canvas.fps == FrameRate(30));
        QVERIFY(res.source == CanvasSource::Explicit);
        QVERIFY(diagnostics.entries().empty());
    }

    void VideoBackgroundSizesCanvas()
    {
        Composition comp(Background::video("bg.mp4", media(3840, 2160, 20.0, FrameRate(60))));
        Diagnostics diagnostics;
        CanvasResolution res = resolve_canvas(comp.snapshot(), defaults, diagnostics);
        QCOMPARE(res.canvas.width, 3840);
        QCOMPARE(res.canvas.height, 2160);
        QVERIFY(res.canvas.fps == FrameRate(60));
        QVERIFY(res.source == CanvasSource::Background);
    }

    void ImageBackgroundUsesImageRate()
    {
        Composition comp(Background::image("bg.png", 1280, 720));
        Diagnostics diagnostics;
        CanvasResolution res = resolve_canvas(comp.snapshot(), defaults, diagnostics);
        QCOMPARE(res.canvas.width, 1280);
        QVERIFY(res.canvas.fps == FrameRate(24));
        QCOMPARE(QString(to_string(res.source)), QString("background"));
    }

    void LayerBoundsFallbackWarns()
    {
        Composition comp(Background::color("white"));
        comp.add(clip(1280, 720)).size(SizeSpec::pixels(640, 360));
        comp.add(clip(300, 300)).at(Anchor::TopLeft, 501, 0);
        Diagnostics diagnostics;
        CanvasResolution res = resolve_canvas(comp.snapshot(), defaults, diagnostics);
        QCOMPARE(res.canvas.width, 802);
        QCOMPARE(res.canvas.height, 360);
        QVERIFY(res.canvas.fps == FrameRate(25));
        QVERIFY(res.source == CanvasSource::LayerBounds);
        QCOMPARE(int(diagnostics.entries().size()), 1);
        QVERIFY(diagnostics.entries()[0].level == Diagnostic::Level::Warning);
        QCOMPARE(QString::fromStdString(diagnostics.entries()[0].stage), QString("Canvas"));
    }

    void LayerBoundsFollowRotation()
    {
        Composition comp;
        comp.add(clip(400, 200)).rotate(90);
        Diagnostics diagnostics;
        CanvasResolution res = resolve_canvas(comp.snapshot(), defaults, diagnostics);
        QCOMPARE(res.canvas.width, 200);
        QCOMPARE(res.canvas.height, 400);
    }

    void NothingToSizeFails()
    {
        Composition comp(Background::color("black"));
        Diagnostics diagnostics;
        QVERIFY_EXCEPTION_THROWN(resolve_canvas(comp.snapshot(), defaults, diagnostics), ResolutionError);
    }

    void ExplicitDurationWins()
    {
        Composition comp(Background::video("bg.mp4", media(1920, 1080, 20.0)));
        comp.set_duration(4.0);
        Diagnostics diagnostics;
        QCOMPARE(*resolve_duration(comp.snapshot(), diagnostics), 4.0);
    }

    void VideoBackgroundSetsDuration()
    {
        Composition comp(Background::video("bg.mp4", media(1920, 1080, 20.0)).subclip(5.0));
        comp.add(clip(640, 360, 40.0));
        Diagnostics diagnostics;
        QCOMPARE(*resolve_duration(comp.snapshot(), diagnostics), 15.0);
    }

    void LongestLayerSetsDuration()
    {
        Composition comp(Background::color("black"));
        comp.add(clip(640, 360, 6.0)).start(3.0);
        comp.add(clip(640, 360, 2.0)).end(8.0);
        Diagnostics diagnostics;
        QCOMPARE(*resolve_duration(comp.snapshot(), diagnostics), 9.0);
        QCOMPARE(int(diagnostics.entries().size()), 1);
        QVERIFY(diagnostics.entries()[0].level == Diagnostic::Level::Note);
    }

    void EndlessBackgroundFails()
    {
        Composition comp(Background::image("bg.png", 1920, 1080));
        comp.add(clip(640, 360, 0.0));
        Diagnostics diagnostics;
        QVERIFY_EXCEPTION_THROWN(resolve_duration(comp.snapshot(), diagnostics), ResolutionError);
    }

    void UnknownVideoLengthLeftOpen()
    {
        Composition comp(Background::video("bg.mp4", media(1920, 1080, 0.0)));
        Diagnostics diagnostics;
        QVERIFY(!resolve_duration(comp.snapshot(), diagnostics));
    }
};

QTEST_APPLESS_MAIN(TestCanvas)

#include "test_canvas.moc"
