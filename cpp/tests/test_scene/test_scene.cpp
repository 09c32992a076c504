#include <QString>
#include <QtTest>

#include <climits>
#include <cmath>

#include "scene/composition.hpp"
#include "scene/errors.hpp"

using namespace vcomp;
using namespace vcomp::scene;

static QString q(const std::string& s)
{
    return QString::fromStdString(s);
}

static MediaInfo media(int width, int height, double duration = 10.0, bool audio = false)
{
    MediaInfo info;
    info.width = width;
    info.height = height;
    info.fps = FrameRate(30);
    info.duration = duration;
    info.has_audio = audio;
    return info;
}

class TestScene : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void FrameRateReduces()
    {
        FrameRate rate(60, 2);
        QCOMPARE(rate.num, 30);
        QCOMPARE(rate.den, 1);
        QVERIFY(FrameRate(50, 2) == FrameRate(25));
        QVERIFY_EXCEPTION_THROWN(FrameRate(0), ConfigurationError);
    }

    void FrameRateFromDouble()
    {
        QCOMPARE(q(FrameRate::from_double(29.97).to_string()), QString("30000/1001"));
        QCOMPARE(q(FrameRate::from_double(23.976).to_string()), QString("24000/1001"));
        QCOMPARE(q(FrameRate::from_double(25.0).to_string()), QString("25"));
        QCOMPARE(q(FrameRate::from_double(12.5).to_string()), QString("25/2"));
    }

    void FrameRateRejectsHugeRates()
    {
        QCOMPARE(q(FrameRate::from_double(kMaxFrameRate).to_string()), QString("1000000"));
        QVERIFY_EXCEPTION_THROWN(FrameRate::from_double(1e12), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(FrameRate::from_double(3e6 + 0.5), ConfigurationError);
    }

    void NamesParse()
    {
        Anchor anchor;
        QVERIFY(parse_anchor("top-left", anchor));
        QVERIFY(anchor == Anchor::TopLeft);
        QVERIFY(parse_anchor("bottom_right", anchor));
        QVERIFY(anchor == Anchor::BottomRight);
        QVERIFY(parse_anchor("top", anchor));
        QVERIFY(anchor == Anchor::TopCenter);
        QVERIFY(!parse_anchor("middle-ish", anchor));
        QCOMPARE(QString(to_string(Anchor::CenterLeft)), QString("center-left"));

        SizeMode mode;
        QVERIFY(parse_size_mode("canvas_percent", mode));
        QVERIFY(mode == SizeMode::CanvasPercent);
        QVERIFY(parse_size_mode("px", mode));
        QVERIFY(mode == SizeMode::Pixels);
        QVERIFY(!parse_size_mode("stretch", mode));
    }

    void StackedSourceSize()
    {
        Foreground side = Foreground::stacked("fg.mp4", StackOrientation::SideBySide,
                                              StackOrder::ColorFirst, media(2560, 720));
        QCOMPARE(side.source_width(), 1280);
        QCOMPARE(side.source_height(), 720);

        Foreground top = Foreground::stacked("fg.mp4", StackOrientation::TopBottom,
                                             StackOrder::AlphaFirst, media(1280, 1440));
        QCOMPARE(top.source_width(), 1280);
        QCOMPARE(top.source_height(), 720);

        QVERIFY_EXCEPTION_THROWN(Foreground::stacked("fg.mp4", StackOrientation::SideBySide,
                                                     StackOrder::ColorFirst, media(1, 720)),
                                 ConfigurationError);
    }

    void DescriptorFormats()
    {
        ForegroundDescriptor desc;
        desc.format = "webm_vp9";
        desc.path = "fg.webm";
        desc.media = media(1280, 720);
        QVERIFY(std::holds_alternative<NativeAlpha>(Foreground::from_descriptor(desc).encoding()));

        desc.format = "stacked_video";
        QVERIFY_EXCEPTION_THROWN(Foreground::from_descriptor(desc), ConfigurationError);
        desc.orientation = StackOrientation::TopBottom;
        QVERIFY_EXCEPTION_THROWN(Foreground::from_descriptor(desc), ConfigurationError);
        desc.order = StackOrder::ColorFirst;
        QVERIFY(std::holds_alternative<StackedLayout>(Foreground::from_descriptor(desc).encoding()));

        desc.format = "pro_bundle";
        desc.mask_path = "mask.mp4";
        desc.audio_path = "voice.wav";
        Foreground split = Foreground::from_descriptor(desc);
        QVERIFY(std::holds_alternative<SplitMask>(split.encoding()));
        QVERIFY(split.has_audio());

        desc.format = "gif";
        QVERIFY_EXCEPTION_THROWN(Foreground::from_descriptor(desc), ConfigurationError);
    }

    void EmptyPathRejected()
    {
        QVERIFY_EXCEPTION_THROWN(Foreground::native_alpha("", media(640, 360)), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(Foreground::native_alpha("fg.webm", media(0, 360)), ConfigurationError);
    }

    void SubclipShortensDuration()
    {
        Foreground fg = Foreground::native_alpha("fg.webm", media(640, 360, 10.0));
        QCOMPARE(fg.subclip(2.0, 6.0).duration(), 4.0);
        QCOMPARE(fg.subclip(3.0).duration(), 7.0);
        QCOMPARE(fg.duration(), 10.0);
        QVERIFY_EXCEPTION_THROWN(fg.subclip(12.0), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(fg.subclip(4.0, 3.0), ConfigurationError);
    }

    void BackgroundColors()
    {
        Background red = Background::color("#FF0000");
        const auto& fill = std::get<ColorFill>(red.source());
        QCOMPARE(q(fill.color), QString("0xff0000"));
        QCOMPARE(fill.alpha, 1.0);
        QVERIFY(!red.is_transparent());

        Background half = Background::color("#00FF0080");
        QVERIFY(std::fabs(std::get<ColorFill>(half.source()).alpha - 128.0 / 255.0) < 1e-9);
        QVERIFY(half.is_transparent());

        QCOMPARE(q(std::get<ColorFill>(Background::color("Navy").source()).color), QString("navy"));
        QVERIFY(Background::transparent().is_transparent());
        QVERIFY_EXCEPTION_THROWN(Background::color("#12"), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(Background::color("not a color"), ConfigurationError);
    }

    void BackgroundVideoOnlyOptions()
    {
        QVERIFY_EXCEPTION_THROWN(Background::color("black").with_audio(false), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(Background::image("bg.png", 1920, 1080).subclip(1.0), ConfigurationError);

        Background video = Background::video("bg.mp4", media(1920, 1080, 20.0, true));
        QVERIFY(video.has_intrinsic_size());
        QVERIFY(video.has_audio());
        QCOMPARE(*video.subclip(5.0).duration(), 15.0);
        QVERIFY(!Background::image("bg.png", 1920, 1080).duration());
        QVERIFY(!video.with_audio(false).audio_enabled());
    }

    void SettersChain()
    {
        Layer layer(1, "a", Foreground::native_alpha("fg.webm", media(640, 360)));
        Layer& same = layer.at(Anchor::TopLeft).opacity(0.5).rotate(15).start(1).duration(2);
        QCOMPARE(&same, &layer);
        QCOMPARE(layer.state().opacity, 0.5);
        QCOMPARE(layer.state().rotation, 15.0);
        QCOMPARE(*layer.state().timing.start, 1.0);
    }

    void SetterValidation()
    {
        Layer layer(1, "a", Foreground::native_alpha("fg.webm", media(640, 360)));
        QVERIFY_EXCEPTION_THROWN(layer.opacity(1.5), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.opacity(-0.1), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.rotate(NAN), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.crop(600, 0, 100, 100), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.crop(0, 0, 0, 100), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.crop(INT_MAX, 0, 1, 1), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.crop(1, 0, INT_MAX, 1), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.crop(0, INT_MAX - 10, 1, 100), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.audio(true, -1.0), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(layer.duration(0), ConfigurationError);

        // A rejected setter leaves the layer untouched
        layer.start(2);
        QVERIFY_EXCEPTION_THROWN(layer.end(1), CompositionError);
        QVERIFY(!layer.state().timing.end);
        QCOMPARE(layer.state().opacity, 1.0);

        // Crop flush with the source edge is accepted
        layer.crop(540, 0, 100, 360);
        QVERIFY(layer.state().crop);
        QCOMPARE(layer.state().crop->x, 540);
    }

    void CompositionLayers()
    {
        Composition comp(Background::color("black"));
        Foreground fg = Foreground::native_alpha("fg.webm", media(640, 360));
        Layer& first = comp.add(fg);
        Layer& second = comp.add(fg, "title");
        QCOMPARE(q(first.name()), QString("layer1"));
        QCOMPARE(q(second.name()), QString("title"));
        QCOMPARE(int(comp.layer_count()), 2);
        QCOMPARE(&comp.layer(second.id()), &second);
        QVERIFY_EXCEPTION_THROWN(comp.layer(99), ConfigurationError);
    }

    void LayerReferencesStayValid()
    {
        Composition comp(Background::color("black"));
        Foreground fg = Foreground::native_alpha("fg.webm", media(640, 360));
        Layer& first = comp.add(fg);
        for (int i = 0; i < 16; i++) comp.add(fg);
        first.opacity(0.25);
        QCOMPARE(comp.snapshot().layers[0].opacity, 0.25);
    }

    void MoveAndRemove()
    {
        Composition comp(Background::color("black"));
        Foreground fg = Foreground::native_alpha("fg.webm", media(640, 360));
        LayerId a = comp.add(fg, "a").id();
        LayerId b = comp.add(fg, "b").id();
        LayerId c = comp.add(fg, "c").id();

        comp.move(c, 0);
        SceneSnapshot snap = comp.snapshot();
        QCOMPARE(q(snap.layers[0].name), QString("c"));
        QCOMPARE(q(snap.layers[1].name), QString("a"));
        QCOMPARE(q(snap.layers[2].name), QString("b"));

        comp.remove(a);
        snap = comp.snapshot();
        QCOMPARE(int(snap.layers.size()), 2);
        QCOMPARE(snap.layers[1].id, b);
        QVERIFY_EXCEPTION_THROWN(comp.remove(a), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(comp.move(b, 5), ConfigurationError);

        // Ids are never reused
        QVERIFY(comp.add(fg).id() > c);
    }

    void SnapshotIsIsolated()
    {
        Composition comp(Background::color("black"));
        Layer& layer = comp.add(Foreground::native_alpha("fg.webm", media(640, 360)));
        SceneSnapshot before = comp.snapshot();
        layer.opacity(0.1);
        comp.set_duration(3);
        QCOMPARE(before.layers[0].opacity, 1.0);
        QVERIFY(!before.duration);
    }

    void CanvasValidation()
    {
        Composition comp = Composition::with_canvas(1280, 720, FrameRate(25));
        QVERIFY(comp.canvas());
        QCOMPARE(comp.canvas()->width, 1280);
        QVERIFY(comp.background()->is_transparent());
        QVERIFY_EXCEPTION_THROWN(comp.set_canvas(0, 720, FrameRate(25)), ConfigurationError);
        QVERIFY_EXCEPTION_THROWN(comp.set_duration(-1), ConfigurationError);
    }
};

QTEST_APPLESS_MAIN(TestScene)

#include "test_scene.moc"
