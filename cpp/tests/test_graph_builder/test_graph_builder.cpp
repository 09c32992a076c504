#include <QString>
#include <QtTest>

#include <algorithm>

#include "compiler/compiler.hpp"
#include "compiler/timing.hpp"
#include "scene/errors.hpp"

using namespace vcomp;
using namespace vcomp::compiler;
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

static bool contains(const std::vector<std::string>& args, const std::string& value)
{
    return std::find(args.begin(), args.end(), value) != args.end();
}

static bool has_diagnostic(const CompiledProgram& program, Diagnostic::Level level, const std::string& stage)
{
    for (const auto& d : program.diagnostics()) {
        if (d.level == level && d.stage == stage) return true;
    }
    return false;
}

class TestGraphBuilder : public QObject
{
    Q_OBJECT

public:
    TestGraphBuilder()
    {
        defaults.log_diagnostics = false;
    }

private:
    config::Defaults defaults;

    Composition hd_scene() const
    {
        Composition comp(Background::color("#000000"));
        comp.set_canvas(1920, 1080, FrameRate(30));
        return comp;
    }

private Q_SLOTS:
    void CenteredContainLayer()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::native_alpha("fg.mov", media(1280, 720))).audio(false);

        CompositionCompiler compiler(defaults);
        CompiledProgram program = compiler.compile(comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));

        std::vector<FilterNode> scales = program.nodes_named("scale");
        QCOMPARE(int(scales.size()), 1);
        QCOMPARE(q(scales[0].params), QString("1920:1080:force_original_aspect_ratio=decrease"));

        std::vector<FilterNode> overlays = program.nodes_named("overlay");
        QCOMPARE(int(overlays.size()), 1);
        QCOMPARE(q(overlays[0].params), QString("x='(W-w)/2':y='(H-h)/2':eof_action=pass"));

        QCOMPARE(q(program.filter_graph()),
                 QString("[1:v]format=rgba,scale=1920:1080:force_original_aspect_ratio=decrease[l1_scale];"
                         "[0:v][l1_scale]overlay=x='(W-w)/2':y='(H-h)/2':eof_action=pass[vout]"));

        std::vector<std::string> args = program.arguments();
        QVERIFY(contains(args, "-an"));
        QVERIFY(!program.audio_map());
        QCOMPARE(q(program.video_map()), QString("[vout]"));
        QCOMPARE(q(args[0]), QString("-y"));
        QCOMPARE(q(args[1]), QString("-f"));
        QCOMPARE(q(args[2]), QString("lavfi"));
        QCOMPARE(q(args[4]), QString("color=c=0x000000:size=1920x1080:rate=30"));
        QCOMPARE(q(args.back()), QString("out.mp4"));
        QVERIFY(!program.requires_alpha());
        QCOMPARE(*program.duration(), 10.0);
    }

    void AdjacentWindowsNeverOverlap()
    {
        Composition comp = hd_scene();
        Foreground fg = Foreground::native_alpha("fg.mov", media(640, 360, 20.0));
        comp.add(fg).end(5);
        comp.add(fg).start(5).end(10);

        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));

        std::vector<FilterNode> overlays = program.nodes_named("overlay");
        QCOMPARE(int(overlays.size()), 2);
        QVERIFY(overlays[0].params.find(":enable='lt(t,5)'") != std::string::npos);
        QVERIFY(overlays[1].params.find(":enable='gte(t,5)*lt(t,10)'") != std::string::npos);

        std::vector<FilterNode> shifts = program.nodes_named("setpts");
        QCOMPARE(int(shifts.size()), 1);
        QCOMPARE(q(shifts[0].params), QString("PTS-STARTPTS+5/TB"));

        SceneSnapshot snap = comp.snapshot();
        EnablePredicate first(resolve_timing(snap.layers[0].timing));
        EnablePredicate second(resolve_timing(snap.layers[1].timing));
        for (int step = 0; step < 1000; step++) {
            double t = step * 0.01;
            QVERIFY(first.contains(t) != second.contains(t));
        }
        QCOMPARE(*program.duration(), 10.0);
    }

    void ZOrderFollowsLayerOrder()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::native_alpha("a.mov", media(640, 360)));
        LayerId b = comp.add(Foreground::native_alpha("b.mov", media(640, 360))).id();

        CompositionCompiler compiler(defaults);
        CompiledProgram before = compiler.compile(comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        comp.move(b, 0);
        CompiledProgram after = compiler.compile(comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));

        QCOMPARE(q(before.inputs()[1].url), QString("a.mov"));
        QCOMPARE(q(before.inputs()[2].url), QString("b.mov"));
        QCOMPARE(q(after.inputs()[1].url), QString("b.mov"));
        QCOMPARE(q(after.inputs()[2].url), QString("a.mov"));
        QVERIFY(before != after);

        // Only the sources trade places
        std::vector<std::string> swapped = after.arguments();
        for (auto& arg : swapped) {
            if (arg == "a.mov") arg = "b.mov";
            else if (arg == "b.mov") arg = "a.mov";
        }
        QVERIFY(swapped == before.arguments());
    }

    void ExplicitCanvasBeatsBackground()
    {
        Composition comp(Background::video("bg.mp4", media(3840, 2160, 20.0)));
        comp.set_canvas(1920, 1080, FrameRate(30));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));

        QCOMPARE(program.canvas().width, 1920);
        QCOMPARE(program.canvas().height, 1080);
        QCOMPARE(q(program.nodes_named("scale")[0].params), QString("1920:1080:force_original_aspect_ratio=increase"));
        QCOMPARE(q(program.nodes_named("crop")[0].params), QString("1920:1080"));
        QVERIFY(program.nodes_named("fps").empty());
        QCOMPARE(q(program.video_map()), QString("[vout]"));
        QCOMPARE(*program.duration(), 20.0);
    }

    void BackgroundRateConverted()
    {
        MediaInfo info = media(1920, 1080, 20.0);
        info.fps = FrameRate(60);
        Composition comp(Background::video("bg.mp4", info));
        comp.set_canvas(1920, 1080, FrameRate(30));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        QVERIFY(program.nodes_named("scale").empty());
        QCOMPARE(q(program.nodes_named("fps")[0].params), QString("30"));
    }

    void StillImageLoops()
    {
        Composition comp(Background::image("bg.png", 1280, 720));
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360, 4.0)));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        const InputSpec& bg = program.inputs()[0];
        QCOMPARE(q(bg.url), QString("bg.png"));
        QCOMPARE(int(bg.options.size()), 4);
        QCOMPARE(q(bg.options[0]), QString("-loop"));
        QCOMPARE(q(bg.options[3]), QString("30"));
        QCOMPARE(*program.duration(), 4.0);
    }

    void TransparentSceneNeedsAlphaEncoder()
    {
        Composition comp = Composition::with_canvas(1280, 720, FrameRate(30));
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360)));
        CompositionCompiler compiler(defaults);
        QVERIFY_EXCEPTION_THROWN(compiler.compile(comp, EncoderProfile::h264(), OutputTarget::file("out.mp4")),
                                 ConfigurationError);

        CompiledProgram program = compiler.compile(comp, EncoderProfile::transparent_webm(),
                                                   OutputTarget::file("out.webm"));
        QVERIFY(program.requires_alpha());
        QCOMPARE(q(program.inputs()[0].url), QString("color=c=black@0:size=1280x720:rate=30"));
        QCOMPARE(q(program.nodes()[0].body()), QString("format=rgba"));
        QVERIFY(q(program.nodes_named("overlay")[0].params).endsWith(":format=rgb"));
        QVERIFY(contains(program.arguments(), "yuva420p"));
    }

    void LayerTransformOrder()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::native_alpha("fg.mov", media(1280, 720)))
            .crop(0, 0, 640, 360)
            .size(SizeSpec::pixels(320, 180))
            .rotate(30)
            .opacity(0.5);
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));

        std::vector<std::string> order;
        for (const auto& node : program.nodes()) order.push_back(node.operation);
        std::vector<std::string> expected = {"format", "crop", "scale", "rotate", "colorchannelmixer", "overlay"};
        QVERIFY(order == expected);

        QCOMPARE(q(program.nodes_named("crop")[0].params), QString("640:360:0:0"));
        QCOMPARE(q(program.nodes_named("scale")[0].params), QString("320:180"));
        QCOMPARE(q(program.nodes_named("rotate")[0].params),
                 QString("a=30*PI/180:ow=rotw(30*PI/180):oh=roth(30*PI/180):c=none"));
        QCOMPARE(q(program.nodes_named("colorchannelmixer")[0].params), QString("aa=0.5"));
    }

    void AudioSourcesMixed()
    {
        Composition comp(Background::video("bg.mp4", media(1920, 1080, 20.0, true)));
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360, 5.0, true))).start(2).audio(true, 0.5);
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));

        QCOMPARE(q(program.nodes_named("adelay")[0].params), QString("2000:all=1"));
        QCOMPARE(q(program.nodes_named("volume")[0].params), QString("0.5"));
        std::vector<FilterNode> mix = program.nodes_named("amix");
        QCOMPARE(int(mix.size()), 1);
        QCOMPARE(q(mix[0].params), QString("inputs=2:duration=longest:normalize=0"));
        QCOMPARE(q(mix[0].inputs[0]), QString("0:a"));
        QCOMPARE(q(*program.audio_map()), QString("[aout]"));
        QVERIFY(contains(program.arguments(), "aac"));
        QVERIFY(!contains(program.arguments(), "-an"));
    }

    void SingleAudioSourceMappedDirectly()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360, 5.0, true)));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        QCOMPARE(q(*program.audio_map()), QString("1:a"));
        QVERIFY(program.nodes_named("amix").empty());
    }

    void TimedAudioIsTrimmed()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360, 5.0, true))).start(1).end(4);
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        QCOMPARE(q(program.nodes_named("adelay")[0].params), QString("1000:all=1"));
        QCOMPARE(q(program.nodes_named("atrim")[0].params), QString("end=4"));
        QCOMPARE(q(program.nodes_named("atrim")[0].outputs[0]), QString("aout"));
        QCOMPARE(q(*program.audio_map()), QString("[aout]"));
    }

    void MutedBackgroundSkipped()
    {
        Composition comp(Background::video("bg.mp4", media(1920, 1080, 20.0, true)).with_audio(false));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        QVERIFY(!program.audio_map());
        QVERIFY(has_diagnostic(program, Diagnostic::Level::Note, "Audio"));
        QVERIFY(program.nodes().empty());
        QCOMPARE(q(program.video_map()), QString("0:v"));
    }

    void ImageSequenceDropsAudio()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360, 5.0, true)));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::png_sequence(), OutputTarget::file("frames/f_%05d.png"));
        QVERIFY(!program.audio_map());
        QVERIFY(contains(program.arguments(), "-an"));
        QVERIFY(has_diagnostic(program, Diagnostic::Level::Warning, "Audio"));
    }

    void StackedOutputPacksAlpha()
    {
        Composition comp = Composition::with_canvas(1280, 720, FrameRate(30));
        comp.add(Foreground::native_alpha("fg.mov", media(640, 360)));
        CompiledProgram program = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::stacked_video(StackLayout::Vertical), OutputTarget::file("out.mp4"));

        const FilterNode& last = program.nodes().back();
        QCOMPARE(q(last.operation), QString("vstack"));
        QCOMPARE(q(last.params), QString("inputs=2"));
        QCOMPARE(q(last.inputs[0]), QString("stack_color"));
        QCOMPARE(q(last.inputs[1]), QString("stack_alpha"));
        QCOMPARE(int(program.nodes_named("alphaextract").size()), 1);
        QCOMPARE(q(program.video_map()), QString("[vout]"));

        CompiledProgram side = CompositionCompiler(defaults).compile(
            comp, EncoderProfile::stacked_video(StackLayout::Horizontal), OutputTarget::file("out.mp4"));
        QCOMPARE(q(side.nodes().back().operation), QString("hstack"));
    }

    void SameSnapshotSameProgram()
    {
        Composition comp = hd_scene();
        comp.add(Foreground::stacked("fg.mp4", StackOrientation::TopBottom, StackOrder::ColorFirst,
                                     media(1280, 1440, 6.0, true)))
            .size(SizeSpec::canvas_percent(40))
            .at(Anchor::BottomRight, -40, -40)
            .start(1.5);
        SceneSnapshot snap = comp.snapshot();

        CompositionCompiler compiler(defaults);
        CompiledProgram first = compiler.compile(snap, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        comp.layer(snap.layers[0].id).opacity(0.2);
        CompiledProgram second = compiler.compile(snap, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        QVERIFY(first == second);
        QCOMPARE(q(first.command_line("ffmpeg")), q(second.command_line("ffmpeg")));

        CompiledProgram edited = compiler.compile(comp, EncoderProfile::h264(), OutputTarget::file("out.mp4"));
        QVERIFY(edited != first);
    }
};

QTEST_APPLESS_MAIN(TestGraphBuilder)

#include "test_graph_builder.moc"
