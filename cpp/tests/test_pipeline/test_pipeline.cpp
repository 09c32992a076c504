#include <QString>
#include <QTemporaryDir>
#include <QtTest>

#include <cstdio>
#include <fstream>

#include <unistd.h>

#include "compiler/compiler.hpp"
#include "compiler/program.hpp"
#include "config/defaults.hpp"
#include "pipeline/engine_runner.hpp"
#include "pipeline/graph_validator.hpp"
#include "pipeline/media_probe.hpp"
#include "pipeline/scene_loader.hpp"
#include "utils/cancel_flag.hpp"

using namespace vcomp;
using namespace vcomp::compiler;
using namespace vcomp::pipeline;

static CompiledProgram::Parts overlay_parts()
{
    CompiledProgram::Parts parts;
    parts.canvas = scene::Canvas{640, 360, scene::FrameRate(25)};

    InputSpec bg;
    bg.options = {"-f", "lavfi"};
    bg.url = "color=c=black:size=640x360:rate=25";
    InputSpec fg;
    fg.url = "logo.webm";
    parts.inputs = {bg, fg};

    parts.nodes = {
        FilterNode{"format", {"1:v"}, {"l1_src"}, "rgba"},
        FilterNode{"scale", {"l1_src"}, {"l1_scale"}, "320:180"},
        FilterNode{"overlay", {"0:v", "l1_scale"}, {"vout"}, "x='(W-w)/2':y='(H-h)/2':eof_action=pass"},
    };
    parts.video_map = "[vout]";
    parts.encoder.video = {"-c:v", "libx264"};
    parts.output = OutputTarget::file("out.mp4");
    return parts;
}

static const char* kLogoScene = R"({
    "background": {"type": "color", "color": "#000000"},
    "canvas": {"width": 640, "height": 360, "fps": 25},
    "duration": 3,
    "layers": [
        {
            "source": {"format": "webm_vp9", "path": "logo.webm",
                       "width": 200, "height": 200, "codec": "vp9"},
            "size": {"mode": "pixels", "width": 100, "height": 100}
        }
    ],
    "encoder": {"kind": "h264"},
    "output": {"path": "out.mp4"}
})";

// Points fd 1 at a temporary file until finish() hands back what was written
class StdoutCapture
{
public:
    StdoutCapture()
        : file_(std::tmpfile())
    {
        fflush(stdout);
        saved_ = dup(STDOUT_FILENO);
        if (file_) dup2(fileno(file_), STDOUT_FILENO);
    }

    ~StdoutCapture()
    {
        restore();
        if (file_) fclose(file_);
    }

    std::string finish()
    {
        restore();
        std::string text;
        if (!file_) return text;
        rewind(file_);
        char buf[4096];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), file_)) > 0) text.append(buf, n);
        return text;
    }

    bool ok() const { return file_ != nullptr && saved_ >= 0; }

private:
    void restore()
    {
        if (saved_ < 0) return;
        fflush(stdout);
        dup2(saved_, STDOUT_FILENO);
        ::close(saved_);
        saved_ = -1;
    }

    FILE* file_;
    int saved_ = -1;
};

class TestPipeline : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void ParsesStatusLine()
    {
        double seconds = -1.0;
        double speed = -1.0;
        std::string line = "frame=  120 fps= 60 q=28.0 size=     256kB time=00:01:02.50 bitrate= 33.5kbits/s speed=1.5x";
        QVERIFY(EngineRunner::parse_progress(line, &seconds, &speed));
        QCOMPARE(seconds, 62.5);
        QCOMPARE(speed, 1.5);
    }

    void ParsesHours()
    {
        double seconds = 0.0;
        QVERIFY(EngineRunner::parse_progress("time=01:00:03.00", &seconds, nullptr));
        QCOMPARE(seconds, 3603.0);
    }

    void MissingSpeedIsZero()
    {
        double seconds = 0.0;
        double speed = -1.0;
        QVERIFY(EngineRunner::parse_progress("size=0kB time=00:00:04.00 bitrate=N/A", &seconds, &speed));
        QCOMPARE(seconds, 4.0);
        QCOMPARE(speed, 0.0);
    }

    void RejectsNonStatusLines()
    {
        double seconds = 0.0;
        QVERIFY(!EngineRunner::parse_progress("Input #0, matroska,webm, from 'logo.webm':", &seconds, nullptr));
        QVERIFY(!EngineRunner::parse_progress("time=N/A", &seconds, nullptr));
    }

    void ValidGraphPasses()
    {
        CompiledProgram program(overlay_parts());
        std::string error;
        QVERIFY2(GraphValidator().validate(program, &error), error.c_str());
        QVERIFY(error.empty());
    }

    void EmptyGraphPasses()
    {
        CompiledProgram::Parts parts = overlay_parts();
        parts.nodes.clear();
        parts.video_map = "0:v";
        std::string error;
        QVERIFY(GraphValidator().validate(CompiledProgram(parts), &error));
    }

    void UnknownInputStreamFails()
    {
        CompiledProgram::Parts parts = overlay_parts();
        parts.nodes[0].inputs = {"2:v"};
        std::string error;
        QVERIFY(!GraphValidator().validate(CompiledProgram(parts), &error));
        QVERIFY(error.find("[2:v]") != std::string::npos);
    }

    void UnmappedOutputFails()
    {
        CompiledProgram::Parts parts = overlay_parts();
        parts.video_map = "[l1_scale]";
        std::string error;
        QVERIFY(!GraphValidator().validate(CompiledProgram(parts), &error));
        QVERIFY(error.find("[vout]") != std::string::npos);
    }

    void LoadingAndCompilingKeepStdoutClean()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::string config_path = dir.filePath("defaults.conf").toStdString();
        {
            std::ofstream out(config_path);
            out << "h264_crf=20\n";
        }

        StdoutCapture capture;
        QVERIFY(capture.ok());

        config::Defaults defaults;
        bool loaded = defaults.load_from_file(config_path);
        SceneFile scene = SceneLoader(probe_media).load_string(kLogoScene);
        CompiledProgram program =
            CompositionCompiler(defaults).compile(scene.composition, scene.profile, scene.output);
        std::string error;
        bool valid = GraphValidator().validate(program, &error);
        scene::MediaInfo info;
        bool probed = probe_media(dir.filePath("missing.webm").toStdString(), info);

        std::string written = capture.finish();
        QVERIFY(loaded);
        QVERIFY2(valid, error.c_str());
        QVERIFY(!probed);
        QCOMPARE(QString::fromStdString(written), QString());
    }

    void StaleCancelDoesNotStopNextRun()
    {
        utils::request_cancel();
        QVERIFY(utils::is_cancel_requested());
        QCOMPARE(utils::cancel_signal(), 0);

        EngineRunner runner("true");
        EngineResult result = runner.run(CompiledProgram(overlay_parts()));
        QVERIFY(!result.cancelled);
        QCOMPARE(result.exit_code, 0);
        QVERIFY(!utils::is_cancel_requested());
    }

    void UnknownFilterFails()
    {
        CompiledProgram::Parts parts = overlay_parts();
        parts.nodes[1].operation = "no_such_filter";
        std::string error;
        QVERIFY(!GraphValidator().validate(CompiledProgram(parts), &error));
        QVERIFY(!error.empty());
    }
};

QTEST_APPLESS_MAIN(TestPipeline)

#include "test_pipeline.moc"
