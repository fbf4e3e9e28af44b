#include <JuceHeader.h>
#include "../src/core/RenderJob.h"
#include "../src/core/RenderOptions.h"
#include "../src/rendering/RenderEngine.h"
#include "../src/rendering/SegmentEncoder.h"

using namespace RenderTypes;

namespace
{
    juce::File createScratchDirectory(const juce::String& name)
    {
        auto dir = juce::File::getSpecialLocation(juce::File::tempDirectory).getNonexistentChildFile(name, "", false);
        dir.createDirectory();
        return dir;
    }

    RenderOptions scratchOptions(const juce::File& root)
    {
        RenderOptions options;
        options.useHardwareEncoding = false;
        options.tempDirectory = root.getChildFile("work");
        options.logDirectory = root.getChildFile("logs");
        options.tempDirectory.createDirectory();
        return options;
    }

    bool writeTone(const juce::File& file, double seconds)
    {
        AudioTrack track;
        track.buffer.setSize(2, (int) std::llround(seconds * track.sampleRate));
        for (int i = 0; i < track.buffer.getNumSamples(); ++i)
        {
            const auto sample = 0.25f * std::sin(2.0f * juce::MathConstants<float>::pi * 440.0f * (float) i / 44100.0f);
            track.buffer.setSample(0, i, sample);
            track.buffer.setSample(1, i, sample);
        }

        AudioMixer mixer;
        return mixer.writeWav(track, file);
    }

    Layer layerWith(LayerType type, const juce::StringArray& sources, double start = 0.0, double duration = -1.0)
    {
        Layer layer;
        layer.type = type;
        layer.sources = sources;
        layer.hasArraySource = sources.size() > 1;
        layer.source = sources[0];
        layer.startTime = start;
        layer.duration = duration;
        return layer;
    }
}

//==============================================================================
class EncoderSettingsTests : public juce::UnitTest
{
public:
    EncoderSettingsTests() : juce::UnitTest("EncoderSettings", "Encoding") {}

    void runTest() override
    {
        beginTest("User encoder params cannot override managed options");
        {
            const auto args = RenderOptions::sanitiseEncoderParams("-c:v libx265 -preset slow -pix_fmt yuv444p -an -crf 20 -r=25",
                                                                   "libx264");
            expectEquals(args.joinIntoString(" "), juce::String("-c:v libx264 -preset slow -crf 20"));
        }

        beginTest("Quality presets select encoder settings");
        {
            RenderOptions options;
            expectEquals(options.getSoftwareEncoderArgs().joinIntoString(" "),
                         juce::String("-c:v libx264 -preset fast -crf 23"));
            expectEquals(options.getHardwareEncoderArgs().joinIntoString(" "),
                         juce::String("-c:v h264_nvenc -preset p4 -cq 23"));

            options.quality = RenderOptions::Quality::High;
            expectEquals(options.getSoftwareEncoderArgs().joinIntoString(" "),
                         juce::String("-c:v libx264 -preset medium -crf 18"));

            options.softwareParams = "-preset veryslow -crf 16";
            expectEquals(options.getSoftwareEncoderArgs().joinIntoString(" "),
                         juce::String("-c:v libx264 -preset veryslow -crf 16"));
        }

        beginTest("Quality names are parsed leniently");
        {
            expect(RenderOptions::qualityFromString(" HIGH ") == RenderOptions::Quality::High);
            expect(RenderOptions::qualityFromString("low") == RenderOptions::Quality::Low);
            expect(RenderOptions::qualityFromString("ultra") == RenderOptions::Quality::Medium);
        }

        beginTest("Options are read from JSON config");
        {
            const auto options = RenderOptions::fromVar(juce::JSON::parse(R"({
                "fps": 25, "quality": "low", "use_hardware_encoding": false,
                "background_clips": {"9:16": "/media/bg_vertical.mp4"},
                "transition_type": "fade_black", "transition_duration": 0.5, "auto_transitions": true,
                "keep_temp_files": true
            })"));

            expectWithinAbsoluteError(options.fps, 25.0, 1.0e-9);
            expect(options.quality == RenderOptions::Quality::Low);
            expect(!options.useHardwareEncoding);
            expect(options.autoTransitions);
            expect(options.keepTempFiles);
            expectEquals(options.getBackgroundClip("9:16").getFullPathName(), juce::String("/media/bg_vertical.mp4"));
            expect(options.getBackgroundClip("16:9") == juce::File());

            const auto transition = options.getDefaultTransition();
            expectEquals(transition["transition_type"].toString(), juce::String("fade_black"));
            expectWithinAbsoluteError((double) transition["duration"], 0.5, 1.0e-9);
        }

        beginTest("Broken config files are reported");
        {
            const auto dir = createScratchDirectory("storyreel_config_tests");
            const auto file = dir.getChildFile("config.json");
            file.replaceWithText("{ \"fps\": ");

            RenderOptions options;
            expect(RenderOptions::loadFromFile(file, options).failed());
            expect(RenderOptions::loadFromFile(dir.getChildFile("missing.json"), options).failed());

            file.replaceWithText("{ \"fps\": 24 }");
            expect(RenderOptions::loadFromFile(file, options).wasOk());
            expectWithinAbsoluteError(options.fps, 24.0, 1.0e-9);

            dir.deleteRecursively();
        }

        beginTest("ffmpeg progress lines are parsed");
        {
            expectWithinAbsoluteError(FFmpegExecutor::parseProgressSeconds("frame=  120 fps= 30 q=28.0 size=512kB time=00:01:02.50 bitrate=1000kbits/s"),
                                      62.5, 1.0e-9);
            expectWithinAbsoluteError(FFmpegExecutor::parseProgressSeconds("size=0kB time=N/A bitrate=N/A"), -1.0, 1.0e-9);
            expectWithinAbsoluteError(FFmpegExecutor::parseProgressSeconds("Stream mapping:"), -1.0, 1.0e-9);
        }

        beginTest("Commands are described with quoted arguments");
        {
            expectEquals(FFmpegExecutor::describeCommand({ "ffmpeg", "-i", "/tmp/my clip.mp4" }),
                         juce::String("ffmpeg -i \"/tmp/my clip.mp4\""));
        }
    }
};

static EncoderSettingsTests encoderSettingsTests;

//==============================================================================
class SegmentEncoderTests : public juce::UnitTest
{
public:
    SegmentEncoderTests() : juce::UnitTest("SegmentEncoder", "Encoding") {}

    void runTest() override
    {
        const juce::File output ("/tmp/out/segment_000.mp4");
        const juce::StringArray encoder { "-c:v", "libx264", "-preset", "fast", "-crf", "23" };

        beginTest("Frame counts follow the frame grid");
        {
            Segment segment;
            segment.startTime = 1.0;
            segment.duration = 2.0;
            expectEquals(SegmentEncoder::frameCount(segment, 30.0), 60);

            segment.startTime = 0.0;
            segment.duration = 0.01;
            expectEquals(SegmentEncoder::frameCount(segment, 30.0), 1);

            // Adjacent segments never lose or gain frames between them
            Segment first { 0.0, 1.0 / 3.0, true };
            Segment second { 1.0 / 3.0, 2.0 / 3.0, false };
            expectEquals(SegmentEncoder::frameCount(first, 25.0) + SegmentEncoder::frameCount(second, 25.0), 25);
        }

        beginTest("Stills are looped for the segment's frames");
        {
            const auto args = SegmentEncoder::buildStillArgs(juce::File("/tmp/out/still_000.png"), 90, 30.0, encoder, output);

            expectEquals(args.joinIntoString(" "),
                         juce::String("-y -loop 1 -framerate 30 -i /tmp/out/still_000.png -frames:v 90 "
                                      "-c:v libx264 -preset fast -crf 23 -pix_fmt yuv420p -r 30 -an /tmp/out/segment_000.mp4"));
        }

        beginTest("Animated segments read a numbered frame sequence");
        {
            const auto args = SegmentEncoder::buildSequenceArgs(juce::File("/tmp/out/frames_001"), 48, 23.976, encoder, output);

            expect(args.contains("/tmp/out/frames_001/frame_%05d.png"));
            expectEquals(args[args.indexOf("-framerate") + 1], juce::String("23.976"));
            expectEquals(args[args.indexOf("-start_number") + 1], juce::String("0"));
            expectEquals(args[args.indexOf("-frames:v") + 1], juce::String("48"));
            expect(args.contains("-an"));
        }

        beginTest("Concatenation copies streams unless re-encoding");
        {
            const juce::File list ("/tmp/out/segments.txt");

            const auto copy = SegmentEncoder::buildConcatArgs(list, {}, output);
            expectEquals(copy.joinIntoString(" "),
                         juce::String("-y -f concat -safe 0 -i /tmp/out/segments.txt -c copy -an /tmp/out/segment_000.mp4"));

            const auto reencode = SegmentEncoder::buildConcatArgs(list, encoder, output);
            expect(!reencode.contains("copy"));
            expect(reencode.contains("+genpts"));
            expectEquals(reencode[reencode.indexOf("-pix_fmt") + 1], juce::String("yuv420p"));
        }

        beginTest("Audio is muxed without re-encoding the video");
        {
            const auto args = SegmentEncoder::buildMuxArgs(juce::File("/tmp/v.mp4"), juce::File("/tmp/a.wav"),
                                                           "aac", "192k", juce::File("/tmp/final.mp4"));

            expectEquals(args.joinIntoString(" "),
                         juce::String("-y -i /tmp/v.mp4 -i /tmp/a.wav -map 0:v:0 -map 1:a:0 -c:v copy -c:a aac "
                                      "-b:a 192k -movflags +faststart /tmp/final.mp4"));
            expect(!args.contains("-shortest"));
        }

        beginTest("Concat list entries escape quotes");
        {
            expectEquals(SegmentEncoder::concatListEntry(juce::File("/tmp/it's/segment.mp4")),
                         juce::String("file '/tmp/it'\\''s/segment.mp4'"));
        }

        beginTest("Encoding an empty timeline fails before running ffmpeg");
        {
            FFmpegExecutor ffmpeg;
            RenderOptions options;
            SegmentEncoder segmentEncoder (ffmpeg, options, juce::File::getSpecialLocation(juce::File::tempDirectory)
                                                               .getChildFile("storyreel_unused_segments"));

            expect(segmentEncoder.encode(Clip(), { Segment { 0.0, 1.0, true } }, output).failed());
            expect(segmentEncoder.encode(ClipOps::createSolid(juce::Colours::black, 16, 16, 1.0), {}, output).failed());
        }
    }
};

static SegmentEncoderTests segmentEncoderTests;

//==============================================================================
class RenderEngineTests : public juce::UnitTest
{
public:
    RenderEngineTests() : juce::UnitTest("RenderEngine", "Encoding") {}

    void runTest() override
    {
        beginTest("Total duration prefers narration, then sections, then layers");
        {
            std::vector<Section> sections (2);
            sections[0].audioDuration = 4.0;
            sections[1].audioDuration = 6.5;

            const std::vector<Layer> layers { layerWith(LayerType::Text, { "Hi" }, 2.0, 5.0) };

            expectWithinAbsoluteError(RenderEngine::computeTotalDuration(12.0, sections, layers, 10.0), 12.0, 1.0e-9);
            expectWithinAbsoluteError(RenderEngine::computeTotalDuration(0.0, sections, layers, 10.0), 10.5, 1.0e-9);
            expectWithinAbsoluteError(RenderEngine::computeTotalDuration(0.0, {}, layers, 10.0), 7.0, 1.0e-9);
            expectWithinAbsoluteError(RenderEngine::computeTotalDuration(0.0, {}, {}, 10.0), 10.0, 1.0e-9);
        }

        beginTest("Assets are discovered from array layers");
        {
            const std::vector<Layer> layers { layerWith(LayerType::Mixed, { "a.jpg", "b.mov" }),
                                              layerWith(LayerType::Image, { "single.jpg" }),
                                              layerWith(LayerType::Video, { "c.bin", "d.bin" }) };

            const auto assets = RenderEngine::discoverAssets(layers);
            expectEquals((int) assets.size(), 4);
            expect(assets[0].type == MediaType::Image);
            expect(assets[1].type == MediaType::Video);
            expect(assets[2].type == MediaType::Video);
            expectEquals(assets[3].url, juce::String("d.bin"));
        }

        beginTest("Music and logo blocks become effects");
        {
            Template parsed;
            parsed.backgroundMusic = juce::JSON::parse(R"({"url": "https://cdn.example.com/bed.mp3", "volume": 0.2, "fade_in": 1})");
            parsed.logo = juce::JSON::parse(R"({"url": "https://cdn.example.com/logo.png", "position": "top-right", "enabled": true})");

            auto effects = RenderEngine::collectEffects(parsed);
            expectEquals((int) effects.size(), 2);
            expectEquals(effects[0].type, juce::String("background_music"));
            expectEquals(effects[0].params["music_path"].toString(), juce::String("https://cdn.example.com/bed.mp3"));
            expectWithinAbsoluteError((double) effects[0].params["music_volume"], 0.2, 1.0e-9);
            expectEquals(effects[1].type, juce::String("logo_watermark"));
            expectEquals(effects[1].params["position"].toString(), juce::String("top-right"));

            parsed.logo = juce::JSON::parse(R"({"url": "https://cdn.example.com/logo.png", "enabled": false})");
            parsed.backgroundMusic = "https://cdn.example.com/bed.mp3";
            effects = RenderEngine::collectEffects(parsed);
            expectEquals((int) effects.size(), 1);
            expectEquals(effects[0].type, juce::String("background_music"));
        }

        beginTest("Audio extensions select audio-only output");
        {
            expect(RenderEngine::isAudioOnlyOutput(juce::File("/tmp/out.WAV")));
            expect(RenderEngine::isAudioOnlyOutput(juce::File("/tmp/out.mp3")));
            expect(!RenderEngine::isAudioOnlyOutput(juce::File("/tmp/out.mp4")));
        }

        beginTest("Elapsed time is formatted in hours, minutes and seconds");
        {
            expectEquals(RenderEngine::formatElapsedTime(42.7), juce::String("42s"));
            expectEquals(RenderEngine::formatElapsedTime(125.0), juce::String("2m 5s"));
            expectEquals(RenderEngine::formatElapsedTime(3723.0), juce::String("1h 2m 3s"));
        }

        beginTest("Results serialise to the status shape");
        {
            const auto ok = RenderResult::succeeded(juce::File("/tmp/final.mp4"), 12.5, 2048).toVar();
            expectEquals(ok["status"].toString(), juce::String("success"));
            expectEquals(ok["path"].toString(), juce::String("/tmp/final.mp4"));
            expectWithinAbsoluteError((double) ok["duration"], 12.5, 1.0e-9);
            expectEquals((int) ok["file_size"], 2048);

            const auto failed = RenderResult::failed(FailureKind::InputError, "Missing required variables: title").toVar();
            expectEquals(failed["status"].toString(), juce::String("error"));
            expectEquals(failed["error_type"].toString(), juce::String("input_error"));
            expect(failed["path"].isVoid());
        }

        const auto root = createScratchDirectory("storyreel_engine_tests");
        const auto options = scratchOptions(root);

        beginTest("Requests with missing inputs fail as input errors");
        {
            RenderEngine engine (options);

            RenderRequest request;
            request.templateDocument = juce::JSON::parse(R"({
                "aspect_ratio": "16:9",
                "variables": {"product": {"type": "text", "required": true}},
                "layers": [{"id": "title", "type": "text", "text": "{{product}}"}]
            })");

            auto result = engine.render(request);
            expect(!result.success);
            expect(result.failure == FailureKind::InputError);

            request.outputFile = root.getChildFile("out.mp4");
            result = engine.render(request);
            expect(result.failure == FailureKind::InputError);
            expect(result.message.contains("product"));

            // An override can supply the default the template lacks
            request.overrides = juce::JSON::parse(R"({"variables": {"product": {"default": "Kettle"}}})");
            request.narrationUrl = root.getChildFile("missing_narration.wav").getFullPathName();
            result = engine.render(request);
            expect(result.failure == FailureKind::InputError);
            expect(!result.message.contains("product"));
            expect(result.message.startsWith("Missing required narration audio"));

            request.overrides = {};
            request.variables = juce::JSON::parse(R"({"product": "Kettle"})");
            result = engine.render(request);
            expect(result.failure == FailureKind::InputError);
            expect(result.message.startsWith("Missing required narration audio"));

            request.narrationUrl = {};
            result = engine.render(request);
            expect(result.failure == FailureKind::InputError);
            expect(result.message.contains("background"));
            expect(engine.getState() == RenderState::Failed);
            expect(!request.outputFile.existsAsFile());
        }

        beginTest("Audio-only output is written without ffmpeg for WAV");
        {
            const auto narration = root.getChildFile("narration.wav");
            expect(writeTone(narration, 1.5));

            RenderEngine engine (options);

            juce::Array<RenderState> states;
            engine.setStateCallback([&states](RenderState state, const juce::String&) { states.add(state); });

            RenderRequest request;
            request.templateDocument = juce::JSON::parse(R"({"aspect_ratio": "16:9", "layers": []})");
            request.narrationUrl = narration.getFullPathName();
            request.outputFile = root.getChildFile("output/voice.wav");

            const auto result = engine.render(request);
            expect(result.success, result.message);
            expect(request.outputFile.existsAsFile());
            expectWithinAbsoluteError(result.duration, 1.5, 1.0e-3);
            expect(states.getLast() == RenderState::Completed);

            expect(engine.getSessionDirectory().getChildFile("render.log").existsAsFile());
            expect(options.tempDirectory.findChildFiles(juce::File::findDirectories, false).isEmpty());
        }

        beginTest("Jobs record their outcome in the status file");
        {
            RenderRequest request;
            request.templateDocument = juce::JSON::parse(R"({"aspect_ratio": "16:9", "layers": []})");
            request.narrationUrl = root.getChildFile("narration.wav").getFullPathName();
            request.outputFile = root.getChildFile("output/job.wav");

            const auto statusFile = root.getChildFile("status/job.json");
            RenderJob job (request, options, statusFile);

            int lastPercent = -1;
            bool progressWentBackwards = false;
            job.setProgressCallback([&](int percent, const juce::String&)
            {
                progressWentBackwards = progressWentBackwards || percent < lastPercent;
                lastPercent = percent;
            });

            expect(job.start());
            expect(!job.start());
            expect(job.waitForCompletion(60000));
            expect(job.isFinished());
            expect(job.getResult().success);
            expect(!progressWentBackwards);

            const auto record = juce::JSON::parse(statusFile);
            expectEquals(record["status"].toString(), juce::String("completed"));
            expectEquals((int) record["progress"], 100);
            expectEquals(record["path"].toString(), request.outputFile.getFullPathName());
            expect(record["updated_at"].toString().isNotEmpty());
        }

        beginTest("Failed jobs keep the error in the status file");
        {
            RenderRequest request;
            request.templateDocument = juce::JSON::parse(R"({"aspect_ratio": "16:9", "layers": []})");
            request.outputFile = root.getChildFile("output/never.mp4");

            const auto statusFile = root.getChildFile("status/failed.json");
            RenderJob job (request, options, statusFile);

            expect(job.start());
            expect(job.waitForCompletion(60000));

            const auto record = juce::JSON::parse(statusFile);
            expectEquals(record["status"].toString(), juce::String("failed"));
            expectEquals(record["error_type"].toString(), juce::String("input_error"));
        }

        beginTest("Destroying a job lets the render run to the end");
        {
            RenderRequest request;
            request.templateDocument = juce::JSON::parse(R"({"aspect_ratio": "16:9", "layers": []})");
            request.narrationUrl = root.getChildFile("narration.wav").getFullPathName();
            request.outputFile = root.getChildFile("output/detached.wav");

            const auto statusFile = root.getChildFile("status/detached.json");
            {
                RenderJob job (request, options, statusFile);
                expect(job.start());
            }

            expect(request.outputFile.existsAsFile());

            const auto record = juce::JSON::parse(statusFile);
            expectEquals(record["status"].toString(), juce::String("completed"));
            expectEquals((int) record["progress"], 100);
        }

        root.deleteRecursively();
    }
};

static RenderEngineTests renderEngineTests;
