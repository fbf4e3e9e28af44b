#include "SegmentEncoder.h"

using namespace RenderTypes;

namespace
{
    juce::String fpsString(double fps)
    {
        return juce::String(fps, 3).trimCharactersAtEnd("0").trimCharactersAtEnd(".");
    }

    // yuv420p needs even dimensions
    int evenDimension(int size)
    {
        return juce::jmax(2, size - size % 2);
    }
}

SegmentEncoder::SegmentEncoder(FFmpegExecutor& executor, const RenderOptions& renderOptions, const juce::File& directory)
    : ffmpeg(executor),
      options(renderOptions),
      workDirectory(directory)
{
}

void SegmentEncoder::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void SegmentEncoder::setProgressCallback(std::function<void(double)> callback)
{
    progressCallback = callback;
}

void SegmentEncoder::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

void SegmentEncoder::reportProgress(double segmentProgress)
{
    if (progressCallback == nullptr || totalFrames <= 0)
        return;

    progressCallback(juce::jlimit(0.0, 1.0, ((double) completedFrames + segmentProgress) / (double) totalFrames));
}

//==============================================================================
int SegmentEncoder::frameIndex(double time, double fps)
{
    return juce::roundToInt(time * fps);
}

int SegmentEncoder::frameCount(const Segment& segment, double fps)
{
    return juce::jmax(1, frameIndex(segment.endTime(), fps) - frameIndex(segment.startTime, fps));
}

juce::StringArray SegmentEncoder::buildStillArgs(const juce::File& still, int frames, double fps,
                                                 const juce::StringArray& encoderArgs, const juce::File& output)
{
    juce::StringArray args { "-y", "-loop", "1", "-framerate", fpsString(fps),
                             "-i", still.getFullPathName(),
                             "-frames:v", juce::String(frames) };
    args.addArray(encoderArgs);
    args.addArray({ "-pix_fmt", "yuv420p", "-r", fpsString(fps), "-an", output.getFullPathName() });
    return args;
}

juce::StringArray SegmentEncoder::buildSequenceArgs(const juce::File& frameDirectory, int frames, double fps,
                                                    const juce::StringArray& encoderArgs, const juce::File& output)
{
    juce::StringArray args { "-y", "-framerate", fpsString(fps), "-start_number", "0",
                             "-i", frameDirectory.getChildFile("frame_%05d.png").getFullPathName(),
                             "-frames:v", juce::String(frames) };
    args.addArray(encoderArgs);
    args.addArray({ "-pix_fmt", "yuv420p", "-r", fpsString(fps), "-an", output.getFullPathName() });
    return args;
}

juce::StringArray SegmentEncoder::buildConcatArgs(const juce::File& listFile, const juce::StringArray& encoderArgs,
                                                  const juce::File& output)
{
    juce::StringArray args { "-y", "-f", "concat", "-safe", "0", "-i", listFile.getFullPathName() };

    if (encoderArgs.isEmpty())
    {
        args.addArray({ "-c", "copy" });
    }
    else
    {
        args.addArray(encoderArgs);
        args.addArray({ "-pix_fmt", "yuv420p", "-fflags", "+genpts", "-avoid_negative_ts", "make_zero" });
    }

    args.addArray({ "-an", output.getFullPathName() });
    return args;
}

juce::StringArray SegmentEncoder::buildMuxArgs(const juce::File& video, const juce::File& audio,
                                               const juce::String& audioCodec, const juce::String& audioBitrate,
                                               const juce::File& output)
{
    return { "-y", "-i", video.getFullPathName(), "-i", audio.getFullPathName(),
             "-map", "0:v:0", "-map", "1:a:0",
             "-c:v", "copy", "-c:a", audioCodec, "-b:a", audioBitrate,
             "-movflags", "+faststart", output.getFullPathName() };
}

juce::String SegmentEncoder::concatListEntry(const juce::File& file)
{
    const auto path = file.getFullPathName().replace("\\", "/").replace("'", "'\\''");
    return "file '" + path + "'";
}

//==============================================================================
juce::Result SegmentEncoder::encode(const Clip& timeline, const std::vector<Segment>& segments, const juce::File& videoFile)
{
    if (!timeline.isValid())
        return juce::Result::fail("Nothing to encode, the timeline is empty");

    if (segments.empty())
        return juce::Result::fail("No segments were planned for the timeline");

    if (!workDirectory.createDirectory())
        return juce::Result::fail("Cannot create work directory: " + workDirectory.getFullPathName());

    useHardware = options.useHardwareEncoding && ffmpeg.isNVENCAvailable();
    outputWidth = evenDimension(timeline.width);
    outputHeight = evenDimension(timeline.height);

    totalFrames = 0;
    completedFrames = 0;

    int staticCount = 0;
    for (const auto& segment : segments)
    {
        totalFrames += frameCount(segment, options.fps);
        if (segment.isStatic)
            ++staticCount;
    }

    log("Encoding " + juce::String((int) segments.size()) + " segments ("
        + juce::String(staticCount) + " static, " + juce::String((int) segments.size() - staticCount)
        + " animated), " + juce::String(totalFrames) + " frames at " + fpsString(options.fps) + " fps, "
        + juce::String(outputWidth) + "x" + juce::String(outputHeight)
        + (useHardware ? ", NVENC" : ", " + options.videoCodec));

    juce::Array<juce::File> segmentFiles;

    for (int i = 0; i < (int) segments.size(); ++i)
    {
        const auto output = workDirectory.getChildFile("segment_" + juce::String(i).paddedLeft('0', 3) + ".mp4");
        const auto result = encodeSegment(timeline, segments[(size_t) i], i, output);

        if (result.failed())
            return result;

        segmentFiles.add(output);
        completedFrames += frameCount(segments[(size_t) i], options.fps);
        reportProgress(0.0);
    }

    return joinSegments(segmentFiles, videoFile);
}

juce::Result SegmentEncoder::encodeSegment(const Clip& timeline, const Segment& segment, int index, const juce::File& output)
{
    const double fps = options.fps;
    const int first = frameIndex(segment.startTime, fps);
    const int frames = frameCount(segment, fps);
    const double expectedDuration = frames / fps;

    const auto label = "segment " + juce::String(index + 1) + " ["
        + juce::String(segment.startTime, 2) + "s - " + juce::String(segment.endTime(), 2) + "s]";

    auto frameAt = [this, &timeline](double t)
    {
        auto frame = timeline.renderFrame(t);
        if (frame.getWidth() != outputWidth || frame.getHeight() != outputHeight)
            frame = frame.rescaled(outputWidth, outputHeight, juce::Graphics::highResamplingQuality);
        return frame;
    };

    if (segment.isStatic)
    {
        const auto still = workDirectory.getChildFile("still_" + juce::String(index).paddedLeft('0', 3) + ".png");

        if (!writeFrame(frameAt(segment.startTime + segment.duration / 2.0), still))
            return juce::Result::fail("Could not write still frame for " + label);

        const bool ok = runEncode([&](const juce::StringArray& encoderArgs)
                                  { return buildStillArgs(still, frames, fps, encoderArgs, output); },
                                  "static " + label, expectedDuration);

        if (!options.keepTempFiles)
            still.deleteFile();

        if (!ok)
            return juce::Result::fail("Encoding failed for static " + label + ": " + ffmpeg.getLastErrorOutput());

        return juce::Result::ok();
    }

    const auto frameDirectory = workDirectory.getChildFile("frames_" + juce::String(index).paddedLeft('0', 3));
    if (!frameDirectory.createDirectory())
        return juce::Result::fail("Cannot create frame directory: " + frameDirectory.getFullPathName());

    log("Rendering " + juce::String(frames) + " frames for animated " + label);

    for (int i = 0; i < frames; ++i)
    {
        const double t = juce::jmin((double) (first + i) / fps, timeline.duration);
        const auto file = frameDirectory.getChildFile("frame_" + juce::String(i).paddedLeft('0', 5) + ".png");

        if (!writeFrame(frameAt(t), file))
            return juce::Result::fail("Could not write frame " + juce::String(first + i));

        // Rendering is counted as half the work of an animated segment
        reportProgress(0.5 * (double) (i + 1));
    }

    const bool ok = runEncode([&](const juce::StringArray& encoderArgs)
                              { return buildSequenceArgs(frameDirectory, frames, fps, encoderArgs, output); },
                              "animated " + label, expectedDuration);

    if (!options.keepTempFiles)
        frameDirectory.deleteRecursively();

    if (!ok)
        return juce::Result::fail("Encoding failed for animated " + label + ": " + ffmpeg.getLastErrorOutput());

    return juce::Result::ok();
}

bool SegmentEncoder::runEncode(const std::function<juce::StringArray(const juce::StringArray&)>& buildArgs,
                               const juce::String& description, double expectedDuration)
{
    if (useHardware)
    {
        if (ffmpeg.execute(buildArgs(options.getHardwareEncoderArgs()), expectedDuration))
            return true;

        log("WARNING: NVENC encoding failed for " + description
            + ", switching to " + options.videoCodec + " for the rest of the render");
        useHardware = false;
    }

    return ffmpeg.execute(buildArgs(options.getSoftwareEncoderArgs()), expectedDuration);
}

juce::Result SegmentEncoder::joinSegments(const juce::Array<juce::File>& segmentFiles, const juce::File& output)
{
    if (output.existsAsFile())
        output.deleteFile();

    if (segmentFiles.size() == 1)
    {
        const bool moved = options.keepTempFiles ? segmentFiles.getFirst().copyFileTo(output)
                                                 : segmentFiles.getFirst().moveFileTo(output);
        if (!moved)
            return juce::Result::fail("Could not move the encoded segment to " + output.getFullPathName());

        return juce::Result::ok();
    }

    const auto listFile = workDirectory.getChildFile("segments.txt");
    listFile.deleteFile();

    {
        juce::FileOutputStream stream(listFile);
        if (!stream.openedOk())
            return juce::Result::fail("Cannot create concat list: " + listFile.getFullPathName());

        for (const auto& file : segmentFiles)
            stream.writeText(concatListEntry(file) + "\n", false, false, nullptr);

        stream.flush();
    }

    log("Joining " + juce::String(segmentFiles.size()) + " segments");

    if (!ffmpeg.execute(buildConcatArgs(listFile, {}, output)))
    {
        log("WARNING: Joining segments by stream copy failed; retrying with re-encoding");

        if (output.existsAsFile())
            output.deleteFile();

        if (!ffmpeg.execute(buildConcatArgs(listFile, options.getSoftwareEncoderArgs(), output)))
            return juce::Result::fail("Joining segments failed after retry: " + ffmpeg.getLastErrorOutput());

        log("Retry succeeded for joining segments");
    }

    if (!options.keepTempFiles)
    {
        listFile.deleteFile();
        for (const auto& file : segmentFiles)
            file.deleteFile();
    }

    return juce::Result::ok();
}

juce::Result SegmentEncoder::muxAudio(const juce::File& videoFile, const juce::File& audioFile, const juce::File& outputFile)
{
    if (!videoFile.existsAsFile())
        return juce::Result::fail("Video to mux does not exist: " + videoFile.getFullPathName());

    if (!audioFile.existsAsFile())
        return juce::Result::fail("Audio to mux does not exist: " + audioFile.getFullPathName());

    if (!outputFile.getParentDirectory().createDirectory())
        return juce::Result::fail("Cannot create output directory: " + outputFile.getParentDirectory().getFullPathName());

    log("Muxing audio into " + outputFile.getFileName());

    if (!ffmpeg.execute(buildMuxArgs(videoFile, audioFile, options.audioCodec, options.audioBitrate, outputFile)))
        return juce::Result::fail("Muxing audio failed: " + ffmpeg.getLastErrorOutput());

    return juce::Result::ok();
}

bool SegmentEncoder::writeFrame(const juce::Image& frame, const juce::File& file) const
{
    file.deleteFile();

    juce::FileOutputStream stream(file);
    if (!stream.openedOk())
        return false;

    juce::PNGImageFormat png;
    return png.writeImageToStream(frame.convertedToFormat(juce::Image::RGB), stream);
}
