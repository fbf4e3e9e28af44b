#pragma once
#include <JuceHeader.h>
#include <vector>
#include "Clip.h"
#include "FFmpegExecutor.h"
#include "RenderTypes.h"
#include "../core/RenderOptions.h"

/**
 * Turns a composed timeline into a video file.
 *
 * Each planned segment is encoded on its own: a static segment is a single
 * PNG held for the segment's frame count, an animated one is a numbered PNG
 * sequence. The segment files are then joined with the concat demuxer
 * without re-encoding, and finally the narration is muxed in.
 *
 * Hardware encoding (h264_nvenc) is tried first when enabled. The first time
 * it fails the encoder switches to the software codec for the rest of the
 * render.
 */
class SegmentEncoder
{
public:
    SegmentEncoder(FFmpegExecutor& ffmpeg, const RenderOptions& options, const juce::File& workDirectory);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Receives overall encoding progress from 0 to 1. */
    void setProgressCallback(std::function<void(double)> callback);

    /**
     * Encodes every segment of the timeline and joins them into one silent
     * video.
     */
    juce::Result encode(const Clip& timeline,
                        const std::vector<RenderTypes::Segment>& segments,
                        const juce::File& videoFile);

    /** Combines a silent video with an audio file. The video stream is copied. */
    juce::Result muxAudio(const juce::File& videoFile, const juce::File& audioFile, const juce::File& outputFile);

    bool isUsingHardwareEncoder() const { return useHardware; }

    //==============================================================================
    /** Index of the frame shown at a time. Segment boundaries are rounded to whole frames. */
    static int frameIndex(double time, double fps);

    /** Number of frames a segment covers, at least one. */
    static int frameCount(const RenderTypes::Segment& segment, double fps);

    static juce::StringArray buildStillArgs(const juce::File& still, int frames, double fps,
                                            const juce::StringArray& encoderArgs, const juce::File& output);

    static juce::StringArray buildSequenceArgs(const juce::File& firstFrameDirectory, int frames, double fps,
                                               const juce::StringArray& encoderArgs, const juce::File& output);

    /** Concat demuxer arguments. Empty encoder args mean stream copy. */
    static juce::StringArray buildConcatArgs(const juce::File& listFile, const juce::StringArray& encoderArgs,
                                             const juce::File& output);

    static juce::StringArray buildMuxArgs(const juce::File& video, const juce::File& audio,
                                          const juce::String& audioCodec, const juce::String& audioBitrate,
                                          const juce::File& output);

    /** One line of a concat list, with the path quoted for the demuxer. */
    static juce::String concatListEntry(const juce::File& file);

private:
    juce::Result encodeSegment(const Clip& timeline, const RenderTypes::Segment& segment, int index,
                               const juce::File& output);
    bool runEncode(const std::function<juce::StringArray(const juce::StringArray&)>& buildArgs,
                   const juce::String& description, double expectedDuration);
    juce::Result joinSegments(const juce::Array<juce::File>& segmentFiles, const juce::File& output);
    bool writeFrame(const juce::Image& frame, const juce::File& file) const;
    void reportProgress(double segmentProgress);
    void log(const juce::String& message) const;

    FFmpegExecutor& ffmpeg;
    const RenderOptions& options;
    juce::File workDirectory;

    bool useHardware = false;
    int outputWidth = 0;
    int outputHeight = 0;

    int totalFrames = 0;
    int completedFrames = 0;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(double)> progressCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SegmentEncoder)
};
