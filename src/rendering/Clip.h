#pragma once
#include <JuceHeader.h>
#include <functional>
#include <memory>

/**
 * Decoded audio attached to a clip. Shared read-only between clips derived
 * from one another; operations that change audio create a new track.
 */
struct AudioTrack
{
    juce::AudioBuffer<float> buffer;
    double sampleRate = 44100.0;

    double getDuration() const
    {
        return sampleRate > 0.0 ? (double) buffer.getNumSamples() / sampleRate : 0.0;
    }
};

//==============================================================================
/**
 * A time-bounded stream of frames, the unit every effect and compositing step
 * works on.
 *
 * frameAt(t) is called with clip-local time in [0, duration] and returns an
 * ARGB image of width x height. Implementations must not modify an image they
 * may return again: frames from still sources are shared, so anything that
 * changes pixels draws into a fresh image.
 *
 * 'animated' is false only when every frame is identical, which lets the
 * segment encoder hold a single frame instead of rendering a sequence.
 */
struct Clip
{
    using FrameFunction = std::function<juce::Image(double)>;

    FrameFunction frameAt;
    double duration = 0.0;
    int width = 0;
    int height = 0;
    bool animated = false;
    bool containsVideo = false;
    std::shared_ptr<const AudioTrack> audio;

    bool isValid() const { return frameAt != nullptr && duration > 0.0 && width > 0 && height > 0; }

    /** Returns the frame at t, with t clamped into the clip's range. */
    juce::Image renderFrame(double t) const;
};

//==============================================================================
/** Building blocks for creating and combining clips. */
namespace ClipOps
{
    /** A transparent ARGB frame. */
    juce::Image createBlankFrame(int width, int height);

    /** Holds one image for the given duration. */
    Clip createStill(const juce::Image& image, double duration);

    /** A uniformly coloured clip, used as the placeholder for assets that could not be fetched. */
    Clip createSolid(juce::Colour colour, int width, int height, double duration);

    /**
     * Fits a clip to a duration: longer clips are trimmed, shorter ones are
     * repeated from the start. Audio is trimmed but not repeated.
     */
    Clip fitToDuration(const Clip& clip, double duration);

    /** Plays one clip after the other. Audio follows the same order. */
    Clip concatenate(const Clip& first, const Clip& second);

    /**
     * Places a clip's frames into a rectangle on a canvas of the given size,
     * stretching them to fill it.
     */
    Clip placeOnCanvas(const Clip& clip, int canvasWidth, int canvasHeight,
                       juce::Rectangle<int> bounds, juce::Colour background);

    /** Returns a copy of the image with every alpha value scaled. */
    juce::Image withOpacity(const juce::Image& image, float opacity);

    /**
     * Scales an image to cover the target size while keeping its aspect
     * ratio, then crops the centre.
     */
    juce::Image coverToSize(const juce::Image& image, int width, int height);

    /** Returns a new track containing [start, start + length) of the source, padded with silence. */
    std::shared_ptr<const AudioTrack> sliceAudio(const std::shared_ptr<const AudioTrack>& audio,
                                                 double start, double length);

    /** Appends the second track after the first. Either may be null. */
    std::shared_ptr<const AudioTrack> appendAudio(const std::shared_ptr<const AudioTrack>& first,
                                                  const std::shared_ptr<const AudioTrack>& second,
                                                  double firstDuration);
}
