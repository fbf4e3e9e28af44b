#pragma once
#include <JuceHeader.h>
#include <map>

/**
 * Engine settings for one render, passed by value into the render engine.
 *
 * Nothing here is process-wide: two renders with different options can run
 * side by side. Options can be loaded from a JSON file whose keys match the
 * snake_case names below, and the STORYREEL_FFMPEG, STORYREEL_FFPROBE and
 * STORYREEL_TEMP_DIR environment variables override the matching fields.
 */
struct RenderOptions
{
    enum class Quality
    {
        High,
        Medium,
        Low
    };

    double fps = 30.0;
    int defaultWidth = 1920;
    int defaultHeight = 1080;

    juce::String videoCodec = "libx264";
    juce::String audioCodec = "aac";
    juce::String audioBitrate = "192k";

    Quality quality = Quality::Medium;
    bool useHardwareEncoding = true;
    juce::String hardwareParams;    // replaces the preset's NVENC settings when set
    juce::String softwareParams;    // replaces the preset's software settings when set

    int downloadTimeoutSeconds = 30;
    double defaultDuration = 10.0;
    double sectionFallbackDuration = 5.0;

    std::map<juce::String, juce::File> backgroundClips;     // aspect ratio -> clip

    juce::String transitionType = "crossfade";
    double transitionDuration = 1.0;
    bool autoTransitions = false;

    bool keepTempFiles = false;
    juce::File tempDirectory;
    juce::File logDirectory;
    juce::String ffmpegPath;
    juce::String ffprobePath;

    //==============================================================================
    /** Reads options from a parsed JSON object. Missing keys keep their defaults. */
    static RenderOptions fromVar(const juce::var& config);

    /** Parses a JSON config file into options. */
    static juce::Result loadFromFile(const juce::File& file, RenderOptions& options);

    /** Applies the STORYREEL_* environment overrides. */
    void applyEnvironment();

    static Quality qualityFromString(const juce::String& name);

    /** Encoder arguments for the software path, starting with -c:v. */
    juce::StringArray getSoftwareEncoderArgs() const;

    /** Encoder arguments for the NVENC path, starting with -c:v h264_nvenc. */
    juce::StringArray getHardwareEncoderArgs() const;

    /**
     * Removes codec, pixel format and container flags from user supplied
     * encoder parameters and prefixes "-c:v codec", so the engine always
     * controls those settings itself.
     */
    static juce::StringArray sanitiseEncoderParams(const juce::String& params, const juce::String& codec);

    /** The configured base clip for an aspect ratio, or an empty File. */
    juce::File getBackgroundClip(const juce::String& aspectRatio) const;

    /** Where temporary render directories are created. */
    juce::File getTempRoot() const;

    /** Where render session logs are written. */
    juce::File getLogRoot() const;

    /** Transition params used between base clips when autoTransitions is on. */
    juce::var getDefaultTransition() const;
};
