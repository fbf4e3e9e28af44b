#pragma once
#include <JuceHeader.h>

namespace RenderTypes
{
    /** Kind of a distributable media asset */
    enum class MediaType
    {
        Image,
        Video
    };

    /** An unassigned input asset */
    struct MediaAsset
    {
        juce::String url;
        MediaType type = MediaType::Image;
    };

    /** A narration unit with a known spoken length */
    struct Section
    {
        juce::String title;
        juce::String content;
        double audioDuration = -1.0;    // negative while unknown
        juce::String audioUrl;      // optional per-section narration file

        bool hasDuration() const    { return audioDuration >= 0.0; }
    };

    /** An asset placed on the timeline by the MediaTimingDistributor */
    struct TimedAsset
    {
        juce::String url;
        MediaType type = MediaType::Image;
        double duration = 0.0;
        double startTime = 0.0;         // absolute position on the timeline
        double offsetInSection = 0.0;   // position within its section
        juce::String section;
    };

    /** Selects how assets are assigned to sections */
    enum class DistributionMode
    {
        Auto,
        Manual
    };

    inline juce::String mediaTypeToString(MediaType type)
    {
        return type == MediaType::Video ? "video" : "image";
    }

    inline MediaType mediaTypeFromString(const juce::String& name)
    {
        return name.trim().equalsIgnoreCase("video") ? MediaType::Video : MediaType::Image;
    }

    inline DistributionMode distributionModeFromString(const juce::String& name)
    {
        return name.trim().equalsIgnoreCase("manual") ? DistributionMode::Manual : DistributionMode::Auto;
    }
}
