#pragma once
#include <JuceHeader.h>
#include "VideoEffect.h"

/**
 * Fades a clip in from transparent and/or out to transparent.
 *
 * Params: fade_in_duration (0.5), fade_out_duration (0.5),
 * fade_type ("both", "in" or "out").
 *
 * When the two fades together are longer than the clip they are scaled down
 * in proportion so that they meet exactly and never overlap.
 */
class FadeEffect : public VideoEffect
{
public:
    /** Fade lengths after the fade type and clip length have been applied */
    struct Ramps
    {
        double fadeIn = 0.0;
        double fadeOut = 0.0;
    };

    juce::String getName() const override { return "fade"; }
    juce::Result checkParams(const juce::var& params) const override;
    EffectOutcome apply(const Clip& clip, const juce::var& params) const override;

    static Ramps computeRamps(double clipDuration, double fadeIn, double fadeOut, const juce::String& fadeType);

    /** Opacity in [0, 1] at time t of a clip of the given duration. */
    static double opacityAt(double t, double clipDuration, const Ramps& ramps);
};
